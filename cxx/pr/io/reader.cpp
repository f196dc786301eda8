#include "reader.hpp"

#include "../log/log.hpp"

#include <filesystem>
#include <hdf5.h>

namespace pr {
namespace HD5 {

Reader::Reader(std::string const &fname)
{
  if (!std::filesystem::exists(fname)) { throw Log::Failure("HD5", "File does not exist: {}", fname); }
  Init();
  handle_ = H5Fopen(fname.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (handle_ < 0) { throw Log::Failure("HD5", "Could not open {}: {}", fname, GetError()); }
  Log::Debug("HD5", "Opened {} for reading", fname);
}

Reader::~Reader() { H5Fclose(handle_); }

auto Reader::list() const -> std::vector<std::string> { return List(handle_); }

auto Reader::exists(std::string const &label) const -> bool { return Exists(handle_, label); }

auto Reader::dimensions(std::string const &label) const -> std::vector<Index> { return Dataset(handle_, label).shape(); }

auto Reader::listNames(std::string const &label) const -> std::vector<std::string> { return Dataset(handle_, label).labels(); }

auto Reader::readMatrix(std::string const &label) const -> Eigen::MatrixXd
{
  Dataset const ds(handle_, label);
  auto const    shape = ds.shape();
  if (shape.size() < 1 || shape.size() > 2) {
    throw Log::Failure("HD5", "Dataset '{}' has {} dimensions, a matrix needs 1 or 2", label, shape.size());
  }
  Index const rows = shape[0];
  Index const cols = shape.size() == 2 ? shape[1] : 1;
  // C order on disk is row-major
  Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> buffer(rows, cols);
  CheckedCall(H5Dread(ds.id, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()), "reading " + label);
  Log::Debug("HD5", "Read '{}' {}x{}", label, rows, cols);
  return buffer;
}

auto Reader::readVector(std::string const &label) const -> Eigen::VectorXd
{
  auto const m = readMatrix(label);
  if (m.cols() != 1) { throw Log::Failure("HD5", "Dataset '{}' has {} columns, expected a vector", label, m.cols()); }
  return m.col(0);
}

auto Reader::readIndex(std::string const &label) const -> Index
{
  Dataset const ds(handle_, label);
  if (H5Sget_simple_extent_npoints(ds.space) != 1) { throw Log::Failure("HD5", "Dataset '{}' is not a single value", label); }
  Index value = 0;
  CheckedCall(H5Dread(ds.id, H5T_NATIVE_LONG, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value), "reading " + label);
  return value;
}

auto Reader::readStrings(std::string const &label) const -> std::vector<std::string>
{
  Dataset const ds(handle_, label);
  auto const    shape = ds.shape();
  if (shape.size() != 1) { throw Log::Failure("HD5", "Strings '{}' have {} dimensions, must be 1", label, shape.size()); }
  hid_t const tid = H5Tcopy(H5T_C_S1);
  H5Tset_size(tid, H5T_VARIABLE);
  H5Tset_cset(tid, H5T_CSET_UTF8);
  std::vector<char *> raw(shape[0]);
  CheckedCall(H5Dread(ds.id, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, raw.data()), "reading " + label);
  std::vector<std::string> const strings(raw.begin(), raw.end());
  CheckedCall(H5Dvlen_reclaim(tid, ds.space, H5P_DEFAULT, raw.data()), "reclaiming strings");
  CheckedCall(H5Tclose(tid), "closing string type");
  return strings;
}

auto Reader::readMeta() const -> std::map<std::string, float>
{
  std::map<std::string, float> meta;
  if (!Exists(handle_, Keys::Meta)) { return meta; }
  hid_t const group = H5Gopen(handle_, Keys::Meta.c_str(), H5P_DEFAULT);
  if (group < 0) { throw Log::Failure("HD5", "Could not open meta-data group: {}", GetError()); }
  for (auto const &name : List(group)) {
    Dataset const ds(group, name);
    float         value = 0.f;
    CheckedCall(H5Dread(ds.id, H5T_NATIVE_FLOAT, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value), "reading meta " + name);
    meta[name] = value;
  }
  CheckedCall(H5Gclose(group), "closing meta-data group");
  return meta;
}

} // namespace HD5
} // namespace pr
