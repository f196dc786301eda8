#include "writer.hpp"

#include "../log/log.hpp"

#include <algorithm>
#include <filesystem>
#include <hdf5.h>
#include <hdf5_hl.h>

namespace pr {
namespace HD5 {

namespace {
Index deflate = 2;

// Chunks hold whole rows, about 1 MiB of them
constexpr Index ChunkBytes = 1 << 20;
} // namespace

void SetDeflate(Index const d)
{
  if (d < 0 || d > 9) { throw Log::Failure("HD5", "Deflate level must be 0-9, was {}", d); }
  deflate = d;
}

Writer::Writer(std::string const &fname, bool const append)
{
  Init();
  auto const path = std::filesystem::path(fname).replace_extension(".h5");
  if (append) {
    if (!std::filesystem::exists(path)) { throw Log::Failure("HD5", "Cannot append to missing file {}", path.string()); }
    handle_ = H5Fopen(path.c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
  } else {
    handle_ = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  }
  if (handle_ < 0) { throw Log::Failure("HD5", "Could not open {} for writing: {}", path.string(), GetError()); }
  Log::Debug("HD5", "Opened {} for writing", path.string());
}

Writer::~Writer() { H5Fclose(handle_); }

auto Writer::exists(std::string const &name) const -> bool { return Exists(handle_, name); }

void Writer::write(std::string const              &label,
                   std::vector<Index> const       &shape,
                   double const                   *data,
                   std::vector<std::string> const &dims)
{
  if (std::find(shape.begin(), shape.end(), 0) != shape.end()) {
    throw Log::Failure("HD5", "Cannot write '{}' with an empty dimension, shape {}", label, shape);
  }
  int const            rank = shape.size();
  std::vector<hsize_t> hdims(shape.begin(), shape.end());
  hid_t const          space = H5Screate_simple(rank, hdims.data(), nullptr);
  hid_t const          plist = H5Pcreate(H5P_DATASET_CREATE);
  if (deflate > 0) {
    Index const rowBytes = rank == 2 ? shape[1] * sizeof(double) : sizeof(double);
    auto        chunk = hdims;
    chunk[0] = std::clamp<Index>(ChunkBytes / rowBytes, 1, shape[0]);
    CheckedCall(H5Pset_chunk(plist, rank, chunk.data()), "setting chunk size");
    CheckedCall(H5Pset_deflate(plist, deflate), "setting deflate");
  }
  hid_t const dset = H5Dcreate(handle_, label.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, plist, H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create '{}': {}", label, GetError()); }
  for (int ii = 0; ii < rank; ii++) {
    CheckedCall(H5DSset_label(dset, ii, dims[ii].c_str()), fmt::format("labelling '{}' dimension {}", label, ii));
  }
  CheckedCall(H5Dwrite(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data), "writing " + label);
  CheckedCall(H5Dclose(dset), "closing dataset");
  CheckedCall(H5Pclose(plist), "closing property list");
  CheckedCall(H5Sclose(space), "closing dataspace");
  Log::Debug("HD5", "Wrote '{}' shape {}", label, shape);
}

void Writer::writeMatrix(std::string const &label, Eigen::Ref<Eigen::MatrixXd const> const &m, DNames<2> const &dims)
{
  Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> const buffer = m;
  write(label, {buffer.rows(), buffer.cols()}, buffer.data(), {dims[0], dims[1]});
}

void Writer::writeVector(std::string const &label, Eigen::Ref<Eigen::VectorXd const> const &v, DNames<1> const &dims)
{
  Eigen::VectorXd const buffer = v;
  write(label, {buffer.rows()}, buffer.data(), {dims[0]});
}

void Writer::writeIndex(std::string const &label, Index const value)
{
  hid_t const space = H5Screate(H5S_SCALAR);
  hid_t const dset = H5Dcreate(handle_, label.c_str(), H5T_NATIVE_LONG, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create '{}': {}", label, GetError()); }
  CheckedCall(H5Dwrite(dset, H5T_NATIVE_LONG, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value), "writing " + label);
  CheckedCall(H5Dclose(dset), "closing dataset");
  CheckedCall(H5Sclose(space), "closing dataspace");
}

void Writer::writeStrings(std::string const &label, std::vector<std::string> const &strings)
{
  hsize_t const dims[1] = {strings.size()};
  hid_t const   space = H5Screate_simple(1, dims, nullptr);
  hid_t const   tid = H5Tcopy(H5T_C_S1);
  CheckedCall(H5Tset_size(tid, H5T_VARIABLE), "sizing string type");
  CheckedCall(H5Tset_cset(tid, H5T_CSET_UTF8), "setting string encoding");
  std::vector<char const *> ptrs(strings.size());
  std::transform(strings.begin(), strings.end(), ptrs.begin(), [](std::string const &s) { return s.c_str(); });
  hid_t const dset = H5Dcreate(handle_, label.c_str(), tid, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create '{}': {}", label, GetError()); }
  CheckedCall(H5Dwrite(dset, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()), "writing " + label);
  CheckedCall(H5Dclose(dset), "closing dataset");
  CheckedCall(H5Tclose(tid), "closing string type");
  CheckedCall(H5Sclose(space), "closing dataspace");
}

void Writer::writeMeta(std::map<std::string, float> const &meta)
{
  hid_t const group = H5Gcreate(handle_, Keys::Meta.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group < 0) { throw Log::Failure("HD5", "Could not create meta-data group: {}", GetError()); }
  hid_t const space = H5Screate(H5S_SCALAR);
  for (auto const &[key, value] : meta) {
    hid_t const dset = H5Dcreate(group, key.c_str(), H5T_NATIVE_FLOAT, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dset < 0) { throw Log::Failure("HD5", "Could not create meta-data '{}': {}", key, GetError()); }
    CheckedCall(H5Dwrite(dset, H5T_NATIVE_FLOAT, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value), "writing meta " + key);
    CheckedCall(H5Dclose(dset), "closing meta-data");
  }
  CheckedCall(H5Sclose(space), "closing dataspace");
  CheckedCall(H5Gclose(group), "closing meta-data group");
}

} // namespace HD5
} // namespace pr
