#include "hd5-core.hpp"

#include "../log/log.hpp"

#include <hdf5.h>
#include <hdf5_hl.h>

namespace pr {
namespace HD5 {

void Init()
{
  static bool initialised = false;
  if (initialised) { return; }
  if (auto const err = H5open(); err < 0) { throw Log::Failure("HD5", "Could not open HDF5 library, code: {}", err); }
  // Errors are read back from the stack by GetError instead of being printed by the library
  if (auto const err = H5Eset_auto(H5E_DEFAULT, nullptr, nullptr); err < 0) {
    throw Log::Failure("HD5", "Could not silence HDF5 error printing, code: {}", err);
  }
  initialised = true;
  Log::Debug("HD5", "Initialised HDF5");
}

namespace {
herr_t InnermostError(unsigned n, H5E_error2_t const *err, void *data)
{
  if (n == 0) { *static_cast<std::string *>(data) = err->desc; }
  return 0;
}

herr_t AppendName(hid_t, char const *name, H5L_info_t const *, void *data)
{
  static_cast<std::vector<std::string> *>(data)->emplace_back(name);
  return 0;
}
} // namespace

std::string GetError()
{
  std::string error;
  H5Ewalk(H5Eget_current_stack(), H5E_WALK_UPWARD, &InnermostError, &error);
  return error;
}

void CheckedCall(herr_t status, std::string const &msg)
{
  if (status < 0) { throw Log::Failure("HD5", "Failed {}, status {}: {}", msg, status, GetError()); }
}

auto Exists(hid_t const parent, std::string const &name) -> bool { return H5Lexists(parent, name.c_str(), H5P_DEFAULT) > 0; }

std::vector<std::string> List(Handle h)
{
  std::vector<std::string> names;
  CheckedCall(H5Literate(h, H5_INDEX_NAME, H5_ITER_INC, nullptr, AppendName, &names), "listing datasets");
  std::erase_if(names, [h](std::string const &name) {
    hid_t const obj = H5Oopen(h, name.c_str(), H5P_DEFAULT);
    if (obj < 0) { return true; }
    bool const isGroup = H5Iget_type(obj) != H5I_DATASET;
    H5Oclose(obj);
    return isGroup;
  });
  return names;
}

Dataset::Dataset(Handle const parent, std::string const &n)
  : name{n}
{
  id = H5Dopen(parent, name.c_str(), H5P_DEFAULT);
  if (id < 0) { throw Log::Failure("HD5", "Could not open dataset '{}': {}", name, GetError()); }
  space = H5Dget_space(id);
  if (space < 0) {
    H5Dclose(id);
    throw Log::Failure("HD5", "Could not get dataspace of '{}': {}", name, GetError());
  }
}

Dataset::~Dataset()
{
  H5Sclose(space);
  H5Dclose(id);
}

auto Dataset::shape() const -> std::vector<Index>
{
  int const            rank = H5Sget_simple_extent_ndims(space);
  std::vector<hsize_t> dims(rank);
  H5Sget_simple_extent_dims(space, dims.data(), nullptr);
  return std::vector<Index>(dims.begin(), dims.end());
}

auto Dataset::labels() const -> std::vector<std::string>
{
  int const                rank = H5Sget_simple_extent_ndims(space);
  std::vector<std::string> labels(rank);
  for (int ii = 0; ii < rank; ii++) {
    char buffer[64] = {0};
    H5DSget_label(id, ii, buffer, sizeof(buffer));
    labels[ii] = buffer;
  }
  return labels;
}

} // namespace HD5
} // namespace pr
