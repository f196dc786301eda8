#include "inputs.hpp"
#include "version.h"

#include "pr/log/log.hpp"

#include <H5public.h>

void main_version(args::Subparser &parser)
{
  parser.Parse();
  fmt::print("PRISM {} built {}\n", VERSION, DATETIME);
  fmt::print("Eigen {}.{}.{} fmt {} HDF5 {}.{}.{}\n", EIGEN_WORLD_VERSION, EIGEN_MAJOR_VERSION, EIGEN_MINOR_VERSION,
             FMT_VERSION, H5_VERS_MAJOR, H5_VERS_MINOR, H5_VERS_RELEASE);
}
