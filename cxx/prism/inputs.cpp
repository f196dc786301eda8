#include "inputs.hpp"

#include "pr/io/reader.hpp"
#include "pr/log/log.hpp"

using namespace pr;

PCAArgs::PCAArgs(args::Subparser &parser)
  : components(parser, "P", "Number of components to keep (default 2)", {"components", 'n'}, 2)
  , svd(parser, "SVD", "Decompose the covariance with an SVD instead of an eigensolver", {"svd"})
  , rawSigns(parser, "R", "Do not normalize eigenvector signs", {"raw-signs"})
{
}

auto PCAArgs::Get() -> pr::Reducer::Opts
{
  return pr::Reducer::Opts{.solver = svd ? Solver::SVD : Solver::Eig, .normalizeSigns = !rawSigns};
}

auto ReadObservations(std::string const &fname, std::string const &dset) -> pr::Matrix
{
  HD5::Reader reader(fname);
  auto const  X = reader.readMatrix(dset);
  Log::Print("Input", "Read {} samples of {} features from {}", X.rows(), X.cols(), fname);
  return X;
}
