#pragma once

#include "args.hpp"

#include "pr/pca.hpp"
#include "pr/types.hpp"

struct PCAArgs
{
  args::ValueFlag<Index> components;
  args::Flag             svd, rawSigns;

  PCAArgs(args::Subparser &parser);
  auto Get() -> pr::Reducer::Opts;
};

// Reads an observation matrix (samples x features on disk). One-dimensional datasets are a single feature.
auto ReadObservations(std::string const &fname, std::string const &dset) -> pr::Matrix;
