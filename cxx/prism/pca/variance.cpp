#include "inputs.hpp"

#include "pr/io/model.hpp"
#include "pr/log/log.hpp"

using namespace pr;

void main_variance(args::Subparser &parser)
{
  args::Positional<std::string> mname(parser, "MODEL", "HD5 model file from fit");
  args::ValueFlag<Index>        components(parser, "Q", "Number of components (default from model)", {"components", 'n'});
  args::Flag                    all(parser, "A", "Print the cumulative variance of every component", {"all", 'a'});
  ParseCommand(parser, mname);
  auto const cmd = parser.GetCommand().Name();

  auto const reducer = HD5::ReadModel(HD5::Reader(mname.Get()));
  if (!reducer.hasVariance()) {
    Log::Warn(cmd, "Model was fitted to data with no variance");
    return;
  }
  if (all) {
    auto const cumulative = reducer.cumulativeVariance();
    fmt::print("{:>9} {:>12} {:>10}\n", "Component", "Eigenvalue", "Cumulative");
    for (Index ii = 0; ii < cumulative.rows(); ii++) {
      fmt::print("{:>9} {:>12.4g} {:>10.4f}\n", ii + 1, reducer.eigenvalues()(ii), cumulative(ii));
    }
  } else {
    Index const q = components ? components.Get() : reducer.components();
    fmt::print("{}\n", reducer.explainedVariance(q));
  }
  Log::Print(cmd, "Finished");
}
