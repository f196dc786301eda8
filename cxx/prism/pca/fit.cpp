#include "inputs.hpp"
#include "outputs.hpp"

#include "pr/io/model.hpp"
#include "pr/log/log.hpp"

using namespace pr;

void main_fit(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file with observations");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 model file");
  args::ValueFlag<std::string>  dset(parser, "D", "Dataset to fit (data)", {"dset"}, HD5::Keys::Data);
  PCAArgs                       pcaArgs(parser);
  ParseCommand(parser, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  Reducer    reducer(pcaArgs.components.Get(), pcaArgs.Get());
  auto const X = ReadObservations(iname.Get(), dset.Get());
  reducer.fit(X);
  if (reducer.hasVariance()) {
    Log::Print(cmd, "{} components explain {:.2f}% of the variance", reducer.components(), 100. * reducer.explainedVariance());
  } else {
    Log::Warn(cmd, "Observations have no variance");
  }

  HD5::Writer writer(oname.Get());
  HD5::WriteModel(writer, reducer);
  WriteLog(writer);
  Log::Print(cmd, "Finished");
}
