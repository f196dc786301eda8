#include "inputs.hpp"
#include "outputs.hpp"

#include "pr/io/model.hpp"
#include "pr/log/log.hpp"

using namespace pr;

void main_pca_oneshot(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file with observations");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file");
  args::ValueFlag<std::string>  dset(parser, "D", "Dataset to reduce (data)", {"dset"}, HD5::Keys::Data);
  args::Flag                    recon(parser, "R", "Also write the reconstruction", {"recon", 'r'});
  PCAArgs                       pcaArgs(parser);
  ParseCommand(parser, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  Reducer    reducer(pcaArgs.components.Get(), pcaArgs.Get());
  auto const X = ReadObservations(iname.Get(), dset.Get());
  auto const Xr = reducer.fit(X).transform(X);

  HD5::Writer writer(oname.Get());
  writer.writeMatrix(HD5::Keys::Reduced, Xr, HD5::Dims::Reduced);
  if (recon) { writer.writeMatrix(HD5::Keys::Reconstruction, reducer.reconstruct(Xr), HD5::Dims::Observations); }
  HD5::WriteModel(writer, reducer);
  WriteLog(writer);
  if (reducer.hasVariance()) {
    fmt::print("{}\n", reducer.explainedVariance());
  } else {
    Log::Warn(cmd, "Observations have no variance");
  }
  Log::Print(cmd, "Finished");
}
