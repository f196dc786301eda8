#include "inputs.hpp"
#include "outputs.hpp"

#include "pr/io/model.hpp"
#include "pr/log/log.hpp"

using namespace pr;

void main_inverse(args::Subparser &parser)
{
  args::Positional<std::string> mname(parser, "MODEL", "HD5 model file from fit");
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file with reduced data");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file");
  args::ValueFlag<std::string>  dset(parser, "D", "Dataset to reconstruct (reduced)", {"dset"}, HD5::Keys::Reduced);
  args::Flag                    center(parser, "C", "Add the model mean back after reconstructing", {"center", 'c'});
  ParseCommand(parser, mname, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  HD5::Reader reader(iname.Get());
  auto const  Xr = reader.readMatrix(dset.Get());
  // The number of components is whatever the reduced data holds
  auto const  reducer = HD5::ReadModel(HD5::Reader(mname.Get()), Xr.cols());
  auto const  X = center ? reducer.reconstruct(Xr) : reducer.inverse(Xr);
  Log::Print(cmd, "Reconstructed {} samples of {} features", X.rows(), X.cols());
  WriteOutput(cmd, oname.Get(), HD5::Keys::Reconstruction, X, HD5::Dims::Observations);
}
