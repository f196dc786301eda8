#include "inputs.hpp"
#include "outputs.hpp"

#include "pr/io/model.hpp"
#include "pr/log/log.hpp"

using namespace pr;

void main_project(args::Subparser &parser)
{
  args::Positional<std::string> mname(parser, "MODEL", "HD5 model file from fit");
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file with observations");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file");
  args::ValueFlag<std::string>  dset(parser, "D", "Dataset to project (data)", {"dset"}, HD5::Keys::Data);
  args::ValueFlag<Index>        components(parser, "P", "Override number of components", {"components", 'n'});
  args::Flag                    center(parser, "C", "Subtract the model mean before projecting", {"center", 'c'});
  ParseCommand(parser, mname, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  auto const reducer = HD5::ReadModel(HD5::Reader(mname.Get()), components ? components.Get() : 0);
  auto const X = ReadObservations(iname.Get(), dset.Get());
  auto const Xr = center ? reducer.transform(X) : reducer.project(X);
  Log::Print(cmd, "Projected {} samples onto {} components", Xr.rows(), Xr.cols());
  WriteOutput(cmd, oname.Get(), HD5::Keys::Reduced, Xr, HD5::Dims::Reduced);
}
