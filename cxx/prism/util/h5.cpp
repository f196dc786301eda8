#include "inputs.hpp"

#include "pr/io/reader.hpp"
#include "pr/log/log.hpp"

using namespace pr;

namespace {
void PrintDatasets(HD5::Reader const &reader)
{
  for (auto const &ds : reader.list()) {
    if (ds == HD5::Keys::Samples) {
      continue;
    } else if (ds == HD5::Keys::Log) {
      fmt::print("{:16} {} entries\n", ds, reader.dimensions(ds).at(0));
    } else {
      fmt::print("{:16} {:16} {}\n", ds, fmt::format("{}", reader.dimensions(ds)), reader.listNames(ds));
    }
  }
  if (reader.exists(HD5::Keys::Samples)) { fmt::print("Model fitted to {} samples\n", reader.readIndex(HD5::Keys::Samples)); }
}
} // namespace

void main_h5(args::Subparser &parser)
{
  args::Positional<std::string>    iname(parser, "FILE", "HD5 file to describe");
  args::ValueFlagList<std::string> keys(parser, "KEYS", "Print these meta-data values", {"meta", 'm'});
  args::ValueFlag<Index>           dim(parser, "D", "Print the size of one dimension of --dset", {"dim", 'd'});
  args::ValueFlag<std::string>     dset(parser, "D", "Dataset for --dim (data)", {"dset"}, HD5::Keys::Data);
  args::Flag                       all(parser, "A", "Print all meta-data", {"all", 'a'});
  ParseCommand(parser, iname);
  auto const  cmd = parser.GetCommand().Name();
  HD5::Reader reader(iname.Get());

  if (keys) {
    auto const meta = reader.readMeta();
    std::vector<float> values;
    for (auto const &k : keys.Get()) {
      auto const it = meta.find(k);
      if (it == meta.end()) { throw Log::Failure(cmd, "No meta-data '{}' in {}", k, iname.Get()); }
      values.push_back(it->second);
    }
    fmt::print("{}\n", fmt::join(values, " "));
  } else if (all) {
    for (auto const &[k, v] : reader.readMeta()) {
      fmt::print("{}: {}\n", k, v);
    }
  } else if (dim) {
    auto const shape = reader.dimensions(dset.Get());
    if (dim.Get() < 0 || dim.Get() >= static_cast<Index>(shape.size())) {
      throw Log::Failure(cmd, "Dataset {} has {} dimensions, asked for {}", dset.Get(), shape.size(), dim.Get());
    }
    fmt::print("{}\n", shape[dim.Get()]);
  } else {
    if (reader.list().empty()) { throw Log::Failure(cmd, "No datasets found in {}", iname.Get()); }
    PrintDatasets(reader);
  }
  Log::Print(cmd, "Finished");
}
