#include "inputs.hpp"

#include "pr/io/reader.hpp"
#include "pr/log/log.hpp"

using namespace pr;

void main_log(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "HD5 file with an embedded log");
  args::ValueFlag<std::string>  category(parser, "C", "Only print entries from this category", {"filter", 'f'});
  ParseCommand(parser, iname);
  auto const  cmd = parser.GetCommand().Name();
  HD5::Reader reader(iname.Get());
  if (!reader.exists(HD5::Keys::Log)) { throw Log::Failure(cmd, "File {} does not contain a log", iname.Get()); }
  Index shown = 0;
  for (auto const &entry : reader.readStrings(HD5::Keys::Log)) {
    if (!category || Log::Category(entry) == category.Get()) {
      fmt::print("{}\n", entry);
      shown++;
    }
  }
  Log::Print(cmd, "Printed {} entries", shown);
}
