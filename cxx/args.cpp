#include "args.hpp"

#include "pr/io/writer.hpp"
#include "pr/log/debug.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <unordered_map>

using namespace pr;

namespace {
std::unordered_map<int, Log::Display> levelMap{{0, Log::Display::None}, {1, Log::Display::Low}, {2, Log::Display::High}};
}

args::Group                      global_group("GLOBAL OPTIONS");
args::HelpFlag                   help(global_group, "H", "Show this help message", {'h', "help"});
args::MapFlag<int, Log::Display> verbosity(global_group, "V", "Log level 0-2", {'v', "verbosity"}, levelMap, Log::Display::Low);
args::ValueFlag<std::string>     debug(global_group, "F", "Write intermediate matrices to file", {"debug"});
args::ValueFlag<Index>           deflate_level(global_group, "D", "Set deflate level (0=none)", {"deflate"}, 2);

void SetLogging(std::string const &name)
{
  if (verbosity) {
    Log::SetDisplayLevel(verbosity.Get());
  } else if (char *const env_p = std::getenv("PR_VERBOSITY")) {
    auto const level = levelMap.find(std::atoi(env_p));
    if (level == levelMap.end()) { throw args::Error(fmt::format("PR_VERBOSITY must be 0-2, was {}", env_p)); }
    Log::SetDisplayLevel(level->second);
  }
  Log::Print(name, "Welcome to PRISM");
  if (debug) { Log::SetDebugFile(debug.Get()); }
}

void SetDeflate()
{
  if (deflate_level) {
    HD5::SetDeflate(deflate_level.Get());
  } else if (char *const env_p = std::getenv("PR_DEFLATE")) {
    HD5::SetDeflate(std::atoi(env_p));
  }
}

void ParseCommand(args::Subparser &parser)
{
  args::GlobalOptions globals(parser, global_group);
  parser.Parse();
  SetLogging(parser.GetCommand().Name());
  SetDeflate();
}

void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname)
{
  ParseCommand(parser);
  if (!iname) { throw args::Error("No input file specified"); }
}

void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname, args::Positional<std::string> &oname)
{
  ParseCommand(parser);
  if (!iname) { throw args::Error("No input file specified"); }
  if (!oname) { throw args::Error("No output file specified"); }
}

void ParseCommand(args::Subparser                &parser,
                  args::Positional<std::string> &mname,
                  args::Positional<std::string> &iname,
                  args::Positional<std::string> &oname)
{
  ParseCommand(parser);
  if (!mname) { throw args::Error("No model file specified"); }
  if (!iname) { throw args::Error("No input file specified"); }
  if (!oname) { throw args::Error("No output file specified"); }
}
