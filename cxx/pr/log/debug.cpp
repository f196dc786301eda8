#include "debug.hpp"

#include "../io/writer.hpp"

#include <memory>

namespace pr {
namespace Log {

namespace {
std::shared_ptr<HD5::Writer> debug_file = nullptr;
}

void SetDebugFile(std::string const &fname) { debug_file = std::make_shared<HD5::Writer>(fname); }

auto IsDebugging() -> bool { return debug_file != nullptr; }

void EndDebugging() { debug_file.reset(); }

void Dump(std::string const &nameIn, Eigen::Ref<Eigen::MatrixXd const> const &m)
{
  if (debug_file) {
    Index       count = 0;
    std::string name = nameIn;
    while (debug_file->exists(name)) {
      count++;
      name = fmt::format("{}-{}", nameIn, count);
    }
    debug_file->writeMatrix(name, m, HD5::DNames<2>{"row", "col"});
  }
}

} // namespace Log
} // namespace pr
