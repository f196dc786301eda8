#pragma once

#include "log.hpp"

#include "../types.hpp"

namespace pr {
namespace Log {

void SetDebugFile(std::string const &fname);
auto IsDebugging() -> bool;
void EndDebugging();

// Dump an intermediate matrix into the debug file, if one is open. Repeated names get a numeric suffix.
void Dump(std::string const &name, Eigen::Ref<Eigen::MatrixXd const> const &m);

} // namespace Log
} // namespace pr
