#pragma once

#include "pr/io/hd5-core.hpp"
#include "pr/io/writer.hpp"
#include "pr/types.hpp"

void WriteLog(pr::HD5::Writer &writer);

void WriteOutput(std::string const        &cmd,
                 std::string const        &fname,
                 std::string const        &key,
                 pr::Matrix const         &data,
                 pr::HD5::DNames<2> const &dims);
