#pragma once

#include "log/log.hpp"

/*
 * Failure conditions raised by the reduction core. All of them are Log::Failures, so callers that only care
 * about success can catch the base class and print it.
 */

namespace pr {

struct InvalidConfiguration : Log::Failure
{
  using Log::Failure::Failure;
};

struct DimensionMismatch : Log::Failure
{
  using Log::Failure::Failure;
};

struct NotFitted : Log::Failure
{
  using Log::Failure::Failure;
};

struct InvalidInput : Log::Failure
{
  using Log::Failure::Failure;
};

// Explained variance of a decomposition with no variance at all
struct InvalidState : Log::Failure
{
  using Log::Failure::Failure;
};

struct DecompositionFailed : Log::Failure
{
  using Log::Failure::Failure;
};

} // namespace pr
