#pragma once

#include "kefctl/types.h"

#include <string>

namespace kefctl {
namespace internal {

// Route a message to the callback, or to stderr when none is set.
void Log(const LogCallback& callback, LogLevel level, const std::string& message);

// Fill `error` (if non-null) and return false so callers can `return Fail(...)`.
bool Fail(Error* error, ErrorCode code, std::string message);

}  // namespace internal
}  // namespace kefctl
