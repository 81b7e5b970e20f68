#pragma once

#include <cstdlib>
#include <iostream>

namespace sc {

// Debug tracing to stderr is switched on by setting SC_VALIDATE_DEBUG.
inline bool trace_enabled() { return std::getenv("SC_VALIDATE_DEBUG") != nullptr; }

}  // namespace sc
