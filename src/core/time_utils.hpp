#pragma once

#include <string>
#include <cstdint>

// Format an elapsed duration in milliseconds.
// Returns human-readable string like "2h35m", "14m22s", "8.4s", "350ms".
std::string format_elapsed(int64_t ms);
