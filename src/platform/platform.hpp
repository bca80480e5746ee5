#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// The process working directory, read once per call. Never changed by cmdgate.
std::filesystem::path current_dir();

// True when paths on this platform compare case-insensitively.
bool case_insensitive_paths();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
