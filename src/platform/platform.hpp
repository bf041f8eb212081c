#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Identifier of the calling process. Changes in a forked child.
long current_pid();

// Value of an environment variable, empty if unset.
std::string get_env(const char* name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
