#pragma once

#include <string>
#include <fmt/format.h>

// Debug log shared by the connection manager, the lock engine and the CLI.
// Lines are appended as "[HH:MM:SS.mmm] [pid] message". Never throws.
std::string zklock_log_path();
void set_zklock_log_path(const std::string& path);

void zklock_log(const std::string& msg);

template <typename... Args>
void zklock_logf(fmt::format_string<Args...> fmt_str, Args&&... args) {
    zklock_log(fmt::format(fmt_str, std::forward<Args>(args)...));
}
