#include "log.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

static std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "zklock_debug.log").string();
    return path;
}

std::string zklock_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_zklock_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path.empty()
        ? (platform::temp_dir() / "zklock_debug.log").string()
        : path;
}

void zklock_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] [" << platform::current_pid() << "] " << msg << "\n";
}
