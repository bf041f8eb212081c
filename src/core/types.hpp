#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Coordination service (ZooKeeper) settings
struct CoordinationConfig {
    std::vector<std::string> hosts;              // "host:port" entries
    std::string lock_namespace;                  // second path segment: /locks/{namespace}/{key}
    int session_timeout = 10;                    // seconds
    int connect_timeout = 15;                    // seconds

    // Comma-joined host list as the ZooKeeper client expects it
    std::string connect_string() const {
        std::string out;
        for (const auto& h : hosts) {
            if (!out.empty()) out += ",";
            out += h;
        }
        return out;
    }
};

struct LogConfig {
    std::string path;                            // empty = <tmp>/zklock_debug.log
};
