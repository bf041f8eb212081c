#pragma once

#include <memory>
#include <mutex>
#include <core/types.hpp>
#include <remote/remote_lock.hpp>

// Process-wide coordination settings: the hosts/namespace the lock engine
// targets and the factory used to build one client per thread.
class Settings {
public:
    static Settings& instance();

    void configure(const CoordinationConfig& config, ClientFactory factory);
    void reset();

    CoordinationConfig coordination() const;
    bool has_hosts() const;

    // Builds an unstarted client. Throws ConfigurationError when no
    // factory has been configured.
    std::unique_ptr<RemoteLockClient> create_client() const;

private:
    Settings() = default;

    mutable std::mutex mutex_;
    CoordinationConfig config_;
    ClientFactory factory_;
};
