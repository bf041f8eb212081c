#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <remote/remote_lock.hpp>

// ZooKeeper C client forward declaration
typedef struct _zhandle zhandle_t;

// ZookeeperClient: one ZooKeeper session over the multi-threaded C client.
//
// Session state arrives on the client's completion thread through the
// global watcher; waiters in ZookeeperLock block on the same condition
// variable, keyed by a generation counter bumped on every event.
//
// Locking DAG: mutex_ is never held across a ZooKeeper API call.

class ZookeeperClient : public RemoteLockClient {
public:
    explicit ZookeeperClient(const CoordinationConfig& config);
    ~ZookeeperClient() override;

    void start() override;
    void stop() override;
    void restart() override;
    bool is_started() const override;

    std::unique_ptr<RemoteLock> create_lock(const std::string& path) override;

    // ── Used by ZookeeperLock ──────────────────────────────────

    // Live handle. Throws SessionClosed when stopped or expired.
    zhandle_t* handle();

    // Throws SessionClosed or RemoteLockError for a non-ZOK return code.
    void check(int rc, const std::string& what) const;

    // Create every missing node along path (persistent, empty).
    void ensure_path(const std::string& path);

    uint64_t generation() const;

    // Wait until an event arrives after `seen`. Returns false on deadline.
    // Throws SessionClosed if the session is lost while waiting.
    bool wait_for_event(uint64_t seen,
                        std::optional<std::chrono::steady_clock::time_point> deadline);

    static void watcher(zhandle_t* zh, int type, int state, const char* path, void* ctx);

private:
    CoordinationConfig config_;
    zhandle_t* zh_ = nullptr;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool connected_ = false;
    bool session_lost_ = false;
    uint64_t generation_ = 0;

    void on_event(int type, int state);
};

// Factory for Settings::configure()
ClientFactory make_zookeeper_client_factory();
