#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <core/settings.hpp>
#include <remote/remote_lock.hpp>

// In-memory stand-in for the coordination service. Paths are exclusive
// across every client built from the same FakeCoordinator, so threads
// contend on it the way they would on a real ensemble.
struct FakeCoordinator {
    enum class Outcome { Normal, Refuse, Timeout, SessionClosed };

    std::atomic<int> clients_created{0};
    std::atomic<int> start_calls{0};
    std::atomic<int> stop_calls{0};
    std::atomic<int> restart_calls{0};
    std::atomic<int> release_calls{0};

    // Forces every acquire to this result instead of consulting the table
    Outcome outcome = Outcome::Normal;
    bool release_raises_session_closed = false;

    std::mutex mutex;
    std::condition_variable cv;
    std::set<std::string> held_paths;
    std::vector<std::string> lock_paths;
    std::vector<std::pair<bool, std::optional<double>>> acquire_calls;

    std::vector<std::string> paths() {
        std::lock_guard<std::mutex> lock(mutex);
        return lock_paths;
    }

    std::vector<std::pair<bool, std::optional<double>>> acquires() {
        std::lock_guard<std::mutex> lock(mutex);
        return acquire_calls;
    }

    bool is_held(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        return held_paths.count(path) > 0;
    }
};

class FakeRemoteLock : public RemoteLock {
public:
    FakeRemoteLock(std::shared_ptr<FakeCoordinator> zk, std::string path)
        : zk_(std::move(zk)), path_(std::move(path)) {}

    ~FakeRemoteLock() override {
        if (!owned_) return;
        std::lock_guard<std::mutex> lock(zk_->mutex);
        zk_->held_paths.erase(path_);
        zk_->cv.notify_all();
    }

    bool acquire(bool blocking, std::optional<double> timeout) override {
        std::unique_lock<std::mutex> lock(zk_->mutex);
        zk_->acquire_calls.emplace_back(blocking, timeout);

        switch (zk_->outcome) {
            case FakeCoordinator::Outcome::Refuse:
                return false;
            case FakeCoordinator::Outcome::Timeout:
                throw RemoteLockTimeout("fake timeout on " + path_);
            case FakeCoordinator::Outcome::SessionClosed:
                throw SessionClosed();
            case FakeCoordinator::Outcome::Normal:
                break;
        }

        auto free = [&] { return zk_->held_paths.count(path_) == 0; };
        if (!free()) {
            if (!blocking) return false;
            if (timeout) {
                auto wait = std::chrono::duration<double>(*timeout);
                if (!zk_->cv.wait_for(lock, wait, free))
                    throw RemoteLockTimeout("fake timeout on " + path_);
            } else {
                zk_->cv.wait(lock, free);
            }
        }
        zk_->held_paths.insert(path_);
        owned_ = true;
        return true;
    }

    void release() override {
        zk_->release_calls++;
        std::lock_guard<std::mutex> lock(zk_->mutex);
        if (owned_) {
            zk_->held_paths.erase(path_);
            owned_ = false;
            zk_->cv.notify_all();
        }
        if (zk_->release_raises_session_closed) throw SessionClosed();
    }

private:
    std::shared_ptr<FakeCoordinator> zk_;
    std::string path_;
    bool owned_ = false;
};

class FakeLockClient : public RemoteLockClient {
public:
    explicit FakeLockClient(std::shared_ptr<FakeCoordinator> zk) : zk_(std::move(zk)) {
        zk_->clients_created++;
    }

    void start() override {
        zk_->start_calls++;
        started_ = true;
        ever_started_ = true;
    }

    void stop() override {
        zk_->stop_calls++;
        started_ = false;
    }

    void restart() override {
        zk_->restart_calls++;
        stop();
        start();
    }

    bool is_started() const override { return started_; }
    bool ever_started() const { return ever_started_; }

    std::unique_ptr<RemoteLock> create_lock(const std::string& path) override {
        {
            std::lock_guard<std::mutex> lock(zk_->mutex);
            zk_->lock_paths.push_back(path);
        }
        return std::make_unique<FakeRemoteLock>(zk_, path);
    }

private:
    std::shared_ptr<FakeCoordinator> zk_;
    bool started_ = false;
    bool ever_started_ = false;
};

inline const char* FAKE_NAMESPACE = "zklock-test-app";

// Point Settings at a fake coordinator. Pass no hosts to simulate an
// unconfigured deployment.
inline void install_fake_coordinator(std::shared_ptr<FakeCoordinator> zk,
                                     std::vector<std::string> hosts = {"localhost:2181"},
                                     const std::string& lock_namespace = FAKE_NAMESPACE) {
    CoordinationConfig config;
    config.hosts = std::move(hosts);
    config.lock_namespace = lock_namespace;
    Settings::instance().configure(config, [zk](const CoordinationConfig&) {
        return std::unique_ptr<RemoteLockClient>(std::make_unique<FakeLockClient>(zk));
    });
}
