#include "zookeeper_client.hpp"
#include "zookeeper_lock.hpp"
#include <core/log.hpp>
#include <zookeeper/zookeeper.h>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>

// ── Lifecycle ──────────────────────────────────────────────────

ZookeeperClient::ZookeeperClient(const CoordinationConfig& config)
    : config_(config) {}

ZookeeperClient::~ZookeeperClient() {
    stop();
}

void ZookeeperClient::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (zh_) return;
        connected_ = false;
        session_lost_ = false;
    }

    zoo_set_debug_level(ZOO_LOG_LEVEL_ERROR);

    std::string hosts = config_.connect_string();
    zhandle_t* zh = zookeeper_init(hosts.c_str(), &ZookeeperClient::watcher,
                                   config_.session_timeout * 1000, nullptr, this, 0);
    if (!zh) {
        throw RemoteLockError(fmt::format("zookeeper_init({}) failed: {}",
                                          hosts, std::strerror(errno)));
    }

    bool connected;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        connected = cv_.wait_for(lock, std::chrono::seconds(config_.connect_timeout),
                                 [this] { return connected_ || session_lost_; });
        connected = connected && connected_;
        if (connected) zh_ = zh;
    }

    if (!connected) {
        zookeeper_close(zh);
        throw RemoteLockError(fmt::format("Connection to {} timed out after {}s",
                                          hosts, config_.connect_timeout));
    }
    zklock_logf("ZookeeperClient: session established ({})", hosts);
}

void ZookeeperClient::stop() {
    zhandle_t* zh;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        zh = zh_;
        zh_ = nullptr;
        connected_ = false;
    }
    if (!zh) return;

    // Joins the client's threads, so no watcher runs after this returns.
    // Ephemeral lock nodes are removed by the server with the session.
    int rc = zookeeper_close(zh);
    if (rc != ZOK)
        zklock_logf("ZookeeperClient: close returned {}", zerror(rc));
    zklock_log("ZookeeperClient: session closed");
}

void ZookeeperClient::restart() {
    stop();
    start();
}

bool ZookeeperClient::is_started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return zh_ != nullptr && !session_lost_;
}

std::unique_ptr<RemoteLock> ZookeeperClient::create_lock(const std::string& path) {
    return std::make_unique<ZookeeperLock>(*this, path);
}

// ── Session access ─────────────────────────────────────────────

zhandle_t* ZookeeperClient::handle() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!zh_) throw SessionClosed("ZooKeeper client is not started");
    if (session_lost_) throw SessionClosed("ZooKeeper session expired");
    return zh_;
}

void ZookeeperClient::check(int rc, const std::string& what) const {
    if (rc == ZOK) return;
    std::string msg = fmt::format("{}: {}", what, zerror(rc));
    if (rc == ZSESSIONEXPIRED || rc == ZCONNECTIONLOSS || rc == ZCLOSING ||
        rc == ZINVALIDSTATE || rc == ZSESSIONMOVED) {
        throw SessionClosed(msg);
    }
    throw RemoteLockError(msg);
}

void ZookeeperClient::ensure_path(const std::string& path) {
    zhandle_t* zh = handle();
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        std::string prefix = path.substr(0, pos);
        if (prefix.empty() || prefix == "/") continue;

        int rc = zoo_create(zh, prefix.c_str(), nullptr, -1, &ZOO_OPEN_ACL_UNSAFE,
                            0, nullptr, 0);
        if (rc == ZNODEEXISTS) continue;
        check(rc, "create " + prefix);
    }
}

// ── Events ─────────────────────────────────────────────────────

uint64_t ZookeeperClient::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

bool ZookeeperClient::wait_for_event(
        uint64_t seen, std::optional<std::chrono::steady_clock::time_point> deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [&] { return generation_ != seen || session_lost_; };
    bool woke = true;
    if (deadline) {
        woke = cv_.wait_until(lock, *deadline, ready);
    } else {
        cv_.wait(lock, ready);
    }
    if (session_lost_) throw SessionClosed("ZooKeeper session expired");
    return woke;
}

void ZookeeperClient::watcher(zhandle_t*, int type, int state, const char*, void* ctx) {
    static_cast<ZookeeperClient*>(ctx)->on_event(type, state);
}

void ZookeeperClient::on_event(int type, int state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (type == ZOO_SESSION_EVENT) {
        if (state == ZOO_CONNECTED_STATE) {
            connected_ = true;
        } else if (state == ZOO_EXPIRED_SESSION_STATE || state == ZOO_AUTH_FAILED_STATE) {
            connected_ = false;
            session_lost_ = true;
        } else {
            // CONNECTING: the C client is reconnecting within the session
            connected_ = false;
        }
    }
    generation_++;
    cv_.notify_all();
}

ClientFactory make_zookeeper_client_factory() {
    return [](const CoordinationConfig& config) -> std::unique_ptr<RemoteLockClient> {
        return std::make_unique<ZookeeperClient>(config);
    };
}
