#include "zookeeper_lock.hpp"
#include "zookeeper_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <zookeeper/zookeeper.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

ZookeeperLock::ZookeeperLock(ZookeeperClient& client, std::string path)
    : client_(client), path_(std::move(path)) {}

ZookeeperLock::~ZookeeperLock() {
    delete_node_quietly();
}

bool ZookeeperLock::acquire(bool blocking, std::optional<double> timeout) {
    if (acquired_) return true;

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (blocking && timeout) {
        deadline = std::chrono::steady_clock::now() +
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(*timeout));
    }

    client_.ensure_path(path_);

    std::string prefix = path_ + "/" + REMOTE_CONTENDER_PREFIX;
    std::string data = fmt::format("pid={}", platform::current_pid());
    char created[ZK_PATH_BUF_SIZE];
    int rc = zoo_create(client_.handle(), prefix.c_str(), data.data(),
                        static_cast<int>(data.size()), &ZOO_OPEN_ACL_UNSAFE,
                        ZOO_EPHEMERAL | ZOO_SEQUENCE, created, sizeof(created));
    client_.check(rc, "create " + prefix);
    node_ = created;
    std::string our_name = node_.substr(path_.size() + 1);

    try {
        while (true) {
            uint64_t seen = client_.generation();
            auto names = contenders();
            auto it = std::find(names.begin(), names.end(), our_name);
            if (it == names.end())
                throw SessionClosed("Lock node vanished: " + node_);

            if (it == names.begin()) {
                acquired_ = true;
                return true;
            }

            if (!blocking) {
                delete_node();
                return false;
            }

            std::string predecessor = path_ + "/" + *(it - 1);
            struct Stat stat;
            rc = zoo_wexists(client_.handle(), predecessor.c_str(),
                             &ZookeeperClient::watcher, &client_, &stat);
            if (rc == ZNONODE) continue;
            client_.check(rc, "exists " + predecessor);

            if (!client_.wait_for_event(seen, deadline)) {
                delete_node();
                throw RemoteLockTimeout(fmt::format("Failed to acquire lock on {} after {}s",
                                                    path_, timeout.value_or(0.0)));
            }
        }
    } catch (const SessionClosed&) {
        // The ephemeral node goes away with the session
        node_.clear();
        throw;
    } catch (const RemoteLockError&) {
        delete_node_quietly();
        throw;
    }
}

void ZookeeperLock::release() {
    if (!acquired_) return;
    acquired_ = false;
    delete_node();
}

std::vector<std::string> ZookeeperLock::contenders() {
    struct String_vector children;
    int rc = zoo_get_children(client_.handle(), path_.c_str(), 0, &children);
    client_.check(rc, "get_children " + path_);

    std::string prefix = REMOTE_CONTENDER_PREFIX;
    std::vector<std::string> names;
    for (int i = 0; i < children.count; i++) {
        std::string name = children.data[i];
        if (name.compare(0, prefix.size(), prefix) == 0) names.push_back(name);
    }
    deallocate_String_vector(&children);

    // Sequence suffixes are zero-padded, so lexical order is creation order
    std::sort(names.begin(), names.end());
    return names;
}

void ZookeeperLock::delete_node() {
    if (node_.empty()) return;
    std::string node = node_;
    node_.clear();
    int rc = zoo_delete(client_.handle(), node.c_str(), -1);
    if (rc == ZNONODE) return;
    client_.check(rc, "delete " + node);
}

void ZookeeperLock::delete_node_quietly() {
    try {
        delete_node();
    } catch (const RemoteLockError& e) {
        zklock_logf("ZookeeperLock: cleanup of {} failed: {}", path_, e.what());
    }
}
