#pragma once

#include <optional>
#include <string>
#include <vector>
#include <remote/remote_lock.hpp>

class ZookeeperClient;

// Exclusive lock using the ephemeral-sequential recipe: each contender
// creates <path>/__lock__-<seq>; the lowest sequence number holds the lock,
// every other contender watches its immediate predecessor.
class ZookeeperLock : public RemoteLock {
public:
    ZookeeperLock(ZookeeperClient& client, std::string path);
    ~ZookeeperLock() override;

    bool acquire(bool blocking, std::optional<double> timeout) override;
    void release() override;

    const std::string& node() const { return node_; }

private:
    ZookeeperClient& client_;
    std::string path_;
    std::string node_;        // our contender node, empty when none
    bool acquired_ = false;

    std::vector<std::string> contenders();
    void delete_node();
    void delete_node_quietly();
};
