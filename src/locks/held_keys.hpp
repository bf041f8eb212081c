#pragma once

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <tuple>

// Concrete keys currently held, partitioned by thread and process.
// Lookups only ever see entries of the calling thread in the calling
// process, so a forked child never inherits its parent's holdings.
class HeldKeys {
public:
    // (thread, pid, concrete key)
    using Entry = std::tuple<std::thread::id, long, std::string>;

    bool contains(const std::string& key) const;

    // Returns the entry to hand back to erase(), which may run on any thread.
    Entry insert(const std::string& key);
    void erase(const Entry& entry);

    // Entries of the calling thread in the calling process.
    size_t count_current() const;

private:
    static Entry current(const std::string& key);

    mutable std::mutex mutex_;
    std::set<Entry> entries_;
};
