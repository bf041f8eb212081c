#include "held_keys.hpp"
#include <platform/platform.hpp>

HeldKeys::Entry HeldKeys::current(const std::string& key) {
    return Entry{std::this_thread::get_id(), platform::current_pid(), key};
}

bool HeldKeys::contains(const std::string& key) const {
    auto entry = current(key);
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(entry) > 0;
}

HeldKeys::Entry HeldKeys::insert(const std::string& key) {
    auto entry = current(key);
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert(entry);
    return entry;
}

void HeldKeys::erase(const Entry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(entry);
}

size_t HeldKeys::count_current() const {
    auto tid = std::this_thread::get_id();
    auto pid = platform::current_pid();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& e : entries_) {
        if (std::get<0>(e) == tid && std::get<1>(e) == pid) n++;
    }
    return n;
}
