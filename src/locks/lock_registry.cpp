#include "lock_registry.hpp"
#include <core/errors.hpp>

// ── Registration ───────────────────────────────────────────────

LockRegistry::Registration::Registration(LockRegistry* registry, std::string key,
                                         const void* owner)
    : registry_(registry), key_(std::move(key)), owner_(owner) {}

LockRegistry::Registration::~Registration() {
    reset();
}

LockRegistry::Registration::Registration(Registration&& other) noexcept
    : registry_(other.registry_), key_(std::move(other.key_)), owner_(other.owner_) {
    other.registry_ = nullptr;
    other.owner_ = nullptr;
}

LockRegistry::Registration&
LockRegistry::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        registry_ = other.registry_;
        key_ = std::move(other.key_);
        owner_ = other.owner_;
        other.registry_ = nullptr;
        other.owner_ = nullptr;
    }
    return *this;
}

void LockRegistry::Registration::reset() {
    if (!registry_) return;
    registry_->unregister(key_, owner_);
    registry_ = nullptr;
    owner_ = nullptr;
}

// ── LockRegistry ───────────────────────────────────────────────

LockRegistry& LockRegistry::instance() {
    static LockRegistry registry;
    return registry;
}

LockRegistry::Registration LockRegistry::register_key(const std::string& key,
                                                      const void* owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (keys_.count(key)) throw DuplicateKey(key);
    keys_[key] = owner;
    return Registration(this, key, owner);
}

bool LockRegistry::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.count(key) > 0;
}

const void* LockRegistry::owner(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(key);
    return it == keys_.end() ? nullptr : it->second;
}

size_t LockRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

void LockRegistry::unregister(const std::string& key, const void* owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(key);
    // Only the registrant may free its slot
    if (it != keys_.end() && it->second == owner) keys_.erase(it);
}
