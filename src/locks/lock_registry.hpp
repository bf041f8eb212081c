#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

// Process-wide map of lock key templates to the Lock that registered them.
// Catches accidental key reuse at construction time; uniqueness is by exact
// template text.
class LockRegistry {
public:
    // Move-only ownership of one registered key. Destruction (or reset())
    // frees the key for reuse.
    class Registration {
    public:
        Registration() = default;
        ~Registration();

        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        const std::string& key() const { return key_; }
        bool active() const { return registry_ != nullptr; }
        void reset();

    private:
        friend class LockRegistry;
        Registration(LockRegistry* registry, std::string key, const void* owner);

        LockRegistry* registry_ = nullptr;
        std::string key_;
        const void* owner_ = nullptr;
    };

    static LockRegistry& instance();

    // Throws DuplicateKey if key is already registered.
    Registration register_key(const std::string& key, const void* owner);

    bool contains(const std::string& key) const;
    const void* owner(const std::string& key) const;
    size_t size() const;

private:
    LockRegistry() = default;

    void unregister(const std::string& key, const void* owner);

    mutable std::mutex mutex_;
    std::map<std::string, const void*> keys_;
};
