#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <connection/connection_manager.hpp>
#include <remote/remote_lock.hpp>
#include "held_keys.hpp"
#include "key_template.hpp"
#include "lock_registry.hpp"

class Lock;

struct AcquireOptions {
    bool blocking = true;
    std::optional<double> timeout;   // seconds; nullopt waits indefinitely
};

// Held critical section returned by Lock::acquire(). Releasing (explicitly
// or on destruction) frees the remote lock, forgets the held key and exits
// the connection scope. A reentrant guard owns nothing and releases nothing.
//
// A guard may be moved to and released on another thread; the release
// undoes exactly what the acquiring thread recorded.
//
// The destructor always takes the plain release() path. When the body
// fails with SessionClosed, call release_after_session_closed() before
// the guard goes out of scope so the connection manager reconnects, or
// use Lock::run(), which does this itself.
class LockGuard {
public:
    ~LockGuard();

    LockGuard(LockGuard&& other) noexcept;
    LockGuard& operator=(LockGuard&&) = delete;
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

    // Propagates remote release errors. Idempotent.
    void release();

    // Release while a SessionClosed raised inside the critical section is
    // propagating: remote errors are logged, the connection is recovered.
    void release_after_session_closed();

    const std::string& key() const { return key_; }
    bool reentrant() const { return reentrant_; }
    bool owns_lock() const { return !released_ && !reentrant_; }

private:
    friend class Lock;

    LockGuard(Lock* lock, std::string key);
    LockGuard(Lock* lock, HeldKeys::Entry held, ConnectionScope scope,
              std::unique_ptr<RemoteLock> remote);

    Lock* lock_;
    std::string key_;
    HeldKeys::Entry held_entry_;
    std::optional<ConnectionScope> scope_;
    std::unique_ptr<RemoteLock> remote_;
    bool reentrant_;
    bool released_ = false;
};

// Exclusive distributed lock on /locks/{namespace}/{key}.
//
//   Lock lock("my-lock-{object_id}");
//
//   lock.run({param("object_id", 123)}, {}, [] { ... });
//
//   try {
//       auto guard = lock.acquire({param("object_id", 123)}, {true, 9.0});
//       ...
//   } catch (const LockTimeout&) {
//       // unable to lock after waiting for 9s
//   }
//
// The key template must be unique among live Lock objects in the process.
// Acquiring a key the calling thread already holds through this Lock is a
// reentrant no-op.
class Lock {
public:
    // Throws KeyFormatError for malformed templates, DuplicateKey if the
    // template is already registered by a live Lock.
    explicit Lock(std::string key);

    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;

    const std::string& key() const { return template_.text(); }
    const KeyTemplate& key_template() const { return template_; }

    // Concrete key and remote path for the given parameters.
    std::string concrete_key(const KeyParams& params) const;
    std::string path(const KeyParams& params) const;

    // Throws MissingParameter, Locked, LockTimeout or SessionClosed.
    LockGuard acquire(const KeyParams& params = {}, const AcquireOptions& options = {});

    // Run fn while holding the lock.
    template <typename Fn>
    auto run(const KeyParams& params, const AcquireOptions& options, Fn&& fn) -> decltype(fn());

    template <typename Fn>
    auto run(Fn&& fn) -> decltype(fn()) { return run({}, {}, std::forward<Fn>(fn)); }

    // True if the calling thread of this process holds the concrete key.
    bool is_held(const KeyParams& params = {}) const;

private:
    friend class LockGuard;

    KeyTemplate template_;
    LockRegistry::Registration registration_;
    HeldKeys held_;
};

template <typename Fn>
auto Lock::run(const KeyParams& params, const AcquireOptions& options, Fn&& fn) -> decltype(fn()) {
    LockGuard guard = acquire(params, options);
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            guard.release();
        } else {
            auto result = fn();
            guard.release();
            return result;
        }
    } catch (const SessionClosed&) {
        guard.release_after_session_closed();
        throw;
    }
}
