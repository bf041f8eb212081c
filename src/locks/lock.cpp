#include "lock.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/settings.hpp>
#include <fmt/format.h>

// ── LockGuard ──────────────────────────────────────────────────

LockGuard::LockGuard(Lock* lock, std::string key)
    : lock_(lock), key_(std::move(key)), reentrant_(true) {}

LockGuard::LockGuard(Lock* lock, HeldKeys::Entry held, ConnectionScope scope,
                     std::unique_ptr<RemoteLock> remote)
    : lock_(lock), key_(std::get<2>(held)), held_entry_(std::move(held)), scope_(std::move(scope)),
      remote_(std::move(remote)), reentrant_(false) {}

LockGuard::LockGuard(LockGuard&& other) noexcept
    : lock_(other.lock_), key_(std::move(other.key_)), held_entry_(std::move(other.held_entry_)),
      scope_(std::move(other.scope_)),
      remote_(std::move(other.remote_)), reentrant_(other.reentrant_),
      released_(other.released_) {
    other.scope_.reset();
    other.released_ = true;
}

LockGuard::~LockGuard() {
    if (released_) return;
    try {
        release();
    } catch (const std::exception& e) {
        zklock_logf("Lock: release of {} failed: {}", key_, e.what());
    }
}

void LockGuard::release() {
    if (released_) return;
    released_ = true;
    if (reentrant_) return;

    // The remote lock borrows the scope's client and must go first.
    lock_->held_.erase(held_entry_);
    try {
        remote_->release();
    } catch (const SessionClosed&) {
        remote_.reset();
        scope_->close_after_session_closed();
        throw;
    } catch (const RemoteLockError&) {
        remote_.reset();
        scope_.reset();
        throw;
    }
    remote_.reset();
    zklock_logf("Released lock key={}", key_);
    scope_->close();
}

void LockGuard::release_after_session_closed() {
    if (released_) return;
    released_ = true;
    if (reentrant_) return;

    lock_->held_.erase(held_entry_);
    try {
        remote_->release();
    } catch (const RemoteLockError& e) {
        zklock_logf("Lock: release of {} after session loss failed: {}", key_, e.what());
    }
    remote_.reset();
    scope_->close_after_session_closed();
}

// ── Lock ───────────────────────────────────────────────────────

Lock::Lock(std::string key)
    : template_(std::move(key)),
      registration_(LockRegistry::instance().register_key(template_.text(), this)) {}

std::string Lock::concrete_key(const KeyParams& params) const {
    return template_.format(params);
}

std::string Lock::path(const KeyParams& params) const {
    return fmt::format(REMOTE_LOCK_PATH, Settings::instance().coordination().lock_namespace,
                       concrete_key(params));
}

bool Lock::is_held(const KeyParams& params) const {
    return held_.contains(concrete_key(params));
}

LockGuard Lock::acquire(const KeyParams& params, const AcquireOptions& options) {
    std::string key = concrete_key(params);
    if (held_.contains(key)) {
        zklock_logf("Reentrant lock key={}", key);
        return LockGuard(this, key);
    }

    ConnectionScope scope;
    try {
        std::string lock_namespace = Settings::instance().coordination().lock_namespace;
        auto remote = scope.client().create_lock(
            fmt::format(REMOTE_LOCK_PATH, lock_namespace, key));

        zklock_logf("Acquiring lock namespace={} key={}", lock_namespace, key);
        bool acquired;
        try {
            acquired = remote->acquire(options.blocking, options.timeout);
        } catch (const RemoteLockTimeout& e) {
            zklock_logf("Lock timeout key={}: {}", key, e.what());
            throw LockTimeout(key);
        }
        if (!acquired) {
            zklock_logf("Lock busy key={}", key);
            throw Locked(key);
        }

        auto held = held_.insert(key);
        zklock_logf("Acquired lock key={}", key);
        return LockGuard(this, std::move(held), std::move(scope), std::move(remote));
    } catch (const SessionClosed&) {
        scope.close_after_session_closed();
        throw;
    }
}
