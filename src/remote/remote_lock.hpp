#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <core/types.hpp>

// Failures reported by a coordination-service client.
class RemoteLockError : public std::runtime_error {
public:
    explicit RemoteLockError(const std::string& msg) : std::runtime_error(msg) {}
};

// The session was severed (expired, closed or lost). Recovered by
// ConnectionManager on scope exit, but always propagated to the caller.
class SessionClosed : public RemoteLockError {
public:
    explicit SessionClosed(const std::string& msg = "Connection has been closed")
        : RemoteLockError(msg) {}
};

// A blocking acquire ran out of time. The lock engine translates this
// into LockTimeout; it never reaches callers of Lock.
class RemoteLockTimeout : public RemoteLockError {
public:
    explicit RemoteLockTimeout(const std::string& msg) : RemoteLockError(msg) {}
};

// Exclusive lock on one remote path. Created per acquisition attempt and
// never reused.
class RemoteLock {
public:
    virtual ~RemoteLock() = default;

    // Returns false when blocking is false and the lock is held elsewhere.
    // Throws RemoteLockTimeout when a finite timeout (seconds) elapses.
    virtual bool acquire(bool blocking, std::optional<double> timeout) = 0;

    virtual void release() = 0;
};

// Session-oriented client to the coordination service.
class RemoteLockClient {
public:
    virtual ~RemoteLockClient() = default;

    // Blocks until the session is established.
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void restart() = 0;
    virtual bool is_started() const = 0;

    virtual std::unique_ptr<RemoteLock> create_lock(const std::string& path) = 0;
};

using ClientFactory =
    std::function<std::unique_ptr<RemoteLockClient>(const CoordinationConfig&)>;
