#pragma once

#include <exception>
#include <memory>
#include <remote/remote_lock.hpp>

// ConnectionManager: one coordination-service client per thread, shared by
// every nested scope on that thread.
//
// Each enter_scope() borrows the connection; the matching exit_scope()
// returns it. The client is created lazily by the first get_client() and
// stopped when the outermost scope exits. All ConnectionManager objects
// are views of the same per-thread state, so they can be created freely.
//
// Scope nesting must be strictly LIFO on a thread. Prefer ConnectionScope
// or run() over calling enter_scope()/exit_scope() by hand.

// Reference counter and client of one thread (defined in the .cpp).
struct ThreadConnectionState;

class ConnectionManager {
public:
    // Increment the current thread's reference counter.
    void enter_scope();

    // Decrement the counter and stop the client when the outermost scope
    // exits. Throws ConfigurationError without a matching enter_scope().
    void exit_scope();

    // exit_scope() followed by a reconnect of a client that is still alive,
    // so the next scope on this thread does not inherit a dead session.
    // Reconnect failures are logged; the caller rethrows the original error.
    void exit_scope_after_session_closed();

    // Connected client for the current thread, created and started on
    // first use. Throws ConfigurationError outside of a scope.
    RemoteLockClient& get_client();

    bool is_managed() const;
    bool has_client() const;
    int reference_count() const;

    // Run fn inside a connection scope. A SessionClosed escaping fn
    // triggers the reconnect rule before it is rethrown.
    template <typename Fn>
    auto run(Fn&& fn) -> decltype(fn());
};

// RAII connection scope. The destructor exits the scope and logs (never
// throws) if stopping the client fails.
//
// A scope is bound to the state of the thread that opened it: closing it
// from another thread (after a move) exits that thread's scope, and the
// state outlives its thread until the last scope on it is closed.
class ConnectionScope {
public:
    explicit ConnectionScope(ConnectionManager manager = ConnectionManager());
    ~ConnectionScope();

    ConnectionScope(ConnectionScope&& other) noexcept;
    ConnectionScope& operator=(ConnectionScope&&) = delete;
    ConnectionScope(const ConnectionScope&) = delete;
    ConnectionScope& operator=(const ConnectionScope&) = delete;

    RemoteLockClient& client();

    // Exit now, propagating errors from stopping the client.
    void close();

    // Exit because the body failed with SessionClosed.
    void close_after_session_closed();

    bool active() const { return active_; }

private:
    std::shared_ptr<ThreadConnectionState> state_;
    bool active_ = true;
};

template <typename Fn>
auto ConnectionManager::run(Fn&& fn) -> decltype(fn()) {
    ConnectionScope scope(*this);
    try {
        return fn();
    } catch (const SessionClosed&) {
        scope.close_after_session_closed();
        throw;
    }
}
