#include "worker_hooks.hpp"
#include <connection/connection_manager.hpp>
#include <core/log.hpp>

namespace {

// Declared after the connection manager's per-thread state is first used,
// so it is destroyed before that state at thread/process exit.
struct WorkerScope {
    bool open = false;

    ~WorkerScope() { close(); }

    void close() {
        if (!open) return;
        open = false;

        ConnectionManager manager;
        if (!manager.is_managed()) return;
        try {
            manager.exit_scope();
        } catch (const std::exception& e) {
            zklock_logf("Worker: closing connection scope failed: {}", e.what());
            return;
        }
        zklock_log("Worker: connection scope closed");
    }
};

WorkerScope& worker_scope() {
    thread_local WorkerScope scope;
    return scope;
}

} // namespace

void worker_connection_initializer() {
    ConnectionManager manager;
    manager.enter_scope();

    auto& scope = worker_scope();
    if (scope.open) {
        // Already initialized on this worker; keep a single borrow
        manager.exit_scope();
        return;
    }
    scope.open = true;
    zklock_log("Worker: connection scope opened");
}

void worker_connection_finalizer() {
    worker_scope().close();
}
