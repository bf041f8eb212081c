#include "connection_manager.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/settings.hpp>
#include <mutex>

// Reference counter and client for one thread. Scopes moved to another
// thread still close against this state, so the mutex keeps the counter
// check and client creation/teardown atomic.
struct ThreadConnectionState {
    std::mutex mutex;
    int reference_counter = 0;
    std::unique_ptr<RemoteLockClient> client;
};

namespace {

const std::shared_ptr<ThreadConnectionState>& thread_state() {
    thread_local std::shared_ptr<ThreadConnectionState> state =
        std::make_shared<ThreadConnectionState>();
    return state;
}

void stop_connection(ThreadConnectionState& state) {
    // Clear the handle first so a failing stop() cannot leave a dead client behind
    auto client = std::move(state.client);
    zklock_log("ConnectionManager: stopping client");
    client->stop();
}

void enter_state(ThreadConnectionState& state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    state.reference_counter++;
}

void exit_state(ThreadConnectionState& state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.reference_counter <= 0)
        throw ConfigurationError("Calling exit_scope before enter_scope.");
    state.reference_counter--;
    if (state.reference_counter == 0 && state.client)
        stop_connection(state);
}

void exit_after_session_closed(ThreadConnectionState& state) {
    exit_state(state);

    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.client) return;

    zklock_log("ConnectionManager: session closed, restarting client");
    try {
        state.client->restart();
    } catch (const std::exception& e) {
        zklock_logf("ConnectionManager: restart failed: {}", e.what());
    }
}

RemoteLockClient& client_of(ThreadConnectionState& state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.reference_counter <= 0)
        throw ConfigurationError("Use ConnectionManager within an active connection scope.");

    if (!state.client) {
        auto client = Settings::instance().create_client();
        zklock_logf("ConnectionManager: starting client ({})",
                    Settings::instance().coordination().connect_string());
        client->start();
        state.client = std::move(client);
    }
    return *state.client;
}

} // namespace

// ── ConnectionManager ──────────────────────────────────────────

void ConnectionManager::enter_scope() {
    enter_state(*thread_state());
}

void ConnectionManager::exit_scope() {
    exit_state(*thread_state());
}

void ConnectionManager::exit_scope_after_session_closed() {
    exit_after_session_closed(*thread_state());
}

RemoteLockClient& ConnectionManager::get_client() {
    return client_of(*thread_state());
}

bool ConnectionManager::is_managed() const {
    auto& state = *thread_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.reference_counter > 0;
}

bool ConnectionManager::has_client() const {
    auto& state = *thread_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return static_cast<bool>(state.client);
}

int ConnectionManager::reference_count() const {
    auto& state = *thread_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.reference_counter;
}

// ── ConnectionScope ────────────────────────────────────────────

ConnectionScope::ConnectionScope(ConnectionManager)
    : state_(thread_state()) {
    enter_state(*state_);
}

ConnectionScope::~ConnectionScope() {
    if (!active_) return;
    active_ = false;
    try {
        exit_state(*state_);
    } catch (const std::exception& e) {
        zklock_logf("ConnectionScope: exit failed: {}", e.what());
    }
}

ConnectionScope::ConnectionScope(ConnectionScope&& other) noexcept
    : state_(std::move(other.state_)), active_(other.active_) {
    other.active_ = false;
}

RemoteLockClient& ConnectionScope::client() {
    if (!active_) throw ConfigurationError("Use ConnectionManager within an active connection scope.");
    return client_of(*state_);
}

void ConnectionScope::close() {
    if (!active_) return;
    active_ = false;
    exit_state(*state_);
}

void ConnectionScope::close_after_session_closed() {
    if (!active_) return;
    active_ = false;
    exit_after_session_closed(*state_);
}
