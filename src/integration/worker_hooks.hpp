#pragma once

// Hooks for pools of worker threads or processes.
//
// worker_connection_initializer() opens a connection scope that lasts for
// the life of the calling worker, so every task it runs reuses the same
// session. The scope is closed by worker_connection_finalizer(), which runs
// automatically when the worker thread ends or the process exits normally.
// A worker that dies without a clean exit leaves the session to expire on
// the server side.
void worker_connection_initializer();

// Closes the worker scope. Safe to call when it is already closed.
void worker_connection_finalizer();
