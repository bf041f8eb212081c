#pragma once

// ── Remote layout ───────────────────────────────────────────
// Use fmt::format with these: fmt::format(REMOTE_LOCK_PATH, namespace, key)
constexpr const char* REMOTE_LOCK_PATH       = "/locks/{}/{}";
constexpr const char* REMOTE_CONTENDER_PREFIX = "__lock__-";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_SESSION_TIMEOUT_SECS = 10;
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS = 15;
constexpr int ZK_PATH_BUF_SIZE             = 1024;

// ── Well-known keys ─────────────────────────────────────────
constexpr const char* MIGRATIONS_LOCK_KEY = "migrations";
constexpr const char* DEFAULT_DATABASE    = "default";

// ── Exit codes (sysexits.h values) ──────────────────────────
constexpr int EXIT_LOCK_BUSY    = 75;    // EX_TEMPFAIL: lock held elsewhere or timed out
constexpr int EXIT_CONFIG_ERROR = 78;    // EX_CONFIG
constexpr int EXIT_SPAWN_FAILED = 127;
