#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <locks/lock.hpp>

struct MigrateOptions {
    std::string settings;
    std::string pythonpath;
    std::string app_label;
    std::string migration_name;
    bool fake = false;
    bool fake_initial = false;
    bool run_syncdb = false;
    std::string database = "default";

    // No targeting or faking flags and the default database
    bool launched_with_defaults() const;
};

// The host's schema migration machinery.
class MigrationExecutor {
public:
    virtual ~MigrationExecutor() = default;

    // May throw ConfigurationError when no database is configured; the
    // guard then lets apply() decide what to do.
    virtual bool has_unapplied_migrations(const MigrateOptions& options) = 0;

    virtual void apply(const MigrateOptions& options) = 0;
};

// Runs schema migrations in a critical section so concurrent deployments
// never migrate the same database at once.
class MigrationGuard {
public:
    enum class Outcome {
        Guarded,     // migrations ran while holding the lock
        Unguarded,   // migrations ran without a lock (no hosts configured)
        Skipped,     // nothing to apply
    };

    // Without a lock, the guard owns Lock("migrations") for its lifetime.
    MigrationGuard(MigrationExecutor& executor, std::ostream& out, Lock* lock = nullptr);

    Lock& lock() { return *lock_; }

    // Throws whatever the lock or the executor throws.
    Outcome handle(const MigrateOptions& options = {});

private:
    MigrationExecutor& executor_;
    std::ostream& out_;
    std::unique_ptr<Lock> owned_lock_;
    Lock* lock_;
};
