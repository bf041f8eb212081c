#include "migration_guard.hpp"
#include <cli/theme.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/settings.hpp>

bool MigrateOptions::launched_with_defaults() const {
    return settings.empty() && pythonpath.empty() && app_label.empty() &&
           migration_name.empty() && !fake && !fake_initial && !run_syncdb &&
           database == DEFAULT_DATABASE;
}

MigrationGuard::MigrationGuard(MigrationExecutor& executor, std::ostream& out, Lock* lock)
    : executor_(executor), out_(out) {
    if (lock) {
        lock_ = lock;
    } else {
        owned_lock_ = std::make_unique<Lock>(MIGRATIONS_LOCK_KEY);
        lock_ = owned_lock_.get();
    }
}

MigrationGuard::Outcome MigrationGuard::handle(const MigrateOptions& options) {
    out_ << theme::section("Potential data migration will be assisted by Zookeeper locks.");

    bool has_unapplied;
    try {
        has_unapplied = executor_.has_unapplied_migrations(options);
    } catch (const ConfigurationError& e) {
        // No database configured: let the executor decide what to do
        zklock_logf("Migrations: pending check unavailable: {}", e.what());
        has_unapplied = true;
    }

    if (options.launched_with_defaults() && !has_unapplied) {
        out_ << theme::info("No migrations to apply.");
        return Outcome::Skipped;
    }

    if (!Settings::instance().has_hosts()) {
        out_ << theme::warn("No host has been defined in the zookeeper hosts setting - "
                            "Zookeeper locks will not protect current data migration process.");
        executor_.apply(options);
        return Outcome::Unguarded;
    }

    zklock_logf("Migrations: running under lock {}", lock_->key());
    lock_->run([&] { executor_.apply(options); });
    return Outcome::Guarded;
}
