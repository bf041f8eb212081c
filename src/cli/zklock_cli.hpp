#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <integration/migration_guard.hpp>

// Migration executor backed by external commands: `check` (run through
// /bin/sh, non-zero exit = migrations pending) and the migration command.
class CommandMigrationExecutor : public MigrationExecutor {
public:
    CommandMigrationExecutor(std::string check_command, std::vector<std::string> command);

    bool has_unapplied_migrations(const MigrateOptions& options) override;
    void apply(const MigrateOptions& options) override;

    int exit_code() const { return exit_code_; }

private:
    std::string check_command_;
    std::vector<std::string> command_;
    int exit_code_ = 0;
};

class ZklockCLI {
public:
    // Subcommand dispatch; args excludes argv[0]. Returns the process exit code.
    int run(const std::vector<std::string>& args);

    int run_locked(const std::vector<std::string>& args);
    int run_migrate(const std::vector<std::string>& args);
    int run_status(const std::vector<std::string>& args);
    int run_init();

private:
    std::optional<Config> config_;

    // Load config (explicit file or global+project), configure Settings
    // and the log path. Prints the failure and returns false on error.
    bool configure(const std::string& config_path);
};

void print_usage();
