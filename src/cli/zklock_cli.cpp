#include "zklock_cli.hpp"
#include "theme.hpp"
#include <connection/connection_manager.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/settings.hpp>
#include <locks/lock.hpp>
#include <platform/process.hpp>
#include <zk/zookeeper_client.hpp>
#include <fmt/format.h>
#include <iostream>
#include <stdexcept>

// Splits "args -- command..." at the first "--".
static void split_command(const std::vector<std::string>& args,
                          std::vector<std::string>& options,
                          std::vector<std::string>& command) {
    bool in_command = false;
    for (const auto& a : args) {
        if (!in_command && a == "--") {
            in_command = true;
            continue;
        }
        (in_command ? command : options).push_back(a);
    }
}

static bool parse_seconds(const std::string& s, double& out) {
    try {
        size_t used = 0;
        out = std::stod(s, &used);
        return used == s.size() && out >= 0;
    } catch (const std::exception&) {
        return false;
    }
}

// ── CommandMigrationExecutor ───────────────────────────────────

CommandMigrationExecutor::CommandMigrationExecutor(std::string check_command,
                                                   std::vector<std::string> command)
    : check_command_(std::move(check_command)), command_(std::move(command)) {}

bool CommandMigrationExecutor::has_unapplied_migrations(const MigrateOptions&) {
    if (check_command_.empty())
        throw ConfigurationError("No pending-migration check configured");
    int rc = platform::run_command({"/bin/sh", "-c", check_command_});
    zklock_logf("Migrations: check '{}' exited {}", check_command_, rc);
    return rc != 0;
}

void CommandMigrationExecutor::apply(const MigrateOptions&) {
    exit_code_ = platform::run_command(command_);
    if (exit_code_ != 0) {
        throw std::runtime_error(fmt::format("Migration command exited with status {}",
                                             exit_code_));
    }
}

// ── ZklockCLI ──────────────────────────────────────────────────

bool ZklockCLI::configure(const std::string& config_path) {
    auto result = config_path.empty() ? Config::load() : Config::load_file(config_path);
    if (result.is_err()) {
        std::cout << theme::fail("Invalid configuration: " + result.error);
        return false;
    }
    config_ = result.value;
    set_zklock_log_path(config_->log().path);
    Settings::instance().configure(config_->zookeeper(), make_zookeeper_client_factory());
    return true;
}

int ZklockCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return 1;
    }

    std::string cmd = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (cmd == "--version") {
        std::cout << theme::bold("zklock") << theme::dim(" version 0.1.0") << "\n";
        return 0;
    } else if (cmd == "--help" || cmd == "help") {
        print_usage();
        return 0;
    } else if (cmd == "run") {
        return run_locked(rest);
    } else if (cmd == "migrate") {
        return run_migrate(rest);
    } else if (cmd == "status") {
        return run_status(rest);
    } else if (cmd == "init") {
        return run_init();
    }

    std::cout << theme::fail("Unknown command: " + cmd);
    print_usage();
    return 1;
}

int ZklockCLI::run_locked(const std::vector<std::string>& args) {
    std::vector<std::string> opts, command;
    split_command(args, opts, command);

    std::string config_path;
    std::string key;
    KeyParams params;
    AcquireOptions acquire_opts;

    for (size_t i = 0; i < opts.size(); i++) {
        const auto& a = opts[i];
        if (a == "--config" && i + 1 < opts.size()) {
            config_path = opts[++i];
        } else if (a == "--param" && i + 1 < opts.size()) {
            const auto& kv = opts[++i];
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cout << theme::fail("Expected NAME=VALUE for --param, got: " + kv);
                return EXIT_CONFIG_ERROR;
            }
            params[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else if (a == "--timeout" && i + 1 < opts.size()) {
            double secs;
            if (!parse_seconds(opts[++i], secs)) {
                std::cout << theme::fail("Invalid --timeout: " + opts[i]);
                return EXIT_CONFIG_ERROR;
            }
            acquire_opts.timeout = secs;
        } else if (a == "--no-wait") {
            acquire_opts.blocking = false;
        } else if (key.empty() && a.rfind("--", 0) != 0) {
            key = a;
        } else {
            std::cout << theme::fail("Unexpected argument: " + a);
            return EXIT_CONFIG_ERROR;
        }
    }

    if (key.empty() || command.empty()) {
        std::cout << theme::fail("Usage: zklock run [options] KEY -- COMMAND [ARGS...]");
        return EXIT_CONFIG_ERROR;
    }
    if (!configure(config_path)) return EXIT_CONFIG_ERROR;
    if (!Settings::instance().has_hosts()) {
        std::cout << theme::fail("No zookeeper hosts configured.");
        std::cout << theme::step("Set zookeeper.hosts in zklock.yaml or ZKLOCK_HOSTS.");
        return EXIT_CONFIG_ERROR;
    }

    try {
        Lock lock(key);
        std::cout << theme::step("Locking " + lock.path(params));
        return lock.run(params, acquire_opts, [&] {
            return platform::run_command(command);
        });
    } catch (const LockError& e) {
        std::cout << theme::fail(e.what());
        return EXIT_LOCK_BUSY;
    } catch (const KeyFormatError& e) {
        std::cout << theme::fail(e.what());
        return EXIT_CONFIG_ERROR;
    } catch (const ConfigurationError& e) {
        std::cout << theme::fail(e.what());
        return EXIT_CONFIG_ERROR;
    } catch (const RemoteLockError& e) {
        std::cout << theme::fail(std::string("ZooKeeper: ") + e.what());
        return 1;
    }
}

int ZklockCLI::run_migrate(const std::vector<std::string>& args) {
    std::vector<std::string> opts, command;
    split_command(args, opts, command);

    std::string config_path;
    std::string check_command;
    MigrateOptions migrate_opts;

    for (size_t i = 0; i < opts.size(); i++) {
        const auto& a = opts[i];
        bool has_value = i + 1 < opts.size();
        if (a == "--config" && has_value) {
            config_path = opts[++i];
        } else if (a == "--check" && has_value) {
            check_command = opts[++i];
        } else if (a == "--database" && has_value) {
            migrate_opts.database = opts[++i];
        } else if (a == "--app" && has_value) {
            migrate_opts.app_label = opts[++i];
        } else if (a == "--migration" && has_value) {
            migrate_opts.migration_name = opts[++i];
        } else if (a == "--settings" && has_value) {
            migrate_opts.settings = opts[++i];
        } else if (a == "--fake") {
            migrate_opts.fake = true;
        } else if (a == "--fake-initial") {
            migrate_opts.fake_initial = true;
        } else if (a == "--run-syncdb") {
            migrate_opts.run_syncdb = true;
        } else {
            std::cout << theme::fail("Unexpected argument: " + a);
            return EXIT_CONFIG_ERROR;
        }
    }

    if (command.empty()) {
        std::cout << theme::fail("Usage: zklock migrate [options] -- COMMAND [ARGS...]");
        return EXIT_CONFIG_ERROR;
    }
    if (!configure(config_path)) return EXIT_CONFIG_ERROR;

    CommandMigrationExecutor executor(check_command, command);
    try {
        MigrationGuard guard(executor, std::cout);
        auto outcome = guard.handle(migrate_opts);
        if (outcome != MigrationGuard::Outcome::Skipped)
            std::cout << theme::ok("Migrations applied.");
        return 0;
    } catch (const LockError& e) {
        std::cout << theme::fail(e.what());
        return EXIT_LOCK_BUSY;
    } catch (const ConfigurationError& e) {
        std::cout << theme::fail(e.what());
        return EXIT_CONFIG_ERROR;
    } catch (const std::runtime_error& e) {
        std::cout << theme::fail(e.what());
        return executor.exit_code() != 0 ? executor.exit_code() : 1;
    }
}

int ZklockCLI::run_status(const std::vector<std::string>& args) {
    std::string config_path;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else {
            std::cout << theme::fail("Unexpected argument: " + args[i]);
            return EXIT_CONFIG_ERROR;
        }
    }
    if (!configure(config_path)) return EXIT_CONFIG_ERROR;

    const auto& zk = config_->zookeeper();
    std::cout << theme::section("Configuration");
    std::cout << theme::kv("Hosts", zk.hosts.empty() ? "(none)" : zk.connect_string());
    std::cout << theme::kv("Namespace", zk.lock_namespace.empty() ? "(none)" : zk.lock_namespace);
    std::cout << theme::kv("Log", zklock_log_path());

    if (zk.hosts.empty()) {
        std::cout << theme::info("Locking disabled: no hosts configured.");
        return 0;
    }

    std::cout << theme::section("Session");
    try {
        ConnectionManager().run([] {
            ConnectionManager().get_client();
        });
        std::cout << theme::ok("Connected");
        return 0;
    } catch (const RemoteLockError& e) {
        std::cout << theme::fail(e.what());
        return 1;
    }
}

int ZklockCLI::run_init() {
    if (global_config_exists()) {
        std::cout << theme::info("Config already exists: " + get_global_config_path().string());
        return 0;
    }
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return EXIT_CONFIG_ERROR;
    }
    std::cout << theme::ok("Wrote " + get_global_config_path().string());
    std::cout << theme::step("Set zookeeper.hosts and zookeeper.namespace to enable locking.");
    return 0;
}

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::blue("    zklock run ") << theme::dim("[options] KEY -- COMMAND...") << "\n"
              << theme::dim("        Run COMMAND while holding the distributed lock KEY") << "\n"
              << theme::dim("        --param NAME=VALUE   fill a {NAME} placeholder in KEY") << "\n"
              << theme::dim("        --timeout SECS       give up after SECS (exit 75)") << "\n"
              << theme::dim("        --no-wait            fail at once if the lock is held (exit 75)") << "\n";
    std::cout << theme::blue("    zklock migrate ") << theme::dim("[options] -- COMMAND...") << "\n"
              << theme::dim("        Run a schema migration command under the 'migrations' lock") << "\n"
              << theme::dim("        --check CMD          shell command, non-zero exit = pending") << "\n"
              << theme::dim("        --database NAME --app LABEL --migration NAME") << "\n"
              << theme::dim("        --settings MODULE --fake --fake-initial --run-syncdb") << "\n";
    std::cout << theme::blue("    zklock init") << "\n"
              << theme::dim("        Write a default ~/.zklock/config.yaml") << "\n";
    std::cout << theme::blue("    zklock status ") << theme::dim("[--config PATH]") << "\n"
              << theme::dim("        Show configuration and test the session") << "\n";
    std::cout << "\n"
              << theme::dim("    All commands accept --config PATH (default: ~/.zklock/config.yaml + ./zklock.yaml)")
              << "\n\n";
}
