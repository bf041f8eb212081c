#include <gtest/gtest.h>
#include <sstream>
#include <connection/connection_manager.hpp>
#include <core/errors.hpp>
#include <integration/migration_guard.hpp>
#include "fake_client.hpp"

class RecordingExecutor : public MigrationExecutor {
public:
    enum class Plan { Pending, Empty, Unconfigured };

    Plan plan = Plan::Pending;
    int applied = 0;
    bool held_during_apply = false;
    Lock* watched = nullptr;

    bool has_unapplied_migrations(const MigrateOptions&) override {
        if (plan == Plan::Unconfigured) throw ConfigurationError("no database");
        return plan == Plan::Pending;
    }

    void apply(const MigrateOptions&) override {
        applied++;
        if (watched) held_during_apply = watched->is_held();
    }
};

class MigrationGuardTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeCoordinator> zk = std::make_shared<FakeCoordinator>();
    RecordingExecutor executor;
    std::ostringstream out;

    void SetUp() override { install_fake_coordinator(zk); }
    void TearDown() override { Settings::instance().reset(); }
};

TEST_F(MigrationGuardTest, UsesDefaultLock) {
    MigrationGuard guard(executor, out);
    EXPECT_EQ(guard.lock().key(), "migrations");
    executor.plan = RecordingExecutor::Plan::Unconfigured;
    executor.watched = &guard.lock();

    EXPECT_EQ(guard.handle(), MigrationGuard::Outcome::Guarded);
    EXPECT_EQ(executor.applied, 1);
    EXPECT_TRUE(executor.held_during_apply);
    EXPECT_EQ(zk->paths(), std::vector<std::string>{"/locks/zklock-test-app/migrations"});
    EXPECT_NE(out.str().find("Potential data migration will be assisted by Zookeeper locks."),
              std::string::npos);
}

TEST_F(MigrationGuardTest, UsesProvidedLock) {
    Lock lock("test-lock");
    MigrationGuard guard(executor, out, &lock);
    EXPECT_EQ(&guard.lock(), &lock);
    executor.watched = &lock;

    EXPECT_EQ(guard.handle(), MigrationGuard::Outcome::Guarded);
    EXPECT_TRUE(executor.held_during_apply);
    EXPECT_EQ(zk->paths(), std::vector<std::string>{"/locks/zklock-test-app/test-lock"});
}

TEST_F(MigrationGuardTest, NoHostsRunsUnguarded) {
    install_fake_coordinator(zk, {});
    MigrationGuard guard(executor, out);
    executor.watched = &guard.lock();

    EXPECT_EQ(guard.handle(), MigrationGuard::Outcome::Unguarded);
    EXPECT_EQ(executor.applied, 1);
    EXPECT_FALSE(executor.held_during_apply);
    EXPECT_EQ(zk->clients_created, 0);
    EXPECT_NE(out.str().find("Zookeeper locks will not protect current data migration process."),
              std::string::npos);
}

TEST_F(MigrationGuardTest, NothingToApplySkips) {
    executor.plan = RecordingExecutor::Plan::Empty;
    MigrationGuard guard(executor, out);

    EXPECT_EQ(guard.handle(), MigrationGuard::Outcome::Skipped);
    EXPECT_EQ(executor.applied, 0);
    EXPECT_EQ(zk->clients_created, 0);
    EXPECT_NE(out.str().find("No migrations to apply."), std::string::npos);
}

TEST_F(MigrationGuardTest, TargetedRunAlwaysApplies) {
    executor.plan = RecordingExecutor::Plan::Empty;
    MigrationGuard guard(executor, out);
    MigrateOptions options;
    options.app_label = "billing";

    EXPECT_EQ(guard.handle(options), MigrationGuard::Outcome::Guarded);
    EXPECT_EQ(executor.applied, 1);
}

TEST_F(MigrationGuardTest, BusyLockPropagates) {
    zk->outcome = FakeCoordinator::Outcome::Timeout;
    MigrationGuard guard(executor, out);
    EXPECT_THROW(guard.handle(), LockTimeout);
    EXPECT_EQ(executor.applied, 0);
}

TEST(MigrateOptions, LaunchedWithDefaults) {
    MigrateOptions options;
    EXPECT_TRUE(options.launched_with_defaults());
    options.database = "replica";
    EXPECT_FALSE(options.launched_with_defaults());
    options = MigrateOptions{};
    options.fake = true;
    EXPECT_FALSE(options.launched_with_defaults());
}
