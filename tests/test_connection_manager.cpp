#include <gtest/gtest.h>
#include <thread>
#include <connection/connection_manager.hpp>
#include <core/errors.hpp>
#include "fake_client.hpp"

class ConnectionManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeCoordinator> zk = std::make_shared<FakeCoordinator>();
    ConnectionManager manager;

    void SetUp() override { install_fake_coordinator(zk); }
    void TearDown() override { Settings::instance().reset(); }
};

TEST_F(ConnectionManagerTest, ScopeMarksThreadManaged) {
    EXPECT_FALSE(manager.is_managed());
    {
        ConnectionScope scope;
        EXPECT_TRUE(manager.is_managed());
    }
    EXPECT_FALSE(manager.is_managed());
}

TEST_F(ConnectionManagerTest, NestedScopes) {
    {
        ConnectionScope outer;
        {
            ConnectionScope inner;
            EXPECT_TRUE(manager.is_managed());
            EXPECT_EQ(manager.reference_count(), 2);
        }
        EXPECT_TRUE(manager.is_managed());
    }
    EXPECT_FALSE(manager.is_managed());
}

TEST_F(ConnectionManagerTest, RunWrapsCallInScope) {
    EXPECT_FALSE(manager.is_managed());
    int result = manager.run([&] {
        EXPECT_TRUE(manager.is_managed());
        return 7;
    });
    EXPECT_EQ(result, 7);
    EXPECT_FALSE(manager.is_managed());
}

TEST_F(ConnectionManagerTest, GetClientOutsideScopeThrows) {
    try {
        manager.get_client();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_STREQ(e.what(), "Use ConnectionManager within an active connection scope.");
    }
    EXPECT_FALSE(manager.has_client());
    EXPECT_EQ(zk->clients_created, 0);
}

TEST_F(ConnectionManagerTest, ExitWithoutEnterThrows) {
    try {
        manager.exit_scope();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_STREQ(e.what(), "Calling exit_scope before enter_scope.");
    }
    EXPECT_EQ(manager.reference_count(), 0);
}

TEST_F(ConnectionManagerTest, ClientCreatedOnceAndStoppedAtOutermostExit) {
    {
        ConnectionScope outer;
        auto& client = manager.get_client();
        EXPECT_TRUE(manager.has_client());
        EXPECT_TRUE(client.is_started());
        EXPECT_EQ(&manager.get_client(), &client);
        {
            ConnectionScope inner;
            EXPECT_EQ(&manager.get_client(), &client);
            EXPECT_TRUE(client.is_started());
        }
        EXPECT_TRUE(client.is_started());
        EXPECT_EQ(zk->start_calls, 1);
        EXPECT_EQ(zk->stop_calls, 0);
    }
    EXPECT_FALSE(manager.has_client());
    EXPECT_EQ(zk->stop_calls, 1);

    {
        ConnectionScope scope;
        manager.get_client();
    }
    EXPECT_EQ(zk->clients_created, 2);
    EXPECT_EQ(zk->start_calls, 2);
}

TEST_F(ConnectionManagerTest, ScopeWithoutClientNeverConnects) {
    {
        ConnectionScope scope;
    }
    EXPECT_EQ(zk->clients_created, 0);
    EXPECT_EQ(zk->stop_calls, 0);
}

TEST_F(ConnectionManagerTest, SessionClosedInOutermostScopeDoesNotRestart) {
    EXPECT_THROW(manager.run([&] {
        manager.get_client();
        throw SessionClosed();
    }), SessionClosed);
    EXPECT_EQ(zk->restart_calls, 0);
    EXPECT_FALSE(manager.has_client());
}

TEST_F(ConnectionManagerTest, SessionClosedWithoutClientDoesNotRestart) {
    EXPECT_THROW(manager.run([&] {
        manager.run([] { throw SessionClosed(); });
    }), SessionClosed);
    EXPECT_EQ(zk->restart_calls, 0);
    EXPECT_EQ(zk->clients_created, 0);
}

TEST_F(ConnectionManagerTest, SessionClosedInNestedScopeRestartsClient) {
    EXPECT_THROW(manager.run([&] {
        manager.run([&] {
            manager.get_client();
            throw SessionClosed();
        });
    }), SessionClosed);
    EXPECT_EQ(zk->restart_calls, 1);
    EXPECT_FALSE(manager.is_managed());
    EXPECT_FALSE(manager.has_client());
}

TEST_F(ConnectionManagerTest, OtherErrorsLeaveClientAlone) {
    EXPECT_THROW(manager.run([&] {
        manager.run([&] {
            manager.get_client();
            throw std::runtime_error("boom");
        });
    }), std::runtime_error);
    EXPECT_EQ(zk->restart_calls, 0);
    EXPECT_EQ(zk->stop_calls, 1);
    EXPECT_EQ(manager.reference_count(), 0);
}

TEST_F(ConnectionManagerTest, MovedScopeExitsOnce) {
    {
        ConnectionScope first;
        ConnectionScope second(std::move(first));
        EXPECT_FALSE(first.active());
        EXPECT_TRUE(second.active());
        EXPECT_EQ(manager.reference_count(), 1);
    }
    EXPECT_EQ(manager.reference_count(), 0);
}

TEST_F(ConnectionManagerTest, ThreadsHaveIndependentState) {
    ConnectionScope scope;
    auto& mine = manager.get_client();

    RemoteLockClient* theirs = nullptr;
    bool managed_on_start = true;
    std::thread worker([&] {
        ConnectionManager other;
        managed_on_start = other.is_managed();
        other.run([&] { theirs = &other.get_client(); });
    });
    worker.join();

    EXPECT_FALSE(managed_on_start);
    EXPECT_NE(theirs, &mine);
    EXPECT_EQ(zk->clients_created, 2);
    EXPECT_TRUE(manager.is_managed());
}

TEST_F(ConnectionManagerTest, MissingFactoryIsConfigurationError) {
    Settings::instance().reset();
    ConnectionScope scope;
    EXPECT_THROW(manager.get_client(), ConfigurationError);
    EXPECT_FALSE(manager.has_client());
}

TEST_F(ConnectionManagerTest, ScopeClosedOnAnotherThreadExitsOwnersState) {
    ConnectionScope scope;
    scope.client();
    EXPECT_EQ(manager.reference_count(), 1);

    std::thread other([s = std::move(scope)]() mutable {
        EXPECT_EQ(ConnectionManager().reference_count(), 0);
        s.close();
        EXPECT_EQ(ConnectionManager().reference_count(), 0);
    });
    other.join();

    EXPECT_EQ(manager.reference_count(), 0);
    EXPECT_FALSE(manager.has_client());
    EXPECT_EQ(zk->stop_calls, 1);
}
