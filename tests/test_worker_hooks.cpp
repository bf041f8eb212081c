#include <gtest/gtest.h>
#include <thread>
#include <connection/connection_manager.hpp>
#include <integration/worker_hooks.hpp>
#include <locks/lock.hpp>
#include "fake_client.hpp"

class WorkerHooksTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeCoordinator> zk = std::make_shared<FakeCoordinator>();

    void SetUp() override { install_fake_coordinator(zk); }
    void TearDown() override { Settings::instance().reset(); }
};

TEST_F(WorkerHooksTest, InitializerKeepsOneSessionAcrossTasks) {
    std::thread worker([&] {
        worker_connection_initializer();
        ConnectionManager manager;
        EXPECT_TRUE(manager.is_managed());

        Lock lock("worker-task");
        lock.run([] {});
        lock.run([] {});
        EXPECT_TRUE(manager.has_client());

        worker_connection_finalizer();
        EXPECT_FALSE(manager.is_managed());
        EXPECT_FALSE(manager.has_client());
    });
    worker.join();
    EXPECT_EQ(zk->clients_created, 1);
    EXPECT_EQ(zk->start_calls, 1);
    EXPECT_EQ(zk->stop_calls, 1);
}

TEST_F(WorkerHooksTest, ThreadExitRunsFinalizer) {
    std::thread worker([&] {
        worker_connection_initializer();
        ConnectionManager manager;
        manager.run([&] { manager.get_client(); });
    });
    worker.join();
    EXPECT_EQ(zk->start_calls, 1);
    EXPECT_EQ(zk->stop_calls, 1);
}

TEST_F(WorkerHooksTest, RepeatedInitializerBorrowsOnce) {
    std::thread worker([&] {
        worker_connection_initializer();
        worker_connection_initializer();
        EXPECT_EQ(ConnectionManager().reference_count(), 1);
        worker_connection_finalizer();
        worker_connection_finalizer();
        EXPECT_EQ(ConnectionManager().reference_count(), 0);
    });
    worker.join();
}
