#include <gtest/gtest.h>
#include <thread>
#include <atomic>
#include <csignal>
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, ProgrammaticShutdownUnblocksWait)
{
    auto &mgr = ShutdownManager::getInstance();

    std::atomic<bool> unblocked{false};
    std::thread waiter([&]()
                       {
        mgr.waitForShutdown(std::chrono::milliseconds(10));
        unblocked.store(true); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    mgr.requestShutdown("unit-test");

    waiter.join();
    ASSERT_TRUE(unblocked.load());
    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), 0);
    ASSERT_EQ(mgr.getReason(), "unit-test");
}

TEST_F(ShutdownManagerTest, FirstRequestWins)
{
    auto &mgr = ShutdownManager::getInstance();

    mgr.requestShutdown("listen failed");
    mgr.requestShutdown("test-signal", SIGTERM);

    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getReason(), "listen failed");
    ASSERT_EQ(mgr.getSignalNumber(), 0);
}

TEST_F(ShutdownManagerTest, WaitReturnsImmediatelyWhenAlreadyRequested)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("early");

    const auto start = std::chrono::steady_clock::now();
    mgr.waitForShutdown(std::chrono::milliseconds(5000));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST_F(ShutdownManagerTest, DeliveredSignalTriggersShutdown)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.installSignalHandlers();

    std::raise(SIGQUIT);
    mgr.waitForShutdown(std::chrono::milliseconds(10));

    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), SIGQUIT);
    EXPECT_EQ(mgr.getReason(), "Signal received");

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGQUIT, SIG_DFL);
}

TEST_F(ShutdownManagerTest, ResetClearsState)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("done", SIGINT);
    mgr.reset();

    EXPECT_FALSE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    EXPECT_TRUE(mgr.getReason().empty());
}
