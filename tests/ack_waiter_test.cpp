/**
 * @file ack_waiter_test.cpp
 * @brief Unit tests for per-item acknowledgement waits
 */

#include "peersync/AckWaiter.h"
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace PeerSync;

using std::chrono::milliseconds;

TEST(AckWaiterTest, ResolvedBeforeWaitIsReturned) {
    AckWaiter waiter;
    waiter.arm("record_ack", "nbp-a-1");
    EXPECT_TRUE(waiter.isArmed());

    const nlohmann::json ack = {{"type", "record_ack"}, {"uuid", "nbp-a-1"}};
    EXPECT_TRUE(waiter.resolve("record_ack", "nbp-a-1", ack));

    nlohmann::json out;
    EXPECT_EQ(waiter.wait(milliseconds(10), out), AckResult::Received);
    EXPECT_EQ(out, ack);
    EXPECT_FALSE(waiter.isArmed());
}

TEST(AckWaiterTest, ResolvedFromAnotherThread) {
    AckWaiter waiter;
    waiter.arm("character_ack", "Mira");

    std::thread resolver([&waiter] {
        std::this_thread::sleep_for(milliseconds(20));
        waiter.resolve("character_ack", "Mira", {{"name", "Mira"}});
    });

    nlohmann::json out;
    EXPECT_EQ(waiter.wait(milliseconds(5000), out), AckResult::Received);
    EXPECT_EQ(out["name"], "Mira");
    resolver.join();
}

TEST(AckWaiterTest, MismatchedAcksAreIgnored) {
    AckWaiter waiter;
    EXPECT_FALSE(waiter.resolve("record_ack", "nbp-a-1", {}));

    waiter.arm("record_ack", "nbp-a-2");
    EXPECT_FALSE(waiter.resolve("record_ack", "nbp-a-1", {}));
    EXPECT_FALSE(waiter.resolve("character_ack", "nbp-a-2", {}));

    nlohmann::json out;
    EXPECT_EQ(waiter.wait(milliseconds(20), out), AckResult::TimedOut);

    // A late ack after the wait gave up has no slot to land in
    EXPECT_FALSE(waiter.resolve("record_ack", "nbp-a-2", {}));
}

TEST(AckWaiterTest, CancelReportsConnectionClosed) {
    AckWaiter waiter;
    waiter.arm("transfer_ack", "");

    std::thread canceller([&waiter] {
        std::this_thread::sleep_for(milliseconds(20));
        waiter.cancel();
    });

    nlohmann::json out;
    EXPECT_EQ(waiter.wait(milliseconds(10000), out), AckResult::ConnectionClosed);
    canceller.join();

    // Stays cancelled until reset
    waiter.arm("transfer_ack", "");
    EXPECT_EQ(waiter.wait(milliseconds(10000), out), AckResult::ConnectionClosed);

    waiter.reset();
    waiter.arm("transfer_ack", "");
    EXPECT_EQ(waiter.wait(milliseconds(10), out), AckResult::TimedOut);
}

TEST(AckWaiterTest, ReceivedWinsOverCancel) {
    AckWaiter waiter;
    waiter.arm("record_ack", "nbp-a-1");
    waiter.resolve("record_ack", "nbp-a-1", {{"uuid", "nbp-a-1"}});
    waiter.cancel();

    nlohmann::json out;
    EXPECT_EQ(waiter.wait(milliseconds(10), out), AckResult::Received);
}
