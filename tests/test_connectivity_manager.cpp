#include "utils/connectivity_manager.hpp"
#include <gtest/gtest.h>

using Status = ConnectivityManager::ConnectionStatus;

TEST(ConnectivityManagerTest, BackoffGrowsGeometrically) {
    ConnectivityManager connectivity_manager(3, 1000, 1.5);

    ASSERT_TRUE(connectivity_manager.begin_connect_attempt());
    auto first_outcome = connectivity_manager.report_failure("refused");
    EXPECT_FALSE(first_outcome.exhausted);
    EXPECT_EQ(first_outcome.retry_delay_milliseconds, 1000);
    EXPECT_EQ(connectivity_manager.get_retry_delay_milliseconds(), 1000);
    EXPECT_EQ(connectivity_manager.get_status(), Status::BACKING_OFF);

    ASSERT_TRUE(connectivity_manager.begin_connect_attempt());
    EXPECT_EQ(connectivity_manager.report_failure("refused").retry_delay_milliseconds, 1500);

    ASSERT_TRUE(connectivity_manager.begin_connect_attempt());
    EXPECT_EQ(connectivity_manager.report_failure("refused").retry_delay_milliseconds, 2250);
}

TEST(ConnectivityManagerTest, FailureBeyondMaximumIsTerminal) {
    ConnectivityManager connectivity_manager(3, 1000, 1.5);

    for (int attempt = 0; attempt < 3; ++attempt) {
        ASSERT_TRUE(connectivity_manager.begin_connect_attempt());
        ASSERT_FALSE(connectivity_manager.report_failure("timeout").exhausted);
    }

    ASSERT_TRUE(connectivity_manager.begin_connect_attempt());
    auto final_outcome = connectivity_manager.report_failure("timeout");
    EXPECT_TRUE(final_outcome.exhausted);
    EXPECT_EQ(final_outcome.retry_delay_milliseconds, 0);
    EXPECT_TRUE(connectivity_manager.is_failed());
    EXPECT_FALSE(connectivity_manager.begin_connect_attempt());

    connectivity_manager.report_subscribed();
    EXPECT_EQ(connectivity_manager.get_status(), Status::FAILED);
}

TEST(ConnectivityManagerTest, SubscriptionResetsAttemptCount) {
    ConnectivityManager connectivity_manager(3, 1000, 2.0);

    connectivity_manager.begin_connect_attempt();
    connectivity_manager.report_failure("reset by peer");
    connectivity_manager.begin_connect_attempt();
    connectivity_manager.report_failure("reset by peer");
    EXPECT_EQ(connectivity_manager.get_consecutive_failures(), 2);

    connectivity_manager.begin_connect_attempt();
    connectivity_manager.report_connected();
    EXPECT_EQ(connectivity_manager.get_consecutive_failures(), 2);
    connectivity_manager.report_subscribed();
    EXPECT_EQ(connectivity_manager.get_consecutive_failures(), 0);
    EXPECT_EQ(connectivity_manager.get_status(), Status::CONNECTED);

    connectivity_manager.begin_connect_attempt();
    EXPECT_EQ(connectivity_manager.report_failure("pong timeout").retry_delay_milliseconds, 1000);
}

TEST(ConnectivityManagerTest, RejectsInvalidSettings) {
    EXPECT_THROW(ConnectivityManager(0, 1000, 1.5), std::runtime_error);
    EXPECT_THROW(ConnectivityManager(3, 0, 1.5), std::runtime_error);
    EXPECT_THROW(ConnectivityManager(3, 1000, 0.5), std::runtime_error);
}
