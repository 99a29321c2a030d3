#include "trader/coordinators/event_distributor.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace OkxTrader::Core;

namespace {

const std::chrono::milliseconds SHORT_WAIT(50);
const std::chrono::milliseconds LONG_WAIT(2000);

Tick make_tick(double price) {
    Tick tick;
    tick.symbol = "BTC-USDT-SWAP";
    tick.price = price;
    return tick;
}

Signal make_signal(SignalAction action, long long timestamp_ms) {
    Signal signal;
    signal.action = action;
    signal.timestamp_ms = timestamp_ms;
    return signal;
}

} // anonymous namespace

TEST(EventDistributorTest, LossyChannelDropsOldestTicks) {
    EventDistributor distributor;
    EXPECT_EQ(distributor.tick_channel.get_policy(), DeliveryPolicy::DROP_OLDEST);
    EXPECT_EQ(distributor.signal_channel.get_policy(), DeliveryPolicy::BLOCK_UNTIL_SPACE);
    auto tick_subscription = distributor.tick_channel.subscribe(3);

    for (int price = 1; price <= 5; ++price) {
        EXPECT_EQ(distributor.tick_channel.publish(make_tick(price)), 1u);
    }

    EXPECT_EQ(tick_subscription->get_dropped_count(), 2u);
    EXPECT_EQ(distributor.tick_channel.get_total_dropped_count(), 2u);

    std::vector<double> received_prices;
    Tick tick;
    while (tick_subscription->try_pop(tick)) {
        received_prices.push_back(tick.price);
    }
    EXPECT_EQ(received_prices, (std::vector<double>{3.0, 4.0, 5.0}));
}

TEST(EventDistributorTest, LosslessChannelNeverDropsSignals) {
    EventDistributor distributor;
    auto signal_subscription = distributor.signal_channel.subscribe(2);
    const int signal_count = 20;

    std::thread publisher_thread([&distributor, signal_count]() {
        for (int signal_index = 0; signal_index < signal_count; ++signal_index) {
            SignalAction action = signal_index % 2 == 0 ? SignalAction::BUY : SignalAction::SELL;
            distributor.signal_channel.publish(make_signal(action, signal_index));
        }
    });

    std::vector<long long> received_timestamps;
    Signal signal;
    while (static_cast<int>(received_timestamps.size()) < signal_count &&
           signal_subscription->wait_and_pop(signal, LONG_WAIT)) {
        received_timestamps.push_back(signal.timestamp_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    publisher_thread.join();

    ASSERT_EQ(static_cast<int>(received_timestamps.size()), signal_count);
    for (int signal_index = 0; signal_index < signal_count; ++signal_index) {
        EXPECT_EQ(received_timestamps[static_cast<size_t>(signal_index)], signal_index);
    }
    EXPECT_EQ(distributor.signal_channel.get_total_dropped_count(), 0u);
}

TEST(EventDistributorTest, CloseReleasesBlockedPublisher) {
    EventDistributor distributor;
    auto bar_subscription = distributor.completed_bar_channel.subscribe(1);
    distributor.completed_bar_channel.publish(Bar());

    std::atomic<bool> publish_returned{false};
    size_t delivered_count = 1;
    std::thread publisher_thread([&]() {
        delivered_count = distributor.completed_bar_channel.publish(Bar());
        publish_returned.store(true);
    });

    std::this_thread::sleep_for(SHORT_WAIT);
    EXPECT_FALSE(publish_returned.load());

    distributor.close_all();
    publisher_thread.join();
    EXPECT_TRUE(publish_returned.load());
    EXPECT_EQ(delivered_count, 0u);
}

TEST(EventDistributorTest, ClosedSubscriptionDrainsThenReportsEnd) {
    EventChannel<Signal> channel("signals", DeliveryPolicy::BLOCK_UNTIL_SPACE);
    auto subscription = channel.subscribe(4);
    channel.publish(make_signal(SignalAction::BUY, 1));
    channel.close_all();

    Signal signal;
    EXPECT_TRUE(subscription->wait_and_pop(signal, SHORT_WAIT));
    EXPECT_EQ(signal.timestamp_ms, 1);
    EXPECT_FALSE(subscription->wait_and_pop(signal, SHORT_WAIT));
    EXPECT_TRUE(subscription->is_closed());
    EXPECT_EQ(channel.publish(make_signal(SignalAction::SELL, 2)), 0u);
}

TEST(EventDistributorTest, EverySubscriberSeesEveryEventInOrder) {
    EventChannel<Tick> channel("ticks", DeliveryPolicy::DROP_OLDEST);
    auto first_subscription = channel.subscribe(8);
    auto second_subscription = channel.subscribe(8);
    EXPECT_EQ(channel.subscriber_count(), 2u);

    channel.publish(make_tick(1.0));
    channel.publish(make_tick(2.0));

    Tick tick;
    for (const auto& subscription : {first_subscription, second_subscription}) {
        ASSERT_TRUE(subscription->try_pop(tick));
        EXPECT_DOUBLE_EQ(tick.price, 1.0);
        ASSERT_TRUE(subscription->try_pop(tick));
        EXPECT_DOUBLE_EQ(tick.price, 2.0);
    }
}

TEST(EventDistributorTest, WaitTimesOutOnEmptyQueue) {
    EventChannel<Tick> channel("ticks", DeliveryPolicy::DROP_OLDEST);
    auto subscription = channel.subscribe(1);
    Tick tick;
    EXPECT_FALSE(subscription->wait_and_pop(tick, SHORT_WAIT));
    EXPECT_FALSE(subscription->is_closed());
}

TEST(EventDistributorTest, RejectsZeroCapacity) {
    EventChannel<Tick> channel("ticks", DeliveryPolicy::DROP_OLDEST);
    EXPECT_THROW(channel.subscribe(0), std::invalid_argument);
}
