#ifndef EVENT_DISTRIBUTOR_HPP
#define EVENT_DISTRIBUTOR_HPP

#include "trader/data_structures/data_structures.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace OkxTrader {
namespace Core {

enum class DeliveryPolicy {
    DROP_OLDEST,            // full queue evicts its oldest event, publisher never blocks
    BLOCK_UNTIL_SPACE       // full queue blocks the publisher until space or close
};

/**
 * One subscriber's bounded queue.
 */
template <typename T>
class EventSubscription {
public:
    EventSubscription(size_t capacity_value, DeliveryPolicy policy_value)
        : capacity(capacity_value), policy(policy_value), closed(false), dropped_count(0) {
        if (capacity_value == 0) {
            throw std::invalid_argument("EventSubscription capacity must be positive");
        }
    }

    EventSubscription(const EventSubscription&) = delete;
    EventSubscription& operator=(const EventSubscription&) = delete;

    // Returns false when the subscription is closed and the event was not queued.
    bool push(const T& event) {
        std::unique_lock<std::mutex> queue_lock(queue_mutex);
        if (closed) {
            return false;
        }

        if (queue.size() >= capacity) {
            if (policy == DeliveryPolicy::DROP_OLDEST) {
                queue.pop_front();
                dropped_count++;
            } else {
                not_full_cv.wait(queue_lock, [this]() { return closed || queue.size() < capacity; });
                if (closed) {
                    return false;
                }
            }
        }

        queue.push_back(event);
        queue_lock.unlock();
        not_empty_cv.notify_one();
        return true;
    }

    // Returns false on timeout, or once closed and drained.
    bool wait_and_pop(T& event, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> queue_lock(queue_mutex);
        if (!not_empty_cv.wait_for(queue_lock, timeout, [this]() { return closed || !queue.empty(); })) {
            return false;
        }
        if (queue.empty()) {
            return false;
        }
        event = queue.front();
        queue.pop_front();
        queue_lock.unlock();
        not_full_cv.notify_one();
        return true;
    }

    bool try_pop(T& event) {
        std::unique_lock<std::mutex> queue_lock(queue_mutex);
        if (queue.empty()) {
            return false;
        }
        event = queue.front();
        queue.pop_front();
        queue_lock.unlock();
        not_full_cv.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> queue_lock(queue_mutex);
            closed = true;
        }
        not_empty_cv.notify_all();
        not_full_cv.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        return closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        return queue.size();
    }

    size_t get_dropped_count() const {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        return dropped_count;
    }

    DeliveryPolicy get_policy() const { return policy; }

private:
    const size_t capacity;
    const DeliveryPolicy policy;
    mutable std::mutex queue_mutex;
    std::condition_variable not_empty_cv;
    std::condition_variable not_full_cv;
    std::deque<T> queue;
    bool closed;
    size_t dropped_count;
};

/**
 * Typed publish/subscribe channel with a fixed delivery policy.
 * publish() hands the event to every subscriber in subscription order.
 */
template <typename T>
class EventChannel {
public:
    using SubscriptionPtr = std::shared_ptr<EventSubscription<T>>;

    EventChannel(const std::string& channel_name, DeliveryPolicy policy_value)
        : name(channel_name), policy(policy_value), closed(false) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    SubscriptionPtr subscribe(size_t capacity) {
        SubscriptionPtr subscription = std::make_shared<EventSubscription<T>>(capacity, policy);
        std::lock_guard<std::mutex> subscribers_lock(subscribers_mutex);
        if (closed) {
            subscription->close();
        }
        subscribers.push_back(subscription);
        return subscription;
    }

    // Returns the number of subscribers that accepted the event.
    size_t publish(const T& event) {
        std::vector<SubscriptionPtr> subscribers_snapshot;
        {
            std::lock_guard<std::mutex> subscribers_lock(subscribers_mutex);
            subscribers_snapshot = subscribers;
        }

        size_t delivered_count = 0;
        for (const SubscriptionPtr& subscription : subscribers_snapshot) {
            if (subscription->push(event)) {
                delivered_count++;
            }
        }
        return delivered_count;
    }

    void close_all() {
        std::vector<SubscriptionPtr> subscribers_snapshot;
        {
            std::lock_guard<std::mutex> subscribers_lock(subscribers_mutex);
            closed = true;
            subscribers_snapshot = subscribers;
        }
        for (const SubscriptionPtr& subscription : subscribers_snapshot) {
            subscription->close();
        }
    }

    size_t get_total_dropped_count() const {
        std::lock_guard<std::mutex> subscribers_lock(subscribers_mutex);
        size_t total_dropped = 0;
        for (const SubscriptionPtr& subscription : subscribers) {
            total_dropped += subscription->get_dropped_count();
        }
        return total_dropped;
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> subscribers_lock(subscribers_mutex);
        return subscribers.size();
    }

    const std::string& get_name() const { return name; }
    DeliveryPolicy get_policy() const { return policy; }

private:
    const std::string name;
    const DeliveryPolicy policy;
    mutable std::mutex subscribers_mutex;
    std::vector<SubscriptionPtr> subscribers;
    bool closed;
};

// ========================================================================
// Channels shared by the stream, monitor and trader threads
// ========================================================================

struct EventDistributor {
    EventChannel<Tick> tick_channel;                    // lossy
    EventChannel<Bar> bar_update_channel;               // lossy, raw candle pushes
    EventChannel<Bar> completed_bar_channel;            // lossless
    EventChannel<Signal> signal_channel;                // lossless
    EventChannel<StreamWarning> warning_channel;        // lossy

    EventDistributor()
        : tick_channel("ticks", DeliveryPolicy::DROP_OLDEST),
          bar_update_channel("bar_updates", DeliveryPolicy::DROP_OLDEST),
          completed_bar_channel("completed_bars", DeliveryPolicy::BLOCK_UNTIL_SPACE),
          signal_channel("signals", DeliveryPolicy::BLOCK_UNTIL_SPACE),
          warning_channel("warnings", DeliveryPolicy::DROP_OLDEST) {}

    void close_all() {
        tick_channel.close_all();
        bar_update_channel.close_all();
        completed_bar_channel.close_all();
        signal_channel.close_all();
        warning_channel.close_all();
    }
};

} // namespace Core
} // namespace OkxTrader

#endif // EVENT_DISTRIBUTOR_HPP
