#ifndef BOUNDED_SERIES_HPP
#define BOUNDED_SERIES_HPP

#include <deque>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace OkxTrader {
namespace Core {

/**
 * Most recent N values of a series, oldest first.
 * Pushing beyond capacity evicts from the front.
 */
template <typename T>
class BoundedSeries {
public:
    explicit BoundedSeries(int capacity_value) : capacity(capacity_value) {
        if (capacity_value <= 0) {
            throw std::invalid_argument("BoundedSeries capacity must be positive, got " + std::to_string(capacity_value));
        }
    }

    void push(const T& value) {
        values_deque.push_back(value);
        while (values_deque.size() > static_cast<size_t>(capacity)) {
            values_deque.pop_front();
        }
    }

    const std::deque<T>& values() const { return values_deque; }
    const T& back() const { return values_deque.back(); }
    size_t size() const { return values_deque.size(); }
    bool empty() const { return values_deque.empty(); }
    int get_capacity() const { return capacity; }
    void clear() { values_deque.clear(); }

private:
    int capacity;
    std::deque<T> values_deque;
};

} // namespace Core
} // namespace OkxTrader

#endif // BOUNDED_SERIES_HPP
