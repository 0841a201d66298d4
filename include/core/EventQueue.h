#ifndef EVENT_QUEUE_H
#define EVENT_QUEUE_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include "LoggingMacros.h"
#include "core/QueueMetrics.h"
#include "config/ClimateConstants.h"

/**
 * @brief Bounded FIFO with overflow handling and metrics
 *
 * Single-threaded counterpart of the managed queues: the scheduler is the
 * only producer/consumer, so no locking is involved.
 *
 * @tparam T Item type, stored by value
 */
template<typename T>
class EventQueue {
public:
    enum class OverflowStrategy {
        DROP_OLDEST,      // Drop oldest item (default)
        DROP_NEWEST       // Reject the new item
    };

    EventQueue(const std::string& name, size_t length,
               OverflowStrategy strategy = OverflowStrategy::DROP_OLDEST)
        : name_(name)
        , length_(length)
        , strategy_(strategy)
        , warned_(false) {
    }

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /**
     * @brief Enqueue an item
     * @return false if the item itself was dropped
     */
    bool send(const T& item) {
        if (items_.size() >= length_) {
            metrics_.recordDrop(QueueMetrics::DropReason::QUEUE_FULL);
            if (strategy_ == OverflowStrategy::DROP_NEWEST) {
                LOG_WARN(name_.c_str(), "Queue full (%u), dropping new item",
                         static_cast<unsigned>(length_));
                return false;
            }
            LOG_WARN(name_.c_str(), "Queue full (%u), dropping oldest item",
                     static_cast<unsigned>(length_));
            items_.pop_front();
        }

        items_.push_back(item);
        metrics_.recordSend(items_.size());

        size_t threshold = length_ * ClimateConstants::Queue::WARNING_THRESHOLD_PERCENT / 100;
        if (!warned_ && items_.size() >= threshold) {
            LOG_WARN(name_.c_str(), "Queue %u%% full", static_cast<unsigned>(items_.size() * 100 / length_));
            warned_ = true;
        } else if (items_.size() < threshold / 2) {
            warned_ = false;
        }
        return true;
    }

    /**
     * @brief Dequeue the oldest item
     * @return false if the queue is empty
     */
    bool receive(T& item) {
        if (items_.empty()) {
            return false;
        }
        item = items_.front();
        items_.pop_front();
        metrics_.recordReceive();
        return true;
    }

    /**
     * @brief Drop every queued item matching the predicate
     * @return Number of items removed
     */
    template<typename Predicate>
    size_t purge(Predicate pred) {
        size_t removed = 0;
        for (auto it = items_.begin(); it != items_.end();) {
            if (pred(*it)) {
                it = items_.erase(it);
                metrics_.recordDrop(QueueMetrics::DropReason::ENTITY_REMOVED);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() { items_.clear(); }

    size_t getMessagesWaiting() const { return items_.size(); }
    size_t getSpacesAvailable() const { return length_ - items_.size(); }
    bool isEmpty() const { return items_.empty(); }
    bool isFull() const { return items_.size() >= length_; }

    const QueueMetrics& getMetrics() const { return metrics_; }
    void resetMetrics() { metrics_.reset(); }
    const std::string& getName() const { return name_; }

private:
    std::string name_;
    size_t length_;
    OverflowStrategy strategy_;
    std::deque<T> items_;
    QueueMetrics metrics_;
    bool warned_;
};

#endif // EVENT_QUEUE_H
