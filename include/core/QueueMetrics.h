#ifndef QUEUE_METRICS_H
#define QUEUE_METRICS_H

#include <cstdint>
#include <cstddef>

/**
 * @brief Queue usage statistics
 */
class QueueMetrics {
public:
    enum class DropReason {
        QUEUE_FULL,
        ENTITY_REMOVED
    };

    QueueMetrics() { reset(); }

    void recordSend(size_t queueDepth) {
        totalSent_++;
        if (queueDepth > highWaterMark_) {
            highWaterMark_ = queueDepth;
        }
    }

    void recordReceive() { totalReceived_++; }

    void recordDrop(DropReason reason) {
        totalDropped_++;
        if (reason == DropReason::QUEUE_FULL) {
            overflowCount_++;
        } else {
            purgedCount_++;
        }
    }

    void reset() {
        totalSent_ = 0;
        totalReceived_ = 0;
        totalDropped_ = 0;
        overflowCount_ = 0;
        purgedCount_ = 0;
        highWaterMark_ = 0;
    }

    uint32_t getTotalSent() const { return totalSent_; }
    uint32_t getTotalReceived() const { return totalReceived_; }
    uint32_t getTotalDropped() const { return totalDropped_; }
    uint32_t getOverflowCount() const { return overflowCount_; }
    uint32_t getPurgedCount() const { return purgedCount_; }
    size_t getHighWaterMark() const { return highWaterMark_; }

private:
    uint32_t totalSent_;
    uint32_t totalReceived_;
    uint32_t totalDropped_;
    uint32_t overflowCount_;
    uint32_t purgedCount_;
    size_t highWaterMark_;
};

#endif // QUEUE_METRICS_H
