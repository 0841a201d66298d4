#ifndef ONLINE_TRACKER_H
#define ONLINE_TRACKER_H

#include <cstdint>

/**
 * @brief Debounces an "online" input with a grace period
 *
 * An offline report only counts once it has persisted for
 * ClimateConfig::boilerOfflineGraceMs; with a grace of 0 it counts at once.
 * Any online report counts immediately.
 */
class OnlineTracker {
public:
    explicit OnlineTracker(const char* name);

    /**
     * @brief Feed the raw input
     * @return true while the input is considered online
     */
    bool update(bool onlineRaw, uint32_t nowMs);

    bool isOnline() const { return online_; }
    bool isOfflinePending() const { return offlinePending_; }

private:
    const char* name_;
    bool online_;
    bool offlinePending_;
    uint32_t offlineSince_;
};

#endif // ONLINE_TRACKER_H
