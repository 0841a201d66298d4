#ifndef WINDOW_TRACKER_H
#define WINDOW_TRACKER_H

#include <cstdint>

/**
 * @brief Open-window suspension with warm-up delay after closing
 *
 * Heating resumes once the window has stayed closed for
 * ClimateConfig::windowWarmupMs. Re-opening cancels a pending warm-up.
 */
class WindowTracker {
public:
    WindowTracker();

    /**
     * @return true if the open state changed
     */
    bool setOpen(bool open, uint32_t nowMs);

    /**
     * @brief true if the window is closed and no warm-up is pending
     *
     * Clears an elapsed warm-up as a side effect.
     */
    bool shouldHeat(uint32_t nowMs);

    bool isOpen() const { return open_; }
    bool isWarmupPending() const { return warmupPending_; }

private:
    bool open_;
    bool warmupPending_;
    uint32_t closedAt_;
};

#endif // WINDOW_TRACKER_H
