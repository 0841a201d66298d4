#ifndef CLIMATE_CONTROLLER_H
#define CLIMATE_CONTROLLER_H

#include <cstdint>
#include "core/ClimateRegistry.h"
#include "core/EventQueue.h"
#include "events/ClimateEvents.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Single-threaded scheduler of the control engine
 *
 * Consumes the input queue and drives one logical tick bottom-up:
 *   1. queued events (readings, commands)
 *   2. polled inputs (temperature sources, window contacts, boiler input)
 *   3. zone ticks (staleness, warm-up, integration)
 *   4. circuit recompute
 *   5. hub recompute
 * A parent never sees a partially updated child. Notifications emitted by
 * any entity land in the notification queue for the host to drain.
 */
class ClimateController {
public:
    explicit ClimateController(ClimateRegistry& registry);
    ~ClimateController();

    ClimateController(const ClimateController&) = delete;
    ClimateController& operator=(const ClimateController&) = delete;

    /**
     * @brief Queue an event for the next tick
     * @return QUEUE_FULL if the input queue has no space
     */
    Result<void> post(const ClimateEvent& event);

    /**
     * @brief Apply an event now and settle circuits and the hub
     */
    Result<void> execute(const ClimateEvent& event, uint32_t nowMs);

    void tick(uint32_t nowMs);

    /**
     * @brief Re-derive circuits, then the hub, from the current zone outputs
     */
    void aggregate(uint32_t nowMs);

    /**
     * @brief Take the oldest pending notification
     * @return false if none is pending
     */
    bool pollNotification(ClimateNotification& notification);

    ClimateRegistry& getRegistry() { return registry_; }
    const EventQueue<ClimateEvent>& getInputQueue() const { return inputQueue_; }
    const EventQueue<ClimateNotification>& getNotificationQueue() const { return notificationQueue_; }
    uint32_t getTickCount() const { return tickCount_; }

private:
    Result<void> dispatch(const ClimateEvent& event, uint32_t nowMs);
    Result<void> dispatchZoneEvent(ZoneRegulator& zone, const ClimateEvent& event, uint32_t nowMs);
    void pollInputs(uint32_t nowMs);
    void onBoilerFault(bool fault, uint32_t nowMs);
    void onEntityRemoved(const std::string& id);
    void publish(const ClimateNotification& notification);

    ClimateRegistry& registry_;
    EventQueue<ClimateEvent> inputQueue_;
    EventQueue<ClimateNotification> notificationQueue_;
    uint32_t tickCount_;
};

#endif // CLIMATE_CONTROLLER_H
