#ifndef TRADEGATE_EMERGENCY_HPP
#define TRADEGATE_EMERGENCY_HPP

#include <atomic>
#include <string>

#include "access.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace tradegate {

class EventListener;

struct EmergencyState {
    bool emergency_stop = false;
    Timestamp emergency_stop_timestamp = 0;
    bool paused = false;
};

// =============================================================================
// EmergencyControl - global stop switch plus orthogonal pause flag
// =============================================================================

// Halting needs EMERGENCY, resuming needs ADMIN.
class EmergencyControl {
public:
    EmergencyControl(const AccessControl& access, EventListener* events = nullptr)
        : access_(access), events_(events) {}

    // Non-copyable
    EmergencyControl(const EmergencyControl&) = delete;
    EmergencyControl& operator=(const EmergencyControl&) = delete;

    // Idempotent: a second activation keeps the first timestamp
    void activate(const Actor& caller, const std::string& reason, Timestamp now);

    // Throws TradeError(EMERGENCY_STOP_NOT_ACTIVE) when not stopped
    void deactivate(const Actor& caller, Timestamp now);

    void pause(const Actor& caller);

    // Throws TradeError(NOT_PAUSED) when not paused
    void unpause(const Actor& caller);

    // OK, EMERGENCY_STOP_ACTIVE or PAUSED, in that priority
    Reason check() const noexcept;

    // Throws the reason returned by check()
    void require_active() const;

    bool is_stopped() const noexcept { return stopped_.load(std::memory_order_acquire); }
    bool is_paused() const noexcept { return paused_.load(std::memory_order_acquire); }
    EmergencyState state() const noexcept;

private:
    const AccessControl& access_;
    EventListener* events_;

    std::atomic<bool> stopped_{false};
    std::atomic<Timestamp> stopped_at_{0};
    std::atomic<bool> paused_{false};
};

} // namespace tradegate

#endif // TRADEGATE_EMERGENCY_HPP
