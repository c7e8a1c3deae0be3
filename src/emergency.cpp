#include "tradegate/emergency.hpp"
#include "tradegate/events.hpp"

#include <spdlog/spdlog.h>

namespace tradegate {

void EmergencyControl::activate(const Actor& caller, const std::string& reason, Timestamp now) {
    access_.require(caller, Capability::EMERGENCY);

    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("Emergency stop already active, ignoring activation by {}", caller);
        return;
    }
    stopped_at_.store(now, std::memory_order_release);

    if (events_) events_->on_emergency_activated({caller, reason, now});
}

void EmergencyControl::deactivate(const Actor& caller, Timestamp now) {
    access_.require(caller, Capability::ADMIN);

    bool expected = true;
    if (!stopped_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        throw TradeError(Reason::EMERGENCY_STOP_NOT_ACTIVE);
    }
    stopped_at_.store(0, std::memory_order_release);

    if (events_) events_->on_emergency_deactivated({caller, now});
}

void EmergencyControl::pause(const Actor& caller) {
    access_.require(caller, Capability::EMERGENCY);

    if (paused_.exchange(true, std::memory_order_acq_rel)) return;
    if (events_) events_->on_pause_changed({caller, true});
}

void EmergencyControl::unpause(const Actor& caller) {
    access_.require(caller, Capability::ADMIN);

    if (!paused_.exchange(false, std::memory_order_acq_rel)) {
        throw TradeError(Reason::NOT_PAUSED);
    }
    if (events_) events_->on_pause_changed({caller, false});
}

Reason EmergencyControl::check() const noexcept {
    if (is_stopped()) return Reason::EMERGENCY_STOP_ACTIVE;
    if (is_paused()) return Reason::PAUSED;
    return Reason::OK;
}

void EmergencyControl::require_active() const {
    Reason reason = check();
    if (reason != Reason::OK) {
        throw TradeError(reason);
    }
}

EmergencyState EmergencyControl::state() const noexcept {
    EmergencyState s;
    s.emergency_stop = is_stopped();
    s.emergency_stop_timestamp = stopped_at_.load(std::memory_order_acquire);
    s.paused = is_paused();
    return s;
}

} // namespace tradegate
