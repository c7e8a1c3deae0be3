#ifndef TRADEGATE_SINGLE_FLIGHT_HPP
#define TRADEGATE_SINGLE_FLIGHT_HPP

#include <atomic>

#include "errors.hpp"

namespace tradegate {

// =============================================================================
// SingleFlight - at most one state-mutating operation in progress
// =============================================================================

// A second entry while a Flight is alive fails with TradeError(REENTRANCY)
// instead of blocking. Internal continuations pass the live Flight along.
class SingleFlight {
public:
    class Flight {
    public:
        explicit Flight(SingleFlight& guard) : guard_(&guard) {
            bool expected = false;
            if (!guard.busy_.compare_exchange_strong(expected, true,
                                                     std::memory_order_acq_rel)) {
                throw TradeError(Reason::REENTRANCY);
            }
        }

        ~Flight() { guard_->busy_.store(false, std::memory_order_release); }

        // Non-copyable, non-movable
        Flight(const Flight&) = delete;
        Flight& operator=(const Flight&) = delete;

        bool guards(const SingleFlight& guard) const noexcept { return guard_ == &guard; }

    private:
        SingleFlight* guard_;
    };

    SingleFlight() = default;

    // Non-copyable
    SingleFlight(const SingleFlight&) = delete;
    SingleFlight& operator=(const SingleFlight&) = delete;

    bool in_flight() const noexcept { return busy_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> busy_{false};
};

} // namespace tradegate

#endif // TRADEGATE_SINGLE_FLIGHT_HPP
