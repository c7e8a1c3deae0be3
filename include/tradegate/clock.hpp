#ifndef TRADEGATE_CLOCK_HPP
#define TRADEGATE_CLOCK_HPP

#include <atomic>

#include "types.hpp"

namespace tradegate {

// Source of "now" for every time-dependent gate
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

// Settable clock for simulation and tests
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_.load(std::memory_order_acquire); }

    void set(Timestamp t) { now_.store(t, std::memory_order_release); }
    void advance(uint64_t seconds) { now_.fetch_add(seconds, std::memory_order_acq_rel); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace tradegate

#endif // TRADEGATE_CLOCK_HPP
