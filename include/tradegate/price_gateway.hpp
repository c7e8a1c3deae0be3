#ifndef TRADEGATE_PRICE_GATEWAY_HPP
#define TRADEGATE_PRICE_GATEWAY_HPP

#include <memory>
#include <shared_mutex>

#include "errors.hpp"
#include "feed.hpp"
#include "types.hpp"

namespace tradegate {

class EventListener;

// =============================================================================
// Price Snapshot
// =============================================================================

struct PriceSnapshot {
    Price price = 0;
    Timestamp updated_at = 0;
    bool unconfirmed = false;     // moved more than the deviation threshold
    uint64_t deviation_bps = 0;   // relative change against the basis
};

// =============================================================================
// PriceGateway - staleness bound and deviation circuit breaker
// =============================================================================

class PriceGateway {
public:
    PriceGateway(std::shared_ptr<DataFeed> feed, uint64_t deviation_threshold_bps,
                 EventListener* events = nullptr);

    // Non-copyable
    PriceGateway(const PriceGateway&) = delete;
    PriceGateway& operator=(const PriceGateway&) = delete;

    // Non-throwing, side-effect free. Fills `out` only when OK is returned.
    Reason check(Timestamp now, PriceSnapshot& out) const noexcept;

    // Throws TradeError(ORACLE_UNAVAILABLE | INVALID_PRICE | PRICE_DATA_STALE).
    // Emits a price-deviation event when the snapshot is unconfirmed.
    PriceSnapshot read(Timestamp now) const;

    // Makes the snapshot the basis for the next deviation check
    void accept(const PriceSnapshot& snapshot);

    // read() followed by accept()
    PriceSnapshot latest_price(Timestamp now);

    Price last_valid_price() const;
    void restore_basis(Price price);

    void set_feed(std::shared_ptr<DataFeed> feed);
    void set_deviation_threshold(uint64_t bps);

    static uint64_t deviation_bps(Price previous, Price current) noexcept;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<DataFeed> feed_;
    uint64_t deviation_threshold_bps_;
    Price last_valid_price_ = 0;
    EventListener* events_;
};

} // namespace tradegate

#endif // TRADEGATE_PRICE_GATEWAY_HPP
