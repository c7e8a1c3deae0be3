#include "tradegate/price_gateway.hpp"
#include "tradegate/events.hpp"

#include <mutex>
#include <spdlog/spdlog.h>

namespace tradegate {

PriceGateway::PriceGateway(std::shared_ptr<DataFeed> feed, uint64_t deviation_threshold_bps,
                           EventListener* events)
    : feed_(std::move(feed)),
      deviation_threshold_bps_(deviation_threshold_bps),
      events_(events) {}

uint64_t PriceGateway::deviation_bps(Price previous, Price current) noexcept {
    if (previous <= 0) return 0;
    I128 diff = current > previous ? current - previous : previous - current;
    U128 bps = static_cast<U128>(diff) * limits::BPS_DENOMINATOR / static_cast<U128>(previous);
    return bps > UINT64_MAX ? UINT64_MAX : static_cast<uint64_t>(bps);
}

Reason PriceGateway::check(Timestamp now, PriceSnapshot& out) const noexcept {
    std::shared_ptr<DataFeed> feed;
    Price basis;
    uint64_t threshold;
    {
        std::shared_lock lock(mutex_);
        feed = feed_;
        basis = last_valid_price_;
        threshold = deviation_threshold_bps_;
    }

    if (!feed) return Reason::ORACLE_UNAVAILABLE;

    std::optional<Reading> reading;
    try {
        reading = feed->latest_reading();
    } catch (const std::exception& e) {
        spdlog::warn("Price feed '{}' threw: {}", feed->description(), e.what());
        return Reason::ORACLE_UNAVAILABLE;
    }
    if (!reading) return Reason::ORACLE_UNAVAILABLE;
    if (reading->value <= 0) return Reason::INVALID_PRICE;

    // A reading stamped in the future counts as fresh
    if (now > reading->updated_at && now - reading->updated_at > limits::MAX_PRICE_AGE) {
        return Reason::PRICE_DATA_STALE;
    }

    out.price = reading->value;
    out.updated_at = reading->updated_at;
    out.deviation_bps = deviation_bps(basis, reading->value);
    out.unconfirmed = basis > 0 && out.deviation_bps > threshold;
    return Reason::OK;
}

PriceSnapshot PriceGateway::read(Timestamp now) const {
    PriceSnapshot snapshot;
    Reason reason = check(now, snapshot);
    if (reason != Reason::OK) {
        throw TradeError(reason);
    }

    if (snapshot.unconfirmed) {
        Price previous = last_valid_price();
        spdlog::warn("Price moved {}bps since last valid price", snapshot.deviation_bps);
        if (events_) {
            events_->on_price_deviation({previous, snapshot.price, snapshot.deviation_bps});
        }
    }
    return snapshot;
}

void PriceGateway::accept(const PriceSnapshot& snapshot) {
    std::unique_lock lock(mutex_);
    last_valid_price_ = snapshot.price;
}

PriceSnapshot PriceGateway::latest_price(Timestamp now) {
    PriceSnapshot snapshot = read(now);
    accept(snapshot);
    return snapshot;
}

Price PriceGateway::last_valid_price() const {
    std::shared_lock lock(mutex_);
    return last_valid_price_;
}

void PriceGateway::restore_basis(Price price) {
    std::unique_lock lock(mutex_);
    last_valid_price_ = price;
}

void PriceGateway::set_feed(std::shared_ptr<DataFeed> feed) {
    std::unique_lock lock(mutex_);
    feed_ = std::move(feed);
}

void PriceGateway::set_deviation_threshold(uint64_t bps) {
    std::unique_lock lock(mutex_);
    deviation_threshold_bps_ = bps;
}

} // namespace tradegate
