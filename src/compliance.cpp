#include "tradegate/compliance.hpp"

#include <limits>
#include <mutex>

#include <spdlog/spdlog.h>

namespace tradegate {

namespace {

// nullopt when the feed cannot be read
std::optional<Reading> try_read(const DataFeed& feed) noexcept {
    try {
        return feed.latest_reading();
    } catch (const std::exception& e) {
        spdlog::warn("Feed '{}' threw: {}", feed.description(), e.what());
        return std::nullopt;
    }
}

} // namespace

// =============================================================================
// ComplianceEngine
// =============================================================================

ComplianceEngine::ComplianceEngine(std::shared_ptr<DataFeed> volatility_feed,
                                   std::shared_ptr<DataFeed> regulatory_feed)
    : volatility_feed_(std::move(volatility_feed)),
      regulatory_feed_(std::move(regulatory_feed)) {}

bool ComplianceEngine::validate_prediction(const RequestId& request_id, Price predicted_price) {
    if (predicted_price <= 0) {
        spdlog::warn("Compliance: request {} has non-positive prediction", request_id);
        return false;
    }

    std::shared_ptr<DataFeed> volatility;
    std::shared_ptr<DataFeed> regulatory;
    {
        std::shared_lock lock(mutex_);
        volatility = volatility_feed_;
        regulatory = regulatory_feed_;
    }

    if (volatility) {
        auto reading = try_read(*volatility);
        if (!reading) {
            spdlog::warn("Compliance: volatility feed unavailable, rejecting {}", request_id);
            return false;
        }
        if (reading->value < 0 ||
            static_cast<U128>(reading->value) > limits::MAX_VOLATILITY_BPS) {
            spdlog::warn("Compliance: volatility {}bps too high for {}",
                         to_string(reading->value), request_id);
            return false;
        }
    }

    if (regulatory) {
        auto reading = try_read(*regulatory);
        if (!reading) {
            spdlog::warn("Compliance: regulatory feed unavailable, rejecting {}", request_id);
            return false;
        }
        if (reading->value != 0) {
            spdlog::warn("Compliance: trading halted by regulatory status {}",
                         to_string(reading->value));
            return false;
        }
    }

    return true;
}

void ComplianceEngine::set_feeds(std::shared_ptr<DataFeed> volatility_feed,
                                 std::shared_ptr<DataFeed> regulatory_feed) {
    std::unique_lock lock(mutex_);
    volatility_feed_ = std::move(volatility_feed);
    regulatory_feed_ = std::move(regulatory_feed);
}

// =============================================================================
// EcoGate
// =============================================================================

uint64_t EcoGate::score(Timestamp now) const noexcept {
    std::shared_ptr<DataFeed> feed;
    {
        std::shared_lock lock(mutex_);
        feed = feed_;
    }
    if (!feed) return 0;

    constexpr uint64_t worst = std::numeric_limits<uint64_t>::max();

    auto reading = try_read(*feed);
    if (!reading || reading->value < 0) return worst;
    if (now > reading->updated_at && now - reading->updated_at > limits::MAX_PRICE_AGE) {
        return worst;
    }
    if (static_cast<U128>(reading->value) > worst) return worst;
    return static_cast<uint64_t>(reading->value);
}

bool EcoGate::configured() const {
    std::shared_lock lock(mutex_);
    return feed_ != nullptr;
}

void EcoGate::set_feed(std::shared_ptr<DataFeed> feed) {
    std::unique_lock lock(mutex_);
    feed_ = std::move(feed);
}

} // namespace tradegate
