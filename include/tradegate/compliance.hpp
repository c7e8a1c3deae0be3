#ifndef TRADEGATE_COMPLIANCE_HPP
#define TRADEGATE_COMPLIANCE_HPP

#include <memory>
#include <shared_mutex>

#include "feed.hpp"
#include "types.hpp"

namespace tradegate {

// =============================================================================
// ComplianceGate Interface
// =============================================================================

// Predicate over a fulfilled prediction. Must fail closed.
class ComplianceGate {
public:
    virtual ~ComplianceGate() = default;

    virtual bool validate_prediction(const RequestId& request_id, Price predicted_price) = 0;
};

// =============================================================================
// ComplianceEngine - volatility and regulatory status checks
// =============================================================================

class ComplianceEngine : public ComplianceGate {
public:
    // Either feed may be null, which skips that check
    ComplianceEngine(std::shared_ptr<DataFeed> volatility_feed,
                     std::shared_ptr<DataFeed> regulatory_feed);

    bool validate_prediction(const RequestId& request_id, Price predicted_price) override;

    void set_feeds(std::shared_ptr<DataFeed> volatility_feed,
                   std::shared_ptr<DataFeed> regulatory_feed);

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<DataFeed> volatility_feed_;
    std::shared_ptr<DataFeed> regulatory_feed_;
};

// =============================================================================
// EcoGate - environmental impact score
// =============================================================================

class EcoGate {
public:
    explicit EcoGate(std::shared_ptr<DataFeed> feed = nullptr) : feed_(std::move(feed)) {}

    // 0 without a feed; UINT64_MAX when the feed is unreadable, negative or stale
    uint64_t score(Timestamp now) const noexcept;

    bool configured() const;
    void set_feed(std::shared_ptr<DataFeed> feed);

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<DataFeed> feed_;
};

} // namespace tradegate

#endif // TRADEGATE_COMPLIANCE_HPP
