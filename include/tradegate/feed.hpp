#ifndef TRADEGATE_FEED_HPP
#define TRADEGATE_FEED_HPP

#include <mutex>
#include <optional>
#include <string>

#include "types.hpp"

namespace tradegate {

// =============================================================================
// Oracle Reading
// =============================================================================

struct Reading {
    Price value;
    Timestamp updated_at;
};

// =============================================================================
// Data Feed Interface
// =============================================================================

// Price, eco, volatility and regulatory oracles all share this boundary.
// std::nullopt means the source could not be read.
class DataFeed {
public:
    virtual ~DataFeed() = default;

    virtual std::string description() const = 0;
    virtual std::optional<Reading> latest_reading() const = 0;
};

// =============================================================================
// ManualFeed - settable in-memory feed
// =============================================================================

class ManualFeed : public DataFeed {
public:
    ManualFeed(std::string description, Price value, Timestamp updated_at);

    std::string description() const override { return description_; }
    std::optional<Reading> latest_reading() const override;

    void update(Price value, Timestamp updated_at);
    void set_updated_at(Timestamp updated_at);
    void set_available(bool available);

private:
    std::string description_;
    mutable std::mutex mutex_;
    Reading reading_;
    bool available_ = true;
};

} // namespace tradegate

#endif // TRADEGATE_FEED_HPP
