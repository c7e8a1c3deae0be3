#include "tradegate/feed.hpp"

#include <utility>

namespace tradegate {

ManualFeed::ManualFeed(std::string description, Price value, Timestamp updated_at)
    : description_(std::move(description)), reading_{value, updated_at} {}

std::optional<Reading> ManualFeed::latest_reading() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) return std::nullopt;
    return reading_;
}

void ManualFeed::update(Price value, Timestamp updated_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    reading_.value = value;
    reading_.updated_at = updated_at;
}

void ManualFeed::set_updated_at(Timestamp updated_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    reading_.updated_at = updated_at;
}

void ManualFeed::set_available(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

} // namespace tradegate
