#ifndef TRADEGATE_REWARD_HPP
#define TRADEGATE_REWARD_HPP

#include <map>
#include <mutex>
#include <optional>

#include "errors.hpp"
#include "types.hpp"

namespace tradegate {

struct RewardToken {
    uint64_t token_id = 0;
    RequestId request_id;
    uint64_t confidence_bps = 0;
    Timestamp minted_at = 0;
    std::optional<Actor> owner;  // empty while held in the pending pool
};

// =============================================================================
// RewardLedger - tokens for high-confidence predictions
// =============================================================================

class RewardLedger {
public:
    // Ids start at 1. The token lands in the pending pool.
    uint64_t mint(const RequestId& request_id, uint64_t confidence_bps, Timestamp now);

    // Throws TradeError(REWARD_NOT_FOUND) for unknown or already claimed tokens
    void claim(uint64_t token_id, const Actor& recipient);

    std::optional<RewardToken> token(uint64_t token_id) const;

    uint64_t total_supply() const;
    uint64_t pending() const;

private:
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::map<uint64_t, RewardToken> tokens_;
};

} // namespace tradegate

#endif // TRADEGATE_REWARD_HPP
