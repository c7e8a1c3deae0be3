#include "tradegate/reward.hpp"

#include <spdlog/spdlog.h>

namespace tradegate {

uint64_t RewardLedger::mint(const RequestId& request_id, uint64_t confidence_bps,
                            Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    RewardToken token;
    token.token_id = next_id_++;
    token.request_id = request_id;
    token.confidence_bps = confidence_bps;
    token.minted_at = now;

    uint64_t id = token.token_id;
    tokens_.emplace(id, std::move(token));
    return id;
}

void RewardLedger::claim(uint64_t token_id, const Actor& recipient) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tokens_.find(token_id);
    if (it == tokens_.end() || it->second.owner) {
        throw TradeError(Reason::REWARD_NOT_FOUND, "token " + std::to_string(token_id));
    }
    it->second.owner = recipient;
    spdlog::info("Reward #{} claimed by {}", token_id, recipient);
}

std::optional<RewardToken> RewardLedger::token(uint64_t token_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) return std::nullopt;
    return it->second;
}

uint64_t RewardLedger::total_supply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

uint64_t RewardLedger::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t count = 0;
    for (const auto& [id, token] : tokens_) {
        if (!token.owner) ++count;
    }
    return count;
}

} // namespace tradegate
