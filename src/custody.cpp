#include "tradegate/custody.hpp"

#include <spdlog/spdlog.h>

namespace tradegate {

namespace {
constexpr U128 RATE_SCALE = 100000000;  // 1e8
}

PaperCustody::PaperCustody(const Clock& clock, U128 rate_e8, uint64_t performance_fee_bps)
    : clock_(clock), rate_e8_(rate_e8), performance_fee_bps_(performance_fee_bps) {
    if (rate_e8 == 0) {
        throw TradeError(Reason::INVALID_CONFIG, "custody rate must be positive");
    }
    if (performance_fee_bps > limits::BPS_DENOMINATOR) {
        throw TradeError(Reason::INVALID_CONFIG, "performance fee above 10000 bps");
    }
}

Amount PaperCustody::quote_locked(Amount amount_in, Amount& fee) const {
    Amount gross = amount_in * rate_e8_ / RATE_SCALE;
    fee = gross * performance_fee_bps_ / limits::BPS_DENOMINATOR;
    return gross - fee;
}

Amount PaperCustody::quote(Amount amount_in) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount fee = 0;
    return quote_locked(amount_in, fee);
}

ExecutionReceipt PaperCustody::execute(Amount amount_in, Amount min_out, const Path& path,
                                       Timestamp deadline) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!scripted_failures_.empty()) {
        std::string reason = std::move(scripted_failures_.front());
        scripted_failures_.pop_front();
        throw CustodyError(reason);
    }

    if (path.size() != 2) {
        throw CustodyError("Invalid swap path");
    }

    Timestamp now = clock_.now();
    if (now > deadline) {
        throw CustodyError("Transaction expired");
    }
    if (amount_in == 0) {
        throw CustodyError("Zero input amount");
    }

    const Address& from = path.front();
    const Address& to = path.back();

    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount_in) {
        throw CustodyError("Insufficient balance");
    }

    Amount fee = 0;
    Amount out = quote_locked(amount_in, fee);
    if (out < min_out) {
        throw CustodyError("Insufficient output amount");
    }

    it->second -= amount_in;
    balances_[to] += out;
    fees_collected_ += fee;
    ++executions_;

    spdlog::debug("Paper swap {} -> {} (fee {})", format_units(amount_in), format_units(out),
                  format_units(fee));

    ExecutionReceipt receipt;
    receipt.amount_in = amount_in;
    receipt.amount_out = out;
    receipt.fee = fee;
    receipt.executed_at = now;
    return receipt;
}

void PaperCustody::deposit(const Address& asset, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[asset] += amount;
}

Amount PaperCustody::balance(const Address& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(asset);
    return it != balances_.end() ? it->second : 0;
}

void PaperCustody::set_rate(U128 rate_e8) {
    if (rate_e8 == 0) {
        throw TradeError(Reason::INVALID_CONFIG, "custody rate must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    rate_e8_ = rate_e8;
}

void PaperCustody::fail_next(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_failures_.push_back(reason);
}

uint64_t PaperCustody::executions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executions_;
}

Amount PaperCustody::fees_collected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fees_collected_;
}

} // namespace tradegate
