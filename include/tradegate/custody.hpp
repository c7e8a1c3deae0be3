#ifndef TRADEGATE_CUSTODY_HPP
#define TRADEGATE_CUSTODY_HPP

#include <deque>
#include <map>
#include <mutex>
#include <string>

#include "clock.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace tradegate {

// =============================================================================
// Custody Interface
// =============================================================================

struct ExecutionReceipt {
    Amount amount_in = 0;
    Amount amount_out = 0;   // net of fees, credited to the target asset
    Amount fee = 0;
    Timestamp executed_at = 0;
};

// Holds the funds and performs the swap. Throws CustodyError on failure;
// the error message is the failure reason.
class Custody {
public:
    virtual ~Custody() = default;

    virtual ExecutionReceipt execute(Amount amount_in, Amount min_out, const Path& path,
                                     Timestamp deadline) = 0;
};

// =============================================================================
// PaperCustody - in-memory balances and a fixed conversion rate
// =============================================================================

class PaperCustody : public Custody {
public:
    // rate_e8: target units received per source unit, scaled by 1e8
    PaperCustody(const Clock& clock, U128 rate_e8, uint64_t performance_fee_bps = 0);

    // Non-copyable
    PaperCustody(const PaperCustody&) = delete;
    PaperCustody& operator=(const PaperCustody&) = delete;

    ExecutionReceipt execute(Amount amount_in, Amount min_out, const Path& path,
                             Timestamp deadline) override;

    void deposit(const Address& asset, Amount amount);
    Amount balance(const Address& asset) const;

    void set_rate(U128 rate_e8);

    // The next execute() throws CustodyError(reason) without moving funds
    void fail_next(const std::string& reason);

    // Amount the fixed rate would produce, fee deducted
    Amount quote(Amount amount_in) const;

    uint64_t executions() const;
    Amount fees_collected() const;

private:
    Amount quote_locked(Amount amount_in, Amount& fee) const;

    const Clock& clock_;
    mutable std::mutex mutex_;
    U128 rate_e8_;
    uint64_t performance_fee_bps_;
    std::map<Address, Amount> balances_;
    std::deque<std::string> scripted_failures_;
    uint64_t executions_ = 0;
    Amount fees_collected_ = 0;
};

} // namespace tradegate

#endif // TRADEGATE_CUSTODY_HPP
