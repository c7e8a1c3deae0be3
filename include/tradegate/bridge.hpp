#ifndef TRADEGATE_BRIDGE_HPP
#define TRADEGATE_BRIDGE_HPP

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace tradegate {

// =============================================================================
// Prediction Bridge Interface
// =============================================================================

// Ships a prediction request to the off-chain forecaster. Fulfillment comes
// back through PredictionLifecycle::fulfill. Throws BridgeError.
class PredictionBridge {
public:
    virtual ~PredictionBridge() = default;

    virtual RequestId submit_request(const std::string& source,
                                     const std::vector<std::string>& args,
                                     const std::string& metadata) = 0;
};

// =============================================================================
// QueuedBridge - records requests and hands out sequential ids
// =============================================================================

struct SubmittedRequest {
    RequestId request_id;
    std::string source;
    std::vector<std::string> args;
    std::string metadata;
};

class QueuedBridge : public PredictionBridge {
public:
    RequestId submit_request(const std::string& source, const std::vector<std::string>& args,
                             const std::string& metadata) override;

    // The next submission throws BridgeError(reason)
    void fail_next(const std::string& reason);

    std::vector<SubmittedRequest> submitted() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::vector<SubmittedRequest> submitted_;
    std::deque<std::string> scripted_failures_;
};

} // namespace tradegate

#endif // TRADEGATE_BRIDGE_HPP
