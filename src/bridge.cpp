#include "tradegate/bridge.hpp"
#include "tradegate/abi.hpp"

#include <spdlog/spdlog.h>

namespace tradegate {

RequestId QueuedBridge::submit_request(const std::string& source,
                                       const std::vector<std::string>& args,
                                       const std::string& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!scripted_failures_.empty()) {
        std::string reason = std::move(scripted_failures_.front());
        scripted_failures_.pop_front();
        throw BridgeError(reason);
    }

    // 32-byte request id, big-endian sequence number
    abi::Bytes id;
    abi::append_word(id, static_cast<U128>(next_id_++));

    SubmittedRequest request;
    request.request_id = abi::to_hex(id);
    request.source = source;
    request.args = args;
    request.metadata = metadata;
    submitted_.push_back(request);

    spdlog::debug("Bridge queued request {} ({} args)", request.request_id, args.size());
    return request.request_id;
}

void QueuedBridge::fail_next(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_failures_.push_back(reason);
}

std::vector<SubmittedRequest> QueuedBridge::submitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
}

size_t QueuedBridge::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_.size();
}

} // namespace tradegate
