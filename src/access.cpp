#include "tradegate/access.hpp"
#include "tradegate/errors.hpp"

#include <mutex>
#include <spdlog/spdlog.h>

namespace tradegate {

const char* to_string(Capability cap) noexcept {
    switch (cap) {
        case Capability::ADMIN: return "admin";
        case Capability::OPERATOR: return "operator";
        case Capability::SIGNAL: return "signal";
        case Capability::EMERGENCY: return "emergency";
        case Capability::KEEPER: return "keeper";
    }
    return "unknown";
}

Capability parse_capability(std::string_view name) {
    if (name == "admin") return Capability::ADMIN;
    if (name == "operator") return Capability::OPERATOR;
    if (name == "signal" || name == "ai") return Capability::SIGNAL;
    if (name == "emergency") return Capability::EMERGENCY;
    if (name == "keeper") return Capability::KEEPER;
    throw ConfigError("unknown capability: " + std::string(name));
}

AccessControl::AccessControl(const Actor& admin) {
    if (admin.empty()) {
        throw TradeError(Reason::INVALID_CONFIG, "admin actor is empty");
    }
    grants_[admin] = {Capability::ADMIN, Capability::OPERATOR, Capability::SIGNAL,
                      Capability::EMERGENCY, Capability::KEEPER};
}

void AccessControl::grant(const Actor& caller, const Actor& actor, Capability cap) {
    require(caller, Capability::ADMIN);
    if (actor.empty()) {
        throw TradeError(Reason::INVALID_CONFIG, "actor is empty");
    }

    std::unique_lock lock(mutex_);
    grants_[actor].insert(cap);
    spdlog::info("Granted {} to {} (by {})", to_string(cap), actor, caller);
}

void AccessControl::revoke(const Actor& caller, const Actor& actor, Capability cap) {
    require(caller, Capability::ADMIN);

    std::unique_lock lock(mutex_);
    auto it = grants_.find(actor);
    if (it == grants_.end()) return;
    it->second.erase(cap);
    if (it->second.empty()) {
        grants_.erase(it);
    }
    spdlog::info("Revoked {} from {} (by {})", to_string(cap), actor, caller);
}

bool AccessControl::has(const Actor& actor, Capability cap) const {
    std::shared_lock lock(mutex_);
    auto it = grants_.find(actor);
    return it != grants_.end() && it->second.count(cap) > 0;
}

void AccessControl::require(const Actor& actor, Capability cap) const {
    if (has(actor, cap)) return;

    spdlog::warn("Actor '{}' lacks capability {}", actor, to_string(cap));
    throw TradeError(cap == Capability::KEEPER ? Reason::UNAUTHORIZED_KEEPER
                                               : Reason::UNAUTHORIZED,
                     actor + " lacks " + to_string(cap));
}

void AccessControl::require_any(const Actor& actor, const std::vector<Capability>& caps) const {
    for (auto cap : caps) {
        if (has(actor, cap)) return;
    }
    spdlog::warn("Actor '{}' lacks every accepted capability", actor);
    throw TradeError(Reason::UNAUTHORIZED, actor);
}

std::set<Capability> AccessControl::capabilities(const Actor& actor) const {
    std::shared_lock lock(mutex_);
    auto it = grants_.find(actor);
    if (it == grants_.end()) return {};
    return it->second;
}

} // namespace tradegate
