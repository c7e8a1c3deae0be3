#ifndef TRADEGATE_ACCESS_HPP
#define TRADEGATE_ACCESS_HPP

#include <cstdint>
#include <set>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace tradegate {

// =============================================================================
// Capabilities
// =============================================================================

enum class Capability : uint8_t {
    ADMIN = 0,      // config, role grants, resume after emergency
    OPERATOR = 1,   // manual prediction requests, reward claims
    SIGNAL = 2,     // AI signal source: trade and batch trade
    EMERGENCY = 3,  // halt and pause
    KEEPER = 4      // scheduled upkeep
};

const char* to_string(Capability cap) noexcept;

// Throws ConfigError on an unknown name
Capability parse_capability(std::string_view name);

// =============================================================================
// AccessControl - capability sets per actor
// =============================================================================

class AccessControl {
public:
    // The admin actor receives every capability
    explicit AccessControl(const Actor& admin);

    // Non-copyable
    AccessControl(const AccessControl&) = delete;
    AccessControl& operator=(const AccessControl&) = delete;

    // Both require ADMIN on the caller
    void grant(const Actor& caller, const Actor& actor, Capability cap);
    void revoke(const Actor& caller, const Actor& actor, Capability cap);

    bool has(const Actor& actor, Capability cap) const;

    // Throws TradeError(UNAUTHORIZED), or UNAUTHORIZED_KEEPER for KEEPER
    void require(const Actor& actor, Capability cap) const;

    // Passes when the actor holds at least one of the capabilities
    void require_any(const Actor& actor, const std::vector<Capability>& caps) const;

    std::set<Capability> capabilities(const Actor& actor) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Actor, std::set<Capability>> grants_;
};

} // namespace tradegate

#endif // TRADEGATE_ACCESS_HPP
