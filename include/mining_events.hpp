#pragma once

#include "identity.hpp"
#include "token_amount.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace hm {

struct SessionOpened {
    Address caller;
    std::optional<Address> referralTarget;
    IdentityFingerprint fingerprint;
    Amount amount = 0;
    Timestamp openedAt = 0;
};

struct SessionFinished {
    Address caller;
    std::optional<Address> referralTarget;
    IdentityFingerprint fingerprint;
    Amount total = 0;
    Amount payout = 0;
    Amount referralBonus = 0;
    Amount streakBonus = 0;
    std::uint32_t rewardLevel = 0;
    std::uint32_t streakCount = 0;
    bool referralApplied = false;
    Amount stakedAmount = 0;
    Timestamp finishedAt = 0;
};

struct ConfigurationChanged {
    std::string field;
    std::string value;
};

using MiningEvent = std::variant<SessionOpened, SessionFinished, ConfigurationChanged>;
using EventListener = std::function<void(const MiningEvent&)>;

// Canonical little-endian, length-prefixed encoding used for journal leaves.
std::string encodeEvent(const MiningEvent& event);
// One-line human readable rendering for CLI output.
std::string describeEvent(const MiningEvent& event);

} // namespace hm
