#include "mining_events.hpp"

#include <sstream>

namespace hm {

namespace {

enum class EventTag : std::uint8_t { Opened = 1, Finished = 2, ConfigChanged = 3 };

void writeU8(std::string& out, std::uint8_t v) {
    out.push_back(static_cast<char>(v));
}

void writeU32(std::string& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void writeU64(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void writeString(std::string& out, const std::string& s) {
    writeU64(out, static_cast<std::uint64_t>(s.size()));
    out.append(s);
}

void writeOptional(std::string& out, const std::optional<Address>& value) {
    writeU8(out, value ? 1 : 0);
    if (value) {
        writeString(out, *value);
    }
}

struct Encoder {
    std::string& out;

    // | tag u8 | openedAt u64 | amount u64 | caller | referral? | fingerprint |
    void operator()(const SessionOpened& e) const {
        writeU8(out, static_cast<std::uint8_t>(EventTag::Opened));
        writeU64(out, e.openedAt);
        writeU64(out, e.amount);
        writeString(out, e.caller);
        writeOptional(out, e.referralTarget);
        writeString(out, e.fingerprint);
    }

    void operator()(const SessionFinished& e) const {
        writeU8(out, static_cast<std::uint8_t>(EventTag::Finished));
        writeU64(out, e.finishedAt);
        writeU64(out, e.total);
        writeU64(out, e.payout);
        writeU64(out, e.referralBonus);
        writeU64(out, e.streakBonus);
        writeU64(out, e.stakedAmount);
        writeU32(out, e.rewardLevel);
        writeU32(out, e.streakCount);
        writeU8(out, e.referralApplied ? 1 : 0);
        writeString(out, e.caller);
        writeOptional(out, e.referralTarget);
        writeString(out, e.fingerprint);
    }

    void operator()(const ConfigurationChanged& e) const {
        writeU8(out, static_cast<std::uint8_t>(EventTag::ConfigChanged));
        writeString(out, e.field);
        writeString(out, e.value);
    }
};

struct Describer {
    std::ostringstream& oss;

    void operator()(const SessionOpened& e) const {
        oss << "opened caller=" << e.caller << " stake=" << formatTokenAmount(e.amount)
            << " at=" << e.openedAt;
        if (e.referralTarget) {
            oss << " referral=" << *e.referralTarget;
        }
    }

    void operator()(const SessionFinished& e) const {
        oss << "finished caller=" << e.caller << " level=" << e.rewardLevel
            << " payout=" << formatTokenAmount(e.payout)
            << " referral=" << formatTokenAmount(e.referralBonus)
            << (e.referralApplied ? "(applied)" : "")
            << " streak=" << formatTokenAmount(e.streakBonus) << "x" << e.streakCount
            << " total=" << formatTokenAmount(e.total) << " stake=" << formatTokenAmount(e.stakedAmount);
    }

    void operator()(const ConfigurationChanged& e) const {
        oss << "config " << e.field << "=" << e.value;
    }
};

} // namespace

std::string encodeEvent(const MiningEvent& event) {
    std::string out;
    out.reserve(96);
    std::visit(Encoder{ out }, event);
    return out;
}

std::string describeEvent(const MiningEvent& event) {
    std::ostringstream oss;
    std::visit(Describer{ oss }, event);
    return oss.str();
}

} // namespace hm
