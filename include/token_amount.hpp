#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace hm {

// Token quantities are unsigned micro-units (6 decimals) for both the stake
// token and the reward token. Timestamps are seconds.
using Amount = std::uint64_t;
using Timestamp = std::uint64_t;

constexpr Amount kMicrosPerToken = 1'000'000;
// One whole stake token; rewards are quoted per STAKE_UNIT staked.
constexpr Amount kStakeUnit = kMicrosPerToken;
constexpr std::uint32_t kBasisPoints = 10'000;
constexpr Amount kMaxAmount = std::numeric_limits<Amount>::max();

inline Amount checkedAdd(Amount a, Amount b) {
    if (a > kMaxAmount - b) {
        throw std::overflow_error("token amount addition overflow");
    }
    return a + b;
}

inline Amount flooredSub(Amount a, Amount b) {
    return (b >= a) ? 0 : a - b;
}

// floor(a * b / divisor) with a 128-bit intermediate.
inline Amount mulDiv(Amount a, Amount b, Amount divisor) {
    if (divisor == 0) {
        throw std::domain_error("mulDiv divisor must be non-zero");
    }
    unsigned __int128 wide = static_cast<unsigned __int128>(a) * static_cast<unsigned __int128>(b);
    wide /= divisor;
    if (wide > static_cast<unsigned __int128>(kMaxAmount)) {
        throw std::overflow_error("token amount multiplication overflow");
    }
    return static_cast<Amount>(wide);
}

inline Amount applyBps(Amount value, std::uint32_t bps) {
    return mulDiv(value, bps, kBasisPoints);
}

constexpr Amount wholeTokens(std::uint64_t tokens) {
    return tokens * kMicrosPerToken;
}

// Parses "12", "0.1" or "3.000250" into micro-units. At most six fractional digits.
Amount parseTokenAmount(const std::string& text);
std::string formatTokenAmount(Amount micros);
// Parses a whole number of hours into seconds; rejects signs and values whose
// second count does not fit a Timestamp.
Timestamp parseHoursAsSeconds(const std::string& text);

} // namespace hm
