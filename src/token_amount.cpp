#include "token_amount.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace hm {

namespace {

constexpr std::size_t kFractionDigits = 6;
constexpr Timestamp kSecondsPerHour = 60 * 60;

} // namespace

Amount parseTokenAmount(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("token amount must not be empty");
    }
    const auto dot = text.find('.');
    const std::string whole = text.substr(0, dot);
    std::string fraction = (dot == std::string::npos) ? std::string() : text.substr(dot + 1);
    if (whole.empty() && fraction.empty()) {
        throw std::invalid_argument("token amount has no digits: " + text);
    }
    if (fraction.size() > kFractionDigits) {
        throw std::invalid_argument("token amount has more than 6 decimals: " + text);
    }
    for (char c : whole + fraction) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            throw std::invalid_argument("token amount is not a decimal number: " + text);
        }
    }
    fraction.append(kFractionDigits - fraction.size(), '0');

    Amount wholeUnits = 0;
    if (!whole.empty()) {
        std::size_t consumed = 0;
        unsigned long long parsed = std::stoull(whole, &consumed, 10);
        if (consumed != whole.size()) {
            throw std::invalid_argument("token amount is not a decimal number: " + text);
        }
        wholeUnits = mulDiv(parsed, kMicrosPerToken, 1);
    }
    return checkedAdd(wholeUnits, std::stoull(fraction, nullptr, 10));
}

std::string formatTokenAmount(Amount micros) {
    std::ostringstream oss;
    oss << (micros / kMicrosPerToken);
    Amount fraction = micros % kMicrosPerToken;
    if (fraction != 0) {
        std::ostringstream frac;
        frac << std::setw(static_cast<int>(kFractionDigits)) << std::setfill('0') << fraction;
        std::string digits = frac.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        oss << '.' << digits;
    }
    return oss.str();
}

Timestamp parseHoursAsSeconds(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("hours must be a non-negative whole number: " + text);
    }
    unsigned long long hours = 0;
    try {
        hours = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("hours out of range: " + text);
    }
    if (hours > std::numeric_limits<Timestamp>::max() / kSecondsPerHour) {
        throw std::invalid_argument("hours out of range: " + text);
    }
    return static_cast<Timestamp>(hours) * kSecondsPerHour;
}

} // namespace hm
