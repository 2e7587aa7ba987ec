#include "identity.hpp"

#include <picosha2.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace hm {

std::string trimWhitespace(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

void appendLengthPrefixed(std::ostringstream& oss, const std::string& value) {
    oss << value.size() << ':';
    oss.write(value.data(), static_cast<std::streamsize>(value.size()));
    oss << ';';
}

Address normalizeAddress(const std::string& raw) {
    Address out = trimWhitespace(raw);
    if (out.empty()) {
        throw std::invalid_argument("address must not be empty");
    }
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string hexEncode(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<unsigned char> hexDecode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (std::isxdigit(static_cast<unsigned char>(hex[i])) == 0 ||
            std::isxdigit(static_cast<unsigned char>(hex[i + 1])) == 0) {
            throw std::invalid_argument("hex string contains a non-hex character");
        }
        out.push_back(static_cast<unsigned char>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string signalHash(const Address& caller) {
    std::ostringstream oss;
    oss << "humanmine:signal:";
    appendLengthPrefixed(oss, caller);
    return sha256Hex(oss.str());
}

std::string scopeHash(const ProofScope& scope) {
    if (scope.appId.empty()) {
        throw std::invalid_argument("proof scope requires an appId");
    }
    std::ostringstream oss;
    oss << "humanmine:scope:";
    appendLengthPrefixed(oss, scope.appId);
    appendLengthPrefixed(oss, scope.action);
    return sha256Hex(oss.str());
}

} // namespace hm
