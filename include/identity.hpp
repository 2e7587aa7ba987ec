#pragma once

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace hm {

// Ledger account identifier, e.g. "0x5aeda5...". Compared byte-for-byte after
// normalizeAddress().
using Address = std::string;
// Per-person-per-action value issued by the personhood proof system.
using IdentityFingerprint = std::string;

struct ProofScope {
    std::string appId;
    std::string action = "mine";
    std::uint64_t groupId = 1;
};

struct IdentityProof {
    std::string root;
    IdentityFingerprint fingerprint;
    std::string proof;
};

// Strips leading and trailing ASCII whitespace.
std::string trimWhitespace(const std::string& value);
// Appends "<size>:<bytes>;" so concatenated fields cannot be confused.
void appendLengthPrefixed(std::ostringstream& oss, const std::string& value);

// Lower-cases and trims; throws std::invalid_argument for an empty address.
Address normalizeAddress(const std::string& raw);

std::string hexEncode(const unsigned char* data, std::size_t len);
std::vector<unsigned char> hexDecode(const std::string& hex);
std::string sha256Hex(const std::string& data);
// Binds a proof to the account submitting it.
std::string signalHash(const Address& caller);
// Binds a proof to this application and action so it cannot be replayed elsewhere.
std::string scopeHash(const ProofScope& scope);

} // namespace hm
