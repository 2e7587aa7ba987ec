#include "signing_key.hpp"

#include "identity.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace hm {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

SigningKey::SigningKey() {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> pk{};
    crypto_sign_keypair(pk.data(), secretKey_.data());
    publicKeyHex_ = hexEncode(pk.data(), pk.size());
}

SigningKey::SigningKey(const std::string& seedHex) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    auto seed = hexDecode(seedHex);
    if (seed.size() != crypto_sign_SEEDBYTES) {
        sodium_memzero(seed.data(), seed.size());
        throw std::invalid_argument("signing seed must be 32 bytes (hex encoded)");
    }
    std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> pk{};
    crypto_sign_seed_keypair(pk.data(), secretKey_.data(), seed.data());
    sodium_memzero(seed.data(), seed.size());
    publicKeyHex_ = hexEncode(pk.data(), pk.size());
}

SigningKey::SigningKey(SecretTag, const std::string& secretKeyHex) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    auto secret = hexDecode(secretKeyHex);
    if (secret.size() != crypto_sign_SECRETKEYBYTES) {
        sodium_memzero(secret.data(), secret.size());
        throw std::invalid_argument("secret key must be 64 bytes (hex encoded)");
    }
    std::copy(secret.begin(), secret.end(), secretKey_.begin());
    sodium_memzero(secret.data(), secret.size());

    std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> pk{};
    if (crypto_sign_ed25519_sk_to_pk(pk.data(), secretKey_.data()) != 0) {
        throw std::runtime_error("Unable to derive public key from secret key");
    }
    publicKeyHex_ = hexEncode(pk.data(), pk.size());
}

SigningKey SigningKey::fromSecretKeyHex(const std::string& secretKeyHex) {
    return SigningKey(SecretTag{}, secretKeyHex);
}

SigningKey::~SigningKey() {
    sodium_memzero(secretKey_.data(), secretKey_.size());
}

std::string SigningKey::signHex(const std::string& message) const {
    std::array<unsigned char, crypto_sign_BYTES> signature{};
    unsigned long long sigLen = 0;
    if (crypto_sign_detached(signature.data(),
                             &sigLen,
                             reinterpret_cast<const unsigned char*>(message.data()),
                             message.size(),
                             secretKey_.data()) != 0) {
        throw std::runtime_error("Signing failed");
    }
    return hexEncode(signature.data(), static_cast<std::size_t>(sigLen));
}

bool verifySignatureHex(const std::string& publicKeyHex,
                        const std::string& message,
                        const std::string& signatureHex) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    if (publicKeyHex.size() != 2 * crypto_sign_PUBLICKEYBYTES ||
        signatureHex.size() != 2 * crypto_sign_BYTES) {
        return false;
    }
    std::vector<unsigned char> publicKey;
    std::vector<unsigned char> signature;
    try {
        publicKey = hexDecode(publicKeyHex);
        signature = hexDecode(signatureHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       publicKey.data()) == 0;
}

} // namespace hm
