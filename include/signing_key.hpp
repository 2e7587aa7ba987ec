#pragma once

#include <array>
#include <string>

#include <sodium.h>

namespace hm {

// Ed25519 key pair whose secret half is wiped on destruction.
class SigningKey {
public:
    SigningKey();
    explicit SigningKey(const std::string& seedHex);
    ~SigningKey();

    SigningKey(const SigningKey&) = delete;
    SigningKey& operator=(const SigningKey&) = delete;

    const std::string& publicKeyHex() const { return publicKeyHex_; }
    std::string signHex(const std::string& message) const;

    static SigningKey fromSecretKeyHex(const std::string& secretKeyHex);

private:
    struct SecretTag {};
    SigningKey(SecretTag, const std::string& secretKeyHex);

    std::array<unsigned char, crypto_sign_SECRETKEYBYTES> secretKey_{};
    std::string publicKeyHex_;
};

bool ensureSodiumReady();
// False for malformed keys or signatures as well as for a signature that does not match.
bool verifySignatureHex(const std::string& publicKeyHex,
                        const std::string& message,
                        const std::string& signatureHex);

} // namespace hm
