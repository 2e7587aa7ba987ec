#pragma once

#include "identity.hpp"
#include "signing_key.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace hm {

// Contract the session orchestrator needs from the personhood proof system.
// Returns false for a proof that does not verify; may throw for malformed input.
class IdentityProofVerifier {
public:
    virtual ~IdentityProofVerifier() = default;
    virtual bool verify(const std::string& root,
                        std::uint64_t groupId,
                        const std::string& signal,
                        const IdentityFingerprint& fingerprint,
                        const std::string& scope,
                        const std::string& proof) = 0;
};

using VerifierPtr = std::shared_ptr<IdentityProofVerifier>;

// Canonical bytes an attestor signs for one (root, group, signal, fingerprint, scope) tuple.
std::string buildAttestationMessage(const std::string& root,
                                    std::uint64_t groupId,
                                    const std::string& signal,
                                    const IdentityFingerprint& fingerprint,
                                    const std::string& scope);

// Accepts proofs that are Ed25519 signatures by a trusted attestor over the
// attestation message. Stands in for an on-chain personhood verifier.
class AttestorProofVerifier : public IdentityProofVerifier {
public:
    explicit AttestorProofVerifier(std::string attestorPublicKeyHex);

    bool verify(const std::string& root,
                std::uint64_t groupId,
                const std::string& signal,
                const IdentityFingerprint& fingerprint,
                const std::string& scope,
                const std::string& proof) override;

    const std::string& publicKeyHex() const { return publicKeyHex_; }

private:
    std::string publicKeyHex_;
};

// Issues attestations; used by the simulator and by tests.
class Attestor {
public:
    Attestor() = default;
    explicit Attestor(const std::string& seedHex) : key_(seedHex) {}

    const std::string& publicKeyHex() const { return key_.publicKeyHex(); }

    // Fingerprint derived from a person's secret, scoped to one application action.
    static IdentityFingerprint fingerprintFor(const std::string& personSecret, const ProofScope& scope);

    IdentityProof attest(const Address& caller,
                         const IdentityFingerprint& fingerprint,
                         const ProofScope& scope,
                         const std::string& root = "humanmine-root") const;

private:
    SigningKey key_;
};

} // namespace hm
