#include "identity_verifier.hpp"

#include <sstream>
#include <stdexcept>

namespace hm {

std::string buildAttestationMessage(const std::string& root,
                                    std::uint64_t groupId,
                                    const std::string& signal,
                                    const IdentityFingerprint& fingerprint,
                                    const std::string& scope) {
    std::ostringstream oss;
    oss << "humanmine:attestation:v1|group:" << groupId << '|';
    appendLengthPrefixed(oss, root);
    appendLengthPrefixed(oss, signal);
    appendLengthPrefixed(oss, fingerprint);
    appendLengthPrefixed(oss, scope);
    return oss.str();
}

AttestorProofVerifier::AttestorProofVerifier(std::string attestorPublicKeyHex)
    : publicKeyHex_(std::move(attestorPublicKeyHex)) {
    if (publicKeyHex_.size() != 2 * crypto_sign_PUBLICKEYBYTES) {
        throw std::invalid_argument("attestor public key length invalid");
    }
    (void)hexDecode(publicKeyHex_);
}

bool AttestorProofVerifier::verify(const std::string& root,
                                   std::uint64_t groupId,
                                   const std::string& signal,
                                   const IdentityFingerprint& fingerprint,
                                   const std::string& scope,
                                   const std::string& proof) {
    if (fingerprint.empty()) {
        return false;
    }
    const std::string message = buildAttestationMessage(root, groupId, signal, fingerprint, scope);
    return verifySignatureHex(publicKeyHex_, message, proof);
}

IdentityFingerprint Attestor::fingerprintFor(const std::string& personSecret, const ProofScope& scope) {
    if (personSecret.empty()) {
        throw std::invalid_argument("person secret must not be empty");
    }
    return sha256Hex("humanmine:fingerprint|" + personSecret + "|" + scopeHash(scope));
}

IdentityProof Attestor::attest(const Address& caller,
                               const IdentityFingerprint& fingerprint,
                               const ProofScope& scope,
                               const std::string& root) const {
    const std::string message =
        buildAttestationMessage(root, scope.groupId, signalHash(caller), fingerprint, scopeHash(scope));
    return IdentityProof{ root, fingerprint, key_.signHex(message) };
}

} // namespace hm
