#include "identity.hpp"
#include "signing_key.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

using hm::hexDecode;
using hm::trimWhitespace;

// Reads a scoping variable; required ones must be set and deployment specific.
std::string scopeVariable(const char* name, bool required) {
    const char* raw = std::getenv(name);
    const std::string value = raw == nullptr ? std::string() : trimWhitespace(raw);
    if (!required) {
        return value;
    }
    if (value.empty()) {
        throw std::runtime_error(std::string(name) + " must name the deployment being attested; refusing to sign");
    }
    if (value == "default") {
        throw std::runtime_error(std::string(name) + " cannot be \"default\"; use e.g. \"mainnet\" or \"testnet\"");
    }
    return value;
}

bool isHexDigest(const std::string& value) {
    if (value.size() != 64) {
        return false;
    }
    try {
        (void)hexDecode(value);
    } catch (const std::invalid_argument&) {
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: publish_journal <pool_id> <journal_size> <merkle_root> <secret_key_hex> [output.json]\n";
        std::cerr << "Environment: HM_DEPLOYMENT_ID is required; optional HM_CHAIN_ID adds chain scoping.\n";
        return 1;
    }

    std::string poolId = argv[1];
    std::string journalSize = argv[2];
    std::string merkleRoot = argv[3];
    std::string outputPath;
    if (argc >= 6) {
        outputPath = argv[5];
    }

    if (journalSize.empty() || journalSize.find_first_not_of("0123456789") != std::string::npos) {
        std::cerr << "journal_size must be a decimal entry count\n";
        return 1;
    }
    if (!isHexDigest(merkleRoot)) {
        std::cerr << "merkle_root must be a 32-byte hex digest\n";
        return 1;
    }

    std::string deploymentId;
    std::string chainId;
    try {
        deploymentId = scopeVariable("HM_DEPLOYMENT_ID", true);
        chainId = scopeVariable("HM_CHAIN_ID", false);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    std::string message = "humanmine:journal:v1|" + deploymentId + ":";
    if (!chainId.empty()) {
        message += chainId + ":";
    }
    message += poolId + ":" + journalSize + ":" + merkleRoot;

    std::string signatureHex;
    std::string publicKeyHex;
    try {
        auto key = hm::SigningKey::fromSecretKeyHex(argv[4]);
        signatureHex = key.signHex(message);
        publicKeyHex = key.publicKeyHex();
    } catch (const std::exception& ex) {
        std::cerr << "Secret key error: " << ex.what() << "\n";
        return 1;
    }

    std::ostringstream json;
    json << "{\n";
    json << "  \"pool_id\": \"" << poolId << "\",\n";
    json << "  \"journal_size\": " << journalSize << ",\n";
    json << "  \"merkle_root\": \"" << merkleRoot << "\",\n";
    json << "  \"deployment_id\": \"" << deploymentId << "\"";
    if (!chainId.empty()) {
        json << ",\n  \"chain_id\": \"" << chainId << "\"";
    }
    json << ",\n  \"signature\": \"" << signatureHex << "\",\n";
    json << "  \"public_key\": \"" << publicKeyHex << "\"\n";
    json << "}\n";

    if (outputPath.empty()) {
        std::cout << json.str();
        return 0;
    }
    std::ofstream out(outputPath);
    if (!(out << json.str())) {
        std::cerr << "Unable to write " << outputPath << "\n";
        return 1;
    }

    return 0;
}
