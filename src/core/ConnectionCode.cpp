/**
 * @file ConnectionCode.cpp
 * @brief ConnectionCode implementation.
 */

#include "peersync/ConnectionCode.h"
#include "peersync/SecureRandom.h"
#include "peersync/UuidGenerator.h"
#include "peersync/config.h"

#include <cctype>

namespace PeerSync {

bool ConnectionCode::generate(std::string& outCode, std::string& errorMsg) {
    return SecureRandom::randomString(CONNECTION_CODE_ALPHABET, CONNECTION_CODE_LENGTH, outCode, errorMsg);
}

bool ConnectionCode::normalize(const std::string& input, std::string& outCode, std::string& errorMsg) {
    std::string out;
    out.reserve(CONNECTION_CODE_LENGTH);

    for (unsigned char uc : input) {
        const unsigned char upper = static_cast<unsigned char>(std::toupper(uc));
        if ((upper >= 'A' && upper <= 'Z') || (upper >= '0' && upper <= '9')) {
            out.push_back(static_cast<char>(upper));
        }
    }

    if (out.size() != CONNECTION_CODE_LENGTH) {
        errorMsg = "Connection code must be " + std::to_string(CONNECTION_CODE_LENGTH) +
                   " characters (got " + std::to_string(out.size()) + ")";
        return false;
    }

    outCode = std::move(out);
    return true;
}

bool ConnectionCode::isNormalized(const std::string& code) {
    if (code.size() != CONNECTION_CODE_LENGTH) {
        return false;
    }
    for (char c : code) {
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) {
            return false;
        }
    }
    return true;
}

bool ConnectionCode::isFromAlphabet(const std::string& code) {
    const std::string alphabet = CONNECTION_CODE_ALPHABET;
    for (char c : code) {
        if (alphabet.find(c) == std::string::npos) {
            return false;
        }
    }
    return true;
}

std::string ConnectionCode::senderEndpointId(const std::string& code) {
    return std::string(SENDER_ENDPOINT_PREFIX) + code;
}

bool ConnectionCode::receiverEndpointId(std::string& outId, std::string& errorMsg) {
    std::string code;
    if (!generate(code, errorMsg)) {
        return false;
    }
    outId = std::string(RECEIVER_ENDPOINT_PREFIX) + code + "-" +
            UuidGenerator::toBase36(UuidGenerator::nowEpochMs());
    return true;
}

}  // namespace PeerSync
