/**
 * @file SecureRandom.cpp
 * @brief SecureRandom implementation.
 */

#include "peersync/SecureRandom.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <climits>

namespace PeerSync {

namespace {

static std::string opensslLastErrorString() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "Unknown error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

}  // namespace

bool SecureRandom::fillRandom(uint8_t* out, size_t len, std::string& errorMsg) {
    if (!out) {
        errorMsg = "Null output buffer";
        return false;
    }
    if (len == 0) {
        return true;
    }
    if (len > static_cast<size_t>(INT_MAX)) {
        errorMsg = "Requested too many random bytes";
        return false;
    }

    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
        errorMsg = "RAND_bytes failed: " + opensslLastErrorString();
        std::fill(out, out + len, 0);
        return false;
    }
    return true;
}

bool SecureRandom::randomString(const std::string& alphabet,
                                size_t length,
                                std::string& out,
                                std::string& errorMsg) {
    if (alphabet.empty() || alphabet.size() > 256) {
        errorMsg = "Alphabet must contain 1..256 symbols";
        return false;
    }

    // Largest multiple of the alphabet size that fits in a byte
    const size_t limit = 256 - (256 % alphabet.size());

    std::string result;
    result.reserve(length);

    std::array<uint8_t, 32> pool{};
    while (result.size() < length) {
        if (!fillRandom(pool.data(), pool.size(), errorMsg)) {
            return false;
        }
        for (uint8_t b : pool) {
            if (static_cast<size_t>(b) >= limit) {
                continue;
            }
            result.push_back(alphabet[b % alphabet.size()]);
            if (result.size() == length) {
                break;
            }
        }
    }

    out = std::move(result);
    return true;
}

}  // namespace PeerSync
