/**
 * @file SecureRandom.h
 * @brief Cryptographically secure randomness (OpenSSL RAND_bytes)
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace PeerSync {

/**
 * @class SecureRandom
 * @brief Thin wrapper over the OpenSSL CSPRNG
 *
 * Thread Safety:
 * - All methods are thread-safe (OpenSSL 1.1+ RAND is thread-safe)
 */
class SecureRandom {
public:
    /**
     * @brief Fill a buffer with random bytes
     * @param out Output buffer
     * @param len Number of bytes
     * @param errorMsg Output error message on failure
     * @return true on success (buffer is zeroed on failure)
     */
    static bool fillRandom(uint8_t* out, size_t len, std::string& errorMsg);

    /**
     * @brief Draw `length` symbols uniformly from `alphabet`
     *
     * Uses rejection sampling, so alphabets whose size does not divide 256
     * stay unbiased.
     *
     * @return false if the alphabet is empty or the CSPRNG fails
     */
    static bool randomString(const std::string& alphabet,
                             size_t length,
                             std::string& out,
                             std::string& errorMsg);

private:
    SecureRandom() = delete;
};

}  // namespace PeerSync
