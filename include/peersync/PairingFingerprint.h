/**
 * @file PairingFingerprint.h
 * @brief Short visual fingerprint both peers compare before transferring.
 */

#pragma once

#include "config.h"

#include <array>
#include <cstdint>
#include <string>

namespace PeerSync {

using FingerprintSymbols = std::array<std::string, FINGERPRINT_SYMBOL_COUNT>;

class PairingFingerprint {
public:
    /// Number of symbols in the pool
    static constexpr size_t POOL_SIZE = 32;

    /**
     * @brief Compute the 3-symbol fingerprint of a connection.
     *
     * Both endpoint ids are sorted and concatenated, so either side gets the
     * same result. Each symbol is a UTF-8 emoji from pool().
     */
    static FingerprintSymbols compute(const std::string& localId, const std::string& remoteId);

    /**
     * @brief 32-bit rolling hash (h = h * 31 + c, two's complement wrap).
     */
    static int32_t hash(const std::string& text);

    /**
     * @brief Pool index of symbol `position` for a given hash.
     *
     * |(h >> 8*position) mod 32| with an arithmetic shift and a remainder
     * that takes the sign of the dividend.
     */
    static size_t symbolIndex(int32_t hash, size_t position);

    /// The fixed 32-entry emoji pool
    static const std::array<const char*, POOL_SIZE>& pool();

    /// Join symbols with single spaces for display/logging
    static std::string formatForDisplay(const FingerprintSymbols& symbols);
};

}  // namespace PeerSync
