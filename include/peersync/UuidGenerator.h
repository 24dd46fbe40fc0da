/**
 * @file UuidGenerator.h
 * @brief Record UUID generation utility
 *
 * Records exchanged between peers are identified by a UUID that survives
 * the transfer, so the receiver can recognize records it already holds.
 */

#pragma once

#include <cstdint>
#include <string>

namespace PeerSync {

/**
 * @class UuidGenerator
 * @brief Generator and validator for record UUIDs
 *
 * Format: nbp-<base36 epoch milliseconds>-<8 random base36 characters>,
 * e.g. "nbp-lq2x8k3m-a7f3kq9z". All characters are lowercase.
 *
 * Thread Safety:
 * - All methods are thread-safe (no shared state)
 */
class UuidGenerator {
public:
    /**
     * @brief Generate a new record UUID
     * @return UUID string, or empty string if the CSPRNG fails
     */
    static std::string generate();

    /**
     * @brief Check that a string has the record UUID shape
     *
     * Accepts nbp-<[a-z0-9]+>-<[a-z0-9]+>. Older peers produced other
     * random-part lengths, so only the shape is checked.
     */
    static bool isValid(const std::string& uuid);

    /**
     * @brief Lowercase base36 rendering of an unsigned value
     */
    static std::string toBase36(uint64_t value);

    /**
     * @brief Current wall clock time in epoch milliseconds
     */
    static uint64_t nowEpochMs();

private:
    UuidGenerator() = delete;
};

}  // namespace PeerSync
