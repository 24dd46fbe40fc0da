/**
 * @file TransferConfig.h
 * @brief Runtime-tunable settings of the transfer reliability layer
 */

#pragma once

#include "config.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace PeerSync {

/**
 * @struct TransferConfig
 * @brief Timeouts, thresholds and poll budgets used by a session
 *
 * Defaults match the constants in config.h. The receiver's part-wait
 * deadlines in particular are defaults, not protocol requirements.
 *
 * JSON keys are the member names; unknown keys are ignored and keys with
 * the wrong type keep their default.
 */
struct TransferConfig {
    size_t drainThresholdBytes = DRAIN_THRESHOLD_BYTES;
    uint32_t drainPollIntervalMs = DRAIN_POLL_INTERVAL_MS;
    uint32_t drainMaxPolls = DRAIN_MAX_POLLS;
    uint32_t recordAckTimeoutMs = RECORD_ACK_TIMEOUT_MS;
    uint32_t transferAckTimeoutMs = TRANSFER_ACK_TIMEOUT_MS;
    uint32_t settleDelayMs = SETTLE_DELAY_MS;
    uint32_t imagePartWaitMs = IMAGE_PART_WAIT_MS;
    uint32_t videoPartWaitMs = VIDEO_PART_WAIT_MS;
    uint32_t maintenanceTickMs = MAINTENANCE_TICK_MS;
    uint32_t connectionOpenTimeoutMs = CONNECTION_OPEN_TIMEOUT_MS;
    uint32_t endpointOpenTimeoutMs = ENDPOINT_OPEN_TIMEOUT_MS;
    int maxCodeRetries = MAX_CODE_COLLISION_RETRIES;
    std::string diagnosticsFile;  ///< Mirror file for session diagnostics (empty = off)

    nlohmann::json toJson() const;
    static TransferConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Load a configuration file
     * @param path JSON file
     * @param out Output config (defaults for missing keys)
     * @param errorMsg Output error message on failure
     * @return true on success
     */
    static bool loadFromFile(const std::filesystem::path& path,
                             TransferConfig& out,
                             std::string& errorMsg);

    /**
     * @brief Save the configuration as pretty-printed JSON
     */
    bool saveToFile(const std::filesystem::path& path, std::string& errorMsg) const;
};

}  // namespace PeerSync
