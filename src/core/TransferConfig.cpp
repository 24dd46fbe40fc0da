/**
 * @file TransferConfig.cpp
 * @brief TransferConfig JSON persistence
 */

#include "peersync/TransferConfig.h"
#include "peersync/AtomicFile.h"

#include <fstream>

namespace PeerSync {

namespace {

template <typename T>
void readUnsigned(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key) || !j[key].is_number_integer()) {
        return;
    }
    const int64_t value = j[key].get<int64_t>();
    if (value >= 0) {
        target = static_cast<T>(value);
    }
}

}  // namespace

nlohmann::json TransferConfig::toJson() const {
    nlohmann::json j;
    j["drainThresholdBytes"] = drainThresholdBytes;
    j["drainPollIntervalMs"] = drainPollIntervalMs;
    j["drainMaxPolls"] = drainMaxPolls;
    j["recordAckTimeoutMs"] = recordAckTimeoutMs;
    j["transferAckTimeoutMs"] = transferAckTimeoutMs;
    j["settleDelayMs"] = settleDelayMs;
    j["imagePartWaitMs"] = imagePartWaitMs;
    j["videoPartWaitMs"] = videoPartWaitMs;
    j["maintenanceTickMs"] = maintenanceTickMs;
    j["connectionOpenTimeoutMs"] = connectionOpenTimeoutMs;
    j["endpointOpenTimeoutMs"] = endpointOpenTimeoutMs;
    j["maxCodeRetries"] = maxCodeRetries;
    j["diagnosticsFile"] = diagnosticsFile;
    return j;
}

TransferConfig TransferConfig::fromJson(const nlohmann::json& j) {
    TransferConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }

    readUnsigned(j, "drainThresholdBytes", cfg.drainThresholdBytes);
    readUnsigned(j, "drainPollIntervalMs", cfg.drainPollIntervalMs);
    readUnsigned(j, "drainMaxPolls", cfg.drainMaxPolls);
    readUnsigned(j, "recordAckTimeoutMs", cfg.recordAckTimeoutMs);
    readUnsigned(j, "transferAckTimeoutMs", cfg.transferAckTimeoutMs);
    readUnsigned(j, "settleDelayMs", cfg.settleDelayMs);
    readUnsigned(j, "imagePartWaitMs", cfg.imagePartWaitMs);
    readUnsigned(j, "videoPartWaitMs", cfg.videoPartWaitMs);
    readUnsigned(j, "maintenanceTickMs", cfg.maintenanceTickMs);
    readUnsigned(j, "connectionOpenTimeoutMs", cfg.connectionOpenTimeoutMs);
    readUnsigned(j, "endpointOpenTimeoutMs", cfg.endpointOpenTimeoutMs);

    if (j.contains("maxCodeRetries") && j["maxCodeRetries"].is_number_integer()) {
        const int retries = j["maxCodeRetries"].get<int>();
        if (retries > 0) {
            cfg.maxCodeRetries = retries;
        }
    }
    if (j.contains("diagnosticsFile") && j["diagnosticsFile"].is_string()) {
        cfg.diagnosticsFile = j["diagnosticsFile"].get<std::string>();
    }
    if (cfg.maintenanceTickMs == 0) {
        cfg.maintenanceTickMs = MAINTENANCE_TICK_MS;
    }

    return cfg;
}

bool TransferConfig::loadFromFile(const std::filesystem::path& path,
                                  TransferConfig& out,
                                  std::string& errorMsg) {
    std::ifstream in(path);
    if (!in) {
        errorMsg = "Failed to open config file: " + path.string();
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        errorMsg = "Config file is not valid JSON: " + path.string();
        return false;
    }
    if (!j.is_object()) {
        errorMsg = "Config root must be a JSON object";
        return false;
    }

    out = fromJson(j);
    return true;
}

bool TransferConfig::saveToFile(const std::filesystem::path& path, std::string& errorMsg) const {
    const std::string text = toJson().dump(2) + "\n";
    return atomicWriteFile(path,
                           reinterpret_cast<const uint8_t*>(text.data()),
                           text.size(),
                           errorMsg);
}

}  // namespace PeerSync
