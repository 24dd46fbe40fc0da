/**
 * @file TransferStats.h
 * @brief Byte counters, speed, formatting and throttled progress reporting
 */

#pragma once

#include "config.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace PeerSync {

/**
 * @brief Item-level progress of the current phase
 *
 * Phases: "sending", "sending_characters", "receiving",
 * "receiving_characters".
 */
struct TransferProgress {
    uint32_t current = 0;
    uint32_t total = 0;
    std::string phase;
};

using ProgressCallback = std::function<void(const TransferProgress& progress)>;

/**
 * @brief Point-in-time copy of the byte counters
 */
struct TransferStatsSnapshot {
    uint64_t bytesSent = 0;
    uint64_t bytesReceived = 0;
    uint64_t elapsedMs = 0;
    double sendBytesPerSec = 0.0;
    double receiveBytesPerSec = 0.0;
};

/**
 * @class TransferStats
 * @brief Session byte counters and average throughput
 *
 * Thread Safety:
 * - addSent()/addReceived() are lock-free and may be called from any thread
 * - start()/stop()/reset()/snapshot() are thread-safe
 */
class TransferStats {
public:
    void start();
    void stop();
    void reset();

    void addSent(uint64_t bytes) { m_bytesSent.fetch_add(bytes); }
    void addReceived(uint64_t bytes) { m_bytesReceived.fetch_add(bytes); }

    TransferStatsSnapshot snapshot() const;

    /// "512 B", "1.5 KB", "2.25 MB"
    static std::string formatBytes(uint64_t bytes);

    /// "512 B/s", "1.5 KB/s", "2.25 MB/s"
    static std::string formatSpeed(double bytesPerSec);

private:
    std::atomic<uint64_t> m_bytesSent{0};
    std::atomic<uint64_t> m_bytesReceived{0};

    mutable std::mutex m_mutex;
    bool m_running = false;
    std::chrono::steady_clock::time_point m_startTime;
    std::chrono::steady_clock::time_point m_stopTime;
};

/**
 * @class ThrottledProgress
 * @brief Wraps a progress callback with throttling
 *
 * Callbacks are only invoked if at least `throttleMs` have elapsed since
 * the last one, unless the update is forced (phase start and end).
 */
class ThrottledProgress {
public:
    explicit ThrottledProgress(ProgressCallback callback,
                               uint32_t throttleMs = PROGRESS_THROTTLE_MS);

    void operator()(const TransferProgress& progress, bool force = false);

private:
    ProgressCallback m_callback;
    uint32_t m_throttleMs;
    bool m_hasUpdated = false;
    std::chrono::steady_clock::time_point m_lastUpdate;
    std::mutex m_mutex;
};

}  // namespace PeerSync
