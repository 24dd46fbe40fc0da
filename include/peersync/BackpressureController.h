/**
 * @file BackpressureController.h
 * @brief Gates streaming sends on the channel's outbound buffer
 */

#pragma once

#include "DataChannel.h"
#include "config.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace PeerSync {

class DiagnosticsLog;

enum class DrainResult {
    Drained,          ///< bufferedAmount <= threshold
    TimedOut,         ///< Poll budget exhausted; the caller sends anyway
    ConnectionClosed  ///< Channel closed (or wait cancelled); stop the batch
};

const char* drainResultToString(DrainResult result);

/**
 * @class BackpressureController
 * @brief Polls bufferedAmount() until it falls to a threshold
 *
 * The caller blocks for at most pollIntervalMs * maxPolls. A closed channel
 * or cancel() ends the wait immediately with ConnectionClosed.
 *
 * Thread Safety:
 * - waitForDrain() is called from one sender thread
 * - cancel()/reset() may be called from any thread
 */
class BackpressureController {
public:
    BackpressureController(uint32_t pollIntervalMs = DRAIN_POLL_INTERVAL_MS,
                           uint32_t maxPolls = DRAIN_MAX_POLLS,
                           DiagnosticsLog* log = nullptr);

    /**
     * @brief Block until channel.bufferedAmount() <= threshold
     * @param channel Channel to observe
     * @param threshold Byte threshold (0 for a full drain)
     */
    DrainResult waitForDrain(const DataChannel& channel, size_t threshold);

    /// Abort the current and all later waits with ConnectionClosed
    void cancel();

    /// Clear cancellation and counters for a new session
    void reset();

    /// Number of waits that exhausted their poll budget
    uint32_t drainTimeouts() const { return m_drainTimeouts.load(); }

private:
    uint32_t m_pollIntervalMs;
    uint32_t m_maxPolls;
    DiagnosticsLog* m_log;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_cancelled = false;
    std::atomic<uint32_t> m_drainTimeouts{0};
};

}  // namespace PeerSync
