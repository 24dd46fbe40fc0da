/**
 * @file BackpressureController.cpp
 * @brief BackpressureController implementation
 */

#include "peersync/BackpressureController.h"
#include "peersync/DiagnosticsLog.h"
#include "peersync/Debug.h"

#include <chrono>

namespace PeerSync {

const char* drainResultToString(DrainResult result) {
    switch (result) {
        case DrainResult::Drained:          return "Drained";
        case DrainResult::TimedOut:         return "TimedOut";
        case DrainResult::ConnectionClosed: return "ConnectionClosed";
    }
    return "Unknown";
}

BackpressureController::BackpressureController(uint32_t pollIntervalMs,
                                               uint32_t maxPolls,
                                               DiagnosticsLog* log)
    : m_pollIntervalMs(pollIntervalMs == 0 ? 1 : pollIntervalMs)
    , m_maxPolls(maxPolls)
    , m_log(log)
{
}

DrainResult BackpressureController::waitForDrain(const DataChannel& channel, size_t threshold) {
    std::unique_lock<std::mutex> lock(m_mutex);

    if (m_cancelled || !channel.isOpen()) {
        return DrainResult::ConnectionClosed;
    }

    uint32_t polls = 0;
    while (channel.bufferedAmount() > threshold) {
        m_cv.wait_for(lock, std::chrono::milliseconds(m_pollIntervalMs));

        if (m_cancelled || !channel.isOpen()) {
            if (m_log) {
                m_log->add("Connection closed during buffer drain");
            }
            return DrainResult::ConnectionClosed;
        }

        ++polls;
        if (polls % 20 == 0 && m_log) {
            m_log->add("Still draining... bufferedAmount: " + std::to_string(channel.bufferedAmount()));
        }
        if (polls > m_maxPolls) {
            m_drainTimeouts.fetch_add(1);
            LOG_WARNING("Buffer drain timeout after " << polls << " polls, bufferedAmount: "
                        << channel.bufferedAmount());
            if (m_log) {
                m_log->add("Buffer drain timeout, bufferedAmount: " +
                           std::to_string(channel.bufferedAmount()));
            }
            return DrainResult::TimedOut;
        }
    }

    return DrainResult::Drained;
}

void BackpressureController::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

void BackpressureController::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancelled = false;
    m_drainTimeouts.store(0);
}

}  // namespace PeerSync
