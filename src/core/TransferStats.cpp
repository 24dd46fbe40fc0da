/**
 * @file TransferStats.cpp
 * @brief TransferStats and ThrottledProgress implementation
 */

#include "peersync/TransferStats.h"

#include <cstdio>

namespace PeerSync {

namespace {

constexpr double kKiB = 1024.0;
constexpr double kMiB = 1024.0 * 1024.0;

static std::string formatFixed(double value, int decimals, const char* unit) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f %s", decimals, value, unit);
    return std::string(buf);
}

}  // namespace

//=============================================================================
// TransferStats
//=============================================================================

void TransferStats::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_running = true;
    m_startTime = std::chrono::steady_clock::now();
    m_stopTime = m_startTime;
}

void TransferStats::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        m_running = false;
        m_stopTime = std::chrono::steady_clock::now();
    }
}

void TransferStats::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_bytesSent.store(0);
    m_bytesReceived.store(0);
    m_running = false;
    m_startTime = std::chrono::steady_clock::time_point{};
    m_stopTime = m_startTime;
}

TransferStatsSnapshot TransferStats::snapshot() const {
    TransferStatsSnapshot snap;
    snap.bytesSent = m_bytesSent.load();
    snap.bytesReceived = m_bytesReceived.load();

    std::lock_guard<std::mutex> lock(m_mutex);
    const auto end = m_running ? std::chrono::steady_clock::now() : m_stopTime;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - m_startTime).count();
    snap.elapsedMs = elapsed > 0 ? static_cast<uint64_t>(elapsed) : 0;

    if (snap.elapsedMs > 0) {
        const double seconds = static_cast<double>(snap.elapsedMs) / 1000.0;
        snap.sendBytesPerSec = static_cast<double>(snap.bytesSent) / seconds;
        snap.receiveBytesPerSec = static_cast<double>(snap.bytesReceived) / seconds;
    }
    return snap;
}

std::string TransferStats::formatBytes(uint64_t bytes) {
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    if (bytes < 1024 * 1024) {
        return formatFixed(static_cast<double>(bytes) / kKiB, 1, "KB");
    }
    return formatFixed(static_cast<double>(bytes) / kMiB, 2, "MB");
}

std::string TransferStats::formatSpeed(double bytesPerSec) {
    if (bytesPerSec < kKiB) {
        return formatFixed(bytesPerSec, 0, "B/s");
    }
    if (bytesPerSec < kMiB) {
        return formatFixed(bytesPerSec / kKiB, 1, "KB/s");
    }
    return formatFixed(bytesPerSec / kMiB, 2, "MB/s");
}

//=============================================================================
// ThrottledProgress
//=============================================================================

ThrottledProgress::ThrottledProgress(ProgressCallback callback, uint32_t throttleMs)
    : m_callback(std::move(callback))
    , m_throttleMs(throttleMs)
{
}

void ThrottledProgress::operator()(const TransferProgress& progress, bool force) {
    if (!m_callback) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - m_lastUpdate).count();

    if (force || !m_hasUpdated || elapsed >= static_cast<long long>(m_throttleMs)) {
        m_callback(progress);
        m_lastUpdate = now;
        m_hasUpdated = true;
    }
}

}  // namespace PeerSync
