/**
 * @file DiagnosticsLog.cpp
 * @brief Thread-safe per-session diagnostics log implementation
 *
 * (c) 2026 PeerSync Project
 * Licensed under MIT License
 */

#include "peersync/DiagnosticsLog.h"
#include "peersync/Debug.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace PeerSync {

DiagnosticsLog::DiagnosticsLog(std::string tag, size_t maxLines)
    : m_tag(std::move(tag))
    , m_maxLines(maxLines == 0 ? 1 : maxLines)
{
}

void DiagnosticsLog::setMirrorFile(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_mirrorPath = path;
}

void DiagnosticsLog::add(const std::string& message) {
    LOG_DEBUG("[" << m_tag << "] " << message);

    auto now = std::chrono::system_clock::now();
    auto now_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now_t);
#else
    localtime_r(&now_t, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << ": " << message;
    std::string line = oss.str();

    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_mirrorPath.empty()) {
        std::ofstream file(m_mirrorPath, std::ios::app);
        if (file.is_open()) {
            file << "[" << m_tag << "] " << line << "\n";
        }
    }

    m_lines.push_back(std::move(line));
    while (m_lines.size() > m_maxLines) {
        m_lines.pop_front();
    }
}

std::vector<std::string> DiagnosticsLog::lines() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<std::string>(m_lines.begin(), m_lines.end());
}

void DiagnosticsLog::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lines.clear();
}

}  // namespace PeerSync
