/**
 * @file DiagnosticsLog.h
 * @brief Thread-safe per-session diagnostics log
 *
 * (c) 2026 PeerSync Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"

#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace PeerSync {

/**
 * @brief Timestamped diagnostic lines for one session
 *
 * Individual item failures (ACK timeouts, mismatched frames, storage
 * errors) are only surfaced here; the end user sees aggregate counts.
 *
 * Every line is also forwarded to LOG_DEBUG. When a mirror file is set,
 * lines are appended to it as well.
 *
 * Thread Safety:
 * - All methods lock an internal mutex and may be called from any thread
 */
class DiagnosticsLog {
public:
    explicit DiagnosticsLog(std::string tag = "PeerSync",
                            size_t maxLines = DIAGNOSTICS_MAX_LINES);

    /**
     * @brief Mirror every subsequent line to a file (append mode)
     * @param path File path; empty disables mirroring
     */
    void setMirrorFile(const std::filesystem::path& path);

    /**
     * @brief Append a diagnostic line
     *
     * The oldest line is dropped once maxLines is reached.
     */
    void add(const std::string& message);

    /// Snapshot of the buffered lines, oldest first
    std::vector<std::string> lines() const;

    /// Drop all buffered lines
    void clear();

private:
    std::string m_tag;
    size_t m_maxLines;
    std::filesystem::path m_mirrorPath;
    std::deque<std::string> m_lines;
    mutable std::mutex m_mutex;
};

}  // namespace PeerSync
