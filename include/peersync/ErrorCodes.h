/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

#include <string>

namespace PeerSync {
namespace ErrorCodes {

// Connection (endpoint, pairing, channel lifecycle)
inline constexpr const char* CONNECTION_CLOSED = "PSY-CONN-1000";
inline constexpr const char* CONNECTION_INVALID_CODE = "PSY-CONN-1001";
inline constexpr const char* CONNECTION_OPEN_TIMEOUT = "PSY-CONN-1002";
inline constexpr const char* CONNECTION_ICE_FAILED = "PSY-CONN-1003";
inline constexpr const char* CONNECTION_ENDPOINT_ERROR = "PSY-CONN-1004";
inline constexpr const char* CONNECTION_CODE_EXHAUSTED = "PSY-CONN-1005";
inline constexpr const char* CONNECTION_TRANSPORT_ERROR = "PSY-CONN-1100";

// Transfer (sender batch, reconciliation)
inline constexpr const char* TRANSFER_ABORTED_CLOSED = "PSY-XFER-2000";
inline constexpr const char* TRANSFER_STORAGE_READ = "PSY-XFER-2001";
inline constexpr const char* TRANSFER_RECORD_ABANDONED = "PSY-XFER-2002";
inline constexpr const char* TRANSFER_INTERNAL_ERROR = "PSY-XFER-2100";

// Storage (receiver persistence)
inline constexpr const char* STORAGE_WRITE_FAILED = "PSY-STOR-3000";

// Backup files (export/import)
inline constexpr const char* BACKUP_INVALID_FORMAT = "PSY-BACK-4000";
inline constexpr const char* BACKUP_FILE_ERROR = "PSY-BACK-4001";

}  // namespace ErrorCodes

/**
 * @brief Session-level error: stable code plus human-readable message
 */
struct SessionError {
    std::string code;     ///< One of ErrorCodes (empty when no error)
    std::string message;  ///< Details for diagnostics

    bool empty() const { return code.empty(); }
};

}  // namespace PeerSync
