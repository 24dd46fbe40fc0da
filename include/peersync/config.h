/**
 * @file config.h
 * @brief Configuration constants for PeerSync
 *
 * This file contains the compile-time constants used throughout the
 * PeerSync transfer library: wire frame tags, chunking, endpoint naming,
 * the connection code alphabet and the default timings of the reliability
 * layer.
 *
 * Runtime-tunable values (timeouts, thresholds, poll budgets) start from
 * these defaults and can be overridden through TransferConfig.
 *
 * @note Changes to the wire constants break compatibility with peers.
 *       Ensure all peers use compatible configurations.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace PeerSync
 * @brief PeerSync namespace containing all public APIs
 */
namespace PeerSync {

//=========================================================================
// Wire Protocol
//=========================================================================

/** @defgroup WireProtocol Wire Protocol Constants
 * @brief Frame type tags and framing sizes
 *
 * Every message on the data channel begins with exactly one tag byte.
 * @{
 */

constexpr uint8_t FRAME_TAG_JSON = 0x4A;    ///< 'J' - JSON control message
constexpr uint8_t FRAME_TAG_BINARY = 0x42;  ///< 'B' - Whole binary payload (images)
constexpr uint8_t FRAME_TAG_CHUNK = 0x43;   ///< 'C' - One chunk of a large payload (videos)

/**
 * @brief Chunk size for large payloads
 *
 * 16 KiB keeps every chunk frame inside the message size that data
 * channel implementations deliver reliably.
 */
constexpr size_t CHUNK_SIZE = 16 * 1024;

/// Size of the little-endian length/index fields in Binary and Chunk frames
constexpr size_t FRAME_U32_SIZE = 4;

/// Offset of the JSON header inside a Binary body (after the header length)
constexpr size_t BINARY_HEADER_OFFSET = FRAME_U32_SIZE;

/// Offset of the JSON header inside a Chunk body (index + total + length)
constexpr size_t CHUNK_HEADER_OFFSET = 3 * FRAME_U32_SIZE;

/** @} */ // end of WireProtocol

//=========================================================================
// Pairing
//=========================================================================

/** @defgroup Pairing Pairing Configuration
 * @{
 */

/// Length of a connection code
constexpr size_t CONNECTION_CODE_LENGTH = 6;

/**
 * @brief Connection code alphabet (32 symbols)
 *
 * Digits and uppercase letters minus the confusable glyphs 0, O, I and 1.
 * 32 symbols divide 256 evenly, so a random byte maps without bias.
 */
constexpr const char* CONNECTION_CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
constexpr size_t CONNECTION_CODE_ALPHABET_SIZE = 32;

/// Sender endpoint id prefix ("nbp-sync-<CODE>")
constexpr const char* SENDER_ENDPOINT_PREFIX = "nbp-sync-";

/// Receiver endpoint id prefix ("nbp-recv-<random code>-<base36 ms>")
constexpr const char* RECEIVER_ENDPOINT_PREFIX = "nbp-recv-";

/// Number of symbols in a pairing fingerprint
constexpr size_t FINGERPRINT_SYMBOL_COUNT = 3;

/// Maximum endpoint-id collision retries before giving up
constexpr int MAX_CODE_COLLISION_RETRIES = 3;

/** @} */ // end of Pairing

//=========================================================================
// Records
//=========================================================================

/// Record UUID prefix ("nbp-<base36 timestamp>-<random>")
constexpr const char* RECORD_UUID_PREFIX = "nbp-";

/// Number of random base36 characters in a record UUID
constexpr size_t RECORD_UUID_RANDOM_LENGTH = 8;

constexpr const char* DEFAULT_IMAGE_MIME = "image/webp";
constexpr const char* DEFAULT_VIDEO_MIME = "video/mp4";
constexpr const char* DEFAULT_CHARACTER_IMAGE_MIME = "image/png";

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Default timeouts and intervals (milliseconds)
 * @{
 */

/**
 * @brief Outbound buffer threshold for streaming sends
 *
 * A Binary or Chunk frame is only handed to the channel once the buffered
 * amount is at or below this value.
 */
constexpr size_t DRAIN_THRESHOLD_BYTES = 64 * 1024;

/// Interval between buffered-amount polls
constexpr uint32_t DRAIN_POLL_INTERVAL_MS = 50;

/**
 * @brief Maximum number of buffered-amount polls (1200 x 50ms = 60s)
 *
 * After the budget is exhausted the send proceeds anyway.
 */
constexpr uint32_t DRAIN_MAX_POLLS = 1200;

/// Per-record / per-character acknowledgement timeout
constexpr uint32_t RECORD_ACK_TIMEOUT_MS = 60000;

/// Final transfer_ack timeout
constexpr uint32_t TRANSFER_ACK_TIMEOUT_MS = 30000;

/// Settle delay after a burst of binary frames before the closing control frame
constexpr uint32_t SETTLE_DELAY_MS = 100;

/// Receiver wait for missing images after record_end
constexpr uint32_t IMAGE_PART_WAIT_MS = 10000;

/// Receiver wait for a missing video after record_end
constexpr uint32_t VIDEO_PART_WAIT_MS = 30000;

/// Session maintenance tick (receiver deadlines, open timeout)
constexpr uint32_t MAINTENANCE_TICK_MS = 100;

/// Data channel open timeout
constexpr uint32_t CONNECTION_OPEN_TIMEOUT_MS = 30000;

/// Endpoint registration timeout
constexpr uint32_t ENDPOINT_OPEN_TIMEOUT_MS = 30000;

/// Minimum interval between progress callbacks
constexpr uint32_t PROGRESS_THROTTLE_MS = 50;

/** @} */ // end of Timing

//=========================================================================
// Diagnostics
//=========================================================================

/// Maximum number of lines kept in a session's diagnostics buffer
constexpr size_t DIAGNOSTICS_MAX_LINES = 2000;

//=========================================================================
// Backup files
//=========================================================================

/** @defgroup Backup Backup File Format
 * @brief JSON export/import of history and characters
 * @{
 */

/// Written as "version"; any non-zero version is accepted on import
constexpr uint32_t BACKUP_FORMAT_VERSION = 1;

/// "type" of a character backup (history backups carry no type)
constexpr const char* BACKUP_TYPE_CHARACTERS = "characters";

/// Default file names: <prefix><epoch ms>.json
constexpr const char* HISTORY_BACKUP_PREFIX = "nbp-history-";
constexpr const char* CHARACTER_BACKUP_PREFIX = "nbp-characters-";

/// "appVersion" written into backups
constexpr const char* PEERSYNC_VERSION_STRING = "0.1.0";

/** @} */ // end of Backup

}  // namespace PeerSync
