/**
 * @file TransferMessages.h
 * @brief Control messages and binary headers of the transfer protocol
 *
 * Every control message is a JSON object with a "type" field carried in a
 * Json frame. Binary and Chunk frames carry a JSON header whose "type"
 * routes the payload.
 *
 * fromJson() is lenient: missing or wrongly typed fields keep their
 * defaults, so peers on older revisions interoperate.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace PeerSync {

namespace MessageType {

// Pairing
inline constexpr const char* CONFIRM_PAIRING = "confirm_pairing";
inline constexpr const char* SYNC_TYPE = "sync_type";

// History
inline constexpr const char* HISTORY_META = "history_meta";
inline constexpr const char* RECORD_START = "record_start";
inline constexpr const char* RECORD_END = "record_end";
inline constexpr const char* RECORD_ACK = "record_ack";
inline constexpr const char* HISTORY_RECORD = "history_record";  ///< Legacy whole record, inline images

// Characters
inline constexpr const char* CHARACTERS_META = "characters_meta";
inline constexpr const char* CHARACTER_START = "character_start";
inline constexpr const char* CHARACTER_END = "character_end";
inline constexpr const char* CHARACTER_ACK = "character_ack";

// Reconciliation
inline constexpr const char* TRANSFER_COMPLETE = "transfer_complete";
inline constexpr const char* TRANSFER_ACK = "transfer_ack";

// Binary / Chunk header types
inline constexpr const char* RECORD_IMAGE = "record_image";
inline constexpr const char* RECORD_VIDEO = "record_video";
inline constexpr const char* CHARACTER_IMAGE = "character_image";

}  // namespace MessageType

/**
 * @brief What a sender transfers in one session
 */
enum class SyncType {
    History,
    Characters,
    All
};

const char* syncTypeToString(SyncType type);

/// Unknown strings map to History
SyncType syncTypeFromString(const std::string& value);

/// Read the "type" field of a message or header ("" if absent)
std::string messageTypeOf(const nlohmann::json& message);

//=============================================================================
// Metadata payloads
//=============================================================================

/**
 * @brief Scalar metadata of a history record (record_start.meta)
 */
struct RecordMeta {
    std::string uuid;
    int64_t timestamp = 0;
    std::string prompt;
    std::string mode;
    nlohmann::json options = nlohmann::json::object();
    std::string status;
    std::string thinkingText;
    std::string error;
    uint32_t imageCount = 0;
    bool hasVideo = false;

    nlohmann::json toJson() const;
    static RecordMeta fromJson(const nlohmann::json& j);
};

/**
 * @brief Character metadata (character_start.character)
 */
struct CharacterMeta {
    std::string name;
    std::string description;
    std::string physicalTraits;
    std::string clothing;
    std::string accessories;
    std::string distinctiveFeatures;
    std::string thumbnail;

    nlohmann::json toJson() const;
    static CharacterMeta fromJson(const nlohmann::json& j);
};

//=============================================================================
// Binary headers
//=============================================================================

struct RecordImageHeader {
    std::string uuid;
    uint32_t index = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint64_t size = 0;
    std::string mimeType;

    nlohmann::json toJson() const;
    static RecordImageHeader fromJson(const nlohmann::json& j);
};

struct RecordVideoHeader {
    std::string uuid;
    uint32_t width = 0;
    uint32_t height = 0;
    uint64_t size = 0;
    std::string mimeType;

    nlohmann::json toJson() const;
    static RecordVideoHeader fromJson(const nlohmann::json& j);
};

struct CharacterImageHeader {
    std::string name;
    uint64_t size = 0;
    std::string mimeType;

    nlohmann::json toJson() const;
    static CharacterImageHeader fromJson(const nlohmann::json& j);
};

//=============================================================================
// Acknowledgements
//=============================================================================

struct RecordAck {
    std::string uuid;
    uint32_t receivedImages = 0;
    uint32_t expectedImages = 0;
    bool hasVideo = false;
    bool skipped = false;

    nlohmann::json toJson() const;
    static RecordAck fromJson(const nlohmann::json& j);
};

struct CharacterAck {
    std::string name;
    bool skipped = false;

    nlohmann::json toJson() const;
    static CharacterAck fromJson(const nlohmann::json& j);
};

/**
 * @brief Sender's final tally
 */
struct TransferComplete {
    uint32_t total = 0;
    uint32_t sent = 0;
    uint32_t failed = 0;

    nlohmann::json toJson() const;
    static TransferComplete fromJson(const nlohmann::json& j);
};

/**
 * @brief Receiver's reply to transfer_complete
 */
struct TransferAck {
    uint32_t receivedCount = 0;
    uint32_t expectedCount = 0;
    uint32_t imported = 0;
    uint32_t skipped = 0;
    uint32_t failed = 0;

    nlohmann::json toJson() const;
    static TransferAck fromJson(const nlohmann::json& j);
};

//=============================================================================
// Control message builders
//=============================================================================

namespace Messages {

nlohmann::json confirmPairing();
nlohmann::json syncType(SyncType type);
nlohmann::json historyMeta(uint32_t count);
nlohmann::json recordStart(const RecordMeta& meta);
nlohmann::json recordEnd(const std::string& uuid);

/// Legacy single-message record; `record` uses the backup file record shape
nlohmann::json historyRecord(const nlohmann::json& record);
nlohmann::json charactersMeta(uint32_t count);
nlohmann::json characterStart(const CharacterMeta& character);
nlohmann::json characterEnd(const std::string& name);

}  // namespace Messages

}  // namespace PeerSync
