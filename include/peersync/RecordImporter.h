/**
 * @file RecordImporter.h
 * @brief Deduplicating persistence of received records and characters
 *
 * Used by the receiver for streamed and legacy inline records, and by
 * BackupArchive for file imports.
 */

#pragma once

#include "FrameCodec.h"
#include "StorageInterfaces.h"
#include "TransferMessages.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace PeerSync {

class DiagnosticsLog;

/**
 * @brief One image payload of an incoming record
 */
struct IncomingImage {
    uint32_t index = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    std::string mimeType;          ///< Empty means DEFAULT_IMAGE_MIME
    Bytes data;
};

/**
 * @brief A complete record with its media in memory
 */
struct IncomingRecord {
    RecordMeta meta;               ///< imageCount/hasVideo are ignored here
    std::vector<IncomingImage> images;
    bool hasVideo = false;
    RecordVideoHeader videoHeader;
    Bytes video;
};

/**
 * @brief A character with its full image in memory
 */
struct IncomingCharacter {
    CharacterMeta meta;
    bool hasImage = false;
    std::string imageMime;
    Bytes image;
};

enum class ImportOutcome {
    Imported,
    Skipped,
    Failed
};

const char* importOutcomeToString(ImportOutcome outcome);

/**
 * @class RecordImporter
 * @brief Deduplicates by UUID (records) or name (characters) and persists
 *
 * Records get blob paths under "/images/<id>/" and "/videos/<id>/"; a
 * record whose media fails to save has those directories deleted again.
 * Characters get "/characters/<id>/image.<ext>". Thumbnail failures are
 * logged and never fail an import.
 *
 * Thread Safety:
 * - Not thread-safe; callers serialize access
 */
class RecordImporter {
public:
    RecordImporter(HistoryStore& history,
                   BlobStore& blobs,
                   ThumbnailGenerator& thumbnails,
                   DiagnosticsLog& log);

    /**
     * @brief Import one record
     *
     * A record without a UUID is given a fresh one and is never a duplicate.
     *
     * @param newId Storage id when Imported
     * @param errorMsg Reason when Failed
     */
    ImportOutcome importRecord(const IncomingRecord& record, RecordId& newId, std::string& errorMsg);

    ImportOutcome importCharacter(const IncomingCharacter& character, std::string& errorMsg);

    /**
     * @brief Parse a record with inline base64 images
     *
     * Shape: {uuid, timestamp, prompt, mode, options, status, thinkingText,
     * error, images: [{index, width, height, data, mimeType?}]}. Used by
     * backup files and the legacy history_record message.
     *
     * @return false if the value is not an object or an image is not base64
     */
    static bool recordFromInlineJson(const nlohmann::json& j, IncomingRecord& out, std::string& errorMsg);

    static std::string imageExtension(const std::string& mimeType);
    static std::string characterImageExtension(const std::string& mimeType);

private:
    bool saveRecord(const IncomingRecord& record, const std::string& uuid, RecordId& newId, std::string& errorMsg);
    bool saveCharacter(const IncomingCharacter& character, std::string& errorMsg);
    void removeMedia(RecordId id);

    HistoryStore& m_history;
    BlobStore& m_blobs;
    ThumbnailGenerator& m_thumbnails;
    DiagnosticsLog& m_log;
};

}  // namespace PeerSync
