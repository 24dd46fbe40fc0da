/**
 * @file TransferRecords.h
 * @brief Stored forms of history records and characters
 *
 * These are the shapes the storage collaborators hand to the sender and
 * receive from the receiver. Blob payloads are not part of a record; they
 * are addressed by path in the BlobStore.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace PeerSync {

/// Storage-assigned record/character id
using RecordId = int64_t;

/**
 * @brief One image attached to a history record
 */
struct StoredImage {
    uint32_t index = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    std::string path;              ///< Blob path ("/images/<id>/<index>.<ext>")
    std::string thumbnail;         ///< data: URL (may be empty)
    uint64_t originalSize = 0;
    uint64_t compressedSize = 0;
    std::string originalFormat;
    std::string compressedFormat;
};

/**
 * @brief Video attached to a history record
 */
struct StoredVideo {
    std::string path;              ///< Blob path ("/videos/<id>/video.mp4")
    std::string thumbnailPath;     ///< Blob path of the extracted frame
    uint64_t size = 0;
    std::string mimeType;
    uint32_t width = 0;
    uint32_t height = 0;
    std::string thumbnail;         ///< data: URL (may be empty)
};

/**
 * @brief A generation history record
 */
struct HistoryRecord {
    RecordId id = 0;
    std::string uuid;              ///< Stable cross-device identity (may be empty on old records)
    int64_t timestamp = 0;         ///< Epoch milliseconds
    std::string prompt;
    std::string mode;
    nlohmann::json options = nlohmann::json::object();
    std::string status;
    std::string thinkingText;
    std::string error;

    std::vector<StoredImage> images;

    bool hasVideo = false;         ///< `video` is meaningful only when set
    StoredVideo video;
};

/**
 * @brief A saved character
 *
 * Identity across devices is the name.
 */
struct CharacterRecord {
    RecordId id = 0;
    std::string name;
    std::string description;
    std::string physicalTraits;
    std::string clothing;
    std::string accessories;
    std::string distinctiveFeatures;
    std::string thumbnail;         ///< data: URL (may be empty)
    std::string imagePath;         ///< Blob path of the full image (empty if none)
    std::string legacyImageData;   ///< Inline base64 or data: URL from older stores
};

}  // namespace PeerSync
