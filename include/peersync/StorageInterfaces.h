/**
 * @file StorageInterfaces.h
 * @brief Storage collaborators used by the transfer engines
 *
 * The core never touches a database or filesystem directly. The sender
 * reads through these interfaces and the receiver persists through them,
 * so an application plugs in its own record store, blob store and image
 * pipeline.
 *
 * All methods return false with a message on failure. Implementations must
 * be safe to call from the session's worker and transport threads (calls
 * for one session never overlap, but may come from different threads).
 */

#pragma once

#include "FrameCodec.h"
#include "TransferRecords.h"

#include <string>
#include <vector>

namespace PeerSync {

/**
 * @brief Record and character metadata store
 */
class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    virtual bool getAllHistory(std::vector<HistoryRecord>& out, std::string& errorMsg) = 0;
    virtual bool getHistoryByIds(const std::vector<RecordId>& ids,
                                 std::vector<HistoryRecord>& out,
                                 std::string& errorMsg) = 0;
    virtual bool hasHistoryByUuid(const std::string& uuid, bool& exists, std::string& errorMsg) = 0;

    /**
     * @brief Insert a record keeping its UUID
     * @param record Record metadata (images/video are ignored)
     * @param newId Output storage id
     */
    virtual bool addHistoryWithUuid(const HistoryRecord& record, RecordId& newId, std::string& errorMsg) = 0;
    virtual bool updateHistoryImages(RecordId id,
                                     const std::vector<StoredImage>& images,
                                     std::string& errorMsg) = 0;
    virtual bool updateHistoryVideo(RecordId id, const StoredVideo& video, std::string& errorMsg) = 0;

    virtual bool getAllCharacters(std::vector<CharacterRecord>& out, std::string& errorMsg) = 0;
    virtual bool getCharacterById(RecordId id, CharacterRecord& out, bool& found, std::string& errorMsg) = 0;
    virtual bool getCharacterByName(const std::string& name,
                                    CharacterRecord& out,
                                    bool& found,
                                    std::string& errorMsg) = 0;
    virtual bool addCharacter(const CharacterRecord& character, RecordId& newId, std::string& errorMsg) = 0;
    virtual bool updateCharacterImage(RecordId id, const std::string& imagePath, std::string& errorMsg) = 0;
};

/**
 * @brief Hierarchical blob store addressed by absolute virtual paths
 *
 * Paths look like "/images/12/0.webp". Parent directories are created on
 * write.
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual bool writeFile(const std::string& path, const Bytes& data, std::string& errorMsg) = 0;
    virtual bool readFile(const std::string& path, Bytes& out, std::string& errorMsg) = 0;
    virtual bool fileExists(const std::string& path) = 0;
    virtual bool createDirectory(const std::string& path, std::string& errorMsg) = 0;

    /// Recursive; deleting a missing directory succeeds
    virtual bool deleteDirectory(const std::string& path, std::string& errorMsg) = 0;
};

/**
 * @brief Video thumbnail: displayable data URL plus the encoded frame
 */
struct VideoThumbnail {
    std::string dataUrl;
    Bytes encoded;
};

/**
 * @brief Image pipeline used by the receiver to build previews
 */
class ThumbnailGenerator {
public:
    virtual ~ThumbnailGenerator() = default;

    virtual bool imageThumbnail(const Bytes& image,
                                const std::string& mimeType,
                                std::string& outDataUrl,
                                std::string& errorMsg) = 0;

    virtual bool videoThumbnail(const Bytes& video,
                                const std::string& mimeType,
                                VideoThumbnail& out,
                                std::string& errorMsg) = 0;
};

}  // namespace PeerSync
