/**
 * @file RecordImporter.cpp
 * @brief Deduplicating record and character persistence
 */

#include "peersync/RecordImporter.h"
#include "peersync/DataUrl.h"
#include "peersync/DiagnosticsLog.h"
#include "peersync/ErrorCodes.h"
#include "peersync/UuidGenerator.h"

namespace PeerSync {

const char* importOutcomeToString(ImportOutcome outcome) {
    switch (outcome) {
        case ImportOutcome::Imported: return "imported";
        case ImportOutcome::Skipped: return "skipped";
        case ImportOutcome::Failed: return "failed";
    }
    return "failed";
}

RecordImporter::RecordImporter(HistoryStore& history,
                               BlobStore& blobs,
                               ThumbnailGenerator& thumbnails,
                               DiagnosticsLog& log)
    : m_history(history)
    , m_blobs(blobs)
    , m_thumbnails(thumbnails)
    , m_log(log)
{
}

std::string RecordImporter::imageExtension(const std::string& mimeType) {
    return mimeType == "image/png" ? "png" : "webp";
}

std::string RecordImporter::characterImageExtension(const std::string& mimeType) {
    if (mimeType == "image/webp") return "webp";
    if (mimeType == "image/jpeg" || mimeType == "image/jpg") return "jpg";
    return "png";
}

//=============================================================================
// History records
//=============================================================================

ImportOutcome RecordImporter::importRecord(const IncomingRecord& record, RecordId& newId, std::string& errorMsg) {
    newId = 0;
    std::string uuid = record.meta.uuid;

    if (uuid.empty()) {
        uuid = UuidGenerator::generate();
        if (uuid.empty()) {
            errorMsg = "Failed to assign a UUID";
            return ImportOutcome::Failed;
        }
    } else {
        bool exists = false;
        if (!m_history.hasHistoryByUuid(uuid, exists, errorMsg)) {
            m_log.add("Duplicate check failed for " + uuid + ": " + errorMsg);
            return ImportOutcome::Failed;
        }
        if (exists) {
            m_log.add("Skipped duplicate record " + uuid);
            return ImportOutcome::Skipped;
        }
    }

    if (!saveRecord(record, uuid, newId, errorMsg)) {
        m_log.add(std::string("[") + ErrorCodes::STORAGE_WRITE_FAILED + "] Failed to save record " +
                  uuid + ": " + errorMsg);
        if (newId != 0) {
            removeMedia(newId);
        }
        return ImportOutcome::Failed;
    }

    m_log.add("Imported record " + uuid + " as " + std::to_string(newId));
    return ImportOutcome::Imported;
}

void RecordImporter::removeMedia(RecordId id) {
    std::string cleanupError;
    if (!m_blobs.deleteDirectory("/images/" + std::to_string(id), cleanupError) ||
        !m_blobs.deleteDirectory("/videos/" + std::to_string(id), cleanupError)) {
        m_log.add("Cleanup after failed save: " + cleanupError);
    }
}

bool RecordImporter::saveRecord(const IncomingRecord& incoming,
                                const std::string& uuid,
                                RecordId& newId,
                                std::string& errorMsg) {
    const RecordMeta& meta = incoming.meta;

    HistoryRecord record;
    record.uuid = uuid;
    record.timestamp = meta.timestamp;
    record.prompt = meta.prompt;
    record.mode = meta.mode;
    record.options = meta.options;
    record.status = meta.status;
    record.thinkingText = meta.thinkingText;
    record.error = meta.error;
    record.hasVideo = incoming.hasVideo;

    if (!m_history.addHistoryWithUuid(record, newId, errorMsg)) {
        newId = 0;
        return false;
    }
    const std::string idText = std::to_string(newId);

    std::vector<StoredImage> stored;
    stored.reserve(incoming.images.size());
    for (const IncomingImage& img : incoming.images) {
        const std::string mime = img.mimeType.empty() ? DEFAULT_IMAGE_MIME : img.mimeType;

        StoredImage entry;
        entry.index = img.index;
        entry.width = img.width;
        entry.height = img.height;
        entry.path = "/images/" + idText + "/" + std::to_string(img.index) + "." + imageExtension(mime);
        entry.originalSize = img.data.size();
        entry.compressedSize = img.data.size();
        entry.originalFormat = mime;
        entry.compressedFormat = mime;

        if (!m_blobs.writeFile(entry.path, img.data, errorMsg)) {
            return false;
        }

        std::string thumbError;
        if (!m_thumbnails.imageThumbnail(img.data, mime, entry.thumbnail, thumbError)) {
            m_log.add("Thumbnail failed for " + entry.path + ": " + thumbError);
        }
        stored.push_back(std::move(entry));
    }

    if (!stored.empty() && !m_history.updateHistoryImages(newId, stored, errorMsg)) {
        return false;
    }

    if (incoming.hasVideo) {
        const std::string dir = "/videos/" + idText;
        if (!m_blobs.createDirectory(dir, errorMsg)) {
            return false;
        }

        StoredVideo video;
        video.path = dir + "/video.mp4";
        video.size = incoming.video.size();
        video.mimeType = incoming.videoHeader.mimeType.empty() ? DEFAULT_VIDEO_MIME : incoming.videoHeader.mimeType;
        video.width = incoming.videoHeader.width;
        video.height = incoming.videoHeader.height;

        if (!m_blobs.writeFile(video.path, incoming.video, errorMsg)) {
            return false;
        }

        VideoThumbnail thumb;
        std::string thumbError;
        if (!m_thumbnails.videoThumbnail(incoming.video, video.mimeType, thumb, thumbError)) {
            m_log.add("Video thumbnail failed for " + video.path + ": " + thumbError);
        } else {
            const std::string thumbPath = dir + "/thumbnail.webp";
            if (m_blobs.writeFile(thumbPath, thumb.encoded, thumbError)) {
                video.thumbnailPath = thumbPath;
                video.thumbnail = thumb.dataUrl;
            } else {
                m_log.add("Failed to save video thumbnail: " + thumbError);
            }
        }

        if (!m_history.updateHistoryVideo(newId, video, errorMsg)) {
            return false;
        }
    }

    return true;
}

bool RecordImporter::recordFromInlineJson(const nlohmann::json& j, IncomingRecord& out, std::string& errorMsg) {
    if (!j.is_object()) {
        errorMsg = "Record is not a JSON object";
        return false;
    }

    IncomingRecord record;
    record.meta = RecordMeta::fromJson(j);

    if (j.contains("images") && j["images"].is_array()) {
        for (const auto& img : j["images"]) {
            if (!img.is_object() || !img.contains("data") || !img["data"].is_string()) {
                errorMsg = "Image without base64 data";
                return false;
            }
            // Same index/size/mime fields as a record_image header
            const RecordImageHeader header = RecordImageHeader::fromJson(img);

            IncomingImage image;
            image.index = header.index;
            image.width = header.width;
            image.height = header.height;
            image.mimeType = header.mimeType;
            if (!DataUrl::base64Decode(img["data"].get<std::string>(), image.data, errorMsg)) {
                errorMsg = "Image " + std::to_string(image.index) + ": " + errorMsg;
                return false;
            }
            record.images.push_back(std::move(image));
        }
    }

    record.meta.imageCount = static_cast<uint32_t>(record.images.size());
    record.meta.hasVideo = false;
    out = std::move(record);
    return true;
}

//=============================================================================
// Characters
//=============================================================================

ImportOutcome RecordImporter::importCharacter(const IncomingCharacter& character, std::string& errorMsg) {
    const std::string& name = character.meta.name;

    CharacterRecord existing;
    bool found = false;
    if (!m_history.getCharacterByName(name, existing, found, errorMsg)) {
        m_log.add("Duplicate check failed for character " + name + ": " + errorMsg);
        return ImportOutcome::Failed;
    }
    if (found) {
        m_log.add("Skipped duplicate character " + name);
        return ImportOutcome::Skipped;
    }

    if (!saveCharacter(character, errorMsg)) {
        m_log.add(std::string("[") + ErrorCodes::STORAGE_WRITE_FAILED + "] Failed to save character " +
                  name + ": " + errorMsg);
        return ImportOutcome::Failed;
    }

    m_log.add("Imported character " + name);
    return ImportOutcome::Imported;
}

bool RecordImporter::saveCharacter(const IncomingCharacter& incoming, std::string& errorMsg) {
    const CharacterMeta& meta = incoming.meta;
    const std::string mime = incoming.imageMime.empty() ? DEFAULT_CHARACTER_IMAGE_MIME : incoming.imageMime;

    CharacterRecord character;
    character.name = meta.name;
    character.description = meta.description;
    character.physicalTraits = meta.physicalTraits;
    character.clothing = meta.clothing;
    character.accessories = meta.accessories;
    character.distinctiveFeatures = meta.distinctiveFeatures;
    character.thumbnail = meta.thumbnail;

    if (character.thumbnail.empty() && incoming.hasImage) {
        std::string thumbError;
        if (!m_thumbnails.imageThumbnail(incoming.image, mime, character.thumbnail, thumbError)) {
            m_log.add("Thumbnail failed for character " + meta.name + ": " + thumbError);
        }
    }

    RecordId newId = 0;
    if (!m_history.addCharacter(character, newId, errorMsg)) {
        return false;
    }

    if (incoming.hasImage) {
        const std::string path = "/characters/" + std::to_string(newId) + "/image." +
                                 characterImageExtension(mime);
        if (!m_blobs.writeFile(path, incoming.image, errorMsg)) {
            return false;
        }
        if (!m_history.updateCharacterImage(newId, path, errorMsg)) {
            return false;
        }
    }
    return true;
}

}  // namespace PeerSync
