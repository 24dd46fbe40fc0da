/**
 * @file BackupArchive.cpp
 * @brief History and character backup files
 */

#include "peersync/BackupArchive.h"
#include "peersync/AtomicFile.h"
#include "peersync/Debug.h"
#include "peersync/DiagnosticsLog.h"
#include "peersync/ErrorCodes.h"
#include "peersync/UuidGenerator.h"
#include "peersync/config.h"

#include <chrono>
#include <fstream>

namespace PeerSync {

namespace {

bool hasVersion(const nlohmann::json& archive) {
    if (!archive.is_object() || !archive.contains("version")) {
        return false;
    }
    const auto& version = archive["version"];
    if (version.is_number()) {
        return version.get<double>() != 0.0;
    }
    return version.is_string() && !version.get<std::string>().empty();
}

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

BackupArchive::BackupArchive(HistoryStore& history,
                             BlobStore& blobs,
                             ThumbnailGenerator& thumbnails,
                             DiagnosticsLog& log)
    : m_history(history)
    , m_blobs(blobs)
    , m_log(log)
    , m_importer(history, blobs, thumbnails, log)
{
}

nlohmann::json BackupArchive::header() {
    nlohmann::json j;
    j["version"] = BACKUP_FORMAT_VERSION;
    j["exportedAt"] = nowMs();
    j["appVersion"] = PEERSYNC_VERSION_STRING;
    return j;
}

bool BackupArchive::isHistoryArchive(const nlohmann::json& archive) {
    return hasVersion(archive) && archive.contains("records") && archive["records"].is_array();
}

bool BackupArchive::isCharacterArchive(const nlohmann::json& archive) {
    return hasVersion(archive) &&
           archive.value("type", std::string()) == BACKUP_TYPE_CHARACTERS &&
           archive.contains("characters") && archive["characters"].is_array();
}

void BackupArchive::tally(ImportOutcome outcome, TransferResult& result) {
    switch (outcome) {
        case ImportOutcome::Imported: ++result.imported; break;
        case ImportOutcome::Skipped: ++result.skipped; break;
        case ImportOutcome::Failed: ++result.failed; break;
    }
}

//=============================================================================
// History
//=============================================================================

bool BackupArchive::exportHistory(const std::vector<RecordId>& selectedIds,
                                  nlohmann::json& out,
                                  uint32_t& count,
                                  std::string& errorMsg) {
    count = 0;

    std::vector<HistoryRecord> records;
    std::string storeError;
    const bool loaded = selectedIds.empty()
        ? m_history.getAllHistory(records, storeError)
        : m_history.getHistoryByIds(selectedIds, records, storeError);
    if (!loaded) {
        errorMsg = std::string("[") + ErrorCodes::TRANSFER_STORAGE_READ + "] Failed to load history: " + storeError;
        LOG_ERROR(errorMsg);
        return false;
    }

    nlohmann::json items = nlohmann::json::array();
    for (const HistoryRecord& record : records) {
        items.push_back(exportRecord(record));
    }

    out = header();
    out["records"] = std::move(items);
    count = static_cast<uint32_t>(records.size());
    m_log.add("Exported " + std::to_string(count) + " history records");
    return true;
}

nlohmann::json BackupArchive::exportRecord(const HistoryRecord& record) {
    nlohmann::json j;
    j["uuid"] = record.uuid.empty() ? UuidGenerator::generate() : record.uuid;
    j["timestamp"] = record.timestamp;
    j["prompt"] = record.prompt;
    j["mode"] = record.mode;
    j["options"] = record.options;
    j["status"] = record.status;
    j["thinkingText"] = record.thinkingText;
    j["error"] = record.error;

    nlohmann::json images = nlohmann::json::array();
    for (const StoredImage& img : record.images) {
        Bytes data;
        std::string readError;
        if (!m_blobs.readFile(img.path, data, readError)) {
            m_log.add("Failed to read image " + img.path + ": " + readError + ", left out of backup");
            continue;
        }
        nlohmann::json image;
        image["index"] = img.index;
        image["width"] = img.width;
        image["height"] = img.height;
        image["mimeType"] = img.compressedFormat.empty()
            ? TransferSender::mimeTypeForPath(img.path, DEFAULT_IMAGE_MIME)
            : img.compressedFormat;
        image["data"] = DataUrl::base64Encode(data);
        images.push_back(std::move(image));
    }
    j["images"] = std::move(images);
    return j;
}

bool BackupArchive::importHistory(const nlohmann::json& archive, TransferResult& result, std::string& errorMsg) {
    result = TransferResult{};
    if (!isHistoryArchive(archive)) {
        errorMsg = std::string("[") + ErrorCodes::BACKUP_INVALID_FORMAT + "] Invalid export file format";
        LOG_ERROR(errorMsg);
        return false;
    }

    const auto& records = archive["records"];
    result.total = static_cast<uint32_t>(records.size());

    for (const auto& item : records) {
        IncomingRecord record;
        std::string itemError;
        if (!RecordImporter::recordFromInlineJson(item, record, itemError)) {
            m_log.add("Failed to import record: " + itemError);
            ++result.failed;
            continue;
        }
        RecordId newId = 0;
        tally(m_importer.importRecord(record, newId, itemError), result);
    }

    m_log.add("History import: " + std::to_string(result.imported) + " imported, " +
              std::to_string(result.skipped) + " skipped, " +
              std::to_string(result.failed) + " failed of " + std::to_string(result.total));
    return true;
}

//=============================================================================
// Characters
//=============================================================================

bool BackupArchive::exportCharacters(const std::vector<RecordId>& selectedIds,
                                     nlohmann::json& out,
                                     uint32_t& count,
                                     std::string& errorMsg) {
    count = 0;

    std::vector<CharacterRecord> characters;
    std::string storeError;
    if (selectedIds.empty()) {
        if (!m_history.getAllCharacters(characters, storeError)) {
            errorMsg = std::string("[") + ErrorCodes::TRANSFER_STORAGE_READ + "] Failed to load characters: " +
                       storeError;
            LOG_ERROR(errorMsg);
            return false;
        }
    } else {
        for (RecordId id : selectedIds) {
            CharacterRecord character;
            bool found = false;
            if (!m_history.getCharacterById(id, character, found, storeError)) {
                errorMsg = std::string("[") + ErrorCodes::TRANSFER_STORAGE_READ + "] Failed to load character " +
                           std::to_string(id) + ": " + storeError;
                LOG_ERROR(errorMsg);
                return false;
            }
            if (found) {
                characters.push_back(std::move(character));
            }
        }
    }

    nlohmann::json items = nlohmann::json::array();
    for (const CharacterRecord& character : characters) {
        items.push_back(exportCharacter(character));
    }

    out = header();
    out["type"] = BACKUP_TYPE_CHARACTERS;
    out["characters"] = std::move(items);
    count = static_cast<uint32_t>(characters.size());
    m_log.add("Exported " + std::to_string(count) + " characters");
    return true;
}

nlohmann::json BackupArchive::exportCharacter(const CharacterRecord& character) {
    nlohmann::json j;
    j["name"] = character.name;
    j["description"] = character.description;
    j["physicalTraits"] = character.physicalTraits;
    j["clothing"] = character.clothing;
    j["accessories"] = character.accessories;
    j["distinctiveFeatures"] = character.distinctiveFeatures;
    j["thumbnail"] = character.thumbnail;

    InlinePayload image;
    if (loadCharacterImage(character, image)) {
        j["imageData"] = DataUrl::build(image.mimeType, image.data);
    } else {
        j["imageData"] = nullptr;
    }
    return j;
}

bool BackupArchive::loadCharacterImage(const CharacterRecord& character, InlinePayload& out) {
    std::string errorMsg;
    if (!character.imagePath.empty() && m_blobs.fileExists(character.imagePath)) {
        if (m_blobs.readFile(character.imagePath, out.data, errorMsg)) {
            out.mimeType = TransferSender::mimeTypeForPath(character.imagePath, DEFAULT_CHARACTER_IMAGE_MIME);
            return true;
        }
        m_log.add("Failed to read character image " + character.imagePath + ": " + errorMsg);
    }
    if (!character.legacyImageData.empty()) {
        if (DataUrl::decodeInlineImage(character.legacyImageData, out, errorMsg, DEFAULT_CHARACTER_IMAGE_MIME)) {
            return true;
        }
        m_log.add("Failed to decode inline image of " + character.name + ": " + errorMsg);
    }
    return false;
}

bool BackupArchive::importCharacters(const nlohmann::json& archive, TransferResult& result, std::string& errorMsg) {
    result = TransferResult{};
    if (!isCharacterArchive(archive)) {
        errorMsg = std::string("[") + ErrorCodes::BACKUP_INVALID_FORMAT + "] Invalid character export file format";
        LOG_ERROR(errorMsg);
        return false;
    }

    const auto& characters = archive["characters"];
    result.total = static_cast<uint32_t>(characters.size());

    for (const auto& item : characters) {
        IncomingCharacter character;
        character.meta = CharacterMeta::fromJson(item);
        if (character.meta.name.empty()) {
            m_log.add("Failed to import character: missing name");
            ++result.failed;
            continue;
        }

        std::string itemError;
        if (item.contains("imageData") && item["imageData"].is_string() &&
            !item["imageData"].get<std::string>().empty()) {
            InlinePayload image;
            if (!DataUrl::decodeInlineImage(item["imageData"].get<std::string>(), image, itemError,
                                            DEFAULT_CHARACTER_IMAGE_MIME)) {
                m_log.add("Failed to import character " + character.meta.name + ": " + itemError);
                ++result.failed;
                continue;
            }
            character.hasImage = true;
            character.imageMime = image.mimeType;
            character.image = std::move(image.data);
        }

        tally(m_importer.importCharacter(character, itemError), result);
    }

    m_log.add("Character import: " + std::to_string(result.imported) + " imported, " +
              std::to_string(result.skipped) + " skipped, " +
              std::to_string(result.failed) + " failed of " + std::to_string(result.total));
    return true;
}

//=============================================================================
// Files
//=============================================================================

bool BackupArchive::writeFile(const std::filesystem::path& path,
                              const nlohmann::json& archive,
                              std::string& errorMsg) {
    const std::string text = archive.dump();
    if (!atomicWriteFile(path, reinterpret_cast<const uint8_t*>(text.data()), text.size(), errorMsg)) {
        errorMsg = std::string("[") + ErrorCodes::BACKUP_FILE_ERROR + "] " + errorMsg;
        return false;
    }
    return true;
}

bool BackupArchive::readFile(const std::filesystem::path& path,
                             nlohmann::json& out,
                             std::string& errorMsg) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        errorMsg = std::string("[") + ErrorCodes::BACKUP_FILE_ERROR + "] Failed to open backup file: " +
                   path.string();
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        errorMsg = std::string("[") + ErrorCodes::BACKUP_INVALID_FORMAT + "] Backup file is not valid JSON: " +
                   path.string();
        return false;
    }
    out = std::move(j);
    return true;
}

std::string BackupArchive::defaultFileName(const std::string& prefix, int64_t epochMs) {
    return prefix + std::to_string(epochMs) + ".json";
}

}  // namespace PeerSync
