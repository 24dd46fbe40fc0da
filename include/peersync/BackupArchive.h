/**
 * @file BackupArchive.h
 * @brief JSON backup files of history and characters
 *
 * (c) 2026 PeerSync Project
 * Licensed under MIT License
 */

#pragma once

#include "DataUrl.h"
#include "RecordImporter.h"
#include "StorageInterfaces.h"
#include "TransferSender.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace PeerSync {

class DiagnosticsLog;

/**
 * @class BackupArchive
 * @brief Offline export/import of the same data the peer transfer carries
 *
 * History backup:
 *   {version, exportedAt, appVersion,
 *    records: [{uuid, timestamp, prompt, mode, options, status,
 *               thinkingText, error, images: [{index, width, height,
 *               mimeType, data}]}]}
 * Character backup:
 *   {version, type: "characters", exportedAt, appVersion,
 *    characters: [{name, description, physicalTraits, clothing,
 *                  accessories, distinctiveFeatures, imageData, thumbnail}]}
 *
 * `data` is bare base64 and `imageData` a data: URL. Videos are not part
 * of a backup. Imports deduplicate like a peer transfer (UUID for records,
 * name for characters) and count every entry as imported, skipped or
 * failed; one bad entry never stops the rest.
 *
 * Thread Safety:
 * - Not thread-safe; do not run while a session uses the same stores
 */
class BackupArchive {
public:
    BackupArchive(HistoryStore& history,
                  BlobStore& blobs,
                  ThumbnailGenerator& thumbnails,
                  DiagnosticsLog& log);

    //=========================================================================
    // Export
    //=========================================================================

    /**
     * @brief Build a history backup
     *
     * Records without a UUID are given one in the backup. Images whose blob
     * cannot be read are left out.
     *
     * @param selectedIds Records to export (empty = all)
     * @param count Number of records written
     */
    bool exportHistory(const std::vector<RecordId>& selectedIds,
                       nlohmann::json& out,
                       uint32_t& count,
                       std::string& errorMsg);

    /**
     * @brief Build a character backup
     * @param selectedIds Characters to export (empty = all); unknown ids are ignored
     */
    bool exportCharacters(const std::vector<RecordId>& selectedIds,
                          nlohmann::json& out,
                          uint32_t& count,
                          std::string& errorMsg);

    //=========================================================================
    // Import
    //=========================================================================

    /**
     * @brief Import a history backup
     * @return false (with an error code in errorMsg) if the document is not
     *         a history backup; per-record problems only count as failed
     */
    bool importHistory(const nlohmann::json& archive, TransferResult& result, std::string& errorMsg);

    bool importCharacters(const nlohmann::json& archive, TransferResult& result, std::string& errorMsg);

    /// Non-zero version and a records array
    static bool isHistoryArchive(const nlohmann::json& archive);

    /// Non-zero version, type "characters" and a characters array
    static bool isCharacterArchive(const nlohmann::json& archive);

    //=========================================================================
    // Files
    //=========================================================================

    /// Write compact JSON through a temp file
    static bool writeFile(const std::filesystem::path& path,
                          const nlohmann::json& archive,
                          std::string& errorMsg);

    static bool readFile(const std::filesystem::path& path,
                         nlohmann::json& out,
                         std::string& errorMsg);

    /// "<prefix><epochMs>.json"
    static std::string defaultFileName(const std::string& prefix, int64_t epochMs);

private:
    nlohmann::json exportRecord(const HistoryRecord& record);
    nlohmann::json exportCharacter(const CharacterRecord& character);
    bool loadCharacterImage(const CharacterRecord& character, InlinePayload& out);
    void tally(ImportOutcome outcome, TransferResult& result);

    static nlohmann::json header();

    HistoryStore& m_history;
    BlobStore& m_blobs;
    DiagnosticsLog& m_log;
    RecordImporter m_importer;
};

}  // namespace PeerSync
