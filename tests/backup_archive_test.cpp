/**
 * @file backup_archive_test.cpp
 * @brief Tests for history and character backup files
 */

#include "peersync/BackupArchive.h"
#include "peersync/DataUrl.h"
#include "peersync/DiagnosticsLog.h"
#include "peersync/ErrorCodes.h"
#include "peersync/FileBlobStore.h"
#include "peersync/InlineThumbnailGenerator.h"
#include "peersync/MemoryHistoryStore.h"
#include "peersync/UuidGenerator.h"
#include "peersync/config.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace PeerSync;

namespace {

class BackupArchiveTest : public ::testing::Test {
protected:
    BackupArchiveTest()
        : m_root(std::filesystem::temp_directory_path() / ("peersync-backup-" + UuidGenerator::generate()))
        , m_blobs(m_root / "blobs")
        , m_log("backup-test")
        , m_archive(m_history, m_blobs, m_thumbnails, m_log)
    {
    }

    ~BackupArchiveTest() override {
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }

    HistoryRecord seedRecord(const std::string& uuid, int images) {
        HistoryRecord record;
        record.uuid = uuid;
        record.timestamp = 1700000000000;
        record.prompt = "prompt " + uuid;
        record.mode = "edit";
        record.options = {{"ratio", "16:9"}};
        record.status = "completed";
        record.thinkingText = "thinking";

        std::string err;
        for (int i = 0; i < images; ++i) {
            StoredImage image;
            image.index = static_cast<uint32_t>(i);
            image.width = 320;
            image.height = 240;
            image.path = "/seed/" + std::to_string(m_history.historyCount()) + "/" + std::to_string(i) + ".png";
            image.compressedFormat = "image/png";
            EXPECT_TRUE(m_blobs.writeFile(image.path, Bytes(200 + static_cast<size_t>(i), 0x30), err)) << err;
            record.images.push_back(image);
        }
        record.id = m_history.insertHistory(record);
        return record;
    }

    static nlohmann::json inlineRecord(const std::string& uuid, const std::string& base64) {
        nlohmann::json image = {{"index", 0}, {"width", 8}, {"height", 8}, {"data", base64}};
        return {{"uuid", uuid},
                {"timestamp", 1700000000123},
                {"prompt", "from backup"},
                {"mode", "generate"},
                {"status", "completed"},
                {"images", nlohmann::json::array({image})}};
    }

    static nlohmann::json historyArchive(const nlohmann::json& records) {
        return {{"version", 1}, {"exportedAt", 1700000000000}, {"appVersion", "test"}, {"records", records}};
    }

    static nlohmann::json characterArchive(const nlohmann::json& characters) {
        return {{"version", 1}, {"type", "characters"}, {"exportedAt", 1700000000000},
                {"appVersion", "test"}, {"characters", characters}};
    }

    std::filesystem::path m_root;
    MemoryHistoryStore m_history;
    FileBlobStore m_blobs;
    InlineThumbnailGenerator m_thumbnails;
    DiagnosticsLog m_log;
    BackupArchive m_archive;
};

}  // namespace

//=============================================================================
// History export
//=============================================================================

TEST_F(BackupArchiveTest, ExportHistoryWritesVersionedDocument) {
    seedRecord("nbp-exp-001", 2);
    seedRecord("", 0);

    nlohmann::json doc;
    uint32_t count = 0;
    std::string err;
    ASSERT_TRUE(m_archive.exportHistory({}, doc, count, err)) << err;

    EXPECT_EQ(count, 2u);
    EXPECT_EQ(doc["version"], BACKUP_FORMAT_VERSION);
    EXPECT_EQ(doc["appVersion"], PEERSYNC_VERSION_STRING);
    EXPECT_TRUE(doc["exportedAt"].is_number_integer());
    EXPECT_FALSE(doc.contains("type"));
    EXPECT_TRUE(BackupArchive::isHistoryArchive(doc));
    EXPECT_FALSE(BackupArchive::isCharacterArchive(doc));
    ASSERT_EQ(doc["records"].size(), 2u);

    const auto& first = doc["records"][0];
    EXPECT_EQ(first["uuid"], "nbp-exp-001");
    EXPECT_EQ(first["mode"], "edit");
    EXPECT_EQ(first["options"]["ratio"], "16:9");
    EXPECT_EQ(first["thinkingText"], "thinking");
    ASSERT_EQ(first["images"].size(), 2u);
    EXPECT_EQ(first["images"][1]["index"], 1);
    EXPECT_EQ(first["images"][1]["width"], 320);
    EXPECT_EQ(first["images"][1]["mimeType"], "image/png");
    Bytes decoded;
    ASSERT_TRUE(DataUrl::base64Decode(first["images"][1]["data"].get<std::string>(), decoded, err)) << err;
    EXPECT_EQ(decoded, Bytes(201, 0x30));

    // Old records get an identity in the backup
    const std::string generated = doc["records"][1]["uuid"].get<std::string>();
    EXPECT_TRUE(UuidGenerator::isValid(generated)) << generated;
}

TEST_F(BackupArchiveTest, UnreadableImagesAreLeftOut) {
    const HistoryRecord record = seedRecord("nbp-exp-002", 2);
    std::string err;
    ASSERT_TRUE(m_blobs.deleteDirectory("/seed/0", err)) << err;
    ASSERT_FALSE(m_blobs.fileExists(record.images[0].path));

    nlohmann::json doc;
    uint32_t count = 0;
    ASSERT_TRUE(m_archive.exportHistory({}, doc, count, err)) << err;
    EXPECT_EQ(count, 1u);
    EXPECT_TRUE(doc["records"][0]["images"].empty());
}

TEST_F(BackupArchiveTest, ExportHistorySelectsIds) {
    seedRecord("nbp-sel-001", 0);
    const HistoryRecord chosen = seedRecord("nbp-sel-002", 0);

    nlohmann::json doc;
    uint32_t count = 0;
    std::string err;
    ASSERT_TRUE(m_archive.exportHistory({chosen.id}, doc, count, err)) << err;
    ASSERT_EQ(count, 1u);
    EXPECT_EQ(doc["records"][0]["uuid"], "nbp-sel-002");
}

//=============================================================================
// History import
//=============================================================================

TEST_F(BackupArchiveTest, ImportHistoryCountsEveryRecord) {
    HistoryRecord existing;
    existing.uuid = "nbp-imp-dup";
    existing.prompt = "local copy";
    m_history.insertHistory(existing);

    const std::string image = DataUrl::base64Encode(Bytes(64, 0x5A));
    const nlohmann::json doc = historyArchive(nlohmann::json::array({
        inlineRecord("nbp-imp-dup", image),
        inlineRecord("nbp-imp-bad", "@@not base64@@"),
        inlineRecord("nbp-imp-new", image),
        "not a record",
    }));

    TransferResult result;
    std::string err;
    ASSERT_TRUE(m_archive.importHistory(doc, result, err)) << err;
    EXPECT_EQ(result.total, 4u);
    EXPECT_EQ(result.imported, 1u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.failed, 2u);
    EXPECT_EQ(m_history.historyCount(), 2u);

    std::vector<HistoryRecord> all;
    ASSERT_TRUE(m_history.getAllHistory(all, err)) << err;
    for (const auto& record : all) {
        if (record.uuid == "nbp-imp-dup") {
            EXPECT_EQ(record.prompt, "local copy");
            continue;
        }
        EXPECT_EQ(record.uuid, "nbp-imp-new");
        EXPECT_EQ(record.timestamp, 1700000000123);
        EXPECT_FALSE(record.hasVideo);
        ASSERT_EQ(record.images.size(), 1u);
        EXPECT_EQ(record.images[0].path, "/images/" + std::to_string(record.id) + "/0.webp");
        EXPECT_EQ(record.images[0].compressedFormat, DEFAULT_IMAGE_MIME);
        EXPECT_FALSE(record.images[0].thumbnail.empty());
        Bytes data;
        ASSERT_TRUE(m_blobs.readFile(record.images[0].path, data, err)) << err;
        EXPECT_EQ(data, Bytes(64, 0x5A));
    }
}

TEST_F(BackupArchiveTest, ImportHistoryAssignsUuidToAnonymousRecords) {
    nlohmann::json record = inlineRecord("", DataUrl::base64Encode(Bytes(4, 1)));
    record.erase("uuid");

    TransferResult result;
    std::string err;
    ASSERT_TRUE(m_archive.importHistory(historyArchive(nlohmann::json::array({record})), result, err)) << err;
    EXPECT_EQ(result.imported, 1u);

    std::vector<HistoryRecord> all;
    ASSERT_TRUE(m_history.getAllHistory(all, err)) << err;
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(UuidGenerator::isValid(all[0].uuid)) << all[0].uuid;
}

TEST_F(BackupArchiveTest, ImportHistoryRejectsInvalidDocuments) {
    const std::vector<nlohmann::json> invalid = {
        nlohmann::json::array(),
        {{"records", nlohmann::json::array()}},
        {{"version", 0}, {"records", nlohmann::json::array()}},
        {{"version", 1}, {"records", "none"}},
    };

    for (const auto& doc : invalid) {
        TransferResult result;
        std::string err;
        EXPECT_FALSE(m_archive.importHistory(doc, result, err)) << doc.dump();
        EXPECT_NE(err.find(ErrorCodes::BACKUP_INVALID_FORMAT), std::string::npos) << err;
        EXPECT_EQ(result.total, 0u);
    }
    EXPECT_EQ(m_history.historyCount(), 0u);
}

TEST_F(BackupArchiveTest, BackupFileMovesHistoryToAnotherStore) {
    seedRecord("nbp-mov-001", 1);
    seedRecord("nbp-mov-002", 3);

    nlohmann::json doc;
    uint32_t count = 0;
    std::string err;
    ASSERT_TRUE(m_archive.exportHistory({}, doc, count, err)) << err;

    const std::filesystem::path file = m_root / BackupArchive::defaultFileName(HISTORY_BACKUP_PREFIX, 1700000000000);
    EXPECT_EQ(file.filename().string(), "nbp-history-1700000000000.json");
    ASSERT_TRUE(BackupArchive::writeFile(file, doc, err)) << err;

    MemoryHistoryStore otherHistory;
    FileBlobStore otherBlobs(m_root / "other");
    DiagnosticsLog otherLog("backup-other");
    BackupArchive other(otherHistory, otherBlobs, m_thumbnails, otherLog);

    nlohmann::json loaded;
    ASSERT_TRUE(BackupArchive::readFile(file, loaded, err)) << err;
    TransferResult result;
    ASSERT_TRUE(other.importHistory(loaded, result, err)) << err;
    EXPECT_EQ(result.imported, 2u);
    EXPECT_EQ(result.failed, 0u);

    std::vector<HistoryRecord> all;
    ASSERT_TRUE(otherHistory.getAllHistory(all, err)) << err;
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].uuid, "nbp-mov-002");
    ASSERT_EQ(all[1].images.size(), 3u);
    EXPECT_EQ(all[1].images[2].width, 320u);
    EXPECT_EQ(all[1].images[2].compressedFormat, "image/png");
    Bytes data;
    ASSERT_TRUE(otherBlobs.readFile(all[1].images[2].path, data, err)) << err;
    EXPECT_EQ(data, Bytes(202, 0x30));

    // A second import of the same file only skips
    ASSERT_TRUE(other.importHistory(loaded, result, err)) << err;
    EXPECT_EQ(result.imported, 0u);
    EXPECT_EQ(result.skipped, 2u);
    EXPECT_EQ(otherHistory.historyCount(), 2u);
}

//=============================================================================
// Characters
//=============================================================================

TEST_F(BackupArchiveTest, ExportCharactersEmbedsImages) {
    std::string err;
    ASSERT_TRUE(m_blobs.writeFile("/characters/9/image.webp", Bytes(32, 0x44), err)) << err;

    CharacterRecord stored;
    stored.name = "Aria";
    stored.description = "pilot";
    stored.accessories = "goggles";
    stored.thumbnail = "data:image/webp;base64,AAAA";
    stored.imagePath = "/characters/9/image.webp";
    m_history.insertCharacter(stored);

    CharacterRecord legacy;
    legacy.name = "Bram";
    legacy.legacyImageData = DataUrl::base64Encode(Bytes(16, 0x11));
    const RecordId legacyId = m_history.insertCharacter(legacy);

    CharacterRecord bare;
    bare.name = "Cole";
    m_history.insertCharacter(bare);

    nlohmann::json doc;
    uint32_t count = 0;
    ASSERT_TRUE(m_archive.exportCharacters({}, doc, count, err)) << err;
    EXPECT_EQ(count, 3u);
    EXPECT_EQ(doc["type"], BACKUP_TYPE_CHARACTERS);
    EXPECT_TRUE(BackupArchive::isCharacterArchive(doc));
    ASSERT_EQ(doc["characters"].size(), 3u);

    const auto& aria = doc["characters"][0];
    EXPECT_EQ(aria["name"], "Aria");
    EXPECT_EQ(aria["accessories"], "goggles");
    EXPECT_EQ(aria["thumbnail"], "data:image/webp;base64,AAAA");
    EXPECT_EQ(aria["imageData"], DataUrl::build("image/webp", Bytes(32, 0x44)));

    EXPECT_EQ(doc["characters"][1]["imageData"], DataUrl::build(DEFAULT_CHARACTER_IMAGE_MIME, Bytes(16, 0x11)));
    EXPECT_TRUE(doc["characters"][2]["imageData"].is_null());

    ASSERT_TRUE(m_archive.exportCharacters({legacyId, 404}, doc, count, err)) << err;
    ASSERT_EQ(count, 1u);
    EXPECT_EQ(doc["characters"][0]["name"], "Bram");
}

TEST_F(BackupArchiveTest, ImportCharactersDeduplicatesByName) {
    CharacterRecord existing;
    existing.name = "Aria";
    m_history.insertCharacter(existing);

    const nlohmann::json doc = characterArchive(nlohmann::json::array({
        {{"name", "Aria"}, {"description", "duplicate"}},
        {{"name", "Bram"}, {"imageData", "data:image/webp;base64,@@"}},
        {{"description", "nameless"}},
        {{"name", "Cole"}, {"clothing", "coat"}, {"imageData", DataUrl::build("image/webp", Bytes(24, 0x66))}},
        {{"name", "Dana"}, {"imageData", nullptr}},
    }));

    TransferResult result;
    std::string err;
    ASSERT_TRUE(m_archive.importCharacters(doc, result, err)) << err;
    EXPECT_EQ(result.total, 5u);
    EXPECT_EQ(result.imported, 2u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.failed, 2u);
    EXPECT_EQ(m_history.characterCount(), 3u);

    CharacterRecord cole;
    bool found = false;
    ASSERT_TRUE(m_history.getCharacterByName("Cole", cole, found, err)) << err;
    ASSERT_TRUE(found);
    EXPECT_EQ(cole.clothing, "coat");
    EXPECT_EQ(cole.imagePath, "/characters/" + std::to_string(cole.id) + "/image.webp");
    EXPECT_FALSE(cole.thumbnail.empty());
    Bytes data;
    ASSERT_TRUE(m_blobs.readFile(cole.imagePath, data, err)) << err;
    EXPECT_EQ(data, Bytes(24, 0x66));

    CharacterRecord dana;
    ASSERT_TRUE(m_history.getCharacterByName("Dana", dana, found, err)) << err;
    ASSERT_TRUE(found);
    EXPECT_TRUE(dana.imagePath.empty());
}

TEST_F(BackupArchiveTest, ArchiveKindsAreNotInterchangeable) {
    const nlohmann::json history = historyArchive(nlohmann::json::array());
    const nlohmann::json characters = characterArchive(nlohmann::json::array());

    TransferResult result;
    std::string err;
    EXPECT_FALSE(m_archive.importCharacters(history, result, err));
    EXPECT_NE(err.find(ErrorCodes::BACKUP_INVALID_FORMAT), std::string::npos) << err;
    EXPECT_FALSE(m_archive.importHistory(characters, result, err));

    nlohmann::json wrongType = characters;
    wrongType["type"] = "history";
    EXPECT_FALSE(BackupArchive::isCharacterArchive(wrongType));
}

//=============================================================================
// Files
//=============================================================================

TEST_F(BackupArchiveTest, ReadFileReportsMissingAndMalformedFiles) {
    nlohmann::json doc;
    std::string err;
    EXPECT_FALSE(BackupArchive::readFile(m_root / "missing.json", doc, err));
    EXPECT_NE(err.find(ErrorCodes::BACKUP_FILE_ERROR), std::string::npos) << err;

    std::filesystem::create_directories(m_root);
    const std::filesystem::path broken = m_root / "broken.json";
    {
        std::ofstream out(broken);
        out << "{\"version\": 1, \"records\": [";
    }
    EXPECT_FALSE(BackupArchive::readFile(broken, doc, err));
    EXPECT_NE(err.find(ErrorCodes::BACKUP_INVALID_FORMAT), std::string::npos) << err;
}
