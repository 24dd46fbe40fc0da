/**
 * @file record_importer_test.cpp
 * @brief Unit tests for deduplicating record/character persistence
 */

#include "peersync/DataUrl.h"
#include "peersync/DiagnosticsLog.h"
#include "peersync/InlineThumbnailGenerator.h"
#include "peersync/MemoryHistoryStore.h"
#include "peersync/RecordImporter.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using namespace PeerSync;

namespace {

/// Blob store kept in a map; writes under `failPrefix` fail
class MapBlobStore : public BlobStore {
public:
    bool writeFile(const std::string& path, const Bytes& data, std::string& errorMsg) override {
        if (!failPrefix.empty() && path.compare(0, failPrefix.size(), failPrefix) == 0) {
            errorMsg = "Disk full";
            return false;
        }
        files[path] = data;
        return true;
    }

    bool readFile(const std::string& path, Bytes& out, std::string& errorMsg) override {
        auto it = files.find(path);
        if (it == files.end()) {
            errorMsg = "No such blob: " + path;
            return false;
        }
        out = it->second;
        return true;
    }

    bool fileExists(const std::string& path) override { return files.count(path) > 0; }

    bool createDirectory(const std::string& path, std::string& errorMsg) override {
        (void)errorMsg;
        directories.push_back(path);
        return true;
    }

    bool deleteDirectory(const std::string& path, std::string& errorMsg) override {
        (void)errorMsg;
        deleted.push_back(path);
        const std::string prefix = path + "/";
        for (auto it = files.begin(); it != files.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                it = files.erase(it);
            } else {
                ++it;
            }
        }
        return true;
    }

    std::map<std::string, Bytes> files;
    std::vector<std::string> directories;
    std::vector<std::string> deleted;
    std::string failPrefix;
};

class RecordImporterTest : public ::testing::Test {
protected:
    RecordImporterTest()
        : m_log("importer-test")
        , m_importer(m_history, m_blobs, m_thumbnails, m_log)
    {
    }

    static IncomingRecord record(const std::string& uuid, int images) {
        IncomingRecord r;
        r.meta.uuid = uuid;
        r.meta.prompt = "prompt " + uuid;
        for (int i = images - 1; i >= 0; --i) {
            IncomingImage image;
            image.index = static_cast<uint32_t>(i);
            image.width = 16;
            image.height = 9;
            image.mimeType = i == 0 ? "image/png" : "";
            image.data = Bytes(10 + static_cast<size_t>(i), static_cast<uint8_t>(i));
            r.images.push_back(image);
        }
        return r;
    }

    bool logged(const std::string& needle) const {
        const auto lines = m_log.lines();
        return std::any_of(lines.begin(), lines.end(),
                           [&](const std::string& line) { return line.find(needle) != std::string::npos; });
    }

    MemoryHistoryStore m_history;
    MapBlobStore m_blobs;
    InlineThumbnailGenerator m_thumbnails;
    DiagnosticsLog m_log;
    RecordImporter m_importer;
};

}  // namespace

TEST_F(RecordImporterTest, ImportStoresImagesByIndex) {
    RecordId id = 0;
    std::string err;
    ASSERT_EQ(m_importer.importRecord(record("nbp-imp-001", 2), id, err), ImportOutcome::Imported) << err;
    ASSERT_NE(id, 0);

    std::vector<HistoryRecord> all;
    ASSERT_TRUE(m_history.getAllHistory(all, err)) << err;
    ASSERT_EQ(all.size(), 1u);
    const HistoryRecord& stored = all[0];
    EXPECT_EQ(stored.uuid, "nbp-imp-001");
    EXPECT_FALSE(stored.hasVideo);
    ASSERT_EQ(stored.images.size(), 2u);

    const std::string dir = "/images/" + std::to_string(id) + "/";
    EXPECT_EQ(m_blobs.files.at(dir + "0.png"), Bytes(10, 0));
    EXPECT_EQ(m_blobs.files.at(dir + "1.webp"), Bytes(11, 1));
    EXPECT_TRUE(logged("Imported record nbp-imp-001 as " + std::to_string(id)));
}

TEST_F(RecordImporterTest, DuplicateUuidIsSkippedWithoutWrites) {
    HistoryRecord existing;
    existing.uuid = "nbp-imp-dup";
    m_history.insertHistory(existing);

    RecordId id = 0;
    std::string err;
    EXPECT_EQ(m_importer.importRecord(record("nbp-imp-dup", 1), id, err), ImportOutcome::Skipped);
    EXPECT_EQ(id, 0);
    EXPECT_TRUE(m_blobs.files.empty());
    EXPECT_EQ(m_history.historyCount(), 1u);
}

TEST_F(RecordImporterTest, FailedMediaWriteRemovesRecordMedia) {
    IncomingRecord incoming = record("nbp-imp-002", 1);
    incoming.hasVideo = true;
    incoming.video = Bytes(100, 0x7E);
    m_blobs.failPrefix = "/videos/";

    RecordId id = 0;
    std::string err;
    EXPECT_EQ(m_importer.importRecord(incoming, id, err), ImportOutcome::Failed);
    EXPECT_EQ(err, "Disk full");
    ASSERT_NE(id, 0);

    const std::string idText = std::to_string(id);
    EXPECT_NE(std::find(m_blobs.deleted.begin(), m_blobs.deleted.end(), "/images/" + idText), m_blobs.deleted.end());
    EXPECT_NE(std::find(m_blobs.deleted.begin(), m_blobs.deleted.end(), "/videos/" + idText), m_blobs.deleted.end());
    EXPECT_TRUE(m_blobs.files.empty());
    EXPECT_TRUE(logged("[PSY-STOR-3000] Failed to save record nbp-imp-002"));
}

TEST_F(RecordImporterTest, VideoIsStoredWhenThumbnailFails) {
    IncomingRecord incoming = record("nbp-imp-003", 0);
    incoming.hasVideo = true;
    incoming.videoHeader.width = 1280;
    incoming.videoHeader.height = 720;
    incoming.video = Bytes(300, 0x55);

    RecordId id = 0;
    std::string err;
    ASSERT_EQ(m_importer.importRecord(incoming, id, err), ImportOutcome::Imported) << err;

    std::vector<HistoryRecord> all;
    ASSERT_TRUE(m_history.getAllHistory(all, err)) << err;
    ASSERT_EQ(all.size(), 1u);
    ASSERT_TRUE(all[0].hasVideo);
    EXPECT_EQ(all[0].video.path, "/videos/" + std::to_string(id) + "/video.mp4");
    EXPECT_EQ(all[0].video.mimeType, DEFAULT_VIDEO_MIME);
    EXPECT_EQ(all[0].video.width, 1280u);
    EXPECT_TRUE(all[0].video.thumbnailPath.empty());
    EXPECT_EQ(m_blobs.files.at(all[0].video.path).size(), 300u);
    EXPECT_TRUE(logged("Video thumbnail failed"));
}

TEST_F(RecordImporterTest, InlineJsonNeedsBase64ForEveryImage) {
    const nlohmann::json good = {
        {"uuid", "nbp-inl-001"},
        {"prompt", "inline"},
        {"imageCount", 9},
        {"hasVideo", true},
        {"images", nlohmann::json::array({
            {{"index", 3}, {"width", 4}, {"height", 5}, {"mimeType", "image/png"},
             {"data", DataUrl::base64Encode(Bytes(6, 0x42))}},
        })},
    };

    IncomingRecord parsed;
    std::string err;
    ASSERT_TRUE(RecordImporter::recordFromInlineJson(good, parsed, err)) << err;
    EXPECT_EQ(parsed.meta.uuid, "nbp-inl-001");
    EXPECT_EQ(parsed.meta.imageCount, 1u);
    EXPECT_FALSE(parsed.meta.hasVideo);
    EXPECT_FALSE(parsed.hasVideo);
    ASSERT_EQ(parsed.images.size(), 1u);
    EXPECT_EQ(parsed.images[0].index, 3u);
    EXPECT_EQ(parsed.images[0].mimeType, "image/png");
    EXPECT_EQ(parsed.images[0].data, Bytes(6, 0x42));

    nlohmann::json missing = good;
    missing["images"][0].erase("data");
    EXPECT_FALSE(RecordImporter::recordFromInlineJson(missing, parsed, err));

    nlohmann::json corrupt = good;
    corrupt["images"][0]["data"] = "%%%";
    EXPECT_FALSE(RecordImporter::recordFromInlineJson(corrupt, parsed, err));
    EXPECT_NE(err.find("Image 3"), std::string::npos) << err;

    EXPECT_FALSE(RecordImporter::recordFromInlineJson(nlohmann::json::array(), parsed, err));
}

TEST_F(RecordImporterTest, CharacterIsDeduplicatedByName) {
    IncomingCharacter character;
    character.meta.name = "Aria";
    character.hasImage = true;
    character.imageMime = "image/jpeg";
    character.image = Bytes(12, 0x09);

    std::string err;
    ASSERT_EQ(m_importer.importCharacter(character, err), ImportOutcome::Imported) << err;
    EXPECT_EQ(m_importer.importCharacter(character, err), ImportOutcome::Skipped);
    EXPECT_EQ(m_history.characterCount(), 1u);

    CharacterRecord stored;
    bool found = false;
    ASSERT_TRUE(m_history.getCharacterByName("Aria", stored, found, err)) << err;
    ASSERT_TRUE(found);
    EXPECT_EQ(stored.imagePath, "/characters/" + std::to_string(stored.id) + "/image.jpg");
    EXPECT_EQ(stored.thumbnail, DataUrl::build("image/jpeg", Bytes(12, 0x09)));
}

TEST_F(RecordImporterTest, CharacterStoreFailureIsFailed) {
    IncomingCharacter character;
    character.meta.name = "Bram";
    m_history.setWriteFailure(true);

    std::string err;
    EXPECT_EQ(m_importer.importCharacter(character, err), ImportOutcome::Failed);
    EXPECT_TRUE(logged("[PSY-STOR-3000] Failed to save character Bram"));
}

TEST(RecordImporterNamesTest, ExtensionsAndOutcomeNames) {
    EXPECT_EQ(RecordImporter::imageExtension("image/png"), "png");
    EXPECT_EQ(RecordImporter::imageExtension("image/webp"), "webp");
    EXPECT_EQ(RecordImporter::imageExtension(""), "webp");
    EXPECT_EQ(RecordImporter::characterImageExtension("image/jpg"), "jpg");
    EXPECT_EQ(RecordImporter::characterImageExtension("image/webp"), "webp");
    EXPECT_EQ(RecordImporter::characterImageExtension("image/gif"), "png");
    EXPECT_STREQ(importOutcomeToString(ImportOutcome::Skipped), "skipped");
}
