/**
 * @file memory_history_store_test.cpp
 * @brief Unit tests for the in-memory history and character store
 */

#include "peersync/MemoryHistoryStore.h"
#include <gtest/gtest.h>

using namespace PeerSync;

TEST(MemoryHistoryStoreTest, AddAndLookupByUuid) {
    MemoryHistoryStore store;
    std::string err;

    HistoryRecord record;
    record.uuid = "nbp-abc-123";
    record.prompt = "harbor at dusk";

    RecordId id = 0;
    ASSERT_TRUE(store.addHistoryWithUuid(record, id, err)) << err;
    EXPECT_GT(id, 0);

    bool exists = false;
    ASSERT_TRUE(store.hasHistoryByUuid("nbp-abc-123", exists, err));
    EXPECT_TRUE(exists);
    ASSERT_TRUE(store.hasHistoryByUuid("nbp-abc-999", exists, err));
    EXPECT_FALSE(exists);
}

TEST(MemoryHistoryStoreTest, AddStartsWithoutMedia) {
    MemoryHistoryStore store;
    std::string err;

    HistoryRecord record;
    record.uuid = "nbp-abc-123";
    record.hasVideo = true;
    record.images.push_back(StoredImage{});

    RecordId id = 0;
    ASSERT_TRUE(store.addHistoryWithUuid(record, id, err)) << err;

    std::vector<HistoryRecord> all;
    ASSERT_TRUE(store.getAllHistory(all, err));
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].images.empty());
    EXPECT_FALSE(all[0].hasVideo);

    StoredImage image;
    image.index = 0;
    image.path = "/images/1/0.webp";
    ASSERT_TRUE(store.updateHistoryImages(id, {image}, err)) << err;

    StoredVideo video;
    video.path = "/videos/1/video.mp4";
    ASSERT_TRUE(store.updateHistoryVideo(id, video, err)) << err;

    ASSERT_TRUE(store.getHistoryByIds({id}, all, err));
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].images.size(), 1u);
    EXPECT_TRUE(all[0].hasVideo);
    EXPECT_EQ(all[0].video.path, "/videos/1/video.mp4");
}

TEST(MemoryHistoryStoreTest, UpdateUnknownIdFails) {
    MemoryHistoryStore store;
    std::string err;
    EXPECT_FALSE(store.updateHistoryImages(42, {}, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(store.updateCharacterImage(42, "/characters/42/image.png", err));
}

TEST(MemoryHistoryStoreTest, GetByIdsSkipsMissing) {
    MemoryHistoryStore store;
    HistoryRecord record;
    record.uuid = "nbp-a-1";
    const RecordId id = store.insertHistory(record);

    std::vector<HistoryRecord> out;
    std::string err;
    ASSERT_TRUE(store.getHistoryByIds({999, id}, out, err));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, id);
}

TEST(MemoryHistoryStoreTest, Characters) {
    MemoryHistoryStore store;
    std::string err;

    CharacterRecord character;
    character.name = "Mira";
    character.description = "cartographer";

    RecordId id = 0;
    ASSERT_TRUE(store.addCharacter(character, id, err)) << err;
    ASSERT_TRUE(store.updateCharacterImage(id, "/characters/1/image.png", err)) << err;

    CharacterRecord found;
    bool exists = false;
    ASSERT_TRUE(store.getCharacterByName("Mira", found, exists, err));
    ASSERT_TRUE(exists);
    EXPECT_EQ(found.imagePath, "/characters/1/image.png");

    ASSERT_TRUE(store.getCharacterById(id, found, exists, err));
    EXPECT_TRUE(exists);
    ASSERT_TRUE(store.getCharacterByName("Nobody", found, exists, err));
    EXPECT_FALSE(exists);
    EXPECT_EQ(store.characterCount(), 1u);
}

TEST(MemoryHistoryStoreTest, WriteFailureInjection) {
    MemoryHistoryStore store;
    store.setWriteFailure(true);

    RecordId id = 0;
    std::string err;
    EXPECT_FALSE(store.addHistoryWithUuid(HistoryRecord{}, id, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(store.addCharacter(CharacterRecord{}, id, err));
    EXPECT_EQ(store.historyCount(), 0u);

    store.setWriteFailure(false);
    EXPECT_TRUE(store.addHistoryWithUuid(HistoryRecord{}, id, err));
}
