/**
 * @file transfer_sender_test.cpp
 * @brief Unit tests for the sender batch against a scripted data channel
 */

#include "peersync/DiagnosticsLog.h"
#include "peersync/FileBlobStore.h"
#include "peersync/MemoryHistoryStore.h"
#include "peersync/TransferSender.h"
#include "peersync/UuidGenerator.h"
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace PeerSync;

namespace {

/**
 * @brief Channel that records every frame and answers item boundaries
 *
 * Acks are resolved synchronously from send(), which is valid because the
 * sender arms its waiter before sending the boundary message.
 */
class ScriptedChannel : public DataChannel {
public:
    explicit ScriptedChannel(AckWaiter& acks) : m_acks(acks) {}

    void setHandler(DataChannelHandler*) override {}
    size_t bufferedAmount() const override { return 0; }
    bool isOpen() const override { return open.load(); }
    void close() override { open = false; }
    std::string localId() const override { return "nbp-sync-TEST22"; }
    std::string remoteId() const override { return "nbp-recv-TEST22-1"; }

    bool send(const Bytes& message, std::string& errorMsg) override {
        if (!open) {
            errorMsg = "Channel closed";
            return false;
        }

        frames.push_back(FrameCodec::decodeFrame(message));
        const DecodedFrame& frame = frames.back();

        if (frame.kind == FrameKind::Binary) {
            BinaryPacket packet;
            std::string err;
            if (FrameCodec::parseBinaryPacket(frame.body, packet, err) &&
                messageTypeOf(packet.header) == MessageType::RECORD_IMAGE) {
                ++m_imagesForRecord;
            }
            return true;
        }
        if (frame.kind != FrameKind::Json) {
            return true;
        }

        const std::string type = messageTypeOf(frame.json);
        if (type == MessageType::RECORD_START) {
            m_imagesForRecord = 0;
            if (++m_recordStarts == closeOnRecordStart) {
                open = false;
                m_acks.cancel();
            }
            return true;
        }
        if (!autoAck) {
            return true;
        }

        if (type == MessageType::RECORD_END) {
            RecordAck ack;
            ack.uuid = frame.json["uuid"].get<std::string>();
            ack.receivedImages = m_imagesForRecord;
            ack.expectedImages = m_imagesForRecord;
            ++m_acked;
            m_acks.resolve(MessageType::RECORD_ACK, ack.uuid, ack.toJson());
        } else if (type == MessageType::CHARACTER_END) {
            CharacterAck ack;
            ack.name = frame.json["name"].get<std::string>();
            ++m_acked;
            m_acks.resolve(MessageType::CHARACTER_ACK, ack.name, ack.toJson());
        } else if (type == MessageType::TRANSFER_COMPLETE) {
            TransferAck ack;
            ack.receivedCount = m_acked;
            ack.expectedCount = m_acked;
            ack.imported = m_acked;
            m_acks.resolve(MessageType::TRANSFER_ACK, "", ack.toJson());
        }
        return true;
    }

    std::vector<nlohmann::json> jsonOfType(const std::string& type) const {
        std::vector<nlohmann::json> out;
        for (const auto& frame : frames) {
            if (frame.kind == FrameKind::Json && messageTypeOf(frame.json) == type) {
                out.push_back(frame.json);
            }
        }
        return out;
    }

    std::vector<BinaryPacket> binaryPackets() const {
        std::vector<BinaryPacket> out;
        for (const auto& frame : frames) {
            BinaryPacket packet;
            std::string err;
            if (frame.kind == FrameKind::Binary && FrameCodec::parseBinaryPacket(frame.body, packet, err)) {
                out.push_back(std::move(packet));
            }
        }
        return out;
    }

    size_t chunkFrames() const {
        size_t count = 0;
        for (const auto& frame : frames) {
            if (frame.kind == FrameKind::Chunk) {
                ++count;
            }
        }
        return count;
    }

    std::vector<DecodedFrame> frames;
    std::atomic<bool> open{true};
    bool autoAck = true;
    int closeOnRecordStart = 0;

private:
    AckWaiter& m_acks;
    uint32_t m_imagesForRecord = 0;
    int m_recordStarts = 0;
    uint32_t m_acked = 0;
};

/// Blob store whose listed paths exist but cannot be read
class UnreadableBlobStore : public FileBlobStore {
public:
    using FileBlobStore::FileBlobStore;

    bool readFile(const std::string& path, Bytes& out, std::string& errorMsg) override {
        if (unreadable.count(path) > 0) {
            errorMsg = "I/O error";
            return false;
        }
        return FileBlobStore::readFile(path, out, errorMsg);
    }

    std::set<std::string> unreadable;
};

class FailingHistoryStore : public MemoryHistoryStore {
public:
    bool getAllHistory(std::vector<HistoryRecord>& out, std::string& errorMsg) override {
        (void)out;
        errorMsg = "database is locked";
        return false;
    }
};

class TransferSenderTest : public ::testing::Test {
protected:
    TransferSenderTest()
        : m_root(std::filesystem::temp_directory_path() / ("peersync-sender-" + UuidGenerator::generate()))
        , m_blobs(m_root)
        , m_log("sender-test")
        , m_channel(std::make_shared<ScriptedChannel>(m_acks))
        , m_backpressure(1, 100)
        , m_writer(m_channel, m_backpressure, m_stats, 64 * 1024, &m_log)
    {
        m_config.settleDelayMs = 0;
        m_config.recordAckTimeoutMs = 100;
        m_config.transferAckTimeoutMs = 100;
    }

    ~TransferSenderTest() override {
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }

    TransferSender makeSender(HistoryStore& history) {
        return TransferSender(history, m_blobs, m_writer, m_acks, m_config, m_log);
    }

    StoredImage writeImage(const std::string& path, size_t size, const std::string& format = "") {
        StoredImage image;
        image.path = path;
        image.compressedFormat = format;
        std::string err;
        EXPECT_TRUE(m_blobs.writeFile(path, Bytes(size, 0x5A), err)) << err;
        return image;
    }

    bool logContains(const std::string& needle) const {
        for (const auto& line : m_log.lines()) {
            if (line.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::filesystem::path m_root;
    MemoryHistoryStore m_history;
    UnreadableBlobStore m_blobs;
    TransferConfig m_config;
    DiagnosticsLog m_log;
    AckWaiter m_acks;
    std::shared_ptr<ScriptedChannel> m_channel;
    BackpressureController m_backpressure;
    TransferStats m_stats;
    FrameWriter m_writer;
};

}  // namespace

TEST(TransferSenderMimeTest, MimeTypeForPath) {
    EXPECT_EQ(TransferSender::mimeTypeForPath("/images/1/0.png", "x"), "image/png");
    EXPECT_EQ(TransferSender::mimeTypeForPath("/images/1/0.WEBP", "x"), "image/webp");
    EXPECT_EQ(TransferSender::mimeTypeForPath("/a/b.jpeg", "x"), "image/jpeg");
    EXPECT_EQ(TransferSender::mimeTypeForPath("/a/b.jpg", "x"), "image/jpeg");
    EXPECT_EQ(TransferSender::mimeTypeForPath("/videos/1/video.mp4", "x"), "video/mp4");
    EXPECT_EQ(TransferSender::mimeTypeForPath("/a/b.bmp", "image/webp"), "image/webp");
    EXPECT_EQ(TransferSender::mimeTypeForPath("/a.dir/noext", "fallback"), "fallback");
}

TEST_F(TransferSenderTest, SendsRecordsImagesAndChunkedVideo) {
    HistoryRecord first;
    first.uuid = "nbp-abc-1";
    first.prompt = "two images";
    StoredImage png = writeImage("/seed/1/0.png", 1000);
    png.index = 0;
    StoredImage webp = writeImage("/seed/1/1.bin", 2000, "image/webp");
    webp.index = 1;
    first.images = {png, webp};
    m_history.insertHistory(first);

    HistoryRecord second;
    second.uuid = "nbp-abc-2";
    second.hasVideo = true;
    second.video.path = "/seed/2/video.mp4";
    second.video.width = 720;
    std::string err;
    ASSERT_TRUE(m_blobs.writeFile(second.video.path, Bytes(CHUNK_SIZE * 2 + 10, 0x11), err)) << err;
    m_history.insertHistory(second);

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    ASSERT_TRUE(sender.sendHistory({}, summary, err)) << err;

    EXPECT_EQ(summary.total, 2u);
    EXPECT_EQ(summary.sent, 2u);
    EXPECT_EQ(summary.failed, 0u);

    ASSERT_FALSE(m_channel->frames.empty());
    EXPECT_EQ(messageTypeOf(m_channel->frames.front().json), "history_meta");
    EXPECT_EQ(m_channel->frames.front().json["count"], 2);

    const auto starts = m_channel->jsonOfType("record_start");
    ASSERT_EQ(starts.size(), 2u);
    EXPECT_EQ(starts[0]["meta"]["imageCount"], 2);
    EXPECT_EQ(starts[0]["meta"]["hasVideo"], false);
    EXPECT_EQ(starts[1]["meta"]["hasVideo"], true);

    const auto images = m_channel->binaryPackets();
    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0].header["mimeType"], "image/png");
    EXPECT_EQ(images[0].header["uuid"], "nbp-abc-1");
    EXPECT_EQ(images[0].data.size(), 1000u);
    EXPECT_EQ(images[1].header["mimeType"], "image/webp");
    EXPECT_EQ(images[1].header["index"], 1);

    EXPECT_EQ(m_channel->chunkFrames(), 3u);
    EXPECT_EQ(m_channel->jsonOfType("record_end").size(), 2u);
    EXPECT_GT(m_stats.snapshot().bytesSent, static_cast<uint64_t>(CHUNK_SIZE * 2));
}

TEST_F(TransferSenderTest, SelectedIdsLimitTheBatch) {
    HistoryRecord record;
    record.uuid = "nbp-sel-1";
    const RecordId wanted = m_history.insertHistory(record);
    record.uuid = "nbp-sel-2";
    m_history.insertHistory(record);

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    std::string err;
    ASSERT_TRUE(sender.sendHistory({wanted}, summary, err)) << err;

    EXPECT_EQ(summary.total, 1u);
    const auto starts = m_channel->jsonOfType("record_start");
    ASSERT_EQ(starts.size(), 1u);
    EXPECT_EQ(starts[0]["meta"]["uuid"], "nbp-sel-1");
}

TEST_F(TransferSenderTest, RecordWithoutUuidGetsOne) {
    HistoryRecord record;
    record.prompt = "old record";
    m_history.insertHistory(record);

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    std::string err;
    ASSERT_TRUE(sender.sendHistory({}, summary, err)) << err;

    const auto starts = m_channel->jsonOfType("record_start");
    ASSERT_EQ(starts.size(), 1u);
    const std::string uuid = starts[0]["meta"]["uuid"].get<std::string>();
    EXPECT_TRUE(UuidGenerator::isValid(uuid)) << uuid;
    EXPECT_EQ(m_channel->jsonOfType("record_end")[0]["uuid"], uuid);
    EXPECT_EQ(summary.sent, 1u);
}

TEST_F(TransferSenderTest, MissingImageBlobIsSkipped) {
    HistoryRecord record;
    record.uuid = "nbp-miss-1";
    StoredImage present = writeImage("/seed/m/0.webp", 10);
    StoredImage absent;
    absent.index = 1;
    absent.path = "/seed/m/1.webp";
    record.images = {present, absent};
    m_history.insertHistory(record);

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    std::string err;
    ASSERT_TRUE(sender.sendHistory({}, summary, err)) << err;

    EXPECT_EQ(m_channel->binaryPackets().size(), 1u);
    EXPECT_EQ(m_channel->jsonOfType("record_start")[0]["meta"]["imageCount"], 2);
    EXPECT_EQ(summary.sent, 1u);
    EXPECT_TRUE(logContains("Image mismatch"));
}

TEST_F(TransferSenderTest, UnreadableBlobsStillCloseTheRecord) {
    HistoryRecord first;
    first.uuid = "nbp-io-1";
    m_history.insertHistory(first);

    HistoryRecord broken;
    broken.uuid = "nbp-io-2";
    StoredImage good = writeImage("/seed/io/0.webp", 20);
    StoredImage bad = writeImage("/seed/io/1.webp", 30);
    bad.index = 1;
    broken.images = {good, bad};
    broken.hasVideo = true;
    broken.video.path = "/seed/io/video.mp4";
    std::string err;
    ASSERT_TRUE(m_blobs.writeFile(broken.video.path, Bytes(100, 0x33), err)) << err;
    m_history.insertHistory(broken);

    HistoryRecord last;
    last.uuid = "nbp-io-3";
    m_history.insertHistory(last);

    m_blobs.unreadable = {bad.path, broken.video.path};

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    ASSERT_TRUE(sender.sendHistory({}, summary, err)) << err;

    const auto ends = m_channel->jsonOfType("record_end");
    ASSERT_EQ(ends.size(), 3u);
    EXPECT_EQ(ends[1]["uuid"], "nbp-io-2");
    EXPECT_EQ(ends[2]["uuid"], "nbp-io-3");

    const auto images = m_channel->binaryPackets();
    ASSERT_EQ(images.size(), 1u);
    EXPECT_EQ(images[0].header["uuid"], "nbp-io-2");
    EXPECT_EQ(images[0].header["index"], 0);
    EXPECT_EQ(m_channel->chunkFrames(), 0u);

    EXPECT_EQ(summary.sent, 3u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_TRUE(logContains("Failed to read image /seed/io/1.webp"));
    EXPECT_TRUE(logContains("Failed to read video /seed/io/video.mp4"));
}

TEST_F(TransferSenderTest, UnreadableCharacterImageFallsBackToInlineData) {
    CharacterRecord character;
    character.name = "Mira";
    character.imagePath = "/characters/1/image.png";
    character.legacyImageData = "Zm9v";
    std::string err;
    ASSERT_TRUE(m_blobs.writeFile(character.imagePath, Bytes(8, 0x44), err)) << err;
    m_history.insertCharacter(character);

    CharacterRecord noFallback;
    noFallback.name = "Tomas";
    noFallback.imagePath = "/characters/2/image.png";
    ASSERT_TRUE(m_blobs.writeFile(noFallback.imagePath, Bytes(8, 0x45), err)) << err;
    m_history.insertCharacter(noFallback);

    m_blobs.unreadable = {character.imagePath, noFallback.imagePath};

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    ASSERT_TRUE(sender.sendCharacters({}, summary, err)) << err;

    const auto images = m_channel->binaryPackets();
    ASSERT_EQ(images.size(), 1u);
    EXPECT_EQ(images[0].header["name"], "Mira");
    EXPECT_EQ(images[0].data, (Bytes{'f', 'o', 'o'}));
    EXPECT_EQ(m_channel->jsonOfType("character_end").size(), 2u);
    EXPECT_EQ(summary.sent, 2u);
}

TEST_F(TransferSenderTest, AckTimeoutCountsAsFailedAndContinues) {
    m_channel->autoAck = false;

    HistoryRecord record;
    record.uuid = "nbp-slow-1";
    m_history.insertHistory(record);
    record.uuid = "nbp-slow-2";
    m_history.insertHistory(record);

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    std::string err;
    ASSERT_TRUE(sender.sendHistory({}, summary, err)) << err;

    EXPECT_EQ(summary.total, 2u);
    EXPECT_EQ(summary.sent, 0u);
    EXPECT_EQ(summary.failed, 2u);
    EXPECT_EQ(m_channel->jsonOfType("record_end").size(), 2u);
    EXPECT_TRUE(logContains("ACK timeout: nbp-slow-1"));
}

TEST_F(TransferSenderTest, CloseMidBatchStopsSending) {
    m_channel->closeOnRecordStart = 2;

    for (int i = 0; i < 3; ++i) {
        HistoryRecord record;
        record.uuid = "nbp-close-" + std::to_string(i);
        m_history.insertHistory(record);
    }

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    std::string err;
    EXPECT_FALSE(sender.sendHistory({}, summary, err));
    EXPECT_EQ(err, "Connection closed");
    EXPECT_EQ(summary.sent, 1u);
    EXPECT_EQ(m_channel->jsonOfType("record_start").size(), 2u);
    EXPECT_EQ(m_channel->jsonOfType("record_end").size(), 1u);
}

TEST_F(TransferSenderTest, LoadFailureIsReported) {
    FailingHistoryStore failing;
    TransferSender sender = makeSender(failing);
    SendSummary summary;
    std::string err;

    EXPECT_FALSE(sender.sendHistory({}, summary, err));
    EXPECT_EQ(err.rfind("Failed to load history", 0), 0u);
    EXPECT_TRUE(m_channel->frames.empty());
}

TEST_F(TransferSenderTest, CharactersFromBlobAndInlineData) {
    CharacterRecord withBlob;
    withBlob.name = "Mira";
    withBlob.imagePath = "/characters/1/image.webp";
    std::string err;
    ASSERT_TRUE(m_blobs.writeFile(withBlob.imagePath, Bytes(64, 0x22), err)) << err;
    m_history.insertCharacter(withBlob);

    CharacterRecord legacy;
    legacy.name = "Tomas";
    legacy.legacyImageData = "Zm9v";
    m_history.insertCharacter(legacy);

    CharacterRecord bare;
    bare.name = "Ilse";
    m_history.insertCharacter(bare);

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    ASSERT_TRUE(sender.sendCharacters({}, summary, err)) << err;

    EXPECT_EQ(summary.total, 3u);
    EXPECT_EQ(summary.sent, 3u);
    EXPECT_EQ(messageTypeOf(m_channel->frames.front().json), "characters_meta");

    const auto images = m_channel->binaryPackets();
    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0].header["type"], "character_image");
    EXPECT_EQ(images[0].header["name"], "Mira");
    EXPECT_EQ(images[0].header["mimeType"], "image/webp");
    EXPECT_EQ(images[1].header["name"], "Tomas");
    EXPECT_EQ(images[1].header["mimeType"], "image/png");
    EXPECT_EQ(images[1].data, (Bytes{'f', 'o', 'o'}));

    EXPECT_EQ(m_channel->jsonOfType("character_end").size(), 3u);
}

TEST_F(TransferSenderTest, SelectedCharacterIds) {
    CharacterRecord character;
    character.name = "Mira";
    const RecordId id = m_history.insertCharacter(character);
    character.name = "Tomas";
    m_history.insertCharacter(character);

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    std::string err;
    ASSERT_TRUE(sender.sendCharacters({id, 404}, summary, err)) << err;
    EXPECT_EQ(summary.total, 1u);
    EXPECT_EQ(m_channel->jsonOfType("character_start")[0]["character"]["name"], "Mira");
}

TEST_F(TransferSenderTest, FinishTransferReturnsReceiverCounts) {
    HistoryRecord record;
    record.uuid = "nbp-fin-1";
    m_history.insertHistory(record);

    TransferSender sender = makeSender(m_history);
    SendSummary summary;
    std::string err;
    ASSERT_TRUE(sender.sendHistory({}, summary, err)) << err;

    TransferAck ack;
    bool received = false;
    ASSERT_TRUE(sender.finishTransfer(summary, ack, received, err)) << err;
    EXPECT_TRUE(received);
    EXPECT_EQ(ack.receivedCount, 1u);
    EXPECT_EQ(ack.imported, 1u);

    const auto complete = m_channel->jsonOfType("transfer_complete");
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_EQ(complete[0]["total"], 1);
    EXPECT_EQ(complete[0]["sent"], 1);
    EXPECT_EQ(complete[0]["failed"], 0);
}

TEST_F(TransferSenderTest, FinishTransferWithoutAckStillSucceeds) {
    m_channel->autoAck = false;
    TransferSender sender = makeSender(m_history);

    SendSummary summary;
    summary.total = 4;
    summary.sent = 3;
    summary.failed = 1;

    TransferAck ack;
    bool received = true;
    std::string err;
    ASSERT_TRUE(sender.finishTransfer(summary, ack, received, err)) << err;
    EXPECT_FALSE(received);
    EXPECT_TRUE(logContains("transfer_ack"));
}

TEST_F(TransferSenderTest, FinishTransferOnClosedChannelFails) {
    m_channel->close();
    TransferSender sender = makeSender(m_history);

    TransferAck ack;
    bool received = false;
    std::string err;
    EXPECT_FALSE(sender.finishTransfer(SendSummary{}, ack, received, err));
    EXPECT_FALSE(received);
}
