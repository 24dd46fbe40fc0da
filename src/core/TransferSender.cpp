/**
 * @file TransferSender.cpp
 * @brief Sender transfer engine implementation
 */

#include "peersync/TransferSender.h"
#include "peersync/DataUrl.h"
#include "peersync/DiagnosticsLog.h"
#include "peersync/UuidGenerator.h"
#include "peersync/Debug.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace PeerSync {

TransferSender::TransferSender(HistoryStore& history,
                               BlobStore& blobs,
                               FrameWriter& writer,
                               AckWaiter& acks,
                               const TransferConfig& config,
                               DiagnosticsLog& log,
                               ProgressCallback progress)
    : m_history(history)
    , m_blobs(blobs)
    , m_writer(writer)
    , m_acks(acks)
    , m_config(config)
    , m_log(log)
    , m_progress(std::move(progress))
{
}

std::string TransferSender::mimeTypeForPath(const std::string& path, const std::string& fallback) {
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || path.find('/', dot) != std::string::npos) {
        return fallback;
    }

    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "png") return "image/png";
    if (ext == "webp") return "image/webp";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif") return "image/gif";
    if (ext == "mp4") return "video/mp4";
    if (ext == "webm") return "video/webm";
    return fallback;
}

void TransferSender::settle() {
    if (m_config.settleDelayMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(m_config.settleDelayMs));
    }
}

void TransferSender::reportProgress(const TransferProgress& progress, bool force) {
    m_progress(progress, force);
}

TransferSender::ItemResult TransferSender::classifyFailure(const std::string& what, const std::string& errorMsg) {
    if (!m_writer.isOpen()) {
        m_log.add("Connection closed while sending " + what);
        return ItemResult::ConnectionClosed;
    }
    m_log.add("Failed to send " + what + ": " + errorMsg);
    return ItemResult::Failed;
}

TransferSender::ItemResult TransferSender::closeItem(const nlohmann::json& endMessage,
                                                     const char* ackType,
                                                     const std::string& key,
                                                     nlohmann::json& outAck) {
    std::string errorMsg;

    // Everything for this item must be on the wire before the boundary frame
    if (!m_writer.drain(0, errorMsg)) {
        return ItemResult::ConnectionClosed;
    }
    settle();

    m_acks.arm(ackType, key);
    if (!m_writer.sendJson(endMessage, errorMsg)) {
        return classifyFailure(messageTypeOf(endMessage), errorMsg);
    }

    m_log.add(std::string("Waiting for ") + ackType + ": " + key);
    const AckResult result = m_acks.wait(std::chrono::milliseconds(m_config.recordAckTimeoutMs), outAck);
    switch (result) {
        case AckResult::Received:
            return ItemResult::Sent;
        case AckResult::TimedOut:
            m_log.add("ACK timeout: " + key);
            return ItemResult::Failed;
        case AckResult::ConnectionClosed:
            m_log.add("Connection closed while waiting for " + std::string(ackType) + ": " + key);
            return ItemResult::ConnectionClosed;
    }
    return ItemResult::Failed;
}

//=============================================================================
// History
//=============================================================================

bool TransferSender::sendHistory(const std::vector<RecordId>& selectedIds,
                                 SendSummary& summary,
                                 std::string& errorMsg) {
    summary = SendSummary{};

    std::vector<HistoryRecord> records;
    std::string storeError;
    const bool loaded = selectedIds.empty()
        ? m_history.getAllHistory(records, storeError)
        : m_history.getHistoryByIds(selectedIds, records, storeError);
    if (!loaded) {
        errorMsg = "Failed to load history: " + storeError;
        LOG_ERROR(errorMsg);
        return false;
    }

    summary.total = static_cast<uint32_t>(records.size());
    TransferProgress progress{0, summary.total, "sending"};
    reportProgress(progress, true);

    if (!m_writer.sendJson(Messages::historyMeta(summary.total), errorMsg)) {
        return false;
    }

    for (const HistoryRecord& record : records) {
        const ItemResult result = sendRecord(record);
        if (result == ItemResult::ConnectionClosed) {
            errorMsg = "Connection closed";
            return false;
        }
        if (result == ItemResult::Sent) {
            ++summary.sent;
        } else {
            ++summary.failed;
        }

        ++progress.current;
        reportProgress(progress, progress.current == progress.total);
    }

    m_log.add("Waiting for buffer to drain...");
    if (!m_writer.drain(0, errorMsg)) {
        return false;
    }

    LOG_INFO("History sent: " << summary.sent << "/" << summary.total
             << " (" << summary.failed << " failed)");
    return true;
}

TransferSender::ItemResult TransferSender::sendRecord(const HistoryRecord& record) {
    const std::string uuid = record.uuid.empty() ? UuidGenerator::generate() : record.uuid;
    if (uuid.empty()) {
        m_log.add("Failed to assign a UUID to record " + std::to_string(record.id));
        return ItemResult::Failed;
    }

    RecordMeta meta;
    meta.uuid = uuid;
    meta.timestamp = record.timestamp;
    meta.prompt = record.prompt;
    meta.mode = record.mode;
    meta.options = record.options;
    meta.status = record.status;
    meta.thinkingText = record.thinkingText;
    meta.error = record.error;
    meta.imageCount = static_cast<uint32_t>(record.images.size());
    meta.hasVideo = record.hasVideo && !record.video.path.empty();

    std::string errorMsg;
    if (!m_writer.sendJson(Messages::recordStart(meta), errorMsg)) {
        return classifyFailure("record_start " + uuid, errorMsg);
    }

    for (size_t i = 0; i < record.images.size(); ++i) {
        const StoredImage& img = record.images[i];
        if (img.path.empty() || !m_blobs.fileExists(img.path)) {
            m_log.add("Image " + std::to_string(img.index) + " of " + uuid + " missing, skipped");
            continue;
        }

        Bytes data;
        if (!m_blobs.readFile(img.path, data, errorMsg)) {
            m_log.add("Failed to read image " + img.path + ": " + errorMsg + ", skipped");
            continue;
        }

        RecordImageHeader header;
        header.uuid = uuid;
        header.index = img.index;
        header.width = img.width;
        header.height = img.height;
        header.size = data.size();
        header.mimeType = img.compressedFormat.empty()
            ? mimeTypeForPath(img.path, DEFAULT_IMAGE_MIME)
            : img.compressedFormat;

        if (!m_writer.sendBinary(header.toJson(), data, errorMsg)) {
            return classifyFailure("image " + std::to_string(img.index) + " of " + uuid, errorMsg);
        }
        m_log.add("Sent image " + std::to_string(i + 1) + "/" + std::to_string(record.images.size()) +
                  ": " + TransferStats::formatBytes(data.size()));
    }

    if (meta.hasVideo) {
        Bytes data;
        if (!m_blobs.fileExists(record.video.path)) {
            m_log.add("Video of " + uuid + " missing, skipped");
        } else if (!m_blobs.readFile(record.video.path, data, errorMsg)) {
            m_log.add("Failed to read video " + record.video.path + ": " + errorMsg + ", skipped");
        } else {
            RecordVideoHeader header;
            header.uuid = uuid;
            header.width = record.video.width;
            header.height = record.video.height;
            header.size = data.size();
            header.mimeType = record.video.mimeType.empty() ? DEFAULT_VIDEO_MIME : record.video.mimeType;

            if (!m_writer.sendChunked(header.toJson(), data, errorMsg)) {
                return classifyFailure("video of " + uuid, errorMsg);
            }
            m_log.add("Sent video: " + TransferStats::formatBytes(data.size()));
        }
    }

    nlohmann::json ackJson;
    const ItemResult result = closeItem(Messages::recordEnd(uuid), MessageType::RECORD_ACK, uuid, ackJson);
    if (result != ItemResult::Sent) {
        return result;
    }

    const RecordAck ack = RecordAck::fromJson(ackJson);
    if (ack.receivedImages != meta.imageCount) {
        m_log.add("Warning: Image mismatch for " + uuid + ": sent " + std::to_string(meta.imageCount) +
                  ", received " + std::to_string(ack.receivedImages));
    } else {
        m_log.add("Record " + uuid + " acknowledged, " + std::to_string(ack.receivedImages) + "/" +
                  std::to_string(meta.imageCount) + " images OK" + (ack.skipped ? " (skipped)" : ""));
    }
    return ItemResult::Sent;
}

//=============================================================================
// Characters
//=============================================================================

bool TransferSender::sendCharacters(const std::vector<RecordId>& selectedIds,
                                    SendSummary& summary,
                                    std::string& errorMsg) {
    summary = SendSummary{};

    std::vector<CharacterRecord> characters;
    std::string storeError;
    if (selectedIds.empty()) {
        if (!m_history.getAllCharacters(characters, storeError)) {
            errorMsg = "Failed to load characters: " + storeError;
            LOG_ERROR(errorMsg);
            return false;
        }
    } else {
        for (RecordId id : selectedIds) {
            CharacterRecord character;
            bool found = false;
            if (!m_history.getCharacterById(id, character, found, storeError)) {
                errorMsg = "Failed to load character " + std::to_string(id) + ": " + storeError;
                LOG_ERROR(errorMsg);
                return false;
            }
            if (found) {
                characters.push_back(std::move(character));
            }
        }
    }

    summary.total = static_cast<uint32_t>(characters.size());
    TransferProgress progress{0, summary.total, "sending_characters"};
    reportProgress(progress, true);

    if (!m_writer.sendJson(Messages::charactersMeta(summary.total), errorMsg)) {
        return false;
    }

    for (const CharacterRecord& character : characters) {
        const ItemResult result = sendCharacter(character);
        if (result == ItemResult::ConnectionClosed) {
            errorMsg = "Connection closed";
            return false;
        }
        if (result == ItemResult::Sent) {
            ++summary.sent;
        } else {
            ++summary.failed;
        }

        ++progress.current;
        reportProgress(progress, progress.current == progress.total);
    }

    if (!m_writer.drain(0, errorMsg)) {
        return false;
    }

    LOG_INFO("Characters sent: " << summary.sent << "/" << summary.total
             << " (" << summary.failed << " failed)");
    return true;
}

TransferSender::ItemResult TransferSender::sendCharacter(const CharacterRecord& character) {
    CharacterMeta meta;
    meta.name = character.name;
    meta.description = character.description;
    meta.physicalTraits = character.physicalTraits;
    meta.clothing = character.clothing;
    meta.accessories = character.accessories;
    meta.distinctiveFeatures = character.distinctiveFeatures;
    meta.thumbnail = character.thumbnail;

    std::string errorMsg;
    if (!m_writer.sendJson(Messages::characterStart(meta), errorMsg)) {
        return classifyFailure("character_start " + character.name, errorMsg);
    }

    // An unreadable image is left out; the character itself still goes through
    InlinePayload image;
    const bool hasImage = loadCharacterImage(character, image);

    if (hasImage) {
        CharacterImageHeader header;
        header.name = character.name;
        header.size = image.data.size();
        header.mimeType = image.mimeType;

        if (!m_writer.sendBinary(header.toJson(), image.data, errorMsg)) {
            return classifyFailure("image of character " + character.name, errorMsg);
        }
        m_log.add("Sent character image: " + character.name + ", " +
                  TransferStats::formatBytes(image.data.size()));
    }

    nlohmann::json ackJson;
    const ItemResult result = closeItem(Messages::characterEnd(character.name),
                                        MessageType::CHARACTER_ACK,
                                        character.name,
                                        ackJson);
    if (result == ItemResult::Sent) {
        const CharacterAck ack = CharacterAck::fromJson(ackJson);
        m_log.add("Character " + character.name + " acknowledged" + (ack.skipped ? " (skipped)" : ""));
    }
    return result;
}

bool TransferSender::loadCharacterImage(const CharacterRecord& character, InlinePayload& out) {
    // Blob store first, inline legacy data as fallback
    std::string errorMsg;
    if (!character.imagePath.empty() && m_blobs.fileExists(character.imagePath)) {
        if (m_blobs.readFile(character.imagePath, out.data, errorMsg)) {
            out.mimeType = mimeTypeForPath(character.imagePath, DEFAULT_CHARACTER_IMAGE_MIME);
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

//=============================================================================
// Reconciliation
//=============================================================================

bool TransferSender::finishTransfer(const SendSummary& summary,
                                   TransferAck& outAck,
                                   bool& ackReceived,
                                   std::string& errorMsg) {
    ackReceived = false;

    if (!m_writer.drain(0, errorMsg)) {
        return false;
    }

    TransferComplete complete;
    complete.total = summary.total;
    complete.sent = summary.sent;
    complete.failed = summary.failed;

    m_acks.arm(MessageType::TRANSFER_ACK, "");
    if (!m_writer.sendJson(complete.toJson(), errorMsg)) {
        return false;
    }

    nlohmann::json ackJson;
    const AckResult result = m_acks.wait(std::chrono::milliseconds(m_config.transferAckTimeoutMs), ackJson);
    if (result != AckResult::Received) {
        m_log.add(std::string("ACK error: transfer_ack ") + ackResultToString(result));
        return true;
    }

    outAck = TransferAck::fromJson(ackJson);
    ackReceived = true;
    m_log.add("ACK received: imported=" + std::to_string(outAck.imported) +
              ", skipped=" + std::to_string(outAck.skipped) +
              ", failed=" + std::to_string(outAck.failed));
    if (outAck.receivedCount != summary.total || outAck.expectedCount != summary.total) {
        m_log.add("Warning: receiver processed " + std::to_string(outAck.receivedCount) +
                  " of " + std::to_string(summary.total) + " items");
    }
    return true;
}

}  // namespace PeerSync
