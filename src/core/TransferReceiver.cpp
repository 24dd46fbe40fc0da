/**
 * @file TransferReceiver.cpp
 * @brief Receiver assembly engine implementation
 */

#include "peersync/TransferReceiver.h"
#include "peersync/DiagnosticsLog.h"
#include "peersync/ErrorCodes.h"
#include "peersync/Debug.h"

#include <algorithm>

namespace PeerSync {

namespace {

uint32_t readCount(const nlohmann::json& message) {
    if (!message.contains("count") || !message["count"].is_number_integer()) {
        return 0;
    }
    const int64_t count = message["count"].get<int64_t>();
    return count > 0 ? static_cast<uint32_t>(count) : 0;
}

}  // namespace

TransferReceiver::TransferReceiver(HistoryStore& history,
                                   BlobStore& blobs,
                                   ThumbnailGenerator& thumbnails,
                                   const TransferConfig& config,
                                   DiagnosticsLog& log,
                                   SendFunction send,
                                   ProgressCallback progress)
    : m_importer(history, blobs, thumbnails, log)
    , m_config(config)
    , m_log(log)
    , m_send(std::move(send))
    , m_progressCallback(std::move(progress))
{
}

void TransferReceiver::reset() {
    m_record = PendingRecord{};
    m_character = PendingCharacter{};
    m_videoAssemblies.clear();
    m_progress = TransferProgress{};
    m_syncType.clear();
    m_expectedItems = 0;
    m_receivedItems = 0;
    m_imported = 0;
    m_skipped = 0;
    m_failed = 0;
}

TransferResult TransferReceiver::result() const {
    TransferResult r;
    r.imported = m_imported;
    r.skipped = m_skipped;
    r.failed = m_failed;
    r.total = m_expectedItems;
    return r;
}

void TransferReceiver::sendAck(const nlohmann::json& ack) {
    std::string errorMsg;
    if (!m_send || !m_send(ack, errorMsg)) {
        m_log.add("Failed to send " + messageTypeOf(ack) + ": " + errorMsg);
    }
}

void TransferReceiver::itemDone() {
    ++m_receivedItems;
    ++m_progress.current;
    m_progressCallback(m_progress, m_progress.current >= m_progress.total);
}

void TransferReceiver::countOutcome(ImportOutcome outcome) {
    switch (outcome) {
        case ImportOutcome::Imported: ++m_imported; break;
        case ImportOutcome::Skipped: ++m_skipped; break;
        case ImportOutcome::Failed: ++m_failed; break;
    }
}

void TransferReceiver::beginPhase(uint32_t count, const char* phase) {
    m_expectedItems += count;
    m_progress = TransferProgress{0, count, phase};
    m_progressCallback(m_progress, true);
    m_log.add(std::string("Receiving ") + std::to_string(count) + " items (" + phase + ")");
}

//=============================================================================
// Frame dispatch
//=============================================================================

ReceiverEvent TransferReceiver::handleFrame(const DecodedFrame& frame, Clock::time_point now) {
    switch (frame.kind) {
        case FrameKind::Json:
            return handleJson(frame.json, now);
        case FrameKind::Binary:
            handleBinary(frame.body);
            return ReceiverEvent::None;
        case FrameKind::Chunk:
            handleChunk(frame.body);
            return ReceiverEvent::None;
    }
    return ReceiverEvent::None;
}

ReceiverEvent TransferReceiver::handleJson(const nlohmann::json& message, Clock::time_point now) {
    const std::string type = messageTypeOf(message);

    if (type == MessageType::HISTORY_META) {
        beginPhase(readCount(message), "receiving");
        return ReceiverEvent::PhaseStarted;
    }
    if (type == MessageType::CHARACTERS_META) {
        beginPhase(readCount(message), "receiving_characters");
        return ReceiverEvent::PhaseStarted;
    }
    if (type == MessageType::RECORD_START) {
        startRecord(RecordMeta::fromJson(message.contains("meta") ? message["meta"] : nlohmann::json()));
        return ReceiverEvent::None;
    }
    if (type == MessageType::HISTORY_RECORD) {
        importInlineRecord(message);
        return ReceiverEvent::None;
    }
    if (type == MessageType::RECORD_END) {
        const std::string uuid = message.contains("uuid") && message["uuid"].is_string()
            ? message["uuid"].get<std::string>() : std::string();
        endRecord(uuid, now);
        return ReceiverEvent::None;
    }
    if (type == MessageType::CHARACTER_START) {
        startCharacter(CharacterMeta::fromJson(message.contains("character") ? message["character"] : nlohmann::json()));
        return ReceiverEvent::None;
    }
    if (type == MessageType::CHARACTER_END) {
        const std::string name = message.contains("name") && message["name"].is_string()
            ? message["name"].get<std::string>() : std::string();
        endCharacter(name);
        return ReceiverEvent::None;
    }
    if (type == MessageType::TRANSFER_COMPLETE) {
        return completeTransfer(TransferComplete::fromJson(message));
    }

    m_log.add("Ignored message: " + (type.empty() ? std::string("<untyped>") : type));
    return ReceiverEvent::None;
}

void TransferReceiver::handleBinary(const Bytes& body) {
    BinaryPacket packet;
    std::string errorMsg;
    if (!FrameCodec::parseBinaryPacket(body, packet, errorMsg)) {
        m_log.add("Discarded binary frame: " + errorMsg);
        return;
    }

    const std::string type = messageTypeOf(packet.header);

    if (type == MessageType::RECORD_IMAGE) {
        RecordImageHeader header = RecordImageHeader::fromJson(packet.header);
        if (!m_record.active || header.uuid != m_record.meta.uuid) {
            m_log.add("Discarded image for " + header.uuid + " (no matching record)");
            return;
        }
        if (header.size != packet.data.size()) {
            m_log.add("Image " + std::to_string(header.index) + " size mismatch: header " +
                      std::to_string(header.size) + ", payload " + std::to_string(packet.data.size()));
        }
        m_log.add("Received image " + std::to_string(header.index) + " for " + header.uuid +
                  ": " + TransferStats::formatBytes(packet.data.size()));
        m_record.images.push_back(ReceivedImage{std::move(header), std::move(packet.data)});
        finalizeIfComplete();
        return;
    }

    if (type == MessageType::RECORD_VIDEO) {
        attachVideo(RecordVideoHeader::fromJson(packet.header), std::move(packet.data));
        return;
    }

    if (type == MessageType::CHARACTER_IMAGE) {
        const CharacterImageHeader header = CharacterImageHeader::fromJson(packet.header);
        if (!m_character.active || header.name != m_character.character.meta.name) {
            m_log.add("Discarded image for character " + header.name + " (no matching character)");
            return;
        }
        m_character.character.hasImage = true;
        m_character.character.imageMime = header.mimeType.empty() ? DEFAULT_CHARACTER_IMAGE_MIME : header.mimeType;
        m_character.character.image = std::move(packet.data);
        return;
    }

    m_log.add("Discarded binary frame of unknown type: " + type);
}

void TransferReceiver::handleChunk(const Bytes& body) {
    ChunkPacket packet;
    std::string errorMsg;
    if (!FrameCodec::parseChunkPacket(body, packet, errorMsg)) {
        m_log.add("Discarded chunk frame: " + errorMsg);
        return;
    }

    if (messageTypeOf(packet.header) != MessageType::RECORD_VIDEO) {
        m_log.add("Discarded chunk of unknown type: " + messageTypeOf(packet.header));
        return;
    }
    if (packet.totalChunks == 0 || packet.chunkIndex >= packet.totalChunks) {
        m_log.add("Discarded chunk " + std::to_string(packet.chunkIndex) + "/" +
                  std::to_string(packet.totalChunks) + ": index out of range");
        return;
    }

    RecordVideoHeader header = RecordVideoHeader::fromJson(packet.header);
    if (!m_record.active || header.uuid != m_record.meta.uuid) {
        m_log.add("Discarded video chunk for " + header.uuid + " (no matching record)");
        return;
    }
    VideoAssembly& assembly = m_videoAssemblies[header.uuid];
    if (assembly.totalChunks != packet.totalChunks) {
        assembly = VideoAssembly{};
        assembly.totalChunks = packet.totalChunks;
    }
    assembly.header = header;
    assembly.chunks[packet.chunkIndex] = std::move(packet.chunkData);

    if (assembly.chunks.size() < assembly.totalChunks) {
        return;
    }

    // std::map iterates in chunk index order
    Bytes video;
    video.reserve(static_cast<size_t>(assembly.totalChunks) * CHUNK_SIZE);
    for (const auto& entry : assembly.chunks) {
        video.insert(video.end(), entry.second.begin(), entry.second.end());
    }
    m_log.add("Reassembled video for " + header.uuid + " from " +
              std::to_string(assembly.totalChunks) + " chunks");
    m_videoAssemblies.erase(header.uuid);

    attachVideo(header, std::move(video));
}

//=============================================================================
// History records
//=============================================================================

void TransferReceiver::startRecord(const RecordMeta& meta) {
    if (m_record.active) {
        if (m_record.endReceived) {
            // Sender finished it; only late parts were outstanding
            m_log.add("record_start for " + meta.uuid + " while " + m_record.meta.uuid +
                      " awaits parts, finalizing it");
            finalizeRecord();
        } else {
            dropRecord("record_start for " + meta.uuid);
        }
    }
    pruneVideoAssemblies(meta.uuid);

    m_record = PendingRecord{};
    m_record.active = true;
    m_record.meta = meta;
    m_log.add("Receiving record " + meta.uuid + " (" + std::to_string(meta.imageCount) + " images" +
              (meta.hasVideo ? ", video)" : ")"));
}

void TransferReceiver::attachVideo(const RecordVideoHeader& header, Bytes data) {
    if (!m_record.active || header.uuid != m_record.meta.uuid) {
        m_log.add("Discarded video for " + header.uuid + " (no matching record)");
        return;
    }

    m_record.videoReceived = true;
    m_record.videoHeader = header;
    if (m_record.videoHeader.mimeType.empty()) {
        m_record.videoHeader.mimeType = DEFAULT_VIDEO_MIME;
    }
    m_record.video = std::move(data);
    m_log.add("Received video for " + header.uuid + ": " + TransferStats::formatBytes(m_record.video.size()));
    finalizeIfComplete();
}

bool TransferReceiver::recordPartsComplete() const {
    return m_record.images.size() >= m_record.meta.imageCount &&
           (!m_record.meta.hasVideo || m_record.videoReceived);
}

void TransferReceiver::finalizeIfComplete() {
    if (m_record.active && m_record.endReceived && recordPartsComplete()) {
        finalizeRecord();
    }
}

void TransferReceiver::endRecord(const std::string& uuid, Clock::time_point now) {
    if (!m_record.active || uuid != m_record.meta.uuid) {
        m_log.add("Ignored record_end for " + uuid + " (no matching record)");
        return;
    }

    m_record.endReceived = true;
    if (recordPartsComplete()) {
        finalizeRecord();
        return;
    }

    uint32_t waitMs = 0;
    if (m_record.images.size() < m_record.meta.imageCount) {
        waitMs += m_config.imagePartWaitMs;
    }
    if (m_record.meta.hasVideo && !m_record.videoReceived) {
        waitMs += m_config.videoPartWaitMs;
    }
    m_record.deadline = now + std::chrono::milliseconds(waitMs);
    m_log.add("Waiting up to " + std::to_string(waitMs) + " ms for missing parts of " + uuid +
              " (" + std::to_string(m_record.images.size()) + "/" +
              std::to_string(m_record.meta.imageCount) + " images)");
}

void TransferReceiver::onTick(Clock::time_point now) {
    if (!m_record.active || !m_record.endReceived) {
        return;
    }
    if (now >= m_record.deadline) {
        m_log.add("Part deadline passed for " + m_record.meta.uuid + ", finalizing with " +
                  std::to_string(m_record.images.size()) + "/" +
                  std::to_string(m_record.meta.imageCount) + " images");
        finalizeRecord();
    }
}

void TransferReceiver::dropRecord(const std::string& reason) {
    m_log.add(std::string("[") + ErrorCodes::TRANSFER_RECORD_ABANDONED + "] " + reason + " while " +
              m_record.meta.uuid + " is open without record_end, dropping it (" +
              std::to_string(m_record.images.size()) + "/" + std::to_string(m_record.meta.imageCount) +
              " images)");
    m_videoAssemblies.erase(m_record.meta.uuid);
    m_record = PendingRecord{};
    ++m_failed;
    itemDone();
}

void TransferReceiver::pruneVideoAssemblies(const std::string& keepUuid) {
    for (auto it = m_videoAssemblies.begin(); it != m_videoAssemblies.end();) {
        if (it->first != keepUuid) {
            m_log.add("Discarded " + std::to_string(it->second.chunks.size()) + "/" +
                      std::to_string(it->second.totalChunks) + " video chunks of " + it->first);
            it = m_videoAssemblies.erase(it);
        } else {
            ++it;
        }
    }
}

void TransferReceiver::finalizeRecord() {
    std::stable_sort(m_record.images.begin(), m_record.images.end(),
                     [](const ReceivedImage& a, const ReceivedImage& b) {
                         return a.header.index < b.header.index;
                     });

    RecordAck ack;
    ack.uuid = m_record.meta.uuid;
    ack.receivedImages = static_cast<uint32_t>(m_record.images.size());
    ack.expectedImages = m_record.meta.imageCount;
    ack.hasVideo = m_record.videoReceived;

    IncomingRecord incoming;
    incoming.meta = m_record.meta;
    incoming.images.reserve(m_record.images.size());
    for (ReceivedImage& img : m_record.images) {
        IncomingImage image;
        image.index = img.header.index;
        image.width = img.header.width;
        image.height = img.header.height;
        image.mimeType = img.header.mimeType;
        image.data = std::move(img.data);
        incoming.images.push_back(std::move(image));
    }
    incoming.hasVideo = m_record.videoReceived;
    incoming.videoHeader = m_record.videoHeader;
    incoming.video = std::move(m_record.video);

    m_videoAssemblies.erase(m_record.meta.uuid);
    m_record = PendingRecord{};

    RecordId newId = 0;
    std::string errorMsg;
    const ImportOutcome outcome = m_importer.importRecord(incoming, newId, errorMsg);
    countOutcome(outcome);
    ack.skipped = (outcome == ImportOutcome::Skipped);

    sendAck(ack.toJson());
    itemDone();
}

void TransferReceiver::importInlineRecord(const nlohmann::json& message) {
    IncomingRecord incoming;
    std::string errorMsg;
    ImportOutcome outcome = ImportOutcome::Failed;

    if (!message.contains("record") ||
        !RecordImporter::recordFromInlineJson(message["record"], incoming, errorMsg)) {
        m_log.add("Invalid history_record: " + (errorMsg.empty() ? std::string("missing record") : errorMsg));
    } else {
        m_log.add("Received inline record " + incoming.meta.uuid + " (" +
                  std::to_string(incoming.images.size()) + " images)");
        RecordId newId = 0;
        outcome = m_importer.importRecord(incoming, newId, errorMsg);
    }

    countOutcome(outcome);
    itemDone();
}

//=============================================================================
// Characters
//=============================================================================

void TransferReceiver::startCharacter(const CharacterMeta& meta) {
    if (m_character.active) {
        m_log.add(std::string("[") + ErrorCodes::TRANSFER_RECORD_ABANDONED + "] character_start for " +
                  meta.name + " while " + m_character.character.meta.name +
                  " is still open, dropping it");
        ++m_failed;
        itemDone();
    }
    m_character = PendingCharacter{};
    m_character.active = true;
    m_character.character.meta = meta;
    m_log.add("Receiving character " + meta.name);
}

void TransferReceiver::endCharacter(const std::string& name) {
    if (!m_character.active || name != m_character.character.meta.name) {
        m_log.add("Ignored character_end for " + name + " (no matching character)");
        return;
    }

    CharacterAck ack;
    ack.name = name;

    std::string errorMsg;
    const ImportOutcome outcome = m_importer.importCharacter(m_character.character, errorMsg);
    countOutcome(outcome);
    ack.skipped = (outcome == ImportOutcome::Skipped);

    m_character = PendingCharacter{};
    sendAck(ack.toJson());
    itemDone();
}

//=============================================================================
// Reconciliation
//=============================================================================

ReceiverEvent TransferReceiver::completeTransfer(const TransferComplete& complete) {
    if (m_record.active) {
        if (m_record.endReceived) {
            m_log.add("transfer_complete while " + m_record.meta.uuid + " awaits parts, finalizing it");
            finalizeRecord();
        } else {
            dropRecord("transfer_complete");
        }
    }
    if (m_character.active) {
        m_log.add(std::string("[") + ErrorCodes::TRANSFER_RECORD_ABANDONED + "] transfer_complete while character " +
                  m_character.character.meta.name + " is open, dropping it");
        m_character = PendingCharacter{};
        ++m_failed;
        itemDone();
    }
    pruneVideoAssemblies(std::string());

    if (m_expectedItems == 0) {
        m_expectedItems = complete.total;
    }
    if (complete.total != m_expectedItems) {
        m_log.add("Warning: sender total " + std::to_string(complete.total) +
                  " differs from announced " + std::to_string(m_expectedItems));
    }

    TransferAck ack;
    ack.receivedCount = m_receivedItems;
    ack.expectedCount = m_expectedItems;
    ack.imported = m_imported;
    ack.skipped = m_skipped;
    ack.failed = m_failed;
    sendAck(ack.toJson());

    m_log.add("Transfer complete: imported=" + std::to_string(m_imported) +
              ", skipped=" + std::to_string(m_skipped) +
              ", failed=" + std::to_string(m_failed));
    LOG_INFO("Receive complete: " << m_imported << " imported, " << m_skipped << " skipped, "
             << m_failed << " failed of " << m_expectedItems);
    return ReceiverEvent::Completed;
}

}  // namespace PeerSync
