/**
 * @file TransferReceiver.h
 * @brief Receiver assembly engine: rebuilds records and characters from frames
 */

#pragma once

#include "FrameCodec.h"
#include "RecordImporter.h"
#include "StorageInterfaces.h"
#include "TransferConfig.h"
#include "TransferMessages.h"
#include "TransferSender.h"
#include "TransferStats.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace PeerSync {

class DiagnosticsLog;

/**
 * @brief What a handled frame means for the owning session
 */
enum class ReceiverEvent {
    None,
    PhaseStarted,   ///< history_meta / characters_meta arrived
    Completed       ///< transfer_complete answered with transfer_ack
};

/**
 * @class TransferReceiver
 * @brief Accumulates one record (or character) at a time and persists it
 *
 * Data flow for a history record:
 * 1. record_start resets the accumulator from the metadata
 * 2. record_image Binary frames and record_video Binary/Chunk frames whose
 *    UUID matches are collected; chunked videos are reassembled by UUID
 * 3. record_end finalizes at once if every announced part arrived,
 *    otherwise arms a deadline (images, then video) checked by onTick()
 * 4. Finalization deduplicates by UUID, persists, and sends record_ack
 *
 * A record still open without record_end when the next record_start or
 * transfer_complete arrives was abandoned by the sender. It is dropped
 * unsaved and counted as failed, so a later resend can still import it.
 * The legacy history_record message carries a whole record with inline
 * base64 images and is imported directly, without an ack.
 *
 * The engine never blocks. Acks go out through the send function given at
 * construction.
 *
 * Thread Safety:
 * - Not thread-safe; the session serializes calls with its own mutex
 */
class TransferReceiver {
public:
    using SendFunction = std::function<bool(const nlohmann::json& message, std::string& errorMsg)>;
    using Clock = std::chrono::steady_clock;

    TransferReceiver(HistoryStore& history,
                     BlobStore& blobs,
                     ThumbnailGenerator& thumbnails,
                     const TransferConfig& config,
                     DiagnosticsLog& log,
                     SendFunction send,
                     ProgressCallback progress = nullptr);

    /// Route one decoded data channel message
    ReceiverEvent handleFrame(const DecodedFrame& frame, Clock::time_point now = Clock::now());

    ReceiverEvent handleJson(const nlohmann::json& message, Clock::time_point now = Clock::now());
    void handleBinary(const Bytes& body);
    void handleChunk(const Bytes& body);

    /// Finalize a record whose part deadline has passed
    void onTick(Clock::time_point now);

    /// Drop all partial state and counters
    void reset();

    /// Counters so far; total is the announced item count of all phases
    TransferResult result() const;

    TransferProgress progress() const { return m_progress; }
    std::string syncType() const { return m_syncType; }
    void setSyncType(const std::string& type) { m_syncType = type; }

    bool hasPendingRecord() const { return m_record.active; }
    bool isAwaitingParts() const { return m_record.active && m_record.endReceived; }
    size_t pendingVideoAssemblies() const { return m_videoAssemblies.size(); }

private:
    struct ReceivedImage {
        RecordImageHeader header;
        Bytes data;
    };

    struct PendingRecord {
        bool active = false;
        RecordMeta meta;
        std::vector<ReceivedImage> images;
        bool videoReceived = false;
        RecordVideoHeader videoHeader;
        Bytes video;
        bool endReceived = false;
        Clock::time_point deadline;
    };

    struct VideoAssembly {
        RecordVideoHeader header;
        uint32_t totalChunks = 0;
        std::map<uint32_t, Bytes> chunks;
    };

    struct PendingCharacter {
        bool active = false;
        IncomingCharacter character;
    };

    void beginPhase(uint32_t count, const char* phase);
    void startRecord(const RecordMeta& meta);
    void endRecord(const std::string& uuid, Clock::time_point now);
    bool recordPartsComplete() const;
    void finalizeRecord();
    void dropRecord(const std::string& reason);
    void pruneVideoAssemblies(const std::string& keepUuid);
    void importInlineRecord(const nlohmann::json& message);
    void countOutcome(ImportOutcome outcome);
    void attachVideo(const RecordVideoHeader& header, Bytes data);
    void finalizeIfComplete();

    void startCharacter(const CharacterMeta& meta);
    void endCharacter(const std::string& name);

    ReceiverEvent completeTransfer(const TransferComplete& complete);
    void itemDone();
    void sendAck(const nlohmann::json& ack);

    RecordImporter m_importer;
    const TransferConfig& m_config;
    DiagnosticsLog& m_log;
    SendFunction m_send;
    ThrottledProgress m_progressCallback;

    PendingRecord m_record;
    PendingCharacter m_character;
    std::map<std::string, VideoAssembly> m_videoAssemblies;

    TransferProgress m_progress;
    std::string m_syncType;
    uint32_t m_expectedItems = 0;
    uint32_t m_receivedItems = 0;
    uint32_t m_imported = 0;
    uint32_t m_skipped = 0;
    uint32_t m_failed = 0;
};

}  // namespace PeerSync
