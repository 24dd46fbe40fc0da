/**
 * @file TransferSender.h
 * @brief Sender transfer engine: streams records and characters with per-item acks
 */

#pragma once

#include "AckWaiter.h"
#include "DataUrl.h"
#include "FrameWriter.h"
#include "StorageInterfaces.h"
#include "TransferConfig.h"
#include "TransferMessages.h"
#include "TransferStats.h"

#include <string>
#include <vector>

namespace PeerSync {

class DiagnosticsLog;

/**
 * @brief Per-phase sender tally
 */
struct SendSummary {
    uint32_t sent = 0;
    uint32_t failed = 0;
    uint32_t total = 0;

    SendSummary& operator+=(const SendSummary& other) {
        sent += other.sent;
        failed += other.failed;
        total += other.total;
        return *this;
    }
};

/**
 * @brief Final outcome of a transfer as shown to the user
 */
struct TransferResult {
    uint32_t imported = 0;
    uint32_t skipped = 0;
    uint32_t failed = 0;
    uint32_t total = 0;
    uint32_t sent = 0;
};

/**
 * @class TransferSender
 * @brief Sends history records and characters, one acknowledged item at a time
 *
 * For each item: *_start, its binary parts through the FrameWriter, a full
 * drain plus settle delay, *_end, then a blocking wait for the matching
 * *_ack. An ack timeout fails only that item. A blob that is missing or
 * unreadable is left out of its item, which is still closed with *_end.
 *
 * Every public method returns false when the batch must stop: the
 * connection closed (writer no longer open) or the item list could not be
 * read from storage. `errorMsg` says which.
 *
 * Thread Safety:
 * - Not thread-safe; runs on the session's single worker thread
 */
class TransferSender {
public:
    TransferSender(HistoryStore& history,
                   BlobStore& blobs,
                   FrameWriter& writer,
                   AckWaiter& acks,
                   const TransferConfig& config,
                   DiagnosticsLog& log,
                   ProgressCallback progress = nullptr);

    /**
     * @brief Send history records
     * @param selectedIds Record ids to send (empty = all records)
     * @param summary Output tally
     */
    bool sendHistory(const std::vector<RecordId>& selectedIds, SendSummary& summary, std::string& errorMsg);

    /**
     * @brief Send characters
     * @param selectedIds Character ids to send (empty = all characters)
     * @param summary Output tally
     */
    bool sendCharacters(const std::vector<RecordId>& selectedIds, SendSummary& summary, std::string& errorMsg);

    /**
     * @brief Send transfer_complete and wait for transfer_ack
     *
     * An ack timeout is not an error: `ackReceived` is false and the caller
     * falls back to its own counts.
     *
     * @param summary Combined tally of all phases
     * @param outAck Receiver's counts when ackReceived
     */
    bool finishTransfer(const SendSummary& summary,
                        TransferAck& outAck,
                        bool& ackReceived,
                        std::string& errorMsg);

    /// MIME type for a blob path by extension ("image/webp" when unknown)
    static std::string mimeTypeForPath(const std::string& path, const std::string& fallback);

private:
    enum class ItemResult {
        Sent,
        Failed,
        ConnectionClosed
    };

    ItemResult sendRecord(const HistoryRecord& record);
    ItemResult sendCharacter(const CharacterRecord& character);

    /// Full character image from the blob store or legacy inline data
    bool loadCharacterImage(const CharacterRecord& character, InlinePayload& out);

    /// Drain, settle, arm the ack, send the *_end message and wait
    ItemResult closeItem(const nlohmann::json& endMessage,
                         const char* ackType,
                         const std::string& key,
                         nlohmann::json& outAck);

    ItemResult classifyFailure(const std::string& what, const std::string& errorMsg);
    void settle();
    void reportProgress(const TransferProgress& progress, bool force);

    HistoryStore& m_history;
    BlobStore& m_blobs;
    FrameWriter& m_writer;
    AckWaiter& m_acks;
    const TransferConfig& m_config;
    DiagnosticsLog& m_log;
    ThrottledProgress m_progress;
};

}  // namespace PeerSync
