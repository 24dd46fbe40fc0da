/**
 * @file PeerSession.h
 * @brief Pairing and transfer session with state management
 */

#pragma once

#include "AckWaiter.h"
#include "BackpressureController.h"
#include "DataChannel.h"
#include "DiagnosticsLog.h"
#include "ErrorCodes.h"
#include "PairingFingerprint.h"
#include "StorageInterfaces.h"
#include "TransferConfig.h"
#include "TransferMessages.h"
#include "TransferReceiver.h"
#include "TransferSender.h"
#include "TransferStats.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace PeerSync {

//=============================================================================
// Session Role and Status Enums
//=============================================================================

enum class SessionRole : uint8_t {
    NONE,
    SENDER,
    RECEIVER
};

/**
 * @brief Status of a session
 *
 * idle -> waiting (sender) / connecting (receiver) -> paired
 *      -> transferring -> completed | error
 */
enum class SessionStatus : uint8_t {
    IDLE,          ///< No connection
    WAITING,       ///< Sender endpoint registered, waiting for a receiver
    CONNECTING,    ///< Receiver dialing the sender
    PAIRED,        ///< Channel open, fingerprint shown, awaiting confirmation
    TRANSFERRING,  ///< Records or characters in flight
    COMPLETED,     ///< transfer_complete / transfer_ack exchanged
    FAILED         ///< Connection-level failure (see SessionState::error)
};

/**
 * @brief Convert SessionStatus to its protocol name
 * @return "idle", "waiting", "connecting", "paired", "transferring",
 *         "completed" or "error"
 */
inline std::string sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::IDLE:         return "idle";
        case SessionStatus::WAITING:      return "waiting";
        case SessionStatus::CONNECTING:   return "connecting";
        case SessionStatus::PAIRED:       return "paired";
        case SessionStatus::TRANSFERRING: return "transferring";
        case SessionStatus::COMPLETED:    return "completed";
        case SessionStatus::FAILED:       return "error";
        default:                          return "unknown";
    }
}

inline std::string sessionRoleToString(SessionRole role) {
    switch (role) {
        case SessionRole::SENDER:   return "sender";
        case SessionRole::RECEIVER: return "receiver";
        default:                    return "none";
    }
}

/**
 * @brief Observable session state
 */
struct SessionState {
    SessionStatus status = SessionStatus::IDLE;
    SessionRole role = SessionRole::NONE;
    std::string connectionCode;
    std::string localId;
    std::string remoteId;
    bool endpointOpen = false;
    FingerprintSymbols fingerprint;
    bool localConfirmed = false;
    bool remoteConfirmed = false;
    bool pairingConfirmed = false;
    SyncType syncType = SyncType::History;
    TransferProgress progress;
    bool hasResult = false;
    TransferResult result;
    SessionError error;
};

/**
 * @brief What a sender transfers
 */
struct SenderOptions {
    SyncType syncType = SyncType::History;
    std::vector<RecordId> historyIds;    ///< Empty = all records
    std::vector<RecordId> characterIds;  ///< Empty = all characters
};

//=============================================================================
// Callback Types
//=============================================================================

using StatusListener = std::function<void(SessionStatus status, const SessionState& state)>;
using CompletionCallback = std::function<void(const TransferResult& result)>;

//=============================================================================
// PeerSession Class
//=============================================================================

/**
 * @class PeerSession
 * @brief One pairing + transfer between a sender and a receiver
 *
 * The sender registers "nbp-sync-<CODE>" and waits; the receiver dials it.
 * Once the channel is open both sides show the same emoji fingerprint and
 * each user confirms. When both confirmations are known the sender streams
 * on a worker thread and the receiver assembles and persists.
 *
 * Threads:
 * - Transport events arrive on the transport's delivery thread
 * - The sender batch runs on one worker thread per session
 * - A maintenance thread ticks every maintenanceTickMs: open timeouts and
 *   the receiver's part deadlines
 *
 * Callbacks (status listeners, progress, completion) run on any of these
 * threads. They must not call cleanup() or destroy the session.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 *
 * Usage:
 * @code
 * PeerSession sender(network, history, blobs, thumbnails);
 * sender.startAsSender(options, err);
 * // show sender.state().connectionCode
 *
 * PeerSession receiver(network, history2, blobs2, thumbnails2);
 * receiver.connectToSender(code, err);
 * // both: wait for PAIRED, compare fingerprints, confirmPairing()
 * @endcode
 */
class PeerSession : public DataChannelHandler, public EndpointHandler {
public:
    PeerSession(PeerEndpointFactory& factory,
                HistoryStore& history,
                BlobStore& blobs,
                ThumbnailGenerator& thumbnails,
                const TransferConfig& config = TransferConfig());

    /// Calls cleanup()
    ~PeerSession() override;

    // Prevent copying
    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    //=========================================================================
    // Control
    //=========================================================================

    /**
     * @brief Become the sender: generate a code and register its endpoint
     *
     * A code whose endpoint id is taken is replaced by a fresh one, up to
     * maxCodeRetries attempts.
     *
     * @return false if the endpoint could not be created
     */
    bool startAsSender(const SenderOptions& options, std::string& errorMsg);

    /**
     * @brief Become the receiver and dial the sender with `code`
     *
     * The code is normalized first; an invalid code moves the session to
     * error with PSY-CONN-1001.
     */
    bool connectToSender(const std::string& code, std::string& errorMsg);

    /**
     * @brief The local user accepted the fingerprint
     * @return false if the session is not paired
     */
    bool confirmPairing(std::string& errorMsg);

    /**
     * @brief Back to idle from any state
     *
     * Closes the transport, joins the worker threads and resets all session
     * and receiver state. Must not be called from a session callback.
     */
    void cleanup();

    //=========================================================================
    // Observation
    //=========================================================================

    /// @return listener id for removeStatusListener()
    int addStatusListener(StatusListener listener);
    void removeStatusListener(int id);

    void setProgressCallback(ProgressCallback callback);
    void setCompletionCallback(CompletionCallback callback);

    SessionState state() const;
    SessionStatus status() const;

    /**
     * @brief Block until the session reaches `status`
     * @return false on timeout
     */
    bool waitForStatus(SessionStatus status, std::chrono::milliseconds timeout) const;

    /// Block until `predicate` holds for the session state; false on timeout
    bool waitForState(const std::function<bool(const SessionState&)>& predicate,
                      std::chrono::milliseconds timeout) const;

    /// Fingerprint as shown to the user ("" until paired)
    std::string fingerprintText() const;

    TransferStatsSnapshot statsSnapshot() const { return m_stats.snapshot(); }
    std::vector<std::string> diagnostics() const { return m_log.lines(); }

    //=========================================================================
    // Transport events
    //=========================================================================

    void onEndpointOpen(const std::string& id) override;
    void onIncomingChannel(std::shared_ptr<DataChannel> channel) override;
    void onEndpointError(const EndpointError& error) override;

    void onChannelOpen() override;
    void onChannelData(const Bytes& message) override;
    void onChannelClose() override;
    void onChannelError(const ChannelError& error) override;

private:
    using Clock = std::chrono::steady_clock;

    bool openSenderEndpoint(std::string& errorMsg);
    void retrySenderEndpoint();

    void handleRemoteConfirm();
    void handleReceiverFrame(const DecodedFrame& frame);
    void startSenderWorkerLocked();
    void runSender();

    void setStatus(SessionStatus status);
    void fail(const char* code, const std::string& message);
    void complete(const TransferResult& result);
    void notifyStatus(SessionStatus status, const SessionState& snapshot);
    void onProgress(const TransferProgress& progress);

    bool sendJson(const nlohmann::json& message, std::string& errorMsg);
    bool sendJsonLocked(const nlohmann::json& message, std::string& errorMsg);

    /// Close channel and endpoint, cancel pending waits (callback-safe)
    void closeConnection();

    void startMaintenance();
    void stopMaintenance();
    void maintenanceLoop();
    void maintenanceTick();

    PeerEndpointFactory& m_factory;
    HistoryStore& m_history;
    BlobStore& m_blobs;
    ThumbnailGenerator& m_thumbnails;
    TransferConfig m_config;

    mutable DiagnosticsLog m_log;
    TransferStats m_stats;
    BackpressureController m_backpressure;
    AckWaiter m_acks;

    // Lock order: m_receiverMutex before m_mutex
    std::mutex m_receiverMutex;
    TransferReceiver m_receiver;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_statusCv;
    SessionState m_state;
    SenderOptions m_options;
    std::shared_ptr<PeerEndpoint> m_endpoint;
    std::shared_ptr<DataChannel> m_channel;
    int m_codeAttempts = 0;
    bool m_endpointPending = false;
    Clock::time_point m_endpointDeadline;
    bool m_channelPending = false;
    Clock::time_point m_channelDeadline;

    std::thread m_senderThread;
    std::atomic<bool> m_senderActive{false};

    std::thread m_maintenanceThread;
    std::mutex m_maintenanceMutex;
    std::condition_variable m_maintenanceCv;
    bool m_maintenanceStop = false;

    std::mutex m_callbackMutex;
    std::map<int, StatusListener> m_listeners;
    int m_nextListenerId = 1;
    ProgressCallback m_progressCallback;
    CompletionCallback m_completionCallback;
};

}  // namespace PeerSync
