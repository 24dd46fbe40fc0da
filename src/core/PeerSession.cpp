/**
 * @file PeerSession.cpp
 * @brief Pairing and transfer session implementation
 */

#include "peersync/PeerSession.h"
#include "peersync/ConnectionCode.h"
#include "peersync/FrameWriter.h"
#include "peersync/Debug.h"

namespace PeerSync {

//=============================================================================
// Construction
//=============================================================================

PeerSession::PeerSession(PeerEndpointFactory& factory,
                         HistoryStore& history,
                         BlobStore& blobs,
                         ThumbnailGenerator& thumbnails,
                         const TransferConfig& config)
    : m_factory(factory)
    , m_history(history)
    , m_blobs(blobs)
    , m_thumbnails(thumbnails)
    , m_config(config)
    , m_log("PeerSession")
    , m_backpressure(config.drainPollIntervalMs, config.drainMaxPolls, &m_log)
    , m_receiver(history, blobs, thumbnails, m_config, m_log,
                 [this](const nlohmann::json& message, std::string& errorMsg) {
                     return sendJson(message, errorMsg);
                 },
                 [this](const TransferProgress& progress) { onProgress(progress); })
{
    if (!m_config.diagnosticsFile.empty()) {
        m_log.setMirrorFile(m_config.diagnosticsFile);
    }
}

PeerSession::~PeerSession() {
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_listeners.clear();
        m_progressCallback = nullptr;
        m_completionCallback = nullptr;
    }
    cleanup();
}

//=============================================================================
// Control
//=============================================================================

bool PeerSession::startAsSender(const SenderOptions& options, std::string& errorMsg) {
    cleanup();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state.role = SessionRole::SENDER;
        m_state.syncType = options.syncType;
        m_options = options;
        m_codeAttempts = 0;
    }

    LOG_INFO("Starting as sender (" << syncTypeToString(options.syncType) << ")");
    startMaintenance();
    return openSenderEndpoint(errorMsg);
}

bool PeerSession::openSenderEndpoint(std::string& errorMsg) {
    std::string code;
    if (!ConnectionCode::generate(code, errorMsg)) {
        fail(ErrorCodes::TRANSFER_INTERNAL_ERROR, "Failed to generate connection code: " + errorMsg);
        return false;
    }
    const std::string id = ConnectionCode::senderEndpointId(code);

    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        attempt = ++m_codeAttempts;
        m_state.connectionCode = code;
        m_state.localId = id;
        m_state.endpointOpen = false;
    }
    setStatus(SessionStatus::WAITING);

    bool created = false;
    {
        // Events are asynchronous; holding the lock keeps them queued until
        // m_endpoint is assigned
        std::lock_guard<std::mutex> lock(m_mutex);
        m_endpointPending = true;
        m_endpointDeadline = Clock::now() + std::chrono::milliseconds(m_config.endpointOpenTimeoutMs);
        m_endpoint = m_factory.createEndpoint(id, this, errorMsg);
        created = m_endpoint != nullptr;
        if (!created) {
            m_endpointPending = false;
        }
    }

    if (!created) {
        fail(ErrorCodes::CONNECTION_ENDPOINT_ERROR, "Failed to create endpoint: " + errorMsg);
        return false;
    }

    m_log.add("Registering endpoint " + id + " (attempt " + std::to_string(attempt) + ")");
    return true;
}

void PeerSession::retrySenderEndpoint() {
    std::shared_ptr<PeerEndpoint> old;
    int attempts = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        old = std::move(m_endpoint);
        m_endpoint.reset();
        m_endpointPending = false;
        attempts = m_codeAttempts;
    }

    if (old) {
        old->setHandler(nullptr);
        old->destroy();
    }

    if (attempts >= m_config.maxCodeRetries) {
        fail(ErrorCodes::CONNECTION_CODE_EXHAUSTED,
             "No free connection code after " + std::to_string(attempts) + " attempts");
        return;
    }

    m_log.add("Connection code taken, generating a new one");
    std::string errorMsg;
    if (!openSenderEndpoint(errorMsg)) {
        LOG_ERROR("Endpoint retry failed: " << errorMsg);
    }
}

bool PeerSession::connectToSender(const std::string& code, std::string& errorMsg) {
    cleanup();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state.role = SessionRole::RECEIVER;
    }

    std::string normalized;
    if (!ConnectionCode::normalize(code, normalized, errorMsg)) {
        fail(ErrorCodes::CONNECTION_INVALID_CODE, errorMsg);
        return false;
    }

    std::string localId;
    if (!ConnectionCode::receiverEndpointId(localId, errorMsg)) {
        fail(ErrorCodes::TRANSFER_INTERNAL_ERROR, "Failed to create endpoint id: " + errorMsg);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state.connectionCode = normalized;
        m_state.localId = localId;
    }
    setStatus(SessionStatus::CONNECTING);
    startMaintenance();

    bool created = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_endpointPending = true;
        m_endpointDeadline = Clock::now() + std::chrono::milliseconds(m_config.endpointOpenTimeoutMs);
        m_endpoint = m_factory.createEndpoint(localId, this, errorMsg);
        created = m_endpoint != nullptr;
        if (!created) {
            m_endpointPending = false;
        }
    }

    if (!created) {
        fail(ErrorCodes::CONNECTION_ENDPOINT_ERROR, "Failed to create endpoint: " + errorMsg);
        return false;
    }

    LOG_INFO("Connecting to " << ConnectionCode::senderEndpointId(normalized) << " as " << localId);
    m_log.add("Connecting to code " + normalized);
    return true;
}

bool PeerSession::confirmPairing(std::string& errorMsg) {
    bool bothConfirmed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.status != SessionStatus::PAIRED) {
            errorMsg = "Session is not paired (status: " + sessionStatusToString(m_state.status) + ")";
            return false;
        }
        if (m_state.localConfirmed) {
            return true;
        }

        // Flags are set before confirm_pairing leaves so that data following
        // the peer's confirmation is never dropped
        m_state.localConfirmed = true;
        bothConfirmed = m_state.remoteConfirmed;
        m_state.pairingConfirmed = bothConfirmed;

        if (!sendJsonLocked(Messages::confirmPairing(), errorMsg)) {
            m_state.localConfirmed = false;
            m_state.pairingConfirmed = false;
            return false;
        }

        if (bothConfirmed && m_state.role == SessionRole::SENDER) {
            startSenderWorkerLocked();
        }
    }
    m_statusCv.notify_all();

    m_log.add(bothConfirmed ? "Pairing confirmed by both peers" : "Pairing confirmed locally");
    return true;
}

void PeerSession::cleanup() {
    stopMaintenance();
    closeConnection();

    std::shared_ptr<DataChannel> channel;
    std::shared_ptr<PeerEndpoint> endpoint;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel = m_channel;
        endpoint = m_endpoint;
    }

    // Detach outside m_mutex: it waits for a running callback, which may
    // itself be waiting for m_mutex
    if (channel) {
        channel->setHandler(nullptr);
    }
    if (endpoint) {
        endpoint->setHandler(nullptr);
    }

    if (m_senderThread.joinable()) {
        m_senderThread.join();
    }
    m_senderActive.store(false);

    {
        std::lock_guard<std::mutex> lock(m_receiverMutex);
        m_receiver.reset();
    }
    m_acks.reset();
    m_backpressure.reset();
    m_stats.reset();

    SessionState snapshot;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        changed = m_state.status != SessionStatus::IDLE;
        m_state = SessionState{};
        m_options = SenderOptions{};
        m_channel.reset();
        m_endpoint.reset();
        m_codeAttempts = 0;
        m_endpointPending = false;
        m_channelPending = false;
        snapshot = m_state;
    }
    m_statusCv.notify_all();

    if (changed) {
        m_log.add("Session reset");
        notifyStatus(SessionStatus::IDLE, snapshot);
    }
}

void PeerSession::closeConnection() {
    std::shared_ptr<DataChannel> channel;
    std::shared_ptr<PeerEndpoint> endpoint;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel = m_channel;
        endpoint = m_endpoint;
        m_endpointPending = false;
        m_channelPending = false;
    }

    m_acks.cancel();
    m_backpressure.cancel();

    if (channel) {
        channel->close();
    }
    if (endpoint) {
        endpoint->destroy();
    }
}

//=============================================================================
// Observation
//=============================================================================

int PeerSession::addStatusListener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    const int id = m_nextListenerId++;
    m_listeners[id] = std::move(listener);
    return id;
}

void PeerSession::removeStatusListener(int id) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_listeners.erase(id);
}

void PeerSession::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_progressCallback = std::move(callback);
}

void PeerSession::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_completionCallback = std::move(callback);
}

SessionState PeerSession::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

SessionStatus PeerSession::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.status;
}

bool PeerSession::waitForState(const std::function<bool(const SessionState&)>& predicate,
                               std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_statusCv.wait_for(lock, timeout, [&] { return predicate(m_state); });
}

bool PeerSession::waitForStatus(SessionStatus status, std::chrono::milliseconds timeout) const {
    return waitForState([status](const SessionState& s) { return s.status == status; }, timeout);
}

std::string PeerSession::fingerprintText() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.remoteId.empty()) {
        return "";
    }
    return PairingFingerprint::formatForDisplay(m_state.fingerprint);
}

//=============================================================================
// State transitions
//=============================================================================

void PeerSession::setStatus(SessionStatus status) {
    SessionState snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.status == status) {
            return;
        }
        // Terminal states only leave through cleanup()
        if (m_state.status == SessionStatus::COMPLETED || m_state.status == SessionStatus::FAILED) {
            return;
        }
        m_state.status = status;
        snapshot = m_state;
    }
    m_statusCv.notify_all();

    LOG_DEBUG("Session " << sessionRoleToString(snapshot.role) << " -> " << sessionStatusToString(status));
    m_log.add("Status: " + sessionStatusToString(status));
    notifyStatus(status, snapshot);
}

void PeerSession::fail(const char* code, const std::string& message) {
    SessionState snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.status == SessionStatus::COMPLETED || m_state.status == SessionStatus::FAILED) {
            return;
        }
        m_state.status = SessionStatus::FAILED;
        m_state.error.code = code;
        m_state.error.message = message;
        snapshot = m_state;
    }
    m_statusCv.notify_all();
    m_stats.stop();

    LOG_ERROR("[" << code << "] " << message);
    m_log.add(std::string("Error [") + code + "]: " + message);
    notifyStatus(SessionStatus::FAILED, snapshot);

    closeConnection();
}

void PeerSession::complete(const TransferResult& result) {
    SessionState snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.status == SessionStatus::COMPLETED || m_state.status == SessionStatus::FAILED) {
            return;
        }
        m_state.status = SessionStatus::COMPLETED;
        m_state.result = result;
        m_state.hasResult = true;
        snapshot = m_state;
    }
    m_statusCv.notify_all();
    m_stats.stop();

    const TransferStatsSnapshot stats = m_stats.snapshot();
    LOG_INFO("Transfer completed: imported=" << result.imported << " skipped=" << result.skipped
             << " failed=" << result.failed << " total=" << result.total
             << " (" << TransferStats::formatBytes(stats.bytesSent + stats.bytesReceived) << ")");
    m_log.add("Status: completed");
    notifyStatus(SessionStatus::COMPLETED, snapshot);

    CompletionCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callback = m_completionCallback;
    }
    if (callback) {
        callback(result);
    }

    closeConnection();
}

void PeerSession::notifyStatus(SessionStatus status, const SessionState& snapshot) {
    std::vector<StatusListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        listeners.reserve(m_listeners.size());
        for (const auto& entry : m_listeners) {
            listeners.push_back(entry.second);
        }
    }
    for (const auto& listener : listeners) {
        if (listener) {
            listener(status, snapshot);
        }
    }
}

void PeerSession::onProgress(const TransferProgress& progress) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state.progress = progress;
    }

    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callback = m_progressCallback;
    }
    if (callback) {
        callback(progress);
    }
}

//=============================================================================
// Sending
//=============================================================================

bool PeerSession::sendJsonLocked(const nlohmann::json& message, std::string& errorMsg) {
    if (!m_channel) {
        errorMsg = "No connection";
        return false;
    }
    const Bytes frame = FrameCodec::encodeJsonMessage(message);
    if (!m_channel->send(frame, errorMsg)) {
        return false;
    }
    m_stats.addSent(frame.size());
    return true;
}

bool PeerSession::sendJson(const nlohmann::json& message, std::string& errorMsg) {
    std::shared_ptr<DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel = m_channel;
    }
    if (!channel) {
        errorMsg = "No connection";
        return false;
    }

    const Bytes frame = FrameCodec::encodeJsonMessage(message);
    if (!channel->send(frame, errorMsg)) {
        return false;
    }
    m_stats.addSent(frame.size());
    return true;
}

//=============================================================================
// Sender worker
//=============================================================================

void PeerSession::startSenderWorkerLocked() {
    if (m_senderActive.load() || m_senderThread.joinable()) {
        return;
    }
    m_senderActive.store(true);
    m_senderThread = std::thread(&PeerSession::runSender, this);
}

void PeerSession::runSender() {
    std::shared_ptr<DataChannel> channel;
    SenderOptions options;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel = m_channel;
        options = m_options;
    }

    if (!channel) {
        fail(ErrorCodes::TRANSFER_INTERNAL_ERROR, "Sender started without a connection");
        m_senderActive.store(false);
        return;
    }

    setStatus(SessionStatus::TRANSFERRING);
    LOG_INFO("Sending " << syncTypeToString(options.syncType) << " to " << channel->remoteId());

    FrameWriter writer(channel, m_backpressure, m_stats, m_config.drainThresholdBytes, &m_log);
    TransferSender sender(m_history, m_blobs, writer, m_acks, m_config, m_log,
                          [this](const TransferProgress& progress) { onProgress(progress); });

    std::string errorMsg;
    SendSummary total;
    TransferAck ack;
    bool ackReceived = false;
    bool ok = false;

    try {
        ok = writer.sendJson(Messages::syncType(options.syncType), errorMsg);

        if (ok && (options.syncType == SyncType::History || options.syncType == SyncType::All)) {
            SendSummary phase;
            ok = sender.sendHistory(options.historyIds, phase, errorMsg);
            total += phase;
        }
        if (ok && (options.syncType == SyncType::Characters || options.syncType == SyncType::All)) {
            SendSummary phase;
            ok = sender.sendCharacters(options.characterIds, phase, errorMsg);
            total += phase;
        }
        if (ok) {
            ok = sender.finishTransfer(total, ack, ackReceived, errorMsg);
        }
    } catch (const std::exception& e) {
        fail(ErrorCodes::TRANSFER_INTERNAL_ERROR, std::string("Sender failed: ") + e.what());
        m_senderActive.store(false);
        return;
    }

    if (!ok) {
        const char* code = writer.isOpen() ? ErrorCodes::TRANSFER_STORAGE_READ
                                           : ErrorCodes::TRANSFER_ABORTED_CLOSED;
        fail(code, errorMsg.empty() ? std::string("Transfer aborted") : errorMsg);
        m_senderActive.store(false);
        return;
    }

    TransferResult result;
    result.total = total.total;
    result.sent = total.sent;
    if (ackReceived) {
        result.imported = ack.imported;
        result.skipped = ack.skipped;
        result.failed = ack.failed;
    } else {
        result.failed = total.failed;
    }

    complete(result);
    m_senderActive.store(false);
}

//=============================================================================
// Endpoint events
//=============================================================================

void PeerSession::onEndpointOpen(const std::string& id) {
    std::shared_ptr<DataChannel> channel;
    std::string errorMsg;
    std::string target;
    bool dialFailed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_endpointPending = false;
        m_state.endpointOpen = true;

        if (m_state.role == SessionRole::RECEIVER && m_endpoint && !m_channel) {
            target = ConnectionCode::senderEndpointId(m_state.connectionCode);
            channel = m_endpoint->connect(target, errorMsg);
            if (channel) {
                m_channel = channel;
                m_channel->setHandler(this);
                m_channelPending = true;
                m_channelDeadline = Clock::now() + std::chrono::milliseconds(m_config.connectionOpenTimeoutMs);
            } else {
                dialFailed = true;
            }
        }
    }
    m_statusCv.notify_all();

    m_log.add("Endpoint open: " + id);
    if (dialFailed) {
        fail(ErrorCodes::CONNECTION_ENDPOINT_ERROR, "Failed to connect to " + target + ": " + errorMsg);
    } else if (channel) {
        m_log.add("Dialing " + target);
    }
}

void PeerSession::onIncomingChannel(std::shared_ptr<DataChannel> channel) {
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        accepted = m_state.role == SessionRole::SENDER && !m_channel &&
                   m_state.status == SessionStatus::WAITING;
        if (accepted) {
            m_channel = channel;
            m_channel->setHandler(this);
            m_channelPending = true;
            m_channelDeadline = Clock::now() + std::chrono::milliseconds(m_config.connectionOpenTimeoutMs);
        }
    }

    if (!accepted) {
        m_log.add("Rejected extra connection from " + channel->remoteId());
        channel->close();
        return;
    }
    m_log.add("Incoming connection from " + channel->remoteId());
}

void PeerSession::onEndpointError(const EndpointError& error) {
    SessionRole role = SessionRole::NONE;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        role = m_state.role;
    }

    if (error.type == EndpointErrorType::UnavailableId && role == SessionRole::SENDER) {
        m_log.add("Endpoint id unavailable: " + error.message);
        retrySenderEndpoint();
        return;
    }

    fail(ErrorCodes::CONNECTION_ENDPOINT_ERROR, error.message);
}

//=============================================================================
// Channel events
//=============================================================================

void PeerSession::onChannelOpen() {
    std::string remoteId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_channel) {
            return;
        }
        m_channelPending = false;
        m_state.remoteId = m_channel->remoteId();
        m_state.fingerprint = PairingFingerprint::compute(m_state.localId, m_state.remoteId);
        remoteId = m_state.remoteId;
    }
    m_stats.start();

    m_log.add("Channel open with " + remoteId + ", fingerprint " + fingerprintText());
    setStatus(SessionStatus::PAIRED);
}

void PeerSession::onChannelData(const Bytes& message) {
    m_stats.addReceived(message.size());
    const DecodedFrame frame = FrameCodec::decodeFrame(message);

    try {
        if (frame.kind == FrameKind::Json) {
            const std::string type = messageTypeOf(frame.json);

            if (type == MessageType::CONFIRM_PAIRING) {
                handleRemoteConfirm();
                return;
            }
            if (type == MessageType::SYNC_TYPE) {
                const std::string value = frame.json.value("syncType", std::string());
                {
                    std::lock_guard<std::mutex> lock(m_receiverMutex);
                    m_receiver.setSyncType(value);
                }
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_state.syncType = syncTypeFromString(value);
                }
                m_log.add("Sync type: " + value);
                return;
            }
            if (type == MessageType::RECORD_ACK || type == MessageType::CHARACTER_ACK ||
                type == MessageType::TRANSFER_ACK) {
                std::string key;
                if (type == MessageType::RECORD_ACK) {
                    key = frame.json.value("uuid", std::string());
                } else if (type == MessageType::CHARACTER_ACK) {
                    key = frame.json.value("name", std::string());
                }
                if (!m_acks.resolve(type, key, frame.json)) {
                    m_log.add("Ignored unexpected " + type + " " + key);
                }
                return;
            }
        }

        handleReceiverFrame(frame);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Malformed frame: " << e.what());
        m_log.add(std::string("Malformed frame: ") + e.what());
    }
}

void PeerSession::handleRemoteConfirm() {
    bool bothConfirmed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state.remoteConfirmed = true;
        if (m_state.localConfirmed && !m_state.pairingConfirmed) {
            m_state.pairingConfirmed = true;
            bothConfirmed = true;
            if (m_state.role == SessionRole::SENDER) {
                startSenderWorkerLocked();
            }
        }
    }
    m_statusCv.notify_all();

    m_log.add(bothConfirmed ? "Pairing confirmed by both peers" : "Peer confirmed pairing");
}

void PeerSession::handleReceiverFrame(const DecodedFrame& frame) {
    bool accept = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        accept = m_state.role == SessionRole::RECEIVER && m_state.pairingConfirmed;
    }
    if (!accept) {
        m_log.add("Dropped frame received before pairing confirmation");
        return;
    }

    ReceiverEvent event = ReceiverEvent::None;
    TransferResult result;
    {
        std::lock_guard<std::mutex> lock(m_receiverMutex);
        event = m_receiver.handleFrame(frame);
        if (event == ReceiverEvent::Completed) {
            result = m_receiver.result();
        }
    }

    switch (event) {
        case ReceiverEvent::PhaseStarted:
            setStatus(SessionStatus::TRANSFERRING);
            break;
        case ReceiverEvent::Completed:
            complete(result);
            break;
        case ReceiverEvent::None:
            break;
    }
}

void PeerSession::onChannelClose() {
    m_acks.cancel();
    m_backpressure.cancel();

    SessionStatus status = SessionStatus::IDLE;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        status = m_state.status;
        m_channelPending = false;
    }
    m_log.add("Connection closed");

    if (status == SessionStatus::COMPLETED || status == SessionStatus::FAILED ||
        status == SessionStatus::IDLE) {
        return;
    }

    // The sender worker sees the cancelled waits and reports the outcome
    if (m_senderActive.load()) {
        return;
    }

    if (status == SessionStatus::TRANSFERRING) {
        fail(ErrorCodes::TRANSFER_ABORTED_CLOSED, "Connection closed during transfer");
        return;
    }

    m_stats.stop();
    closeConnection();
    setStatus(SessionStatus::IDLE);
}

void PeerSession::onChannelError(const ChannelError& error) {
    if (error.type == ChannelErrorType::IceFailed) {
        fail(ErrorCodes::CONNECTION_ICE_FAILED, "ICE failed: " + error.message);
    } else {
        fail(ErrorCodes::CONNECTION_TRANSPORT_ERROR, "Transport error: " + error.message);
    }
}

//=============================================================================
// Maintenance
//=============================================================================

void PeerSession::startMaintenance() {
    stopMaintenance();
    {
        std::lock_guard<std::mutex> lock(m_maintenanceMutex);
        m_maintenanceStop = false;
    }
    m_maintenanceThread = std::thread(&PeerSession::maintenanceLoop, this);
}

void PeerSession::stopMaintenance() {
    {
        std::lock_guard<std::mutex> lock(m_maintenanceMutex);
        m_maintenanceStop = true;
    }
    m_maintenanceCv.notify_all();
    if (m_maintenanceThread.joinable()) {
        m_maintenanceThread.join();
    }
}

void PeerSession::maintenanceLoop() {
    std::unique_lock<std::mutex> lock(m_maintenanceMutex);
    while (!m_maintenanceStop) {
        m_maintenanceCv.wait_for(lock, std::chrono::milliseconds(m_config.maintenanceTickMs),
                                 [this] { return m_maintenanceStop; });
        if (m_maintenanceStop) {
            break;
        }

        lock.unlock();
        try {
            maintenanceTick();
        } catch (const std::exception& e) {
            LOG_ERROR("Maintenance tick failed: " << e.what());
        }
        lock.lock();
    }
}

void PeerSession::maintenanceTick() {
    const Clock::time_point now = Clock::now();

    const char* code = nullptr;
    std::string message;
    SessionRole role = SessionRole::NONE;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        role = m_state.role;
        if (m_endpointPending && now >= m_endpointDeadline) {
            m_endpointPending = false;
            code = ErrorCodes::CONNECTION_OPEN_TIMEOUT;
            message = "Endpoint registration timed out";
        } else if (m_channelPending && now >= m_channelDeadline &&
                   (m_state.status == SessionStatus::WAITING || m_state.status == SessionStatus::CONNECTING)) {
            m_channelPending = false;
            code = ErrorCodes::CONNECTION_OPEN_TIMEOUT;
            message = "Connection timed out";
        }
    }

    if (code) {
        fail(code, message);
    }

    if (role == SessionRole::RECEIVER) {
        std::lock_guard<std::mutex> lock(m_receiverMutex);
        m_receiver.onTick(now);
    }
}

}  // namespace PeerSync
