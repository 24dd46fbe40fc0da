/**
 * @file DataChannel.h
 * @brief Peer transport abstraction: endpoints and message channels
 */

#pragma once

#include "FrameCodec.h"

#include <cstddef>
#include <memory>
#include <string>

namespace PeerSync {

//=============================================================================
// Channel
//=============================================================================

enum class ChannelErrorType {
    Generic,
    IceFailed   ///< Connectivity checks failed; the channel will never open
};

struct ChannelError {
    ChannelErrorType type = ChannelErrorType::Generic;
    std::string message;
};

/**
 * @brief Receives events of one DataChannel.
 *
 * Events of one channel are delivered in order on a transport thread,
 * never concurrently with each other.
 */
class DataChannelHandler {
public:
    virtual ~DataChannelHandler() = default;
    virtual void onChannelOpen() = 0;
    virtual void onChannelData(const Bytes& message) = 0;
    virtual void onChannelClose() = 0;
    virtual void onChannelError(const ChannelError& error) = 0;
};

/**
 * @brief Ordered, reliable, message-oriented channel to one remote endpoint.
 *
 * Messages are delivered whole and in send order. send() never blocks: the
 * message is queued and bufferedAmount() grows until the transport has
 * handed it to the remote side.
 */
class DataChannel {
public:
    virtual ~DataChannel() = default;

    /**
     * @brief Attach or detach (nullptr) the event handler.
     *
     * Detaching blocks until a callback currently running on this channel
     * has returned; afterwards no further callbacks are made.
     */
    virtual void setHandler(DataChannelHandler* handler) = 0;

    virtual bool send(const Bytes& message, std::string& errorMsg) = 0;
    virtual size_t bufferedAmount() const = 0;
    virtual bool isOpen() const = 0;

    /// Graceful close: messages already queued are still delivered. Idempotent.
    virtual void close() = 0;

    virtual std::string localId() const = 0;
    virtual std::string remoteId() const = 0;
};

//=============================================================================
// Endpoint
//=============================================================================

enum class EndpointErrorType {
    UnavailableId,     ///< The requested endpoint id is already registered
    PeerUnavailable,   ///< connect() target is not registered
    Network,
    Other
};

struct EndpointError {
    EndpointErrorType type = EndpointErrorType::Other;
    std::string message;
};

/**
 * @brief Receives events of one PeerEndpoint.
 */
class EndpointHandler {
public:
    virtual ~EndpointHandler() = default;
    virtual void onEndpointOpen(const std::string& id) = 0;
    virtual void onIncomingChannel(std::shared_ptr<DataChannel> channel) = 0;
    virtual void onEndpointError(const EndpointError& error) = 0;
};

/**
 * @brief A registered identity on the signalling service.
 */
class PeerEndpoint {
public:
    virtual ~PeerEndpoint() = default;

    virtual std::string id() const = 0;

    /// Detach semantics as DataChannel::setHandler
    virtual void setHandler(EndpointHandler* handler) = 0;

    /**
     * @brief Dial a remote endpoint.
     *
     * The returned channel opens asynchronously (onChannelOpen) or fails
     * through onChannelError / onEndpointError(PeerUnavailable).
     *
     * @return nullptr if the endpoint is destroyed
     */
    virtual std::shared_ptr<DataChannel> connect(const std::string& remoteId, std::string& errorMsg) = 0;

    /// Unregister the id and close every channel of this endpoint. Idempotent.
    virtual void destroy() = 0;
};

/**
 * @brief Creates endpoints (the signalling service connection).
 */
class PeerEndpointFactory {
public:
    virtual ~PeerEndpointFactory() = default;

    /**
     * @brief Register an endpoint under `id`.
     *
     * Registration completes asynchronously with onEndpointOpen or
     * onEndpointError (UnavailableId on collision). `handler` is attached
     * before any event can fire.
     *
     * @return nullptr on immediate failure
     */
    virtual std::shared_ptr<PeerEndpoint> createEndpoint(const std::string& id,
                                                         EndpointHandler* handler,
                                                         std::string& errorMsg) = 0;
};

}  // namespace PeerSync
