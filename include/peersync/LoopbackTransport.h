/**
 * @file LoopbackTransport.h
 * @brief In-process implementation of the peer transport interfaces
 *
 * (c) 2026 PeerSync Project
 * Licensed under MIT License
 */

#pragma once

#include "DataChannel.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace PeerSync {

/**
 * @class LoopbackNetwork
 * @brief Signalling service and network for endpoints in one process
 *
 * Every event (endpoint open/error, channel open/data/close/error) is
 * queued and dispatched in FIFO order on a single delivery thread, so two
 * sessions in one process behave like two peers on a real network:
 * - send() returns immediately and bufferedAmount() counts the bytes that
 *   have not been delivered yet
 * - endpoint ids are unique; a second registration of a live id fails with
 *   EndpointErrorType::UnavailableId
 * - close() is graceful: queued messages are delivered before the close
 *
 * Test hooks simulate a slow or failing network (pauseDelivery,
 * setLinkDelay, failNextConnection, closeAllChannels).
 *
 * Lifetime:
 * - The network owns an endpoint until destroy() and a channel until its
 *   close has been delivered. Handles stay valid after that and only
 *   report failures (send() on a closed channel, connect() on a destroyed
 *   endpoint).
 * - Destroy the network after every handler registered on it is detached
 *   (sessions cleaned up). Never destroy it from a delivery callback.
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class LoopbackNetwork : public PeerEndpointFactory {
public:
    LoopbackNetwork();
    ~LoopbackNetwork() override;

    // Prevent copying
    LoopbackNetwork(const LoopbackNetwork&) = delete;
    LoopbackNetwork& operator=(const LoopbackNetwork&) = delete;

    std::shared_ptr<PeerEndpoint> createEndpoint(const std::string& id,
                                                 EndpointHandler* handler,
                                                 std::string& errorMsg) override;

    //=========================================================================
    // Simulation controls
    //=========================================================================

    /// Hold queued events (bufferedAmount keeps growing) until resumeDelivery()
    void pauseDelivery();
    void resumeDelivery();

    /// Sleep this long before delivering each data message
    void setLinkDelay(std::chrono::milliseconds delay);

    /// The next connect() fails ICE instead of opening
    void failNextConnection();

    /// Abruptly close every open channel (both sides see onChannelClose)
    void closeAllChannels();

    /// true if an endpoint with this id is registered
    bool isRegistered(const std::string& id) const;

    /**
     * @brief Block until the event queue is empty and nothing is in flight
     * @return false on timeout
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    /// Total bytes delivered since creation
    size_t bytesDelivered() const;

    /// Called on the delivery thread with every data message a peer received
    using TrafficObserver = std::function<void(const std::string& fromId,
                                               const std::string& toId,
                                               const Bytes& message)>;
    void setTrafficObserver(TrafficObserver observer);

    /// Endpoints not yet destroyed
    size_t endpointCount() const;

    /// Channels whose close has not been delivered yet
    size_t channelCount() const;

    struct Hub;

private:
    std::shared_ptr<Hub> m_hub;
};

}  // namespace PeerSync
