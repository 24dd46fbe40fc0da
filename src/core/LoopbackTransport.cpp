/**
 * @file LoopbackTransport.cpp
 * @brief In-process peer transport implementation
 *
 * (c) 2026 PeerSync Project
 * Licensed under MIT License
 */

#include "peersync/LoopbackTransport.h"
#include "peersync/Debug.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace PeerSync {

class LoopbackChannel;
class LoopbackEndpoint;

//=============================================================================
// Hub: event queue, id registry, object ownership
//=============================================================================

struct LoopbackNetwork::Hub {
    mutable std::mutex mutex;
    std::condition_variable queueCv;
    std::condition_variable idleCv;
    std::deque<std::function<void()>> queue;
    bool stopRequested = false;
    bool paused = false;
    bool dispatching = false;
    bool failNextConnection = false;
    std::chrono::milliseconds linkDelay{0};
    std::atomic<size_t> bytesDelivered{0};
    LoopbackNetwork::TrafficObserver observer;

    // Live objects only: destroyed endpoints and closed channels are removed
    std::map<std::string, std::shared_ptr<LoopbackEndpoint>> registry;
    std::vector<std::shared_ptr<LoopbackEndpoint>> endpoints;
    std::vector<std::shared_ptr<LoopbackChannel>> channels;

    std::thread deliveryThread;

    void post(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopRequested) {
                return;
            }
            queue.push_back(std::move(task));
        }
        queueCv.notify_all();
    }

    void run();
    void forgetEndpoint(const LoopbackEndpoint* endpoint);
    void forgetChannel(const LoopbackChannel* channel);
};

void LoopbackNetwork::Hub::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            queueCv.wait(lock, [this] {
                return stopRequested || (!paused && !queue.empty());
            });
            if (stopRequested) {
                break;
            }
            task = std::move(queue.front());
            queue.pop_front();
            dispatching = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Loopback event handler threw: " << e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            dispatching = false;
        }
        idleCv.notify_all();
    }
}

//=============================================================================
// LoopbackChannel
//=============================================================================

class LoopbackChannel final : public DataChannel,
                              public std::enable_shared_from_this<LoopbackChannel> {
public:
    LoopbackChannel(LoopbackNetwork::Hub* hub, std::weak_ptr<LoopbackNetwork::Hub> hubRef,
                    std::string localId, std::string remoteId)
        : m_hub(hub)
        , m_hubRef(std::move(hubRef))
        , m_localId(std::move(localId))
        , m_remoteId(std::move(remoteId))
    {
    }

    void setPeer(const std::shared_ptr<LoopbackChannel>& peer) { m_peer = peer; }

    void setHandler(DataChannelHandler* handler) override {
        std::lock_guard<std::recursive_mutex> lock(m_handlerMutex);
        m_handler = handler;
    }

    bool send(const Bytes& message, std::string& errorMsg) override {
        if (!m_open.load()) {
            errorMsg = "Channel is not open";
            return false;
        }
        auto hubRef = m_hubRef.lock();
        auto peer = m_peer.lock();
        if (!hubRef || !peer) {
            errorMsg = "Network is gone";
            return false;
        }

        const size_t size = message.size();
        m_buffered.fetch_add(size);

        auto self = shared_from_this();
        LoopbackNetwork::Hub* hub = m_hub;
        hub->post([self, peer, message, size, hub] {
            std::chrono::milliseconds delay{0};
            LoopbackNetwork::TrafficObserver observer;
            {
                std::lock_guard<std::mutex> lock(hub->mutex);
                delay = hub->linkDelay;
                observer = hub->observer;
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            if (peer->deliverData(message) && observer) {
                observer(self->m_localId, self->m_remoteId, message);
            }
            self->m_buffered.fetch_sub(size);
            hub->bytesDelivered.fetch_add(size);
        });
        return true;
    }

    size_t bufferedAmount() const override { return m_buffered.load(); }
    bool isOpen() const override { return m_open.load(); }

    void close() override {
        if (m_closed.exchange(true)) {
            return;
        }
        m_open.store(false);

        auto self = shared_from_this();
        auto peer = m_peer.lock();
        m_hub->post([self, peer] {
            if (peer) {
                peer->deliverClose();
            }
            self->deliverClose();
        });
    }

    std::string localId() const override { return m_localId; }
    std::string remoteId() const override { return m_remoteId; }

    //=========================================================================
    // Delivery (hub thread only)
    //=========================================================================

    void deliverOpen() {
        if (m_closed.load()) {
            return;
        }
        m_open.store(true);
        dispatch([](DataChannelHandler* h) { h->onChannelOpen(); });
    }

    bool deliverData(const Bytes& message) {
        if (m_closed.load()) {
            return false;
        }
        dispatch([&message](DataChannelHandler* h) { h->onChannelData(message); });
        return true;
    }

    void deliverClose() {
        m_open.store(false);
        m_closed.store(true);
        if (m_closeNotified.exchange(true)) {
            return;
        }
        dispatch([](DataChannelHandler* h) { h->onChannelClose(); });
        m_hub->forgetChannel(this);
    }

    void deliverError(const ChannelError& error) {
        dispatch([&error](DataChannelHandler* h) { h->onChannelError(error); });
    }

private:
    template <typename Fn>
    void dispatch(Fn&& fn) {
        std::lock_guard<std::recursive_mutex> lock(m_handlerMutex);
        if (m_handler) {
            fn(m_handler);
        }
    }

    LoopbackNetwork::Hub* m_hub;
    std::weak_ptr<LoopbackNetwork::Hub> m_hubRef;
    std::string m_localId;
    std::string m_remoteId;
    std::weak_ptr<LoopbackChannel> m_peer;

    std::recursive_mutex m_handlerMutex;
    DataChannelHandler* m_handler = nullptr;

    std::atomic<bool> m_open{false};
    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_closeNotified{false};
    std::atomic<size_t> m_buffered{0};
};

//=============================================================================
// LoopbackEndpoint
//=============================================================================

class LoopbackEndpoint final : public PeerEndpoint,
                               public std::enable_shared_from_this<LoopbackEndpoint> {
public:
    LoopbackEndpoint(LoopbackNetwork::Hub* hub, std::weak_ptr<LoopbackNetwork::Hub> hubRef, std::string id)
        : m_hub(hub)
        , m_hubRef(std::move(hubRef))
        , m_id(std::move(id))
    {
    }

    std::string id() const override { return m_id; }

    void setHandler(EndpointHandler* handler) override {
        std::lock_guard<std::recursive_mutex> lock(m_handlerMutex);
        m_handler = handler;
    }

    std::shared_ptr<DataChannel> connect(const std::string& remoteId, std::string& errorMsg) override {
        if (m_destroyed.load()) {
            errorMsg = "Endpoint is destroyed";
            return nullptr;
        }
        auto hubRef = m_hubRef.lock();
        if (!hubRef) {
            errorMsg = "Network is gone";
            return nullptr;
        }

        auto self = shared_from_this();
        auto local = std::make_shared<LoopbackChannel>(m_hub, m_hubRef, m_id, remoteId);

        std::shared_ptr<LoopbackEndpoint> remote;
        bool failIce = false;
        {
            std::lock_guard<std::mutex> lock(m_hub->mutex);
            m_hub->channels.push_back(local);
            auto it = m_hub->registry.find(remoteId);
            if (it != m_hub->registry.end()) {
                remote = it->second;
            }
            if (remote && m_hub->failNextConnection) {
                m_hub->failNextConnection = false;
                failIce = true;
            }
        }
        addChannel(local);

        if (!remote) {
            m_hub->post([self, remoteId] {
                EndpointError err;
                err.type = EndpointErrorType::PeerUnavailable;
                err.message = "Could not connect to peer " + remoteId;
                self->deliverError(err);
            });
            return local;
        }

        if (failIce) {
            m_hub->post([local] {
                ChannelError err;
                err.type = ChannelErrorType::IceFailed;
                err.message = "ICE connection failed";
                local->deliverError(err);
            });
            return local;
        }

        auto accepted = std::make_shared<LoopbackChannel>(m_hub, m_hubRef, remoteId, m_id);
        local->setPeer(accepted);
        accepted->setPeer(local);
        {
            std::lock_guard<std::mutex> lock(m_hub->mutex);
            m_hub->channels.push_back(accepted);
        }
        remote->addChannel(accepted);

        m_hub->post([remote, accepted] { remote->deliverIncoming(accepted); });
        m_hub->post([local, accepted] {
            accepted->deliverOpen();
            local->deliverOpen();
        });
        return local;
    }

    void destroy() override {
        if (m_destroyed.exchange(true)) {
            return;
        }

        auto hubRef = m_hubRef.lock();
        if (!hubRef) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_hub->mutex);
            auto it = m_hub->registry.find(m_id);
            if (it != m_hub->registry.end() && it->second.get() == this) {
                m_hub->registry.erase(it);
            }
        }
        // The caller still holds a reference, so this is not the last owner
        m_hub->forgetEndpoint(this);

        std::vector<std::shared_ptr<LoopbackChannel>> channels;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto& weak : m_channels) {
                if (auto ch = weak.lock()) {
                    channels.push_back(std::move(ch));
                }
            }
            m_channels.clear();
        }
        for (auto& ch : channels) {
            ch->close();
        }
    }

    void addChannel(const std::shared_ptr<LoopbackChannel>& channel) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_channels.push_back(channel);
    }

    //=========================================================================
    // Delivery (hub thread only)
    //=========================================================================

    void deliverOpen() {
        if (m_destroyed.load()) {
            return;
        }
        dispatch([this](EndpointHandler* h) { h->onEndpointOpen(m_id); });
    }

    void deliverError(const EndpointError& error) {
        dispatch([&error](EndpointHandler* h) { h->onEndpointError(error); });
    }

    void deliverIncoming(const std::shared_ptr<LoopbackChannel>& channel) {
        if (m_destroyed.load()) {
            channel->close();
            return;
        }
        bool accepted = false;
        dispatch([&](EndpointHandler* h) {
            accepted = true;
            h->onIncomingChannel(channel);
        });
        if (!accepted) {
            channel->close();
        }
    }

private:
    template <typename Fn>
    void dispatch(Fn&& fn) {
        std::lock_guard<std::recursive_mutex> lock(m_handlerMutex);
        if (m_handler) {
            fn(m_handler);
        }
    }

    LoopbackNetwork::Hub* m_hub;
    std::weak_ptr<LoopbackNetwork::Hub> m_hubRef;
    std::string m_id;

    std::recursive_mutex m_handlerMutex;
    EndpointHandler* m_handler = nullptr;

    std::mutex m_mutex;
    std::vector<std::weak_ptr<LoopbackChannel>> m_channels;
    std::atomic<bool> m_destroyed{false};
};

void LoopbackNetwork::Hub::forgetEndpoint(const LoopbackEndpoint* endpoint) {
    std::lock_guard<std::mutex> lock(mutex);
    endpoints.erase(std::remove_if(endpoints.begin(), endpoints.end(),
                                   [endpoint](const std::shared_ptr<LoopbackEndpoint>& e) {
                                       return e.get() == endpoint;
                                   }),
                    endpoints.end());
}

// Runs on the delivery thread inside a task that still owns the channel
void LoopbackNetwork::Hub::forgetChannel(const LoopbackChannel* channel) {
    std::lock_guard<std::mutex> lock(mutex);
    channels.erase(std::remove_if(channels.begin(), channels.end(),
                                  [channel](const std::shared_ptr<LoopbackChannel>& c) {
                                      return c.get() == channel;
                                  }),
                   channels.end());
}

//=============================================================================
// LoopbackNetwork
//=============================================================================

LoopbackNetwork::LoopbackNetwork()
    : m_hub(std::make_shared<Hub>())
{
    Hub* hub = m_hub.get();
    m_hub->deliveryThread = std::thread([hub] { hub->run(); });
}

LoopbackNetwork::~LoopbackNetwork() {
    {
        std::lock_guard<std::mutex> lock(m_hub->mutex);
        m_hub->stopRequested = true;
    }
    m_hub->queueCv.notify_all();
    m_hub->idleCv.notify_all();

    if (m_hub->deliveryThread.joinable()) {
        m_hub->deliveryThread.join();
    }

    // Tasks hold channel references; drop them before the registries
    std::deque<std::function<void()>> pending;
    std::vector<std::shared_ptr<LoopbackChannel>> channels;
    std::vector<std::shared_ptr<LoopbackEndpoint>> endpoints;
    {
        std::lock_guard<std::mutex> lock(m_hub->mutex);
        pending.swap(m_hub->queue);
        channels.swap(m_hub->channels);
        endpoints.swap(m_hub->endpoints);
        m_hub->registry.clear();
    }
}

std::shared_ptr<PeerEndpoint> LoopbackNetwork::createEndpoint(const std::string& id,
                                                              EndpointHandler* handler,
                                                              std::string& errorMsg) {
    if (id.empty()) {
        errorMsg = "Endpoint id must not be empty";
        return nullptr;
    }

    auto endpoint = std::make_shared<LoopbackEndpoint>(m_hub.get(), m_hub, id);
    endpoint->setHandler(handler);

    bool taken = false;
    {
        std::lock_guard<std::mutex> lock(m_hub->mutex);
        if (m_hub->stopRequested) {
            errorMsg = "Network is shutting down";
            return nullptr;
        }
        m_hub->endpoints.push_back(endpoint);
        taken = m_hub->registry.count(id) > 0;
        if (!taken) {
            m_hub->registry[id] = endpoint;
        }
    }

    if (taken) {
        LOG_DEBUG("Loopback: endpoint id already registered: " << id);
        m_hub->post([endpoint, id] {
            EndpointError err;
            err.type = EndpointErrorType::UnavailableId;
            err.message = "ID \"" + id + "\" is taken";
            endpoint->deliverError(err);
        });
    } else {
        m_hub->post([endpoint] { endpoint->deliverOpen(); });
    }
    return endpoint;
}

void LoopbackNetwork::pauseDelivery() {
    std::lock_guard<std::mutex> lock(m_hub->mutex);
    m_hub->paused = true;
}

void LoopbackNetwork::resumeDelivery() {
    {
        std::lock_guard<std::mutex> lock(m_hub->mutex);
        m_hub->paused = false;
    }
    m_hub->queueCv.notify_all();
}

void LoopbackNetwork::setLinkDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(m_hub->mutex);
    m_hub->linkDelay = delay;
}

void LoopbackNetwork::failNextConnection() {
    std::lock_guard<std::mutex> lock(m_hub->mutex);
    m_hub->failNextConnection = true;
}

void LoopbackNetwork::closeAllChannels() {
    std::vector<std::shared_ptr<LoopbackChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(m_hub->mutex);
        channels = m_hub->channels;
    }
    for (auto& ch : channels) {
        ch->close();
    }
}

bool LoopbackNetwork::isRegistered(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_hub->mutex);
    return m_hub->registry.count(id) > 0;
}

bool LoopbackNetwork::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_hub->mutex);
    return m_hub->idleCv.wait_for(lock, timeout, [this] {
        return m_hub->stopRequested || (m_hub->queue.empty() && !m_hub->dispatching);
    });
}

size_t LoopbackNetwork::bytesDelivered() const {
    return m_hub->bytesDelivered.load();
}

void LoopbackNetwork::setTrafficObserver(TrafficObserver observer) {
    std::lock_guard<std::mutex> lock(m_hub->mutex);
    m_hub->observer = std::move(observer);
}

size_t LoopbackNetwork::endpointCount() const {
    std::lock_guard<std::mutex> lock(m_hub->mutex);
    return m_hub->endpoints.size();
}

size_t LoopbackNetwork::channelCount() const {
    std::lock_guard<std::mutex> lock(m_hub->mutex);
    return m_hub->channels.size();
}

}  // namespace PeerSync
