/**
 * @file AckWaiter.cpp
 * @brief AckWaiter implementation
 */

#include "peersync/AckWaiter.h"

namespace PeerSync {

const char* ackResultToString(AckResult result) {
    switch (result) {
        case AckResult::Received:         return "Received";
        case AckResult::TimedOut:         return "TimedOut";
        case AckResult::ConnectionClosed: return "ConnectionClosed";
    }
    return "Unknown";
}

void AckWaiter::arm(const std::string& type, const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_armed = true;
    m_received = false;
    m_type = type;
    m_key = key;
    m_ack = nullptr;
}

bool AckWaiter::resolve(const std::string& type, const std::string& key, const nlohmann::json& ack) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_armed || m_received || type != m_type || key != m_key) {
            return false;
        }
        m_received = true;
        m_ack = ack;
    }
    m_cv.notify_all();
    return true;
}

AckResult AckWaiter::wait(std::chrono::milliseconds timeout, nlohmann::json& outAck) {
    std::unique_lock<std::mutex> lock(m_mutex);

    m_cv.wait_for(lock, timeout, [this] {
        return m_cancelled || m_received;
    });

    AckResult result = AckResult::TimedOut;
    if (m_received) {
        outAck = m_ack;
        result = AckResult::Received;
    } else if (m_cancelled) {
        result = AckResult::ConnectionClosed;
    }

    m_armed = false;
    m_received = false;
    m_ack = nullptr;
    return result;
}

void AckWaiter::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

void AckWaiter::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_armed = false;
    m_received = false;
    m_cancelled = false;
    m_type.clear();
    m_key.clear();
    m_ack = nullptr;
}

bool AckWaiter::isArmed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_armed;
}

}  // namespace PeerSync
