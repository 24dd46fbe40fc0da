/**
 * @file AckWaiter.h
 * @brief Single outstanding acknowledgement slot
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace PeerSync {

enum class AckResult {
    Received,
    TimedOut,
    ConnectionClosed
};

const char* ackResultToString(AckResult result);

/**
 * @class AckWaiter
 * @brief Holds at most one pending acknowledgement
 *
 * The sender arms the slot before sending the frame that triggers the ack,
 * so an ack arriving before wait() starts is not lost. Acks are matched on
 * message type and key (record UUID, character name, or "" for
 * transfer_ack); late acks for an earlier item are ignored.
 *
 * cancel() is sticky: the pending wait and every later one return
 * ConnectionClosed until reset().
 *
 * Thread Safety:
 * - arm()/wait() from the sender thread, resolve()/cancel() from any thread
 */
class AckWaiter {
public:
    /// Prepare for an ack of `type` with `key`, discarding any previous slot
    void arm(const std::string& type, const std::string& key);

    /**
     * @brief Deliver an ack
     * @return true if it matched the armed slot
     */
    bool resolve(const std::string& type, const std::string& key, const nlohmann::json& ack);

    /**
     * @brief Block until the armed ack arrives, the timeout passes, or cancel()
     * @param outAck Receives the ack payload on Received
     */
    AckResult wait(std::chrono::milliseconds timeout, nlohmann::json& outAck);

    void cancel();
    void reset();

    bool isArmed() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_armed = false;
    bool m_received = false;
    bool m_cancelled = false;
    std::string m_type;
    std::string m_key;
    nlohmann::json m_ack;
};

}  // namespace PeerSync
