/**
 * @file FrameWriter.h
 * @brief Sends framed messages over a DataChannel with backpressure
 */

#pragma once

#include "BackpressureController.h"
#include "DataChannel.h"
#include "FrameCodec.h"
#include "TransferStats.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace PeerSync {

class DiagnosticsLog;

/**
 * @class FrameWriter
 * @brief Encodes frames, applies backpressure and counts bytes sent
 *
 * Json frames are small control messages and go out immediately. Binary
 * and Chunk frames first wait until the buffered amount is at or below
 * `thresholdBytes`; a drain timeout is logged and the frame is sent anyway.
 *
 * Every method returns false with a message on failure. After a failure
 * isOpen() tells the caller whether the connection is gone (abort the
 * batch) or only this item failed.
 */
class FrameWriter {
public:
    FrameWriter(std::shared_ptr<DataChannel> channel,
                BackpressureController& backpressure,
                TransferStats& stats,
                size_t thresholdBytes,
                DiagnosticsLog* log = nullptr);

    bool sendJson(const nlohmann::json& message, std::string& errorMsg);
    bool sendBinary(const nlohmann::json& header, const Bytes& data, std::string& errorMsg);

    /// Split `data` into CHUNK_SIZE Chunk frames sharing `header`
    bool sendChunked(const nlohmann::json& header, const Bytes& data, std::string& errorMsg);

    /**
     * @brief Wait for the buffer to fall to `threshold` (0 = fully drained)
     * @return false only if the connection closed
     */
    bool drain(size_t threshold, std::string& errorMsg);

    bool isOpen() const;

private:
    bool sendRaw(const Bytes& frame, std::string& errorMsg);
    bool waitForRoom(std::string& errorMsg);

    std::shared_ptr<DataChannel> m_channel;
    BackpressureController& m_backpressure;
    TransferStats& m_stats;
    size_t m_thresholdBytes;
    DiagnosticsLog* m_log;
};

}  // namespace PeerSync
