/**
 * @file FrameWriter.cpp
 * @brief FrameWriter implementation
 */

#include "peersync/FrameWriter.h"
#include "peersync/DiagnosticsLog.h"

#include <algorithm>

namespace PeerSync {

FrameWriter::FrameWriter(std::shared_ptr<DataChannel> channel,
                         BackpressureController& backpressure,
                         TransferStats& stats,
                         size_t thresholdBytes,
                         DiagnosticsLog* log)
    : m_channel(std::move(channel))
    , m_backpressure(backpressure)
    , m_stats(stats)
    , m_thresholdBytes(thresholdBytes)
    , m_log(log)
{
}

bool FrameWriter::isOpen() const {
    return m_channel && m_channel->isOpen();
}

bool FrameWriter::sendRaw(const Bytes& frame, std::string& errorMsg) {
    if (!isOpen()) {
        errorMsg = "Connection closed";
        return false;
    }
    if (!m_channel->send(frame, errorMsg)) {
        return false;
    }
    m_stats.addSent(frame.size());
    return true;
}

bool FrameWriter::waitForRoom(std::string& errorMsg) {
    return drain(m_thresholdBytes, errorMsg);
}

bool FrameWriter::drain(size_t threshold, std::string& errorMsg) {
    if (!m_channel) {
        errorMsg = "Connection closed";
        return false;
    }
    const DrainResult result = m_backpressure.waitForDrain(*m_channel, threshold);
    if (result == DrainResult::ConnectionClosed) {
        errorMsg = "Connection closed";
        return false;
    }
    return true;
}

bool FrameWriter::sendJson(const nlohmann::json& message, std::string& errorMsg) {
    return sendRaw(FrameCodec::encodeJsonMessage(message), errorMsg);
}

bool FrameWriter::sendBinary(const nlohmann::json& header, const Bytes& data, std::string& errorMsg) {
    const Bytes frame = FrameCodec::encodeBinaryFrame(header, data);

    if (!waitForRoom(errorMsg)) {
        return false;
    }
    return sendRaw(frame, errorMsg);
}

bool FrameWriter::sendChunked(const nlohmann::json& header, const Bytes& data, std::string& errorMsg) {
    const uint32_t totalChunks = FrameCodec::chunkCount(data.size());
    if (m_log) {
        m_log->add("Sending " + TransferStats::formatBytes(data.size()) + " in " +
                   std::to_string(totalChunks) + " chunks");
    }

    const uint32_t logEvery = std::max<uint32_t>(1, totalChunks / 10);
    for (uint32_t i = 0; i < totalChunks; ++i) {
        const size_t start = static_cast<size_t>(i) * CHUNK_SIZE;
        const size_t end = std::min(start + CHUNK_SIZE, data.size());

        const Bytes frame = FrameCodec::createChunkPacket(header, data.data() + start, end - start, i, totalChunks);

        if (!waitForRoom(errorMsg)) {
            return false;
        }
        if (!sendRaw(frame, errorMsg)) {
            return false;
        }

        if (m_log && (i % logEvery == 0 || i == totalChunks - 1)) {
            m_log->add("Chunk " + std::to_string(i + 1) + "/" + std::to_string(totalChunks) + " sent");
        }
    }
    return true;
}

}  // namespace PeerSync
