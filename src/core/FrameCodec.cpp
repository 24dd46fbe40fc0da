/**
 * @file FrameCodec.cpp
 * @brief Wire frame encoding/decoding implementation
 */

#include "peersync/FrameCodec.h"

namespace PeerSync {

//=============================================================================
// Little-endian helpers
//=============================================================================

uint32_t FrameCodec::readU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void FrameCodec::appendU32LE(Bytes& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFFu));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFFu));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFFu));
}

uint32_t FrameCodec::chunkCount(size_t payloadSize) {
    return static_cast<uint32_t>((payloadSize + CHUNK_SIZE - 1) / CHUNK_SIZE);
}

//=============================================================================
// Json frames
//=============================================================================

Bytes FrameCodec::encodeJsonMessage(const nlohmann::json& message) {
    // Replace invalid UTF-8 instead of throwing so encoding stays total
    const std::string text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    Bytes packet;
    packet.reserve(1 + text.size());
    packet.push_back(FRAME_TAG_JSON);
    packet.insert(packet.end(), text.begin(), text.end());
    return packet;
}

DecodedFrame FrameCodec::decodeFrame(const uint8_t* data, size_t size) {
    DecodedFrame frame;

    if (!data || size == 0) {
        frame.kind = FrameKind::Binary;
        return frame;
    }

    const uint8_t tag = data[0];
    switch (tag) {
        case FRAME_TAG_JSON: {
            nlohmann::json parsed = nlohmann::json::parse(data + 1, data + size, nullptr, false);
            if (!parsed.is_discarded()) {
                frame.kind = FrameKind::Json;
                frame.json = std::move(parsed);
                return frame;
            }
            frame.kind = FrameKind::Binary;
            frame.body.assign(data + 1, data + size);
            return frame;
        }
        case FRAME_TAG_BINARY:
            frame.kind = FrameKind::Binary;
            frame.body.assign(data + 1, data + size);
            return frame;
        case FRAME_TAG_CHUNK:
            frame.kind = FrameKind::Chunk;
            frame.body.assign(data + 1, data + size);
            return frame;
        default:
            // Legacy packets were sent without a tag
            frame.kind = FrameKind::Binary;
            frame.body.assign(data, data + size);
            return frame;
    }
}

//=============================================================================
// Binary frames
//=============================================================================

Bytes FrameCodec::createBinaryPacket(const nlohmann::json& header, const uint8_t* data, size_t size) {
    const std::string headerText = header.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    Bytes packet;
    packet.reserve(FRAME_U32_SIZE + headerText.size() + size);
    appendU32LE(packet, static_cast<uint32_t>(headerText.size()));
    packet.insert(packet.end(), headerText.begin(), headerText.end());
    if (data && size > 0) {
        packet.insert(packet.end(), data, data + size);
    }
    return packet;
}

Bytes FrameCodec::encodeBinaryFrame(const nlohmann::json& header, const Bytes& data) {
    Bytes body = createBinaryPacket(header, data);
    Bytes frame;
    frame.reserve(1 + body.size());
    frame.push_back(FRAME_TAG_BINARY);
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

bool FrameCodec::parseBinaryPacket(const Bytes& body, BinaryPacket& out, std::string& errorMsg) {
    if (body.size() < BINARY_HEADER_OFFSET) {
        errorMsg = "Binary packet too short for header length";
        return false;
    }

    const uint32_t headerLength = readU32LE(body.data());
    if (headerLength > body.size() - BINARY_HEADER_OFFSET) {
        errorMsg = "Binary header length " + std::to_string(headerLength) +
                   " exceeds packet size " + std::to_string(body.size());
        return false;
    }

    const uint8_t* headerBegin = body.data() + BINARY_HEADER_OFFSET;
    nlohmann::json header = nlohmann::json::parse(headerBegin, headerBegin + headerLength, nullptr, false);
    if (header.is_discarded()) {
        errorMsg = "Binary header is not valid JSON";
        return false;
    }

    out.header = std::move(header);
    out.data.assign(body.begin() + BINARY_HEADER_OFFSET + headerLength, body.end());
    return true;
}

//=============================================================================
// Chunk frames
//=============================================================================

Bytes FrameCodec::createChunkPacket(const nlohmann::json& header,
                                    const uint8_t* chunkData,
                                    size_t chunkSize,
                                    uint32_t chunkIndex,
                                    uint32_t totalChunks) {
    const std::string headerText = header.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    Bytes packet;
    packet.reserve(1 + CHUNK_HEADER_OFFSET + headerText.size() + chunkSize);
    packet.push_back(FRAME_TAG_CHUNK);
    appendU32LE(packet, chunkIndex);
    appendU32LE(packet, totalChunks);
    appendU32LE(packet, static_cast<uint32_t>(headerText.size()));
    packet.insert(packet.end(), headerText.begin(), headerText.end());
    if (chunkData && chunkSize > 0) {
        packet.insert(packet.end(), chunkData, chunkData + chunkSize);
    }
    return packet;
}

bool FrameCodec::parseChunkPacket(const Bytes& body, ChunkPacket& out, std::string& errorMsg) {
    if (body.size() < CHUNK_HEADER_OFFSET) {
        errorMsg = "Chunk packet too short for fixed fields";
        return false;
    }

    const uint32_t chunkIndex = readU32LE(body.data());
    const uint32_t totalChunks = readU32LE(body.data() + FRAME_U32_SIZE);
    const uint32_t headerLength = readU32LE(body.data() + 2 * FRAME_U32_SIZE);

    if (headerLength > body.size() - CHUNK_HEADER_OFFSET) {
        errorMsg = "Chunk header length " + std::to_string(headerLength) +
                   " exceeds packet size " + std::to_string(body.size());
        return false;
    }

    const uint8_t* headerBegin = body.data() + CHUNK_HEADER_OFFSET;
    nlohmann::json header = nlohmann::json::parse(headerBegin, headerBegin + headerLength, nullptr, false);
    if (header.is_discarded()) {
        errorMsg = "Chunk header is not valid JSON";
        return false;
    }

    out.header = std::move(header);
    out.chunkIndex = chunkIndex;
    out.totalChunks = totalChunks;
    out.chunkData.assign(body.begin() + CHUNK_HEADER_OFFSET + headerLength, body.end());
    return true;
}

}  // namespace PeerSync
