/**
 * @file FrameCodec.h
 * @brief Wire frame encoding/decoding for the PeerSync data channel
 */

#pragma once

#include "config.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace PeerSync {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Frame kinds carried on the data channel
 *
 * Wire layout (all integers little-endian):
 * - Json:   [0x4A][UTF-8 JSON]
 * - Binary: [0x42][u32 headerLen][JSON header][payload]
 * - Chunk:  [0x43][u32 chunkIndex][u32 totalChunks][u32 headerLen][JSON header][chunk]
 */
enum class FrameKind : uint8_t {
    Json = FRAME_TAG_JSON,
    Binary = FRAME_TAG_BINARY,
    Chunk = FRAME_TAG_CHUNK
};

/**
 * @brief A decoded data channel message
 *
 * For Json frames `json` holds the parsed payload. For Binary and Chunk
 * frames `body` holds the bytes after the tag, still to be parsed with
 * parseBinaryPacket() / parseChunkPacket().
 *
 * Malformed JSON and unknown tags both decode as Binary so that a peer
 * speaking another protocol revision degrades instead of failing.
 */
struct DecodedFrame {
    FrameKind kind = FrameKind::Binary;
    nlohmann::json json;
    Bytes body;
};

/**
 * @brief Parsed Binary frame body
 */
struct BinaryPacket {
    nlohmann::json header;
    Bytes data;
};

/**
 * @brief Parsed Chunk frame body
 */
struct ChunkPacket {
    nlohmann::json header;
    uint32_t chunkIndex = 0;
    uint32_t totalChunks = 0;
    Bytes chunkData;
};

/**
 * @class FrameCodec
 * @brief Stateless encoders and decoders for the three frame kinds
 *
 * Encoders never fail. Decoders never throw: decodeFrame() always yields a
 * frame, and the packet parsers report malformed input through their
 * return value.
 */
class FrameCodec {
public:
    /**
     * @brief Encode a JSON control message as a tagged Json frame
     */
    static Bytes encodeJsonMessage(const nlohmann::json& message);

    /**
     * @brief Classify and decode a raw data channel message
     *
     * - 0x4A with valid JSON  -> Json
     * - 0x4A with bad JSON    -> Binary (bytes after the tag)
     * - 0x42                  -> Binary (bytes after the tag)
     * - 0x43                  -> Chunk  (bytes after the tag)
     * - anything else / empty -> Binary (the whole message)
     */
    static DecodedFrame decodeFrame(const uint8_t* data, size_t size);
    static DecodedFrame decodeFrame(const Bytes& raw) {
        return decodeFrame(raw.data(), raw.size());
    }

    /**
     * @brief Build an untagged Binary body: [u32 headerLen][header][data]
     */
    static Bytes createBinaryPacket(const nlohmann::json& header, const uint8_t* data, size_t size);
    static Bytes createBinaryPacket(const nlohmann::json& header, const Bytes& data) {
        return createBinaryPacket(header, data.data(), data.size());
    }

    /**
     * @brief Build a complete tagged Binary frame
     */
    static Bytes encodeBinaryFrame(const nlohmann::json& header, const Bytes& data);

    /**
     * @brief Parse an untagged Binary body
     * @return false if the length prefix or header is malformed
     */
    static bool parseBinaryPacket(const Bytes& body, BinaryPacket& out, std::string& errorMsg);

    /**
     * @brief Build a complete tagged Chunk frame
     */
    static Bytes createChunkPacket(const nlohmann::json& header,
                                   const uint8_t* chunkData,
                                   size_t chunkSize,
                                   uint32_t chunkIndex,
                                   uint32_t totalChunks);
    static Bytes createChunkPacket(const nlohmann::json& header,
                                   const Bytes& chunkData,
                                   uint32_t chunkIndex,
                                   uint32_t totalChunks) {
        return createChunkPacket(header, chunkData.data(), chunkData.size(), chunkIndex, totalChunks);
    }

    /**
     * @brief Parse a Chunk body (the frame without its tag byte)
     * @return false if the fixed fields, length prefix or header are malformed
     */
    static bool parseChunkPacket(const Bytes& body, ChunkPacket& out, std::string& errorMsg);

    /**
     * @brief Number of CHUNK_SIZE chunks needed for a payload (0 for empty)
     */
    static uint32_t chunkCount(size_t payloadSize);

    /// Read a little-endian u32 (caller guarantees 4 readable bytes)
    static uint32_t readU32LE(const uint8_t* p);

    /// Append a little-endian u32
    static void appendU32LE(Bytes& out, uint32_t v);
};

}  // namespace PeerSync
