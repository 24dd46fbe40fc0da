/**
 * @file TransferMessages.cpp
 * @brief Control message and header serialization
 */

#include "peersync/TransferMessages.h"

#include <type_traits>

namespace PeerSync {

namespace {

static std::string readString(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

// Peers may send integral values as doubles
template <typename T>
static T readNumber(const nlohmann::json& j, const char* key, T fallback = T{}) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& v = j[key];
    if (v.is_number_integer()) {
        const int64_t n = v.get<int64_t>();
        if (n < 0 && !std::is_signed<T>::value) {
            return fallback;
        }
        return static_cast<T>(n);
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        return d < 0 ? fallback : static_cast<T>(d);
    }
    return fallback;
}

static bool readBool(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        return false;
    }
    const auto& v = j[key];
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    // Truthiness for numbers sent by loosely typed peers
    if (v.is_number()) {
        return v.get<double>() != 0.0;
    }
    return false;
}

}  // namespace

const char* syncTypeToString(SyncType type) {
    switch (type) {
        case SyncType::History: return "history";
        case SyncType::Characters: return "characters";
        case SyncType::All: return "all";
    }
    return "history";
}

SyncType syncTypeFromString(const std::string& value) {
    if (value == "characters") return SyncType::Characters;
    if (value == "all") return SyncType::All;
    return SyncType::History;
}

std::string messageTypeOf(const nlohmann::json& message) {
    if (!message.is_object()) {
        return {};
    }
    return readString(message, "type");
}

//=============================================================================
// RecordMeta / CharacterMeta
//=============================================================================

nlohmann::json RecordMeta::toJson() const {
    nlohmann::json j;
    j["uuid"] = uuid;
    j["timestamp"] = timestamp;
    j["prompt"] = prompt;
    j["mode"] = mode;
    j["options"] = options;
    j["status"] = status;
    j["thinkingText"] = thinkingText;
    j["error"] = error;
    j["imageCount"] = imageCount;
    j["hasVideo"] = hasVideo;
    return j;
}

RecordMeta RecordMeta::fromJson(const nlohmann::json& j) {
    RecordMeta meta;
    if (!j.is_object()) {
        return meta;
    }
    meta.uuid = readString(j, "uuid");
    meta.timestamp = readNumber<int64_t>(j, "timestamp");
    meta.prompt = readString(j, "prompt");
    meta.mode = readString(j, "mode");
    if (j.contains("options") && !j["options"].is_null()) {
        meta.options = j["options"];
    }
    meta.status = readString(j, "status");
    meta.thinkingText = readString(j, "thinkingText");
    meta.error = readString(j, "error");
    meta.imageCount = readNumber<uint32_t>(j, "imageCount");
    meta.hasVideo = readBool(j, "hasVideo");
    return meta;
}

nlohmann::json CharacterMeta::toJson() const {
    nlohmann::json j;
    j["name"] = name;
    j["description"] = description;
    j["physicalTraits"] = physicalTraits;
    j["clothing"] = clothing;
    j["accessories"] = accessories;
    j["distinctiveFeatures"] = distinctiveFeatures;
    j["thumbnail"] = thumbnail;
    return j;
}

CharacterMeta CharacterMeta::fromJson(const nlohmann::json& j) {
    CharacterMeta c;
    if (!j.is_object()) {
        return c;
    }
    c.name = readString(j, "name");
    c.description = readString(j, "description");
    c.physicalTraits = readString(j, "physicalTraits");
    c.clothing = readString(j, "clothing");
    c.accessories = readString(j, "accessories");
    c.distinctiveFeatures = readString(j, "distinctiveFeatures");
    c.thumbnail = readString(j, "thumbnail");
    return c;
}

//=============================================================================
// Binary headers
//=============================================================================

nlohmann::json RecordImageHeader::toJson() const {
    nlohmann::json j;
    j["type"] = MessageType::RECORD_IMAGE;
    j["uuid"] = uuid;
    j["index"] = index;
    j["width"] = width;
    j["height"] = height;
    j["size"] = size;
    j["mimeType"] = mimeType;
    return j;
}

RecordImageHeader RecordImageHeader::fromJson(const nlohmann::json& j) {
    RecordImageHeader h;
    if (!j.is_object()) {
        return h;
    }
    h.uuid = readString(j, "uuid");
    h.index = readNumber<uint32_t>(j, "index");
    h.width = readNumber<uint32_t>(j, "width");
    h.height = readNumber<uint32_t>(j, "height");
    h.size = readNumber<uint64_t>(j, "size");
    h.mimeType = readString(j, "mimeType");
    return h;
}

nlohmann::json RecordVideoHeader::toJson() const {
    nlohmann::json j;
    j["type"] = MessageType::RECORD_VIDEO;
    j["uuid"] = uuid;
    j["width"] = width;
    j["height"] = height;
    j["size"] = size;
    j["mimeType"] = mimeType;
    return j;
}

RecordVideoHeader RecordVideoHeader::fromJson(const nlohmann::json& j) {
    RecordVideoHeader h;
    if (!j.is_object()) {
        return h;
    }
    h.uuid = readString(j, "uuid");
    h.width = readNumber<uint32_t>(j, "width");
    h.height = readNumber<uint32_t>(j, "height");
    h.size = readNumber<uint64_t>(j, "size");
    h.mimeType = readString(j, "mimeType");
    return h;
}

nlohmann::json CharacterImageHeader::toJson() const {
    nlohmann::json j;
    j["type"] = MessageType::CHARACTER_IMAGE;
    j["name"] = name;
    j["size"] = size;
    j["mimeType"] = mimeType;
    return j;
}

CharacterImageHeader CharacterImageHeader::fromJson(const nlohmann::json& j) {
    CharacterImageHeader h;
    if (!j.is_object()) {
        return h;
    }
    h.name = readString(j, "name");
    h.size = readNumber<uint64_t>(j, "size");
    h.mimeType = readString(j, "mimeType");
    return h;
}

//=============================================================================
// Acknowledgements
//=============================================================================

nlohmann::json RecordAck::toJson() const {
    nlohmann::json j;
    j["type"] = MessageType::RECORD_ACK;
    j["uuid"] = uuid;
    j["receivedImages"] = receivedImages;
    j["expectedImages"] = expectedImages;
    j["hasVideo"] = hasVideo;
    j["skipped"] = skipped;
    return j;
}

RecordAck RecordAck::fromJson(const nlohmann::json& j) {
    RecordAck ack;
    if (!j.is_object()) {
        return ack;
    }
    ack.uuid = readString(j, "uuid");
    ack.receivedImages = readNumber<uint32_t>(j, "receivedImages");
    ack.expectedImages = readNumber<uint32_t>(j, "expectedImages");
    ack.hasVideo = readBool(j, "hasVideo");
    ack.skipped = readBool(j, "skipped");
    return ack;
}

nlohmann::json CharacterAck::toJson() const {
    nlohmann::json j;
    j["type"] = MessageType::CHARACTER_ACK;
    j["name"] = name;
    j["skipped"] = skipped;
    return j;
}

CharacterAck CharacterAck::fromJson(const nlohmann::json& j) {
    CharacterAck ack;
    if (!j.is_object()) {
        return ack;
    }
    ack.name = readString(j, "name");
    ack.skipped = readBool(j, "skipped");
    return ack;
}

nlohmann::json TransferComplete::toJson() const {
    nlohmann::json j;
    j["type"] = MessageType::TRANSFER_COMPLETE;
    j["total"] = total;
    j["sent"] = sent;
    j["failed"] = failed;
    return j;
}

TransferComplete TransferComplete::fromJson(const nlohmann::json& j) {
    TransferComplete msg;
    if (!j.is_object()) {
        return msg;
    }
    msg.total = readNumber<uint32_t>(j, "total");
    msg.sent = readNumber<uint32_t>(j, "sent");
    msg.failed = readNumber<uint32_t>(j, "failed");
    return msg;
}

nlohmann::json TransferAck::toJson() const {
    nlohmann::json j;
    j["type"] = MessageType::TRANSFER_ACK;
    j["receivedCount"] = receivedCount;
    j["expectedCount"] = expectedCount;
    j["imported"] = imported;
    j["skipped"] = skipped;
    j["failed"] = failed;
    return j;
}

TransferAck TransferAck::fromJson(const nlohmann::json& j) {
    TransferAck ack;
    if (!j.is_object()) {
        return ack;
    }
    ack.receivedCount = readNumber<uint32_t>(j, "receivedCount");
    ack.expectedCount = readNumber<uint32_t>(j, "expectedCount");
    ack.imported = readNumber<uint32_t>(j, "imported");
    ack.skipped = readNumber<uint32_t>(j, "skipped");
    ack.failed = readNumber<uint32_t>(j, "failed");
    return ack;
}

//=============================================================================
// Control message builders
//=============================================================================

namespace Messages {

nlohmann::json confirmPairing() {
    return nlohmann::json{{"type", MessageType::CONFIRM_PAIRING}};
}

nlohmann::json syncType(SyncType type) {
    return nlohmann::json{{"type", MessageType::SYNC_TYPE}, {"syncType", syncTypeToString(type)}};
}

nlohmann::json historyMeta(uint32_t count) {
    return nlohmann::json{{"type", MessageType::HISTORY_META}, {"count", count}};
}

nlohmann::json recordStart(const RecordMeta& meta) {
    return nlohmann::json{{"type", MessageType::RECORD_START}, {"meta", meta.toJson()}};
}

nlohmann::json recordEnd(const std::string& uuid) {
    return nlohmann::json{{"type", MessageType::RECORD_END}, {"uuid", uuid}};
}

nlohmann::json historyRecord(const nlohmann::json& record) {
    return nlohmann::json{{"type", MessageType::HISTORY_RECORD}, {"record", record}};
}

nlohmann::json charactersMeta(uint32_t count) {
    return nlohmann::json{{"type", MessageType::CHARACTERS_META}, {"count", count}};
}

nlohmann::json characterStart(const CharacterMeta& character) {
    return nlohmann::json{{"type", MessageType::CHARACTER_START}, {"character", character.toJson()}};
}

nlohmann::json characterEnd(const std::string& name) {
    return nlohmann::json{{"type", MessageType::CHARACTER_END}, {"name", name}};
}

}  // namespace Messages

}  // namespace PeerSync
