/**
 * @file UuidGenerator.cpp
 * @brief UuidGenerator implementation.
 */

#include "peersync/UuidGenerator.h"
#include "peersync/SecureRandom.h"
#include "peersync/Debug.h"
#include "peersync/config.h"

#include <algorithm>
#include <chrono>

namespace PeerSync {

namespace {

constexpr char kBase36Alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

static bool isLowerAlnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

static bool isLowerAlnumRun(const std::string& s, size_t begin, size_t end) {
    if (begin >= end) {
        return false;
    }
    for (size_t i = begin; i < end; ++i) {
        if (!isLowerAlnum(s[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string UuidGenerator::toBase36(uint64_t value) {
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.push_back(kBase36Alphabet[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

uint64_t UuidGenerator::nowEpochMs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string UuidGenerator::generate() {
    std::string randomPart;
    std::string errorMsg;
    if (!SecureRandom::randomString(kBase36Alphabet, RECORD_UUID_RANDOM_LENGTH, randomPart, errorMsg)) {
        LOG_ERROR("UUID generation failed: " << errorMsg);
        return {};
    }

    return std::string(RECORD_UUID_PREFIX) + toBase36(nowEpochMs()) + "-" + randomPart;
}

bool UuidGenerator::isValid(const std::string& uuid) {
    const std::string prefix = RECORD_UUID_PREFIX;
    if (uuid.size() <= prefix.size() || uuid.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    const size_t dash = uuid.find('-', prefix.size());
    if (dash == std::string::npos) {
        return false;
    }

    return isLowerAlnumRun(uuid, prefix.size(), dash) &&
           isLowerAlnumRun(uuid, dash + 1, uuid.size());
}

}  // namespace PeerSync
