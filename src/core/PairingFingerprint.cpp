/**
 * @file PairingFingerprint.cpp
 * @brief PairingFingerprint implementation.
 */

#include "peersync/PairingFingerprint.h"

#include <algorithm>
#include <cstdlib>

namespace PeerSync {

namespace {

// Source file is UTF-8; the pool order is part of the protocol.
const std::array<const char*, PairingFingerprint::POOL_SIZE> kEmojiPool = {{
    "🐶", "🐱", "🐼", "🦊", "🦁", "🐸", "🐵", "🐰",
    "🌸", "🌻", "🌺", "🍀", "🌈", "⭐", "🌙", "❄️",
    "🍎", "🍊", "🍋", "🍇", "🍓", "🍒", "🥝", "🍑",
    "🚀", "✈️", "🚗", "🚲", "⛵", "🎈", "🎮", "🎸",
}};

}  // namespace

const std::array<const char*, PairingFingerprint::POOL_SIZE>& PairingFingerprint::pool() {
    return kEmojiPool;
}

int32_t PairingFingerprint::hash(const std::string& text) {
    uint32_t h = 0;
    for (unsigned char c : text) {
        h = (h << 5) - h + static_cast<uint32_t>(c);
    }
    return static_cast<int32_t>(h);
}

size_t PairingFingerprint::symbolIndex(int32_t hash, size_t position) {
    // >> on a negative int32 is arithmetic on every supported compiler (guaranteed in C++20)
    const int32_t shifted = hash >> (position * 8);
    const int32_t remainder = shifted % static_cast<int32_t>(POOL_SIZE);
    return static_cast<size_t>(std::abs(remainder));
}

FingerprintSymbols PairingFingerprint::compute(const std::string& localId, const std::string& remoteId) {
    const std::string combined = std::min(localId, remoteId) + std::max(localId, remoteId);
    const int32_t h = hash(combined);

    FingerprintSymbols symbols;
    for (size_t i = 0; i < symbols.size(); ++i) {
        symbols[i] = kEmojiPool[symbolIndex(h, i)];
    }
    return symbols;
}

std::string PairingFingerprint::formatForDisplay(const FingerprintSymbols& symbols) {
    std::string out;
    for (size_t i = 0; i < symbols.size(); ++i) {
        if (i > 0) {
            out.push_back(' ');
        }
        out += symbols[i];
    }
    return out;
}

}  // namespace PeerSync
