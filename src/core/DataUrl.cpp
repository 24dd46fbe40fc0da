/**
 * @file DataUrl.cpp
 * @brief DataUrl implementation.
 */

#include "peersync/DataUrl.h"

#include <openssl/evp.h>

#include <cctype>
#include <climits>

namespace PeerSync {

namespace {

constexpr const char* kDataPrefix = "data:";
constexpr const char* kBase64Marker = ";base64";

static bool isBase64Char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '+' || c == '/';
}

}  // namespace

std::string DataUrl::base64Encode(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return {};
    }

    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                        data,
                                        static_cast<int>(size));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

bool DataUrl::base64Decode(const std::string& text, std::vector<uint8_t>& out, std::string& errorMsg) {
    std::string clean;
    clean.reserve(text.size() + 3);

    size_t padding = 0;
    for (unsigned char c : text) {
        if (std::isspace(c) != 0) {
            continue;
        }
        if (c == '=') {
            ++padding;
            clean.push_back('=');
            continue;
        }
        if (padding > 0 || !isBase64Char(c)) {
            errorMsg = "Invalid base64 input";
            return false;
        }
        clean.push_back(static_cast<char>(c));
    }

    if (clean.empty()) {
        out.clear();
        return true;
    }

    while (clean.size() % 4 != 0) {
        clean.push_back('=');
        ++padding;
    }
    if (padding > 2 || clean.size() > static_cast<size_t>(INT_MAX)) {
        errorMsg = "Invalid base64 length";
        return false;
    }

    std::vector<uint8_t> decoded(clean.size() / 4 * 3);
    const int n = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (n < 0) {
        errorMsg = "EVP_DecodeBlock failed";
        return false;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    decoded.resize(static_cast<size_t>(n) - padding);
    out = std::move(decoded);
    return true;
}

std::string DataUrl::build(const std::string& mimeType, const uint8_t* data, size_t size) {
    return std::string(kDataPrefix) + mimeType + kBase64Marker + "," + base64Encode(data, size);
}

bool DataUrl::isDataUrl(const std::string& value) {
    return value.compare(0, 5, kDataPrefix) == 0;
}

bool DataUrl::parse(const std::string& url,
                    InlinePayload& out,
                    std::string& errorMsg,
                    const std::string& defaultMime) {
    if (!isDataUrl(url)) {
        errorMsg = "Not a data URL";
        return false;
    }

    const size_t comma = url.find(',');
    if (comma == std::string::npos) {
        errorMsg = "Data URL has no payload separator";
        return false;
    }

    const std::string meta = url.substr(5, comma - 5);
    const size_t marker = meta.find(kBase64Marker);
    if (marker == std::string::npos) {
        errorMsg = "Only base64 data URLs are supported";
        return false;
    }

    // mime type ends at the first parameter
    std::string mime = meta.substr(0, meta.find(';'));
    if (mime.empty()) {
        mime = defaultMime;
    }

    InlinePayload result;
    result.mimeType = mime;
    if (!base64Decode(url.substr(comma + 1), result.data, errorMsg)) {
        return false;
    }

    out = std::move(result);
    return true;
}

bool DataUrl::decodeInlineImage(const std::string& value,
                                InlinePayload& out,
                                std::string& errorMsg,
                                const std::string& defaultMime) {
    if (isDataUrl(value)) {
        return parse(value, out, errorMsg, defaultMime);
    }

    InlinePayload result;
    result.mimeType = defaultMime;
    if (!base64Decode(value, result.data, errorMsg)) {
        return false;
    }
    out = std::move(result);
    return true;
}

}  // namespace PeerSync
