/**
 * @file DataUrl.h
 * @brief Base64 and "data:" URL helpers (OpenSSL EVP block codec)
 *
 * Thumbnails travel inside JSON metadata as data URLs, and older character
 * stores kept their image inline as either a data URL or bare base64.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace PeerSync {

/**
 * @brief Decoded data URL / inline image payload
 */
struct InlinePayload {
    std::string mimeType;
    std::vector<uint8_t> data;
};

class DataUrl {
public:
    /// Standard base64 with padding
    static std::string base64Encode(const uint8_t* data, size_t size);
    static std::string base64Encode(const std::vector<uint8_t>& data) {
        return base64Encode(data.data(), data.size());
    }

    /**
     * @brief Decode standard base64
     *
     * Whitespace is ignored and missing trailing padding is tolerated.
     *
     * @return false on characters outside the base64 alphabet
     */
    static bool base64Decode(const std::string& text, std::vector<uint8_t>& out, std::string& errorMsg);

    /// Build "data:<mime>;base64,<payload>"
    static std::string build(const std::string& mimeType, const uint8_t* data, size_t size);
    static std::string build(const std::string& mimeType, const std::vector<uint8_t>& data) {
        return build(mimeType, data.data(), data.size());
    }

    /// true if the string starts with "data:"
    static bool isDataUrl(const std::string& value);

    /**
     * @brief Parse a base64 data URL
     *
     * The mime type falls back to `defaultMime` when the URL omits it.
     * Non-base64 (percent-encoded) data URLs are rejected.
     */
    static bool parse(const std::string& url,
                      InlinePayload& out,
                      std::string& errorMsg,
                      const std::string& defaultMime = "image/png");

    /**
     * @brief Decode an inline image that is either a data URL or bare base64
     *
     * Bare base64 is labelled with `defaultMime`.
     */
    static bool decodeInlineImage(const std::string& value,
                                  InlinePayload& out,
                                  std::string& errorMsg,
                                  const std::string& defaultMime = "image/png");
};

}  // namespace PeerSync
