/**
 * @file InlineThumbnailGenerator.h
 * @brief ThumbnailGenerator without an image codec
 */

#pragma once

#include "StorageInterfaces.h"

namespace PeerSync {

/**
 * @class InlineThumbnailGenerator
 * @brief Uses small images as their own thumbnail
 *
 * Images up to `maxInlineBytes` become a data URL of the original bytes;
 * larger images and all videos report failure, which the receiver logs and
 * tolerates. Applications with an image pipeline provide their own
 * ThumbnailGenerator.
 */
class InlineThumbnailGenerator : public ThumbnailGenerator {
public:
    explicit InlineThumbnailGenerator(size_t maxInlineBytes = 64 * 1024)
        : m_maxInlineBytes(maxInlineBytes) {}

    bool imageThumbnail(const Bytes& image,
                        const std::string& mimeType,
                        std::string& outDataUrl,
                        std::string& errorMsg) override;

    bool videoThumbnail(const Bytes& video,
                        const std::string& mimeType,
                        VideoThumbnail& out,
                        std::string& errorMsg) override;

private:
    size_t m_maxInlineBytes;
};

}  // namespace PeerSync
