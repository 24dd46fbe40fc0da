/**
 * @file InlineThumbnailGenerator.cpp
 * @brief InlineThumbnailGenerator implementation
 */

#include "peersync/InlineThumbnailGenerator.h"
#include "peersync/DataUrl.h"

namespace PeerSync {

bool InlineThumbnailGenerator::imageThumbnail(const Bytes& image,
                                              const std::string& mimeType,
                                              std::string& outDataUrl,
                                              std::string& errorMsg) {
    if (image.empty()) {
        errorMsg = "Empty image";
        return false;
    }
    if (image.size() > m_maxInlineBytes) {
        errorMsg = "Image of " + std::to_string(image.size()) +
                   " bytes exceeds inline thumbnail limit";
        return false;
    }
    outDataUrl = DataUrl::build(mimeType.empty() ? "image/png" : mimeType, image);
    return true;
}

bool InlineThumbnailGenerator::videoThumbnail(const Bytes& video,
                                              const std::string& mimeType,
                                              VideoThumbnail& out,
                                              std::string& errorMsg) {
    (void)video;
    (void)out;
    errorMsg = "No video decoder available for " + (mimeType.empty() ? std::string("video") : mimeType);
    return false;
}

}  // namespace PeerSync
