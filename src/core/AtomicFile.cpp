/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 */

#include "peersync/AtomicFile.h"

#include <fstream>

namespace PeerSync {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg)
{
    errorMsg.clear();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(tempPath, ec) || ec) {
        errorMsg = "Temp file does not exist";
        return false;
    }

    // POSIX rename replaces the target; std::filesystem::rename does too
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        return false;
    }

    return true;
}

bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const uint8_t* data,
                     size_t size,
                     std::string& errorMsg)
{
    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            errorMsg = "Failed to open temp file: " + paths.tempPath.string();
            return false;
        }
        if (data && size > 0) {
            out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        }
        out.flush();
        if (!out) {
            errorMsg = "Failed to write temp file: " + paths.tempPath.string();
            out.close();
            std::error_code ec;
            std::filesystem::remove(paths.tempPath, ec);
            return false;
        }
    }

    if (!atomicRenameToFinal(paths.tempPath, paths.finalPath, errorMsg)) {
        std::error_code ec;
        std::filesystem::remove(paths.tempPath, ec);
        return false;
    }
    return true;
}

}  // namespace PeerSync
