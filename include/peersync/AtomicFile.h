/**
 * @file AtomicFile.h
 * @brief Small helpers for atomic file writes (write temp, then rename).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace PeerSync {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute a temp path next to finalPath for atomic writes.
 *
 * The temp path is derived deterministically from finalPath so callers can
 * clean up partial files on error.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Move tempPath over finalPath using rename semantics.
 *
 * An existing finalPath is replaced. tempPath must exist as a file.
 */
bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg);

/**
 * @brief Write a buffer to finalPath through a temp file.
 *
 * Readers see either the previous content or the complete new content.
 * The temp file is removed on failure.
 */
bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const uint8_t* data,
                     size_t size,
                     std::string& errorMsg);

}  // namespace PeerSync
