/**
 * @file FileBlobStore.h
 * @brief BlobStore backed by a directory on the local filesystem
 *
 * (c) 2026 PeerSync Project
 * Licensed under MIT License
 */

#pragma once

#include "StorageInterfaces.h"

#include <filesystem>
#include <mutex>
#include <string>

namespace PeerSync {

/**
 * @class FileBlobStore
 * @brief Maps virtual blob paths onto files below a root directory
 *
 * "/images/3/0.webp" is stored at <root>/images/3/0.webp. Writes go
 * through a temp file and a rename. Paths containing ".." or empty segments
 * are rejected so nothing escapes the root.
 *
 * Thread Safety:
 * - All methods are thread-safe (serialized by an internal mutex)
 */
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(std::filesystem::path root);

    bool writeFile(const std::string& path, const Bytes& data, std::string& errorMsg) override;
    bool readFile(const std::string& path, Bytes& out, std::string& errorMsg) override;
    bool fileExists(const std::string& path) override;
    bool createDirectory(const std::string& path, std::string& errorMsg) override;
    bool deleteDirectory(const std::string& path, std::string& errorMsg) override;

    const std::filesystem::path& root() const { return m_root; }

    /**
     * @brief Map a virtual path onto the filesystem
     * @return false if the path is empty or tries to leave the root
     */
    bool resolve(const std::string& path, std::filesystem::path& out, std::string& errorMsg) const;

private:
    std::filesystem::path m_root;
    std::mutex m_mutex;
};

}  // namespace PeerSync
