/**
 * @file FileBlobStore.cpp
 * @brief Directory-backed blob store implementation
 *
 * (c) 2026 PeerSync Project
 * Licensed under MIT License
 */

#include "peersync/FileBlobStore.h"
#include "peersync/AtomicFile.h"

#include <fstream>
#include <iterator>

namespace PeerSync {

FileBlobStore::FileBlobStore(std::filesystem::path root)
    : m_root(std::move(root))
{
}

bool FileBlobStore::resolve(const std::string& path, std::filesystem::path& out, std::string& errorMsg) const {
    std::filesystem::path result = m_root;
    size_t segments = 0;

    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) {
            next = path.size();
        }
        const std::string segment = path.substr(pos, next - pos);
        pos = next + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == ".." || segment.find('\\') != std::string::npos) {
            errorMsg = "Blob path escapes the store root: " + path;
            return false;
        }
        result /= segment;
        ++segments;
    }

    if (segments == 0) {
        errorMsg = "Empty blob path";
        return false;
    }

    out = std::move(result);
    return true;
}

bool FileBlobStore::writeFile(const std::string& path, const Bytes& data, std::string& errorMsg) {
    std::filesystem::path target;
    if (!resolve(path, target, errorMsg)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        errorMsg = "Failed to create directory " + target.parent_path().string() + ": " + ec.message();
        return false;
    }

    return atomicWriteFile(target, data.data(), data.size(), errorMsg);
}

bool FileBlobStore::readFile(const std::string& path, Bytes& out, std::string& errorMsg) {
    std::filesystem::path target;
    if (!resolve(path, target, errorMsg)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::ifstream in(target, std::ios::binary);
    if (!in) {
        errorMsg = "Failed to open blob: " + path;
        return false;
    }

    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        errorMsg = "Failed to read blob: " + path;
        return false;
    }

    out = std::move(data);
    return true;
}

bool FileBlobStore::fileExists(const std::string& path) {
    std::filesystem::path target;
    std::string ignored;
    if (!resolve(path, target, ignored)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    return std::filesystem::is_regular_file(target, ec) && !ec;
}

bool FileBlobStore::createDirectory(const std::string& path, std::string& errorMsg) {
    std::filesystem::path target;
    if (!resolve(path, target, errorMsg)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    std::filesystem::create_directories(target, ec);
    if (ec) {
        errorMsg = "Failed to create directory " + target.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool FileBlobStore::deleteDirectory(const std::string& path, std::string& errorMsg) {
    std::filesystem::path target;
    if (!resolve(path, target, errorMsg)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    std::filesystem::remove_all(target, ec);
    if (ec) {
        errorMsg = "Failed to delete " + target.string() + ": " + ec.message();
        return false;
    }
    return true;
}

}  // namespace PeerSync
