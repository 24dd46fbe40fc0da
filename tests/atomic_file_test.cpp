#include <gtest/gtest.h>

#include "peersync/AtomicFile.h"

#include <fstream>
#include <iterator>

namespace {

std::string readAll(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

TEST(AtomicFileTest, ComputePathsAddsPartSuffix)
{
    const auto p = PeerSync::computeAtomicFilePaths(
        std::filesystem::path("/tmp/blobs/images/1/0.webp"));

    EXPECT_EQ(p.finalPath, std::filesystem::path("/tmp/blobs/images/1/0.webp"));
    EXPECT_EQ(p.tempPath, std::filesystem::path("/tmp/blobs/images/1/0.webp.part"));
}

TEST(AtomicFileTest, AtomicRenameMovesTempToFinal)
{
    const auto root = std::filesystem::temp_directory_path() / "peersync_atomic_file_test";
    std::filesystem::create_directories(root);

    const auto finalPath = root / "final.bin";
    const auto tempPath = root / "final.bin.part";

    // Clean slate
    std::error_code ec;
    std::filesystem::remove(finalPath, ec);
    std::filesystem::remove(tempPath, ec);

    {
        std::ofstream out(tempPath, std::ios::binary);
        out << "hello";
    }

    std::string err;
    ASSERT_TRUE(PeerSync::atomicRenameToFinal(tempPath, finalPath, err)) << err;

    EXPECT_TRUE(std::filesystem::exists(finalPath));
    EXPECT_FALSE(std::filesystem::exists(tempPath));
    EXPECT_EQ(readAll(finalPath), "hello");
}

TEST(AtomicFileTest, RenameWithoutTempFails)
{
    const auto root = std::filesystem::temp_directory_path() / "peersync_atomic_file_test";
    std::filesystem::create_directories(root);

    std::string err;
    EXPECT_FALSE(PeerSync::atomicRenameToFinal(root / "missing.part", root / "missing", err));
    EXPECT_FALSE(err.empty());
}

TEST(AtomicFileTest, WriteReplacesContentAndLeavesNoTemp)
{
    const auto root = std::filesystem::temp_directory_path() / "peersync_atomic_file_test";
    std::filesystem::create_directories(root);
    const auto finalPath = root / "config.json";

    const std::string first = "{\"a\":1}";
    const std::string second = "{}";

    std::string err;
    ASSERT_TRUE(PeerSync::atomicWriteFile(finalPath,
                                          reinterpret_cast<const uint8_t*>(first.data()),
                                          first.size(), err)) << err;
    ASSERT_TRUE(PeerSync::atomicWriteFile(finalPath,
                                          reinterpret_cast<const uint8_t*>(second.data()),
                                          second.size(), err)) << err;

    EXPECT_EQ(readAll(finalPath), second);
    EXPECT_FALSE(std::filesystem::exists(root / "config.json.part"));

    // Empty payloads produce an empty file
    ASSERT_TRUE(PeerSync::atomicWriteFile(finalPath, nullptr, 0, err)) << err;
    EXPECT_EQ(std::filesystem::file_size(finalPath), 0u);
}

TEST(AtomicFileTest, WriteIntoMissingDirectoryFails)
{
    const auto finalPath = std::filesystem::temp_directory_path() /
                           "peersync_atomic_file_test_missing" / "nested" / "file.bin";
    const uint8_t byte = 1;

    std::string err;
    EXPECT_FALSE(PeerSync::atomicWriteFile(finalPath, &byte, 1, err));
    EXPECT_FALSE(err.empty());
}
