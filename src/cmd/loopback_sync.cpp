/**
 * @file loopback_sync.cpp
 * @brief CLI tool to run a full PeerSync transfer between two in-process peers
 *
 * Usage:
 *   peersync_loopback [records] [images-per-record] [--video] [--config <file>] [--export <file>]
 *
 * Example:
 *   peersync_loopback 20 4 --video
 *
 * A sender and a receiver session are connected through a LoopbackNetwork.
 * The sender's history is generated in memory with blob files under a
 * temporary directory; the receiver persists into a second one. With
 * --export the received history is written as a JSON backup afterwards.
 */

#include "peersync/BackupArchive.h"
#include "peersync/DiagnosticsLog.h"
#include "peersync/FileBlobStore.h"
#include "peersync/InlineThumbnailGenerator.h"
#include "peersync/LoopbackTransport.h"
#include "peersync/MemoryHistoryStore.h"
#include "peersync/PeerSession.h"
#include "peersync/SecureRandom.h"
#include "peersync/UuidGenerator.h"
#include "peersync/config.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace PeerSync;

namespace {

constexpr size_t DEMO_IMAGE_BYTES = 48 * 1024;
constexpr size_t DEMO_VIDEO_BYTES = 300 * 1024;

/**
 * @brief Print usage information
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName
              << " [records] [images-per-record] [--video] [--config <file>] [--export <file>]\n";
    std::cout << "\nArguments:\n";
    std::cout << "  records            Number of history records to send (default 5)\n";
    std::cout << "  images-per-record  Images attached to each record (default 2)\n";
    std::cout << "  --video            Attach a video to every record\n";
    std::cout << "  --config <file>    TransferConfig JSON file\n";
    std::cout << "  --export <file>    Write the received history as a backup file\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << programName << " 20 4 --video\n";
}

bool parseCount(const std::string& text, int& out) {
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || value < 0 || value > 10000) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool makeBlob(size_t size, Bytes& out, std::string& errorMsg) {
    out.resize(size);
    return SecureRandom::fillRandom(out.data(), out.size(), errorMsg);
}

/**
 * @brief Fill the sender's store with generated records
 */
bool seedHistory(MemoryHistoryStore& store, FileBlobStore& blobs,
                 int records, int imagesPerRecord, bool withVideo,
                 std::string& errorMsg) {
    for (int r = 0; r < records; ++r) {
        HistoryRecord record;
        record.uuid = UuidGenerator::generate();
        record.timestamp = static_cast<int64_t>(UuidGenerator::nowEpochMs());
        record.prompt = "Loopback record " + std::to_string(r + 1);
        record.mode = "generate";
        record.status = "completed";
        record.options = {{"aspectRatio", "1:1"}, {"seed", r}};

        const std::string dir = "/seed/" + std::to_string(r);
        for (int i = 0; i < imagesPerRecord; ++i) {
            Bytes data;
            if (!makeBlob(DEMO_IMAGE_BYTES, data, errorMsg)) {
                return false;
            }

            StoredImage image;
            image.index = static_cast<uint32_t>(i);
            image.width = 512;
            image.height = 512;
            image.path = dir + "/" + std::to_string(i) + ".webp";
            image.originalSize = data.size();
            image.compressedSize = data.size();
            image.compressedFormat = "image/webp";
            if (!blobs.writeFile(image.path, data, errorMsg)) {
                return false;
            }
            record.images.push_back(image);
        }

        if (withVideo) {
            Bytes data;
            if (!makeBlob(DEMO_VIDEO_BYTES, data, errorMsg)) {
                return false;
            }
            record.hasVideo = true;
            record.video.path = dir + "/video.mp4";
            record.video.size = data.size();
            record.video.mimeType = DEFAULT_VIDEO_MIME;
            record.video.width = 720;
            record.video.height = 720;
            if (!blobs.writeFile(record.video.path, data, errorMsg)) {
                return false;
            }
        }

        store.insertHistory(std::move(record));
    }
    return true;
}

/**
 * @brief Write the receiver's history as a backup file
 */
bool exportBackup(MemoryHistoryStore& history, FileBlobStore& blobs,
                  InlineThumbnailGenerator& thumbnails, const std::string& path) {
    DiagnosticsLog log("backup");
    BackupArchive archive(history, blobs, thumbnails, log);

    nlohmann::json doc;
    uint32_t count = 0;
    std::string errorMsg;
    if (!archive.exportHistory({}, doc, count, errorMsg) ||
        !BackupArchive::writeFile(path, doc, errorMsg)) {
        std::cerr << "Error: export failed: " << errorMsg << "\n";
        return false;
    }
    std::cout << "Exported:  " << count << " records to " << path << "\n";
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    int records = 5;
    int imagesPerRecord = 2;
    bool withVideo = false;
    std::string configPath;
    std::string exportPath;

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--video") {
            withVideo = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--export" && i + 1 < argc) {
            exportPath = argv[++i];
        } else if (positional == 0 && parseCount(arg, records)) {
            ++positional;
        } else if (positional == 1 && parseCount(arg, imagesPerRecord)) {
            ++positional;
        } else {
            std::cerr << "Invalid argument: " << arg << "\n\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    TransferConfig config;
    std::string errorMsg;
    if (!configPath.empty() && !TransferConfig::loadFromFile(configPath, config, errorMsg)) {
        std::cerr << "Error: " << errorMsg << "\n";
        return 1;
    }

    std::error_code ec;
    const std::filesystem::path workDir = std::filesystem::temp_directory_path(ec) /
        ("peersync-loopback-" + std::to_string(UuidGenerator::nowEpochMs()));
    if (ec) {
        std::cerr << "Error: no temporary directory: " << ec.message() << "\n";
        return 1;
    }

    std::cout << "=== PeerSync Loopback Transfer ===\n";
    std::cout << "Records:   " << records << "\n";
    std::cout << "Images:    " << imagesPerRecord << " per record\n";
    std::cout << "Video:     " << (withVideo ? "yes" : "no") << "\n";
    std::cout << "Work dir:  " << workDir.string() << "\n\n";

    MemoryHistoryStore senderHistory;
    MemoryHistoryStore receiverHistory;
    FileBlobStore senderBlobs(workDir / "sender");
    FileBlobStore receiverBlobs(workDir / "receiver");
    InlineThumbnailGenerator thumbnails;

    if (!seedHistory(senderHistory, senderBlobs, records, imagesPerRecord, withVideo, errorMsg)) {
        std::cerr << "Error: failed to generate records: " << errorMsg << "\n";
        return 1;
    }

    int exitCode = 0;
    {
        LoopbackNetwork network;
        PeerSession sender(network, senderHistory, senderBlobs, thumbnails, config);
        PeerSession receiver(network, receiverHistory, receiverBlobs, thumbnails, config);

        receiver.setProgressCallback([](const TransferProgress& progress) {
            std::cout << "\r[" << progress.phase << "] " << progress.current << "/" << progress.total
                      << std::flush;
        });

        const auto startTime = std::chrono::steady_clock::now();

        SenderOptions options;
        options.syncType = SyncType::History;
        if (!sender.startAsSender(options, errorMsg) ||
            !sender.waitForState([](const SessionState& s) { return s.endpointOpen; },
                                 std::chrono::seconds(10))) {
            std::cerr << "Error: sender could not register: " << errorMsg << "\n";
            return 1;
        }

        const std::string code = sender.state().connectionCode;
        std::cout << "Connection code: " << code << "\n";

        if (!receiver.connectToSender(code, errorMsg) ||
            !receiver.waitForStatus(SessionStatus::PAIRED, std::chrono::seconds(10)) ||
            !sender.waitForStatus(SessionStatus::PAIRED, std::chrono::seconds(10))) {
            std::cerr << "Error: pairing failed: " << errorMsg << " " << receiver.state().error.message << "\n";
            return 1;
        }

        std::cout << "Fingerprint (sender):   " << sender.fingerprintText() << "\n";
        std::cout << "Fingerprint (receiver): " << receiver.fingerprintText() << "\n";

        if (!sender.confirmPairing(errorMsg) || !receiver.confirmPairing(errorMsg)) {
            std::cerr << "Error: confirmation failed: " << errorMsg << "\n";
            return 1;
        }

        const auto finished = [](const SessionState& s) {
            return s.status == SessionStatus::COMPLETED || s.status == SessionStatus::FAILED;
        };
        const std::chrono::minutes budget(10);
        sender.waitForState(finished, budget);
        receiver.waitForState(finished, budget);
        std::cout << "\n\n";

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count();

        const SessionState senderState = sender.state();
        const SessionState receiverState = receiver.state();
        const TransferStatsSnapshot stats = sender.statsSnapshot();

        if (senderState.status == SessionStatus::COMPLETED) {
            const TransferResult& r = senderState.result;
            std::cout << "=== Transfer Complete ===\n";
            std::cout << "Sent:      " << r.sent << "/" << r.total << "\n";
            std::cout << "Imported:  " << r.imported << "\n";
            std::cout << "Skipped:   " << r.skipped << "\n";
            std::cout << "Failed:    " << r.failed << "\n";
            std::cout << "Bytes:     " << TransferStats::formatBytes(stats.bytesSent) << "\n";
            std::cout << "Duration:  " << duration << " ms\n";
            if (duration > 0) {
                std::cout << "Speed:     "
                          << TransferStats::formatSpeed(static_cast<double>(stats.bytesSent) * 1000.0 /
                                                        static_cast<double>(duration))
                          << "\n";
            }
            std::cout << "Stored:    " << receiverHistory.historyCount() << " records under "
                      << receiverBlobs.root().string() << "\n";

            if (!exportPath.empty() && !exportBackup(receiverHistory, receiverBlobs, thumbnails, exportPath)) {
                exitCode = 1;
            }
        } else {
            std::cerr << "=== Transfer Failed ===\n";
            std::cerr << "Sender:   [" << senderState.error.code << "] " << senderState.error.message << "\n";
            std::cerr << "Receiver: " << sessionStatusToString(receiverState.status);
            if (!receiverState.error.empty()) {
                std::cerr << " [" << receiverState.error.code << "] " << receiverState.error.message;
            }
            std::cerr << "\n";
            exitCode = 1;
        }

        sender.cleanup();
        receiver.cleanup();
    }

    std::filesystem::remove_all(workDir, ec);
    return exitCode;
}
