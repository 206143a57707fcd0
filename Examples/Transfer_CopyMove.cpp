#include "FerryCore.h"
#include <filesystem>
#include <string>

using namespace Ferry::Core;
using namespace Ferry::Core::IO;

static std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

int main() {
    const std::string src = tempPath("ferry_copy_src.txt");
    const std::string dst = tempPath("ferry_copy_dst.txt");
    const std::string moved = tempPath("ferry_moved/ferry_move_dst.txt");

    AtomicTransferEngine engine(AtomicTransferEngine::Config::fromEnvironment());

    try {
        // Seed source file
        writeAll(src, std::string(4096, 'A'));

        TransferRequest copyReq;
        copyReq.source = src;
        copyReq.destination = dst;
        copyReq.overwrite = true;
        copyReq.preserveModTime = true;
        auto copied = engine.copy(copyReq);
        FERRY_LOG_INFO(std::string("Copy complete, bytes: ") + std::to_string(copied.bytesTransferred));

        // A second copy without overwrite must leave the destination alone
        copyReq.overwrite = false;
        try {
            engine.copy(copyReq);
        } catch (const FileOperationError& e) {
            if (e.code() != FileError::DestinationConflict) throw;
            FERRY_LOG_INFO(std::string("Refused to overwrite: ") + e.info().destinationPath);
        }

        TransferRequest moveReq;
        moveReq.source = dst;
        moveReq.destination = moved;
        moveReq.createParentDirs = true;
        moveReq.crossVolumePolicy = CrossVolumePolicy::NotifyThenAllow;
        moveReq.onCrossVolume = [](const std::string& from, const std::string& to) {
            FERRY_LOG_WARNING("Moving across volumes: " + from + " -> " + to);
        };
        auto outcome = engine.move(moveReq);
        FERRY_LOG_INFO(std::string("Move complete") + (outcome.usedCrossVolumeFallback ? " (copied)" : ""));
    } catch (const FileOperationError& e) {
        FERRY_LOG_ERROR(std::string("Transfer failed: ") + e.what());
        return 1;
    }

    deleteSure(src);
    deleteSure(PathUtil::parent(moved));
    return 0;
}
