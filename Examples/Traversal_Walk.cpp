#include "FerryCore.h"
#include <iostream>
#include <string>

using namespace Ferry::Core::IO;

int main(int argc, char** argv) {
    const std::string root = argc > 1 ? argv[1] : ".";

    TraversalFilter filter;
    filter.setAllowedExtensions({"cpp", "h"});
    filter.directoryPredicate = [](const std::string& dir) {
        const std::string leaf = PathUtil::leafName(dir);
        return leaf.empty() || leaf[0] != '.';
    };

    auto onError = [](const std::string& path, const FileErrorInfo& error) {
        FERRY_LOG_WARNING("Skipping " + path + ": " + error.message);
    };

    try {
        uint64_t total = 0;
        size_t count = 0;
        for (const auto& entry : DirectoryWalker::recurseFiles(root, filter, onError)) {
            std::cout << entry.fullPath() << "\n";
            total += entry.size();
            ++count;
        }
        FERRY_LOG_INFO(std::to_string(count) + " source files, " + std::to_string(total) + " bytes");

        for (const auto& dir : DirectoryWalker::listDirs(root)) {
            std::cout << "[dir] " << dir.leafName() << "\n";
        }
    } catch (const FileOperationError& e) {
        FERRY_LOG_ERROR(std::string("Traversal failed: ") + e.what());
        return 1;
    }
    return 0;
}
