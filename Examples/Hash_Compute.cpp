#include "FerryCore.h"
#include <iostream>
#include <string>

using namespace Ferry::Core;
using Ferry::Core::Hashing::HashEngine;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: Hash_Compute <file> [algorithm...]\n";
        return 2;
    }

    const std::string path = argv[1];
    const char* defaults[] = {"md5", "sha1", "sha256", "crc32"};

    try {
        if (argc > 2) {
            for (int i = 2; i < argc; ++i) {
                std::cout << argv[i] << "  " << HashEngine::computeHash(path, std::string_view(argv[i])) << "\n";
            }
        } else {
            for (const char* alg : defaults) {
                std::cout << alg << "  " << HashEngine::computeHash(path, std::string_view(alg)) << "\n";
            }
        }
    } catch (const IO::FileOperationError& e) {
        FERRY_LOG_ERROR(std::string("Hash failed: ") + e.what());
        return 1;
    }
    return 0;
}
