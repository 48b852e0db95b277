#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

class BinarySniffer {
public:
    // Number of leading bytes searched for a NUL byte
    static constexpr size_t SNIFF_SIZE = 4096;

    // True for known binary extensions, files with a NUL byte in their
    // first SNIFF_SIZE bytes, and files that cannot be read.
    static bool isBinary(const fs::path& filePath);

    // Extension check alone (lower-case, leading dot)
    static bool hasBinaryExtension(const std::string& ext);

private:
    static const std::unordered_set<std::string>& binaryExtensions();
};
