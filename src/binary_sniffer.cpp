#include "binary_sniffer.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <fstream>

const std::unordered_set<std::string>& BinarySniffer::binaryExtensions() {
    static const std::unordered_set<std::string> extensions = {
        ".png", ".jpg", ".jpeg", ".gif", ".webp", ".ico", ".bmp", ".tiff",
        ".mp3", ".wav", ".flac", ".mp4", ".mkv", ".mov", ".avi", ".pdf",
        ".zip", ".7z", ".rar", ".gz", ".tar", ".woff", ".woff2", ".ttf",
        ".otf", ".psd"
    };
    return extensions;
}

bool BinarySniffer::hasBinaryExtension(const std::string& ext) {
    return binaryExtensions().count(ext) > 0;
}

bool BinarySniffer::isBinary(const fs::path& filePath) {
    // Known binary extensions skip the read entirely
    if (hasBinaryExtension(FileUtils::suffix(filePath))) {
        return true;
    }

    // Peek at the first bytes; unreadable files are treated as binary
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return true;
    }

    char buffer[SNIFF_SIZE];
    file.read(buffer, SNIFF_SIZE);
    if (file.bad()) {
        return true;
    }

    const auto bytesRead = static_cast<size_t>(file.gcount());
    return std::find(buffer, buffer + bytesRead, '\0') != buffer + bytesRead;
}
