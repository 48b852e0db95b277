#include "file_utils.hpp"
#include <algorithm>
#include <cctype>

std::string FileUtils::toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string FileUtils::lowerName(const fs::path& path) {
    return toLower(path.filename().string());
}

std::string FileUtils::suffix(const std::string& fileName) {
    const auto dot = fileName.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == fileName.size()) {
        return "";
    }
    return toLower(fileName.substr(dot));
}

std::string FileUtils::suffix(const fs::path& path) {
    return suffix(path.filename().string());
}

std::string FileUtils::extOrPlaceholder(const fs::path& path) {
    std::string ext = suffix(path);
    return ext.empty() ? std::string(NO_EXTENSION) : ext;
}

std::string FileUtils::stem(const std::string& fileName) {
    const auto dot = fileName.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == fileName.size()) {
        return fileName;
    }
    return fileName.substr(0, dot);
}
