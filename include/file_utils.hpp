#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Placeholder sub-kind for files without an extension
constexpr const char* NO_EXTENSION = "(no extension)";

class FileUtils {
public:
    // ASCII lower-case copy
    static std::string toLower(std::string value);

    // Lower-cased file name of a path
    static std::string lowerName(const fs::path& path);

    // Lower-cased last suffix of a file name, including the dot.
    // Empty when there is no dot, or the only dot is the first or last
    // character (".bashrc", "archive.").
    static std::string suffix(const std::string& fileName);
    static std::string suffix(const fs::path& path);

    // Like suffix(), but NO_EXTENSION when the file has none
    static std::string extOrPlaceholder(const fs::path& path);

    // File name with its last suffix removed (same rules as suffix())
    static std::string stem(const std::string& fileName);
};
