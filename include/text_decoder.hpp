#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Raw bytes to UTF-8 text. Tries, in order: UTF-8 with BOM, strict UTF-8,
// GB18030 through iconv, and finally a lossy UTF-8 decode that replaces
// invalid sequences with U+FFFD. Line endings come out as '\n'.
class TextDecoder {
public:
    // Read and decode a file. Throws std::runtime_error if it cannot be read.
    static std::string readFile(const fs::path& path);

    // Decode raw bytes; never throws on malformed input
    static std::string decode(const std::string& bytes);

    static bool isValidUtf8(const std::string& bytes);

    // GB18030 -> UTF-8, nullopt when the bytes are not valid GB18030 or the
    // converter is unavailable
    static std::optional<std::string> fromGb18030(const std::string& bytes);

    static std::string decodeLossy(const std::string& bytes);

    // "\r\n" and lone '\r' become '\n'
    static std::string normalizeNewlines(const std::string& text);

private:
    static constexpr size_t READ_BUFFER_SIZE = 64 * 1024;
};
