#include "text_decoder.hpp"
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <iconv.h>

namespace {

const char UTF8_BOM[] = "\xEF\xBB\xBF";
const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence at `pos`, 0 if malformed
size_t utf8SequenceLength(const std::string& s, size_t pos) {
    const size_t n = s.size();
    const unsigned char c = static_cast<unsigned char>(s[pos]);
    if (c < 0x80) {
        return 1;
    }

    size_t length = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        length = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        length = 3;
        if (c == 0xE0) {
            lower = 0xA0;
        } else if (c == 0xED) {
            upper = 0x9F;  // no surrogates
        }
    } else if (c >= 0xF0 && c <= 0xF4) {
        length = 4;
        if (c == 0xF0) {
            lower = 0x90;
        } else if (c == 0xF4) {
            upper = 0x8F;
        }
    } else {
        return 0;
    }

    if (pos + length > n) {
        return 0;
    }
    const unsigned char second = static_cast<unsigned char>(s[pos + 1]);
    if (second < lower || second > upper) {
        return 0;
    }
    for (size_t k = 2; k < length; ++k) {
        const unsigned char next = static_cast<unsigned char>(s[pos + k]);
        if (next < 0x80 || next > 0xBF) {
            return 0;
        }
    }
    return length;
}

// Owns an iconv conversion descriptor
class IconvHandle {
public:
    IconvHandle(const char* to, const char* from)
        : handle_(iconv_open(to, from)) {}

    ~IconvHandle() {
        if (valid()) {
            iconv_close(handle_);
        }
    }

    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool valid() const { return handle_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return handle_; }

private:
    iconv_t handle_;
};

} // namespace

std::string TextDecoder::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    std::string content;
    std::vector<char> buffer(READ_BUFFER_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        content.append(buffer.data(), static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }

    return decode(content);
}

std::string TextDecoder::decode(const std::string& bytes) {
    if (bytes.compare(0, 3, UTF8_BOM) == 0) {
        const std::string body = bytes.substr(3);
        if (isValidUtf8(body)) {
            return normalizeNewlines(body);
        }
    }
    if (isValidUtf8(bytes)) {
        return normalizeNewlines(bytes);
    }
    if (auto converted = fromGb18030(bytes)) {
        return normalizeNewlines(*converted);
    }
    return normalizeNewlines(decodeLossy(bytes));
}

bool TextDecoder::isValidUtf8(const std::string& bytes) {
    size_t pos = 0;
    while (pos < bytes.size()) {
        const size_t length = utf8SequenceLength(bytes, pos);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

std::optional<std::string> TextDecoder::fromGb18030(const std::string& bytes) {
    IconvHandle converter("UTF-8", "GB18030");
    if (!converter.valid()) {
        return std::nullopt;
    }

    std::string input = bytes;
    char* in = input.data();
    size_t inLeft = input.size();

    std::string output;
    std::vector<char> buffer(READ_BUFFER_SIZE);
    while (inLeft > 0) {
        char* out = buffer.data();
        size_t outLeft = buffer.size();
        const size_t rc = iconv(converter.get(), &in, &inLeft, &out, &outLeft);
        output.append(buffer.data(), buffer.size() - outLeft);
        if (rc == static_cast<size_t>(-1)) {
            if (errno == E2BIG) {
                continue;
            }
            // EILSEQ or EINVAL: not GB18030
            return std::nullopt;
        }
    }

    // Flush any shift state
    char* out = buffer.data();
    size_t outLeft = buffer.size();
    if (iconv(converter.get(), nullptr, nullptr, &out, &outLeft) == static_cast<size_t>(-1)) {
        return std::nullopt;
    }
    output.append(buffer.data(), buffer.size() - outLeft);

    return output;
}

std::string TextDecoder::decodeLossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size()) {
        const size_t length = utf8SequenceLength(bytes, pos);
        if (length == 0) {
            out += REPLACEMENT_CHARACTER;
            ++pos;
            continue;
        }
        out.append(bytes, pos, length);
        pos += length;
    }
    return out;
}

std::string TextDecoder::normalizeNewlines(const std::string& text) {
    if (text.find('\r') == std::string::npos) {
        return text;
    }

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out += text[i];
        }
    }
    return out;
}
