#include "line_counter.hpp"

namespace {

// Length of the whitespace sequence starting at `pos`, 0 if none
size_t whitespaceAt(const std::string& s, size_t pos) {
    const unsigned char c = static_cast<unsigned char>(s[pos]);
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f') {
        return 1;
    }
    // U+00A0 no-break space
    if (c == 0xC2 && pos + 1 < s.size() && static_cast<unsigned char>(s[pos + 1]) == 0xA0) {
        return 2;
    }
    // U+3000 ideographic space
    if (c == 0xE3 && pos + 2 < s.size() &&
        static_cast<unsigned char>(s[pos + 1]) == 0x80 &&
        static_cast<unsigned char>(s[pos + 2]) == 0x80) {
        return 3;
    }
    return 0;
}

} // namespace

bool LineCounter::isBlank(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size()) {
        const size_t width = whitespaceAt(line, pos);
        if (width == 0) {
            return false;
        }
        pos += width;
    }
    return true;
}

uint64_t LineCounter::codePoints(const std::string& text) {
    uint64_t count = 0;
    for (const char c : text) {
        // Continuation bytes are 10xxxxxx
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

LineCount LineCounter::count(const std::string& text) {
    LineCount result;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }

        const std::string line = text.substr(start, end - start);
        if (!isBlank(line)) {
            ++result.lines;
            result.chars += codePoints(line);
        }
        start = end + 1;
    }
    return result;
}
