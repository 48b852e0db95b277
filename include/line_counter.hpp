#pragma once

#include <cstdint>
#include <string>

struct LineCount {
    uint64_t lines = 0;
    uint64_t chars = 0;
};

// Reduces comment-stripped text to non-blank line and character totals.
// Characters are Unicode code points of the UTF-8 input.
class LineCounter {
public:
    static LineCount count(const std::string& text);

    // True when the line holds nothing but whitespace, NBSP or
    // ideographic spaces
    static bool isBlank(const std::string& line);

    // Number of code points in a UTF-8 string
    static uint64_t codePoints(const std::string& text);
};
