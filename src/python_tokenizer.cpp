#include "python_tokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>

namespace {

bool isNameStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool isNameChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool isStringPrefixChar(char c) {
    switch (c) {
        case 'r': case 'R':
        case 'b': case 'B':
        case 'u': case 'U':
        case 'f': case 'F':
            return true;
        default:
            return false;
    }
}

} // namespace

PythonTokenizer::PythonTokenizer(const std::string& source)
    : source_(source) {
}

size_t PythonTokenizer::lineAt(size_t offset) const {
    const auto end = source_.begin() + static_cast<std::ptrdiff_t>(std::min(offset, source_.size()));
    return 1 + static_cast<size_t>(std::count(source_.begin(), end, '\n'));
}

void PythonTokenizer::emit(TokenType type, size_t begin, size_t end) {
    tokens_.push_back({type, begin, end});
}

// Indentation is only significant at the start of a logical line that is
// neither blank nor comment-only. Returns false when the line was consumed
// entirely (blank/comment line or end of input).
bool PythonTokenizer::handleLineStart() {
    if (depth_ > 0 || continuation_) {
        continuation_ = false;
        return true;
    }

    const size_t n = source_.size();
    size_t column = 0;
    size_t j = pos_;
    while (j < n && (source_[j] == ' ' || source_[j] == '\t' || source_[j] == '\f')) {
        if (source_[j] == '\t') {
            column = (column / 8 + 1) * 8;
        } else if (source_[j] == '\f') {
            column = 0;
        } else {
            ++column;
        }
        ++j;
    }

    if (j >= n) {
        pos_ = j;
        return false;
    }

    if (source_[j] == '\n' || source_[j] == '\r' || source_[j] == '#') {
        if (source_[j] == '#') {
            size_t end = j;
            while (end < n && source_[end] != '\n') {
                ++end;
            }
            emit(TokenType::Comment, j, end);
            j = end;
        }
        if (j < n) {
            emit(TokenType::NL, j, j + 1);
            ++j;
        }
        pos_ = j;
        return false;
    }

    if (column > indents_.back()) {
        indents_.push_back(column);
        emit(TokenType::Indent, pos_, j);
    } else {
        while (column < indents_.back()) {
            indents_.pop_back();
            emit(TokenType::Dedent, j, j);
        }
        if (column != indents_.back()) {
            throw PythonTokenizeError("unindent does not match any outer indentation level", lineAt(j));
        }
    }

    pos_ = j;
    return true;
}

size_t PythonTokenizer::stringPrefixEnd(size_t start) const {
    size_t j = start;
    while (j < source_.size() && j - start < 2 && isStringPrefixChar(source_[j])) {
        ++j;
    }
    if (j < source_.size() && (source_[j] == '\'' || source_[j] == '"')) {
        return j;
    }
    return start;
}

// Returns the offset one past the closing quote
size_t PythonTokenizer::scanString(size_t quotePos) const {
    const size_t n = source_.size();
    const char quote = source_[quotePos];
    const bool triple = quotePos + 2 < n && source_[quotePos + 1] == quote && source_[quotePos + 2] == quote;

    size_t k = quotePos + (triple ? 3 : 1);
    while (k < n) {
        const char c = source_[k];
        if (c == '\\') {
            k += 2;
            continue;
        }
        if (triple) {
            if (c == quote && k + 2 < n && source_[k + 1] == quote && source_[k + 2] == quote) {
                return k + 3;
            }
        } else {
            if (c == '\n') {
                throw PythonTokenizeError("unterminated string literal", lineAt(quotePos));
            }
            if (c == quote) {
                return k + 1;
            }
        }
        ++k;
    }

    throw PythonTokenizeError(triple ? "EOF in multi-line string" : "unterminated string literal",
                              lineAt(quotePos));
}

size_t PythonTokenizer::scanNumber(size_t start) const {
    size_t k = start;
    while (k < source_.size()) {
        const unsigned char c = static_cast<unsigned char>(source_[k]);
        if (std::isalnum(c) || c == '_' || c == '.') {
            ++k;
        } else if ((c == '+' || c == '-') && (source_[k - 1] == 'e' || source_[k - 1] == 'E') &&
                   !(k - start >= 2 && (source_[start + 1] == 'x' || source_[start + 1] == 'X'))) {
            ++k;
        } else {
            break;
        }
    }
    return k;
}

size_t PythonTokenizer::scanName(size_t start) const {
    size_t k = start;
    while (k < source_.size() && isNameChar(static_cast<unsigned char>(source_[k]))) {
        ++k;
    }
    return k;
}

std::vector<PythonTokenizer::Token> PythonTokenizer::tokenize() {
    tokens_.clear();
    indents_.assign(1, 0);
    pos_ = 0;
    depth_ = 0;
    continuation_ = false;
    lineHasContent_ = false;

    const size_t n = source_.size();
    bool atLineStart = true;

    while (pos_ < n) {
        if (atLineStart) {
            atLineStart = false;
            if (!handleLineStart()) {
                atLineStart = true;
                continue;
            }
            if (pos_ >= n) {
                break;
            }
        }

        const char ch = source_[pos_];
        const unsigned char uch = static_cast<unsigned char>(ch);

        if (ch == ' ' || ch == '\t' || ch == '\f' || ch == '\r') {
            ++pos_;
            continue;
        }

        if (ch == '\n') {
            if (depth_ == 0 && lineHasContent_) {
                emit(TokenType::Newline, pos_, pos_ + 1);
                lineHasContent_ = false;
            } else {
                emit(TokenType::NL, pos_, pos_ + 1);
            }
            ++pos_;
            atLineStart = true;
            continue;
        }

        if (ch == '#') {
            size_t end = pos_;
            while (end < n && source_[end] != '\n') {
                ++end;
            }
            emit(TokenType::Comment, pos_, end);
            pos_ = end;
            continue;
        }

        if (ch == '\\') {
            if (pos_ + 1 < n && source_[pos_ + 1] == '\n') {
                continuation_ = true;
                pos_ += 2;
                atLineStart = true;
                continue;
            }
            throw PythonTokenizeError("unexpected character after line continuation character", lineAt(pos_));
        }

        if (ch == '\'' || ch == '"') {
            const size_t end = scanString(pos_);
            emit(TokenType::String, pos_, end);
            lineHasContent_ = true;
            pos_ = end;
            continue;
        }

        if (isNameStart(uch)) {
            const size_t quotePos = stringPrefixEnd(pos_);
            if (quotePos != pos_) {
                const size_t end = scanString(quotePos);
                emit(TokenType::String, pos_, end);
                pos_ = end;
            } else {
                const size_t end = scanName(pos_);
                emit(TokenType::Name, pos_, end);
                pos_ = end;
            }
            lineHasContent_ = true;
            continue;
        }

        if (std::isdigit(uch) ||
            (ch == '.' && pos_ + 1 < n && std::isdigit(static_cast<unsigned char>(source_[pos_ + 1])))) {
            const size_t end = scanNumber(pos_);
            emit(TokenType::Number, pos_, end);
            lineHasContent_ = true;
            pos_ = end;
            continue;
        }

        if (ch == '(' || ch == '[' || ch == '{') {
            ++depth_;
        } else if ((ch == ')' || ch == ']' || ch == '}') && depth_ > 0) {
            --depth_;
        }
        emit(TokenType::Op, pos_, pos_ + 1);
        lineHasContent_ = true;
        ++pos_;
    }

    if (depth_ > 0 || continuation_) {
        throw PythonTokenizeError("EOF in multi-line statement", lineAt(n));
    }

    if (lineHasContent_) {
        emit(TokenType::Newline, n, n);
        lineHasContent_ = false;
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(TokenType::Dedent, n, n);
    }
    emit(TokenType::EndMarker, n, n);

    return tokens_;
}
