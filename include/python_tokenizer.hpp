#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// Raised for source the tokenizer cannot make sense of
class PythonTokenizeError : public std::runtime_error {
public:
    PythonTokenizeError(const std::string& message, size_t line)
        : std::runtime_error(message + " (line " + std::to_string(line) + ")"), line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

// Lexical tokenizer for Python source. It only knows as much of the
// grammar as is needed to find comment and string boundaries, logical
// lines and indentation; operators are emitted one character at a time.
class PythonTokenizer {
public:
    enum class TokenType {
        Name,
        Number,
        String,
        Op,
        Comment,
        Newline,    // end of a logical line
        NL,         // non-logical line break (blank line, inside brackets)
        Indent,
        Dedent,
        EndMarker
    };

    // Token spans are byte offsets into the tokenized text
    struct Token {
        TokenType type;
        size_t begin;
        size_t end;
    };

    explicit PythonTokenizer(const std::string& source);

    // Tokenize the whole source. Throws PythonTokenizeError on unterminated
    // strings, inconsistent dedents and EOF inside a multi-line statement.
    std::vector<Token> tokenize();

private:
    const std::string& source_;
    size_t pos_ = 0;
    int depth_ = 0;
    bool continuation_ = false;
    bool lineHasContent_ = false;
    std::vector<size_t> indents_;
    std::vector<Token> tokens_;

    void emit(TokenType type, size_t begin, size_t end);
    size_t lineAt(size_t offset) const;
    bool handleLineStart();
    size_t scanString(size_t quotePos) const;
    size_t scanNumber(size_t start) const;
    size_t scanName(size_t start) const;
    size_t stringPrefixEnd(size_t start) const;
};
