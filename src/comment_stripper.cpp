#include "comment_stripper.hpp"
#include "python_tokenizer.hpp"
#include "file_utils.hpp"
#include <utility>
#include <vector>

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string leftTrim(const std::string& line) {
    size_t start = 0;
    while (start < line.size() && isSpace(line[start])) {
        ++start;
    }
    return line.substr(start);
}

// Offset of the next '\n' at or after `pos`, or text.size()
size_t lineEnd(const std::string& text, size_t pos) {
    const size_t end = text.find('\n', pos);
    return end == std::string::npos ? text.size() : end;
}

// Rebuilds `text` line by line; the '\n' separators are kept as they are
template <typename Fn>
std::string mapLines(const std::string& text, Fn fn) {
    std::string out;
    out.reserve(text.size());
    size_t start = 0;
    while (true) {
        const size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            out += fn(text.substr(start));
            break;
        }
        out += fn(text.substr(start, end - start));
        out += '\n';
        start = end + 1;
    }
    return out;
}

// Lua long bracket "[", "=" * level, "["; returns the level or -1
int longBracketOpen(const std::string& text, size_t pos) {
    const size_t n = text.size();
    if (pos >= n || text[pos] != '[') {
        return -1;
    }
    size_t j = pos + 1;
    int level = 0;
    while (j < n && text[j] == '=') {
        ++level;
        ++j;
    }
    return (j < n && text[j] == '[') ? level : -1;
}

// True when a closing long bracket of exactly `level` starts at `pos`
bool longBracketClose(const std::string& text, size_t pos, int level) {
    const size_t n = text.size();
    if (pos >= n || text[pos] != ']') {
        return false;
    }
    size_t j = pos + 1;
    int k = 0;
    while (k < level && j < n && text[j] == '=') {
        ++k;
        ++j;
    }
    return k == level && j < n && text[j] == ']';
}

// True when the token at `index` is the first statement of the file or of
// an indented block. Comments and blank lines in between do not count.
bool opensBlock(const std::vector<PythonTokenizer::Token>& tokens, size_t index) {
    using Type = PythonTokenizer::TokenType;
    while (index > 0) {
        --index;
        const Type type = tokens[index].type;
        if (type == Type::Comment || type == Type::NL) {
            continue;
        }
        return type == Type::Indent;
    }
    return true;
}

} // namespace

CommentStripper::Grammar CommentStripper::grammarFor(LanguageTag tag) {
    switch (tag) {
        case LanguageTag::JavaScript:
        case LanguageTag::TypeScript:
        case LanguageTag::CSS:
        case LanguageTag::SCSS:
        case LanguageTag::Less:
        case LanguageTag::C:
        case LanguageTag::Cpp:
        case LanguageTag::CSharp:
        case LanguageTag::ObjectiveC:
        case LanguageTag::Java:
        case LanguageTag::Kotlin:
        case LanguageTag::Swift:
        case LanguageTag::Go:
        case LanguageTag::Rust:
        case LanguageTag::Dart:
        case LanguageTag::Scala:
        case LanguageTag::PHP:
        case LanguageTag::Shader:
        case LanguageTag::Unity:
        case LanguageTag::ActionScript:
        case LanguageTag::Haxe:
        case LanguageTag::Kirikiri:
            return Grammar::CLike;
        case LanguageTag::HTML:
        case LanguageTag::XML:
            return Grammar::Markup;
        case LanguageTag::Shell:
        case LanguageTag::Ruby:
        case LanguageTag::Perl:
        case LanguageTag::R:
        case LanguageTag::YAML:
        case LanguageTag::TOML:
        case LanguageTag::RenPy:
        case LanguageTag::Godot:
            return Grammar::HashLine;
        case LanguageTag::INI:
            return Grammar::Ini;
        case LanguageTag::SQL:
            return Grammar::Sql;
        case LanguageTag::PowerShell:
            return Grammar::PowerShell;
        case LanguageTag::Lua:
            return Grammar::Lua;
        case LanguageTag::Python:
            return Grammar::Python;
        case LanguageTag::Batch:
            return Grammar::Batch;
        default:
            return Grammar::None;
    }
}

std::string CommentStripper::strip(LanguageTag tag, const std::string& text) {
    return strip(grammarFor(tag), text);
}

std::string CommentStripper::strip(Grammar grammar, const std::string& text) {
    switch (grammar) {
        case Grammar::CLike:      return stripCLike(text);
        case Grammar::Markup:     return stripMarkup(text);
        case Grammar::HashLine:   return stripHashLine(text);
        case Grammar::Ini:        return stripIni(text);
        case Grammar::Sql:        return stripSql(text);
        case Grammar::PowerShell: return stripPowerShell(text);
        case Grammar::Lua:        return stripLua(text);
        case Grammar::Python:     return stripPython(text);
        case Grammar::Batch:      return stripBatch(text);
        case Grammar::None:       return text;
    }
    return text;
}

std::string CommentStripper::stripCLike(const std::string& text) {
    enum class State { Code, SingleQuote, DoubleQuote, BackTick, BlockComment };

    std::string out;
    out.reserve(text.size());
    State state = State::Code;
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        const char ch = text[i];
        const char next = i + 1 < n ? text[i + 1] : '\0';

        if (state == State::BlockComment) {
            if (ch == '*' && next == '/') {
                state = State::Code;
                i += 2;
                continue;
            }
            if (ch == '\n') {
                out += '\n';
            }
            ++i;
            continue;
        }

        if (state != State::Code) {
            const char closing = state == State::SingleQuote ? '\''
                               : state == State::DoubleQuote ? '"' : '`';
            out += ch;
            if (ch == '\\' && i + 1 < n) {
                out += next;
                i += 2;
                continue;
            }
            if (ch == closing) {
                state = State::Code;
            }
            ++i;
            continue;
        }

        switch (ch) {
            case '\'':
                state = State::SingleQuote;
                break;
            case '"':
                state = State::DoubleQuote;
                break;
            case '`':
                state = State::BackTick;
                break;
            case '/':
                if (next == '/') {
                    i = lineEnd(text, i + 2);
                    continue;
                }
                if (next == '*') {
                    state = State::BlockComment;
                    i += 2;
                    continue;
                }
                break;
            default:
                break;
        }

        out += ch;
        ++i;
    }

    return out;
}

std::string CommentStripper::stripMarkup(const std::string& text) {
    static const std::string OPEN = "<!--";
    static const std::string CLOSE = "-->";

    std::string out;
    out.reserve(text.size());
    const size_t n = text.size();
    size_t i = 0;
    bool inComment = false;

    while (i < n) {
        if (!inComment && text.compare(i, OPEN.size(), OPEN) == 0) {
            inComment = true;
            i += OPEN.size();
            continue;
        }
        if (inComment && text.compare(i, CLOSE.size(), CLOSE) == 0) {
            inComment = false;
            i += CLOSE.size();
            continue;
        }
        if (!inComment || text[i] == '\n') {
            out += text[i];
        }
        ++i;
    }

    return out;
}

std::string CommentStripper::stripHashLine(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    const size_t n = text.size();
    size_t i = 0;
    char quote = '\0';  // active quote character, '\0' outside strings

    while (i < n) {
        const char ch = text[i];

        if (quote != '\0') {
            out += ch;
            if (ch == '\\' && i + 1 < n) {
                out += text[i + 1];
                i += 2;
                continue;
            }
            if (ch == quote) {
                quote = '\0';
            }
            ++i;
            continue;
        }

        if (ch == '\'' || ch == '"') {
            quote = ch;
        } else if (ch == '#') {
            i = lineEnd(text, i);
            continue;
        }

        out += ch;
        ++i;
    }

    return out;
}

std::string CommentStripper::stripIni(const std::string& text) {
    // Only whole-line comments; "key = a;b" and "url = x#y" are values
    return mapLines(text, [](const std::string& line) -> std::string {
        const std::string trimmed = leftTrim(line);
        if (!trimmed.empty() && (trimmed[0] == ';' || trimmed[0] == '#')) {
            return "";
        }
        return line;
    });
}

std::string CommentStripper::stripSql(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    const size_t n = text.size();
    size_t i = 0;
    bool inString = false;
    bool inBlock = false;

    while (i < n) {
        const char ch = text[i];
        const char next = i + 1 < n ? text[i + 1] : '\0';

        if (inBlock) {
            if (ch == '*' && next == '/') {
                inBlock = false;
                i += 2;
                continue;
            }
            if (ch == '\n') {
                out += '\n';
            }
            ++i;
            continue;
        }

        if (inString) {
            out += ch;
            // '' is an escaped quote inside a literal
            if (ch == '\'' && next == '\'') {
                out += next;
                i += 2;
                continue;
            }
            if (ch == '\'') {
                inString = false;
            }
            ++i;
            continue;
        }

        if (ch == '\'') {
            inString = true;
        } else if (ch == '-' && next == '-') {
            i = lineEnd(text, i + 2);
            continue;
        } else if (ch == '/' && next == '*') {
            inBlock = true;
            i += 2;
            continue;
        }

        out += ch;
        ++i;
    }

    return out;
}

std::string CommentStripper::stripPowerShell(const std::string& text) {
    enum class State { Code, SingleQuote, DoubleQuote, BlockComment };

    std::string out;
    out.reserve(text.size());
    State state = State::Code;
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        const char ch = text[i];
        const char next = i + 1 < n ? text[i + 1] : '\0';

        switch (state) {
            case State::BlockComment:
                if (ch == '#' && next == '>') {
                    state = State::Code;
                    i += 2;
                    continue;
                }
                if (ch == '\n') {
                    out += '\n';
                }
                ++i;
                continue;

            case State::SingleQuote:
                out += ch;
                if (ch == '\'' && next == '\'') {
                    out += next;
                    i += 2;
                    continue;
                }
                if (ch == '\'') {
                    state = State::Code;
                }
                ++i;
                continue;

            case State::DoubleQuote:
                out += ch;
                if (ch == '`' && i + 1 < n) {
                    out += next;
                    i += 2;
                    continue;
                }
                if (ch == '"') {
                    state = State::Code;
                }
                ++i;
                continue;

            case State::Code:
                break;
        }

        if (ch == '<' && next == '#') {
            state = State::BlockComment;
            i += 2;
            continue;
        }
        if (ch == '#') {
            i = lineEnd(text, i);
            continue;
        }
        if (ch == '\'') {
            state = State::SingleQuote;
        } else if (ch == '"') {
            state = State::DoubleQuote;
        }

        out += ch;
        ++i;
    }

    return out;
}

std::string CommentStripper::stripLua(const std::string& text) {
    enum class State { Code, SingleQuote, DoubleQuote, LongString, BlockComment };

    std::string out;
    out.reserve(text.size());
    State state = State::Code;
    int level = 0;  // "=" count of the open long bracket
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        const char ch = text[i];
        const char next = i + 1 < n ? text[i + 1] : '\0';

        if (state == State::BlockComment) {
            if (ch == '\n') {
                out += '\n';
                ++i;
                continue;
            }
            if (longBracketClose(text, i, level)) {
                state = State::Code;
                i += 2 + static_cast<size_t>(level);
                continue;
            }
            ++i;
            continue;
        }

        if (state == State::LongString) {
            if (longBracketClose(text, i, level)) {
                const size_t closeLength = 2 + static_cast<size_t>(level);
                out.append(text, i, closeLength);
                state = State::Code;
                i += closeLength;
                continue;
            }
            out += ch;
            ++i;
            continue;
        }

        if (state == State::SingleQuote || state == State::DoubleQuote) {
            out += ch;
            if (ch == '\\' && i + 1 < n) {
                out += next;
                i += 2;
                continue;
            }
            if (ch == (state == State::SingleQuote ? '\'' : '"')) {
                state = State::Code;
            }
            ++i;
            continue;
        }

        const int stringLevel = longBracketOpen(text, i);
        if (stringLevel >= 0) {
            const size_t openLength = 2 + static_cast<size_t>(stringLevel);
            out.append(text, i, openLength);
            state = State::LongString;
            level = stringLevel;
            i += openLength;
            continue;
        }

        if (ch == '\'') {
            state = State::SingleQuote;
        } else if (ch == '"') {
            state = State::DoubleQuote;
        } else if (ch == '-' && next == '-') {
            // "--[[" or "--[==[" opens a block comment, anything else is a line comment
            const int commentLevel = longBracketOpen(text, i + 2);
            if (commentLevel >= 0) {
                state = State::BlockComment;
                level = commentLevel;
                i += 4 + static_cast<size_t>(commentLevel);
                continue;
            }
            i = lineEnd(text, i + 2);
            continue;
        }

        out += ch;
        ++i;
    }

    return out;
}

std::string CommentStripper::stripBatch(const std::string& text) {
    return mapLines(text, [](const std::string& line) -> std::string {
        const std::string trimmed = leftTrim(line);
        const std::string lower = FileUtils::toLower(trimmed);
        if (lower == "rem" || lower.rfind("rem ", 0) == 0 || trimmed.rfind("::", 0) == 0) {
            return "";
        }
        return line;
    });
}

std::string CommentStripper::stripPython(const std::string& text) {
    using Type = PythonTokenizer::TokenType;

    std::vector<PythonTokenizer::Token> tokens;
    try {
        tokens = PythonTokenizer(text).tokenize();
    } catch (const PythonTokenizeError&) {
        return stripPythonLines(text);
    }

    // Spans to drop: every comment, and strings that make up the whole
    // first statement of the module or of a block (docstrings)
    std::vector<std::pair<size_t, size_t>> removed;
    for (size_t t = 0; t < tokens.size(); ++t) {
        const auto& token = tokens[t];
        if (token.type == Type::Comment) {
            removed.emplace_back(token.begin, token.end);
            continue;
        }
        if (token.type != Type::String || !opensBlock(tokens, t)) {
            continue;
        }

        size_t last = t;
        while (last + 1 < tokens.size() && tokens[last + 1].type == Type::String) {
            ++last;
        }
        size_t next = last + 1;
        while (next < tokens.size() && tokens[next].type == Type::Comment) {
            ++next;
        }
        if (next < tokens.size() &&
            (tokens[next].type == Type::Newline || tokens[next].type == Type::EndMarker)) {
            for (size_t k = t; k <= last; ++k) {
                removed.emplace_back(tokens[k].begin, tokens[k].end);
            }
        }
        t = last;
    }

    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    for (const auto& [begin, end] : removed) {
        out.append(text, cursor, begin - cursor);
        for (size_t k = begin; k < end; ++k) {
            if (text[k] == '\n') {
                out += '\n';
            }
        }
        cursor = end;
    }
    out.append(text, cursor, std::string::npos);
    return out;
}

std::string CommentStripper::stripPythonLines(const std::string& text) {
    return mapLines(text, [](const std::string& line) -> std::string {
        const std::string trimmed = leftTrim(line);
        if (!trimmed.empty() && trimmed[0] == '#') {
            return "";
        }
        const size_t hash = line.find('#');
        return hash == std::string::npos ? line : line.substr(0, hash);
    });
}
