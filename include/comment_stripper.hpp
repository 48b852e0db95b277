#pragma once

#include <string>
#include "language_tag.hpp"

// Removes comments from decoded source text. Code and string literals are
// copied byte-for-byte; removed blocks leave their line breaks behind.
class CommentStripper {
public:
    // Grammar families; one scanner each
    enum class Grammar {
        CLike,       // "//", "/* */", '...', "...", `...`
        Markup,      // <!-- -->
        HashLine,    // "#", '...', "..."
        Ini,         // whole-line ";" and "#"
        Sql,         // "--", "/* */", '' escapes
        PowerShell,  // "#", "<# #>", '' and ` escapes
        Lua,         // "--", "--[==[ ]==]", long strings
        Python,      // token based, drops docstrings too
        Batch,       // REM and ::
        None         // no stripping
    };

    // Grammar used for a tag; None for data formats without comments
    static Grammar grammarFor(LanguageTag tag);

    // Strip comments of `text` using the grammar of `tag`. Never throws;
    // unsupported tags return the text unchanged.
    static std::string strip(LanguageTag tag, const std::string& text);
    static std::string strip(Grammar grammar, const std::string& text);

    static std::string stripCLike(const std::string& text);
    static std::string stripMarkup(const std::string& text);
    static std::string stripHashLine(const std::string& text);
    static std::string stripIni(const std::string& text);
    static std::string stripSql(const std::string& text);
    static std::string stripPowerShell(const std::string& text);
    static std::string stripLua(const std::string& text);
    static std::string stripBatch(const std::string& text);

    // Drops comments and docstring-shaped strings. Falls back to
    // stripPythonLines() when the source cannot be tokenized.
    static std::string stripPython(const std::string& text);

    // Line based fallback for Python: blanks lines starting with '#' and
    // cuts other lines at their first '#'. Not aware of strings.
    static std::string stripPythonLines(const std::string& text);
};
