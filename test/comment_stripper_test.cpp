#include <catch2/catch_test_macros.hpp>
#include "comment_stripper.hpp"
#include "line_counter.hpp"
#include <string>

using Grammar = CommentStripper::Grammar;

TEST_CASE("CommentStripper dispatches by tag", "[CommentStripper]") {
    REQUIRE(CommentStripper::grammarFor(LanguageTag::Cpp) == Grammar::CLike);
    REQUIRE(CommentStripper::grammarFor(LanguageTag::Kirikiri) == Grammar::CLike);
    REQUIRE(CommentStripper::grammarFor(LanguageTag::XML) == Grammar::Markup);
    REQUIRE(CommentStripper::grammarFor(LanguageTag::YAML) == Grammar::HashLine);
    REQUIRE(CommentStripper::grammarFor(LanguageTag::INI) == Grammar::Ini);
    REQUIRE(CommentStripper::grammarFor(LanguageTag::Lua) == Grammar::Lua);
    REQUIRE(CommentStripper::grammarFor(LanguageTag::Batch) == Grammar::Batch);
    REQUIRE(CommentStripper::grammarFor(LanguageTag::JSON) == Grammar::None);
    REQUIRE(CommentStripper::grammarFor(LanguageTag::Markdown) == Grammar::None);

    // Formats without comment syntax come back untouched
    REQUIRE(CommentStripper::strip(LanguageTag::JSON, "{\"a\": \"// b\"} // c") == "{\"a\": \"// b\"} // c");
    REQUIRE(CommentStripper::strip(LanguageTag::Other, "# keep") == "# keep");
}

TEST_CASE("Comment-only sources have no code lines", "[CommentStripper]") {
    struct Case {
        LanguageTag tag;
        std::string text;
    };
    const Case cases[] = {
        {LanguageTag::Cpp, "// one\n\n/* two\n   three */\n"},
        {LanguageTag::HTML, "<!-- a -->\n<!--\n b\n-->\n"},
        {LanguageTag::Shell, "#!/bin/sh\n# comment\n\n"},
        {LanguageTag::INI, "; comment\n# another\n\n"},
        {LanguageTag::SQL, "-- a\n/* b\n c */\n"},
        {LanguageTag::PowerShell, "# a\n<# b\n c #>\n"},
        {LanguageTag::Lua, "-- a\n--[[ b\n c ]]\n--[==[\n]==]\n"},
        {LanguageTag::Python, "# a\n\n# b\n"},
        {LanguageTag::Batch, "REM a\n:: b\n\n"},
    };

    for (const auto& c : cases) {
        const std::string stripped = CommentStripper::strip(c.tag, c.text);
        REQUIRE(LineCounter::count(stripped).lines == 0);
        REQUIRE(stripped.size() <= c.text.size());
    }
}

TEST_CASE("C-like grammar", "[CommentStripper]") {
    SECTION("Line and block comments keep line breaks") {
        const std::string in = "int a = 1; // c\nint b; /* x\ny */ int c;\n";
        REQUIRE(CommentStripper::stripCLike(in) == "int a = 1; \nint b; \n int c;\n");
    }

    SECTION("Delimiters inside strings survive") {
        REQUIRE(CommentStripper::stripCLike("x = \"a // b\";") == "x = \"a // b\";");
        REQUIRE(CommentStripper::stripCLike("url = 'http://x/*y*/';") == "url = 'http://x/*y*/';");
        REQUIRE(CommentStripper::stripCLike("t = `/* ${a} */`;") == "t = `/* ${a} */`;");
    }

    SECTION("Escaped quotes do not end the string") {
        const std::string in = "s = \"a\\\"//b\"; // gone";
        REQUIRE(CommentStripper::stripCLike(in) == "s = \"a\\\"//b\"; ");
    }

    SECTION("A quote of the other kind does not close") {
        const std::string in = "c = \"it's // here\"; // gone";
        REQUIRE(CommentStripper::stripCLike(in) == "c = \"it's // here\"; ");
    }

    SECTION("Block comments do not nest") {
        REQUIRE(CommentStripper::stripCLike("a /* b /* c */ d */") == "a  d */");
    }
}

TEST_CASE("Markup grammar", "[CommentStripper]") {
    REQUIRE(CommentStripper::stripMarkup("<p>x</p><!-- c\nd -->\n") == "<p>x</p>\n\n");
    REQUIRE(CommentStripper::stripMarkup("<a href=\"#\">y</a>") == "<a href=\"#\">y</a>");
}

TEST_CASE("Hash-line grammar", "[CommentStripper]") {
    REQUIRE(CommentStripper::stripHashLine("echo '#not' # yes\n") == "echo '#not' \n");
    REQUIRE(CommentStripper::stripHashLine("s = \"a\\\"#b\" # c\nx\n") == "s = \"a\\\"#b\" \nx\n");
}

TEST_CASE("INI grammar only blanks whole-line comments", "[CommentStripper]") {
    const std::string in = "; c\nkey = a;b\n  # x\nurl = x#y\n";
    REQUIRE(CommentStripper::stripIni(in) == "\nkey = a;b\n\nurl = x#y\n");
}

TEST_CASE("SQL grammar", "[CommentStripper]") {
    SECTION("Doubled quotes stay inside the literal") {
        const std::string in = "SELECT 'it''s -- not' FROM t; -- c\n/* b */SELECT 1;";
        REQUIRE(CommentStripper::stripSql(in) == "SELECT 'it''s -- not' FROM t; \nSELECT 1;");
    }

    SECTION("Escaped literal closes properly") {
        REQUIRE(CommentStripper::stripSql("x = 'it''s' -- c") == "x = 'it''s' ");
    }
}

TEST_CASE("PowerShell grammar", "[CommentStripper]") {
    const std::string in = "$a = 'it''s # no' # c\n<# block\n#>\n$b = \"`\"#x\"\n";
    REQUIRE(CommentStripper::stripPowerShell(in) == "$a = 'it''s # no' \n\n\n$b = \"`\"#x\"\n");
}

TEST_CASE("Lua grammar", "[CommentStripper]") {
    SECTION("Matching equals counts close a block comment") {
        REQUIRE(CommentStripper::stripLua("--[==[ c\n]==] y = 2") == "\n y = 2");
    }

    SECTION("A mismatched closing bracket keeps the comment open") {
        REQUIRE(CommentStripper::stripLua("--[==[ c ]=] still\n]==] y = 2") == "\n y = 2");
        REQUIRE(CommentStripper::stripLua("--[==[ c ]=] x = 1\n") == "\n");
    }

    SECTION("Long strings are kept verbatim") {
        const std::string in = "local s = [==[ a ]] -- ]==] x = 1\n";
        REQUIRE(CommentStripper::stripLua(in) == in);
    }

    SECTION("Line comments") {
        REQUIRE(CommentStripper::stripLua("x = 1 -- c\n") == "x = 1 \n");
        REQUIRE(CommentStripper::stripLua("--[ not long\nx") == "\nx");
        REQUIRE(CommentStripper::stripLua("s = \"a -- b\" -- c") == "s = \"a -- b\" ");
    }

    SECTION("Escaped quotes do not end the string") {
        REQUIRE(CommentStripper::stripLua("s = \"a\\\"-- b\" -- c") == "s = \"a\\\"-- b\" ");
        REQUIRE(CommentStripper::stripLua("s = 'it\\'s -- x' -- c\n") == "s = 'it\\'s -- x' \n");
    }
}

TEST_CASE("Batch grammar", "[CommentStripper]") {
    const std::string in = "@echo off\nREM comment\n  rem another\nrem\n:: label comment\nremark.exe\necho hi\n";
    REQUIRE(CommentStripper::stripBatch(in) == "@echo off\n\n\n\n\nremark.exe\necho hi\n");
}

TEST_CASE("Python grammar", "[CommentStripper]") {
    SECTION("Docstrings go, assigned strings stay") {
        const std::string in =
            "\"\"\"Module doc.\"\"\"\n"
            "import os\n"
            "\n"
            "x = \"config\"\n"
            "\n"
            "\n"
            "def f():\n"
            "    \"\"\"Function doc.\n"
            "    More.\n"
            "    \"\"\"\n"
            "    return x  # trailing\n";
        const std::string expected =
            "\n"
            "import os\n"
            "\n"
            "x = \"config\"\n"
            "\n"
            "\n"
            "def f():\n"
            "    \n"
            "\n"
            "\n"
            "    return x  \n";
        const std::string out = CommentStripper::stripPython(in);
        REQUIRE(out == expected);
        REQUIRE(LineCounter::count(out).lines == 4);
    }

    SECTION("Class docstrings after a comment line") {
        const std::string in = "class A:\n    # note\n    'doc'\n    y = 1\n";
        REQUIRE(CommentStripper::stripPython(in) == "class A:\n    \n    \n    y = 1\n");
    }

    SECTION("Bare strings later in a block are kept") {
        const std::string afterStatement = "def f():\n    x = 1\n    \"note\"\n    return x\n";
        REQUIRE(CommentStripper::stripPython(afterStatement) == afterStatement);
        REQUIRE(LineCounter::count(CommentStripper::stripPython(afterStatement)).lines == 4);

        const std::string afterDedent = "def f():\n    pass\n\"trailing\"\n";
        REQUIRE(CommentStripper::stripPython(afterDedent) == afterDedent);

        const std::string afterImport = "import os\n\"not a docstring\"\n";
        REQUIRE(CommentStripper::stripPython(afterImport) == afterImport);
    }

    SECTION("Strings used in expressions are kept") {
        REQUIRE(CommentStripper::stripPython("print(\"# not\")\n") == "print(\"# not\")\n");
        REQUIRE(CommentStripper::stripPython("\"a\" + x\n") == "\"a\" + x\n");
        REQUIRE(CommentStripper::stripPython("\"a\" \"b\"\n") == " \n");
    }

    SECTION("Untokenizable source uses the line fallback") {
        const std::string in = "s = \"\"\"unterminated\n# comment\nx = 1  # c\n";
        REQUIRE(CommentStripper::stripPython(in) == "s = \"\"\"unterminated\n\nx = 1  \n");
        REQUIRE(CommentStripper::stripPythonLines("  # a\nb # c") == "\nb ");
    }
}
