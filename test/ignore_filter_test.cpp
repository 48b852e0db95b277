#include <catch2/catch_test_macros.hpp>
#include "ignore_filter.hpp"
#include "test_utils.hpp"
#include <stdexcept>

TEST_CASE("IgnoreFilter default lists", "[IgnoreFilter]") {
    IgnoreFilter filter;

    SECTION("Default directories are pruned") {
        REQUIRE(filter.isIgnoredDirectory("node_modules"));
        REQUIRE(filter.isIgnoredDirectory("web/node_modules"));
        REQUIRE(filter.isIgnoredDirectory("build"));
        REQUIRE(filter.isIgnoredDirectory("__pycache__"));
        REQUIRE(filter.isIgnoredDirectory(".git"));
        REQUIRE_FALSE(filter.isIgnoredDirectory("src"));
        REQUIRE_FALSE(filter.isIgnoredDirectory("src/builder"));
    }

    SECTION("Generated reports and logs are skipped") {
        REQUIRE(filter.isIgnoredFile("projstats_report.json"));
        REQUIRE(filter.isIgnoredFile("out/weekly_stats_report2.html"));
        REQUIRE(filter.isIgnoredFile("server.log"));
        REQUIRE(filter.isIgnoredFile("logs/SERVER.LOG"));
        REQUIRE_FALSE(filter.isIgnoredFile("src/main.cpp"));
        REQUIRE_FALSE(filter.isIgnoredFile("README.md"));
    }

    SECTION("Hidden entries are skipped unless requested") {
        REQUIRE(filter.isIgnoredFile(".env"));
        REQUIRE(filter.isIgnoredDirectory(".github"));

        filter.setIncludeHidden(true);
        REQUIRE_FALSE(filter.isIgnoredFile(".env"));
        REQUIRE_FALSE(filter.isIgnoredDirectory(".github"));
        // Still in the default lists
        REQUIRE(filter.isIgnoredDirectory(".git"));
        REQUIRE(filter.isIgnoredFile(".DS_Store"));
    }

    SECTION("noIgnore disables the default lists") {
        filter.setNoIgnore(true);
        REQUIRE_FALSE(filter.isIgnoredDirectory("node_modules"));
        REQUIRE_FALSE(filter.isIgnoredFile("server.log"));
        // Hidden rule is separate
        REQUIRE(filter.isIgnoredDirectory(".git"));
    }
}

TEST_CASE("IgnoreFilter user patterns", "[IgnoreFilter]") {
    IgnoreFilter filter;

    SECTION("Comma-separated patterns") {
        filter.addPatterns("*.min.js, docs/ ,,");
        REQUIRE(filter.userPatterns().size() == 2);
        REQUIRE(filter.isIgnoredFile("static/app.min.js"));
        REQUIRE_FALSE(filter.isIgnoredFile("static/app.js"));
        REQUIRE(filter.isIgnoredDirectory("docs"));
        // Directory-only pattern
        REQUIRE_FALSE(filter.isIgnoredFile("docs"));
    }

    SECTION("Patterns with a slash match the relative path") {
        filter.addPattern("src/gen/**");
        filter.addPattern("**/fixtures/*.json");
        REQUIRE(filter.isIgnoredFile("src/gen/a/b.cpp"));
        REQUIRE_FALSE(filter.isIgnoredFile("src/main.cpp"));
        REQUIRE(filter.isIgnoredFile("a/b/fixtures/x.json"));
        REQUIRE(filter.isIgnoredFile("fixtures/x.json"));
        REQUIRE_FALSE(filter.isIgnoredFile("fixtures/deep/x.json"));
    }

    SECTION("User patterns apply with noIgnore") {
        filter.setNoIgnore(true);
        filter.addPattern("*.tmp");
        REQUIRE(filter.isIgnoredFile("a.tmp"));
    }

    SECTION("Question mark matches one character") {
        const auto regex = IgnoreFilter::globToRegex("file?.txt");
        REQUIRE(std::regex_match("file1.txt", regex));
        REQUIRE(std::regex_match("FILE1.TXT", regex));
        REQUIRE_FALSE(std::regex_match("file10.txt", regex));
        REQUIRE_FALSE(std::regex_match("file1_txt", regex));
    }
}

TEST_CASE("IgnoreFilter loads ignore files", "[IgnoreFilter]") {
    fs::path tempDir = makeTempDir("projstats_ignore_test");
    createTestFile(tempDir / ".statsignore", "# comment\n\n  *.tmp  \nvendor/\n");

    IgnoreFilter filter;
    filter.loadIgnoreFile(tempDir / ".statsignore");
    REQUIRE(filter.userPatterns() == std::vector<std::string>{"*.tmp", "vendor/"});
    REQUIRE(filter.isIgnoredFile("cache/x.tmp"));
    REQUIRE(filter.isIgnoredDirectory("third/vendor"));

    REQUIRE_THROWS_AS(filter.loadIgnoreFile(tempDir / "missing"), std::runtime_error);

    fs::remove_all(tempDir);
}
