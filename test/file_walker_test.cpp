#include <catch2/catch_test_macros.hpp>
#include "file_walker.hpp"
#include "test_utils.hpp"
#include <algorithm>
#include <stdexcept>

TEST_CASE("FileWalker collects files in sorted order", "[FileWalker]") {
    fs::path tempDir = makeTempDir("projstats_walker_test");

    createTestFile(tempDir / "b.py", "print(1)\n");
    createTestFile(tempDir / "a.cpp", "int x;\n");
    createTestFile(tempDir / "sub" / "c.h", "#pragma once\n");
    createTestFile(tempDir / "node_modules" / "lib" / "x.js", "x\n");
    createTestFile(tempDir / ".hidden" / "secret.txt", "s\n");
    createTestFile(tempDir / ".env", "KEY=1\n");
    createTestFile(tempDir / "debug.log", "log\n");

    SECTION("Default filter prunes ignored and hidden entries") {
        IgnoreFilter filter;
        FileWalker walker(tempDir, filter);

        auto files = walker.collect();
        REQUIRE(files == std::vector<fs::path>{
            tempDir / "a.cpp",
            tempDir / "b.py",
            tempDir / "sub" / "c.h"
        });
    }

    SECTION("Hidden and default-ignored entries can be included") {
        IgnoreFilter filter;
        filter.setNoIgnore(true);
        filter.setIncludeHidden(true);
        FileWalker walker(tempDir, filter);

        auto files = walker.collect();
        REQUIRE(files.size() == 7);
        REQUIRE(std::is_sorted(files.begin(), files.end()));
    }

    SECTION("User patterns prune directories") {
        IgnoreFilter filter;
        filter.addPattern("sub/");
        FileWalker walker(tempDir, filter);

        auto files = walker.collect();
        REQUIRE(files == std::vector<fs::path>{tempDir / "a.cpp", tempDir / "b.py"});
    }

    SECTION("Invalid roots are rejected") {
        IgnoreFilter filter;
        REQUIRE_THROWS_AS(FileWalker(tempDir / "missing", filter), std::runtime_error);
        REQUIRE_THROWS_AS(FileWalker(tempDir / "a.cpp", filter), std::runtime_error);
    }

    fs::remove_all(tempDir);
}
