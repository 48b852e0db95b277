#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>
#include <unordered_set>

namespace fs = std::filesystem;

// Decides which directories and files a scan skips. Default lists cover
// VCS/IDE/build directories and generated report files; user patterns
// (globs with *, ? and **) come from --exclude or an ignore file.
class IgnoreFilter {
public:
    IgnoreFilter();

    // Disable the default directory, file and pattern lists. User patterns
    // still apply.
    void setNoIgnore(bool noIgnore) { noIgnore_ = noIgnore; }
    bool noIgnore() const { return noIgnore_; }

    // Keep entries whose name starts with a dot
    void setIncludeHidden(bool includeHidden) { includeHidden_ = includeHidden; }
    bool includeHidden() const { return includeHidden_; }

    // Add one user pattern. A trailing '/' restricts it to directories; a
    // pattern containing '/' is matched against the root-relative path,
    // otherwise against the entry name.
    void addPattern(const std::string& pattern);

    // Add patterns from a comma-separated string (e.g., "*.min.js,vendor/")
    void addPatterns(const std::string& patternsStr);

    // Load patterns from an ignore file, one per line; '#' comments and
    // blank lines are skipped. Throws std::runtime_error if unreadable.
    void loadIgnoreFile(const fs::path& ignorePath);

    // Whether the walker should descend into a directory. `relativePath`
    // is relative to the scan root.
    bool isIgnoredDirectory(const fs::path& relativePath) const;

    // Whether a regular file is left out of the scan
    bool isIgnoredFile(const fs::path& relativePath) const;

    const std::vector<std::string>& userPatterns() const { return userGlobs_; }

    static const std::unordered_set<std::string>& defaultIgnoredDirs();
    static const std::unordered_set<std::string>& defaultIgnoredFiles();
    static const std::vector<std::string>& defaultPatterns();

    // Glob to anchored, case-insensitive regex
    static std::regex globToRegex(const std::string& glob);

private:
    struct Pattern {
        std::regex regex;
        bool matchPath = false;      // contains '/', match the relative path
        bool directoryOnly = false;  // written with a trailing '/'
    };

    bool noIgnore_ = false;
    bool includeHidden_ = false;
    std::vector<Pattern> defaultFilePatterns_;
    std::vector<Pattern> userPatterns_;
    std::vector<std::string> userGlobs_;

    static Pattern compile(const std::string& glob);
    static bool matches(const Pattern& pattern, const std::string& name, const std::string& path);
    static bool isHidden(const std::string& name);
    static std::vector<std::string> splitPatternString(const std::string& patternsStr);
    static std::string trim(const std::string& s);
};
