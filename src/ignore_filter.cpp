#include "ignore_filter.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

IgnoreFilter::IgnoreFilter() {
    for (const auto& glob : defaultPatterns()) {
        defaultFilePatterns_.push_back(compile(glob));
    }
}

const std::unordered_set<std::string>& IgnoreFilter::defaultIgnoredDirs() {
    static const std::unordered_set<std::string> dirs = {
        ".git", ".hg", ".svn", ".idea", ".vscode", ".cursor",
        "node_modules", "dist", "build", "out", ".next", ".nuxt",
        ".cache", "coverage", "__pycache__", ".venv", "venv"
    };
    return dirs;
}

const std::unordered_set<std::string>& IgnoreFilter::defaultIgnoredFiles() {
    static const std::unordered_set<std::string> files = {
        ".ds_store"
    };
    return files;
}

// Reports written by this tool, and logs
const std::vector<std::string>& IgnoreFilter::defaultPatterns() {
    static const std::vector<std::string> patterns = {
        "projstats_report*",
        "*_stats_report*.html",
        "*.log"
    };
    return patterns;
}

void IgnoreFilter::addPattern(const std::string& pattern) {
    const std::string trimmed = trim(pattern);
    if (trimmed.empty()) {
        return;
    }
    userGlobs_.push_back(trimmed);
    userPatterns_.push_back(compile(trimmed));
}

void IgnoreFilter::addPatterns(const std::string& patternsStr) {
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addPattern(pattern);
    }
}

void IgnoreFilter::loadIgnoreFile(const fs::path& ignorePath) {
    std::ifstream file(ignorePath);
    if (!file) {
        throw std::runtime_error("Failed to open ignore file: " + ignorePath.string());
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }
        addPattern(line);
    }
}

bool IgnoreFilter::isIgnoredDirectory(const fs::path& relativePath) const {
    const std::string name = relativePath.filename().string();
    if (!includeHidden_ && isHidden(name)) {
        return true;
    }
    if (!noIgnore_ && defaultIgnoredDirs().count(name) > 0) {
        return true;
    }

    const std::string path = relativePath.generic_string();
    return std::any_of(userPatterns_.begin(), userPatterns_.end(), [&](const Pattern& pattern) {
        return matches(pattern, name, path);
    });
}

bool IgnoreFilter::isIgnoredFile(const fs::path& relativePath) const {
    const std::string name = relativePath.filename().string();
    if (!includeHidden_ && isHidden(name)) {
        return true;
    }

    const std::string path = relativePath.generic_string();
    if (!noIgnore_) {
        if (defaultIgnoredFiles().count(FileUtils::toLower(name)) > 0) {
            return true;
        }
        for (const auto& pattern : defaultFilePatterns_) {
            if (matches(pattern, name, path)) {
                return true;
            }
        }
    }

    for (const auto& pattern : userPatterns_) {
        if (!pattern.directoryOnly && matches(pattern, name, path)) {
            return true;
        }
    }
    return false;
}

IgnoreFilter::Pattern IgnoreFilter::compile(const std::string& glob) {
    Pattern pattern;
    std::string body = glob;
    if (body.size() > 1 && body.back() == '/') {
        pattern.directoryOnly = true;
        body.pop_back();
    }
    if (body.size() > 1 && body.front() == '/') {
        // Anchored at the scan root
        body.erase(0, 1);
        pattern.matchPath = true;
    }
    if (body.find('/') != std::string::npos) {
        pattern.matchPath = true;
    }
    pattern.regex = globToRegex(body);
    return pattern;
}

bool IgnoreFilter::matches(const Pattern& pattern, const std::string& name, const std::string& path) {
    return std::regex_match(pattern.matchPath ? path : name, pattern.regex);
}

bool IgnoreFilter::isHidden(const std::string& name) {
    return !name.empty() && name[0] == '.' && name != "." && name != "..";
}

std::regex IgnoreFilter::globToRegex(const std::string& glob) {
    std::string regexStr = "^";

    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];

        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    // **/ matches any directory depth, including none
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    regexStr += ".*";
                    ++i;
                }
            } else {
                // * stops at directory separators
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' ||
                   c == '}' || c == '+' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }

    regexStr += "$";
    return std::regex(regexStr, std::regex::ECMAScript | std::regex::icase);
}

std::vector<std::string> IgnoreFilter::splitPatternString(const std::string& patternsStr) {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        pattern = trim(pattern);
        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}

std::string IgnoreFilter::trim(const std::string& s) {
    std::string out = s;
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
    out.erase(std::find_if(out.rbegin(), out.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), out.end());
    return out;
}
