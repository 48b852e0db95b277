#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "asset_classifier.hpp"
#include "ignore_filter.hpp"
#include "language_tag.hpp"

namespace fs = std::filesystem;

struct CodeStat {
    uint64_t files = 0;
    uint64_t codeLines = 0;
    uint64_t codeChars = 0;
};

struct AssetStat {
    uint64_t files = 0;
    uint64_t bytes = 0;
};

// Snapshot of one scan
struct AnalyzeResult {
    fs::path root;
    uint64_t totalFiles = 0;                                // non-binary files seen
    std::map<LanguageTag, uint64_t> fileCounts;
    std::map<LanguageTag, CodeStat> codeStats;
    std::map<AssetCategory, AssetStat> assetStats;
    std::map<LanguageTag, std::map<std::string, uint64_t>> fileTypeExtCounts;
    std::map<AssetCategory, std::map<std::string, uint64_t>> assetSubKindCounts;
    uint64_t assetTotalFiles = 0;
    uint64_t assetTotalBytes = 0;
    std::optional<std::vector<std::string>> fileList;      // root-relative, sorted
    bool cancelled = false;

    uint64_t codeFiles() const;
    uint64_t codeLines() const;
    uint64_t codeChars() const;
};

struct AnalyzeOptions {
    bool countAssets = false;   // classify every file into asset categories
    bool needFileList = false;  // collect the relative path of every file
    bool verbose = false;       // report per-file failures on stderr
};

// Called with each path before it is processed
using ProgressCallback = std::function<void(const fs::path&)>;

class StatsAnalyzer {
public:
    StatsAnalyzer(const fs::path& root, const AnalyzeOptions& options,
                  const IgnoreFilter& filter = IgnoreFilter());

    // Scan an explicit list of files. Stops early, with
    // result.cancelled set, once stop() has been called.
    AnalyzeResult analyze(const std::vector<fs::path>& files,
                          const ProgressCallback& progress = nullptr);

    // Walk the root with the ignore filter and scan what it yields.
    // Throws std::runtime_error if the root is not a directory.
    AnalyzeResult analyzeDirectory(const ProgressCallback& progress = nullptr);

    // Request cancellation. Safe from any thread and from signal handlers.
    void stop() { stopRequested_.store(true); }
    bool stopRequested() const { return stopRequested_.load(); }

    const fs::path& root() const { return root_; }
    const AnalyzeOptions& options() const { return options_; }

private:
    fs::path root_;
    AnalyzeOptions options_;
    IgnoreFilter filter_;
    std::atomic<bool> stopRequested_{false};

    void processFile(const fs::path& filePath, AnalyzeResult& result) const;
    void countCode(const fs::path& filePath, LanguageTag tag, AnalyzeResult& result) const;
    void countAsset(const fs::path& filePath, AnalyzeResult& result) const;
    std::string relativeName(const fs::path& filePath) const;
};
