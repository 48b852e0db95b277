#include "stats_analyzer.hpp"
#include "binary_sniffer.hpp"
#include "comment_stripper.hpp"
#include "file_utils.hpp"
#include "file_walker.hpp"
#include "line_counter.hpp"
#include "text_decoder.hpp"
#include "type_classifier.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>
#include <utility>

uint64_t AnalyzeResult::codeFiles() const {
    uint64_t total = 0;
    for (const auto& [tag, stat] : codeStats) {
        total += stat.files;
    }
    return total;
}

uint64_t AnalyzeResult::codeLines() const {
    uint64_t total = 0;
    for (const auto& [tag, stat] : codeStats) {
        total += stat.codeLines;
    }
    return total;
}

uint64_t AnalyzeResult::codeChars() const {
    uint64_t total = 0;
    for (const auto& [tag, stat] : codeStats) {
        total += stat.codeChars;
    }
    return total;
}

StatsAnalyzer::StatsAnalyzer(const fs::path& root, const AnalyzeOptions& options,
                             const IgnoreFilter& filter)
    : root_(root), options_(options), filter_(filter) {
}

AnalyzeResult StatsAnalyzer::analyzeDirectory(const ProgressCallback& progress) {
    FileWalker walker(root_, filter_);
    return analyze(walker.collect(), progress);
}

AnalyzeResult StatsAnalyzer::analyze(const std::vector<fs::path>& files,
                                     const ProgressCallback& progress) {
    AnalyzeResult result;
    result.root = root_;

    std::vector<std::string> fileList;

    for (const auto& filePath : files) {
        if (stopRequested_.load()) {
            result.cancelled = true;
            break;
        }

        if (progress) {
            progress(filePath);
        }

        if (options_.needFileList) {
            fileList.push_back(relativeName(filePath));
        }

        processFile(filePath, result);
    }

    if (options_.needFileList) {
        std::sort(fileList.begin(), fileList.end());
        result.fileList = std::move(fileList);
    }

    return result;
}

void StatsAnalyzer::processFile(const fs::path& filePath, AnalyzeResult& result) const {
    if (!BinarySniffer::isBinary(filePath)) {
        const LanguageTag tag = TypeClassifier::classify(filePath);
        result.fileCounts[tag] += 1;
        result.fileTypeExtCounts[tag][FileUtils::extOrPlaceholder(filePath)] += 1;
        result.totalFiles += 1;

        if (TypeClassifier::isCodeCounted(tag)) {
            countCode(filePath, tag, result);
        }
    }

    if (options_.countAssets) {
        countAsset(filePath, result);
    }
}

void StatsAnalyzer::countCode(const fs::path& filePath, LanguageTag tag, AnalyzeResult& result) const {
    try {
        const std::string text = TextDecoder::readFile(filePath);
        const std::string stripped = CommentStripper::strip(tag, text);
        const LineCount count = LineCounter::count(stripped);

        CodeStat& stat = result.codeStats[tag];
        stat.files += 1;
        stat.codeLines += count.lines;
        stat.codeChars += count.chars;
    } catch (const std::exception& e) {
        // Leaves the file out of the code statistics only
        if (options_.verbose) {
            std::cerr << "Warning: Skipping " << filePath.string() << ": " << e.what() << std::endl;
        }
    }
}

void StatsAnalyzer::countAsset(const fs::path& filePath, AnalyzeResult& result) const {
    const auto kind = AssetClassifier::classify(filePath);
    if (!kind) {
        return;
    }

    std::error_code ec;
    uintmax_t size = fs::file_size(filePath, ec);
    if (ec) {
        size = 0;
    }

    AssetStat& stat = result.assetStats[kind->category];
    stat.files += 1;
    stat.bytes += size;
    result.assetTotalFiles += 1;
    result.assetTotalBytes += size;
    result.assetSubKindCounts[kind->category][kind->subKind] += 1;
}

std::string StatsAnalyzer::relativeName(const fs::path& filePath) const {
    fs::path relative = filePath.lexically_relative(root_);
    if (relative.empty() || *relative.begin() == "..") {
        // Paths given in another form than the root, e.g. absolute vs relative
        std::error_code ec;
        const fs::path canonicalFile = fs::weakly_canonical(filePath, ec);
        const fs::path canonicalRoot = ec ? fs::path() : fs::weakly_canonical(root_, ec);
        relative = ec ? fs::path() : canonicalFile.lexically_relative(canonicalRoot);
    }
    if (relative.empty() || *relative.begin() == "..") {
        return filePath.generic_string();
    }
    return relative.generic_string();
}
