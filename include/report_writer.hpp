#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "stats_analyzer.hpp"

struct ReportOptions {
    bool countAssets = false;  // include the asset section
    bool detail = false;       // per-extension and per-sub-kind breakdowns
    bool listFiles = false;    // include the relative file list
};

// Renders an AnalyzeResult as a console/log report, Markdown, JSON or HTML
class ReportWriter {
public:
    ReportWriter(const AnalyzeResult& result, const ReportOptions& options);

    std::string renderText() const;
    std::string renderMarkdown() const;

    // JSON document, 2-space indentation
    std::string renderJson() const;

    // Standalone page with summary cards and tables; the JSON document is
    // embedded in a <script type="application/json" id="projstats-data"> block
    std::string renderHtml() const;

    static std::string escapeHtml(const std::string& text);

    // 1234567 -> "1,234,567"
    static std::string formatInt(uint64_t value);

    // 1536 -> "1.50 KB"; plain bytes have no decimals
    static std::string formatBytes(uint64_t bytes);

    // 5.25 -> "  5.2%" (one decimal, width 5)
    static std::string formatPercent(double percent);

private:
    const AnalyzeResult& result_;
    ReportOptions options_;

    // Code rows by lines descending, then key
    std::vector<std::pair<LanguageTag, CodeStat>> sortedCodeRows() const;
    // File counts by count descending, then key
    std::vector<std::pair<LanguageTag, uint64_t>> sortedFileCounts() const;
    // Asset rows by bytes descending, then key
    std::vector<std::pair<AssetCategory, AssetStat>> sortedAssetRows() const;

    std::string absoluteRoot() const;

    nlohmann::json toJson() const;
};
