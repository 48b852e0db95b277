#include "report_writer.hpp"
#include "percentage_normalizer.hpp"
#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const std::string RULE(80, '-');
const std::string BANNER(80, '=');

// Count descending, then key ascending
template <typename Key>
std::vector<std::pair<std::string, uint64_t>> sortedCounts(const std::map<Key, uint64_t>& counts) {
    std::vector<std::pair<std::string, uint64_t>> rows(counts.begin(), counts.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });
    return rows;
}

} // namespace

ReportWriter::ReportWriter(const AnalyzeResult& result, const ReportOptions& options)
    : result_(result), options_(options) {
}

std::string ReportWriter::formatInt(uint64_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    const size_t lead = digits.size() % 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i - lead) % 3 == 0) {
            out += ',';
        }
        out += digits[i];
    }
    return out;
}

std::string ReportWriter::formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t unitCount = sizeof(units) / sizeof(units[0]);

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < unitCount) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream ss;
    if (unit == 0) {
        ss << bytes << " B";
    } else {
        ss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    }
    return ss.str();
}

std::string ReportWriter::formatPercent(double percent) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << std::setw(5) << percent << "%";
    return ss.str();
}

std::vector<std::pair<LanguageTag, CodeStat>> ReportWriter::sortedCodeRows() const {
    std::vector<std::pair<LanguageTag, CodeStat>> rows(result_.codeStats.begin(), result_.codeStats.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        if (a.second.codeLines != b.second.codeLines) {
            return a.second.codeLines > b.second.codeLines;
        }
        return LanguageTags::toString(a.first) < LanguageTags::toString(b.first);
    });
    return rows;
}

std::vector<std::pair<LanguageTag, uint64_t>> ReportWriter::sortedFileCounts() const {
    std::vector<std::pair<LanguageTag, uint64_t>> rows(result_.fileCounts.begin(), result_.fileCounts.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return LanguageTags::toString(a.first) < LanguageTags::toString(b.first);
    });
    return rows;
}

std::vector<std::pair<AssetCategory, AssetStat>> ReportWriter::sortedAssetRows() const {
    std::vector<std::pair<AssetCategory, AssetStat>> rows(result_.assetStats.begin(), result_.assetStats.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        if (a.second.bytes != b.second.bytes) {
            return a.second.bytes > b.second.bytes;
        }
        return AssetClassifier::toString(a.first) < AssetClassifier::toString(b.first);
    });
    return rows;
}

std::string ReportWriter::absoluteRoot() const {
    std::error_code ec;
    const fs::path absolute = fs::weakly_canonical(result_.root, ec);
    return ec ? result_.root.string() : absolute.string();
}

// Console and log file report. Sections, in order: file type counts, the
// optional style-sheet extension breakdown, the optional file list, the
// optional asset table, asset totals, then the code table with normalized
// percentages.
std::string ReportWriter::renderText() const {
    std::ostringstream ss;

    ss << "File type statistics:\n";
    ss << RULE << "\n";
    for (const auto& [tag, count] : sortedFileCounts()) {
        if (count == 0) {
            continue;
        }
        ss << "   " << LanguageTags::fileLabel(tag) << ": " << count << "\n";
    }
    ss << "   Total files: " << result_.totalFiles << "\n";

    if (options_.detail) {
        std::map<std::string, uint64_t> merged;
        uint64_t totalStyle = 0;
        for (const LanguageTag tag : {LanguageTag::CSS, LanguageTag::SCSS, LanguageTag::Less}) {
            const auto it = result_.fileTypeExtCounts.find(tag);
            if (it == result_.fileTypeExtCounts.end()) {
                continue;
            }
            for (const auto& [ext, count] : it->second) {
                merged[ext] += count;
                totalStyle += count;
            }
        }

        if (totalStyle > 0) {
            ss << "\n";
            ss << "Breakdown by extension:\n";
            ss << RULE << "\n";
            ss << "   Style sheets (CSS/SCSS/Less): " << totalStyle << "\n";
            for (const auto& [ext, count] : sortedCounts(merged)) {
                ss << "      " << ext << ": " << count << "\n";
            }
        }
    }

    if (options_.listFiles && result_.fileList && !result_.fileList->empty()) {
        ss << "\n";
        ss << BANNER << "\n";
        ss << "--- File list (relative to project root)\n";
        ss << BANNER << "\n";
        ss << "Root: " << absoluteRoot() << "\n";
        ss << "Files: " << result_.fileList->size() << "\n";
        ss << RULE << "\n";
        for (const auto& name : *result_.fileList) {
            ss << name << "\n";
        }
    }

    if (options_.countAssets) {
        ss << "\n";
        ss << BANNER << "\n";
        ss << "[+] Asset / non-code file statistics\n";
        ss << BANNER << "\n";
        ss << "\n";

        for (const auto& [category, stat] : sortedAssetRows()) {
            ss << "   " << std::left << std::setw(14) << AssetClassifier::label(category) << std::right
               << ": " << std::setw(6) << stat.files << " files, "
               << std::setw(12) << formatBytes(stat.bytes) << "\n";

            if (options_.detail) {
                const auto it = result_.assetSubKindCounts.find(category);
                if (it != result_.assetSubKindCounts.end()) {
                    for (const auto& [subKind, count] : sortedCounts(it->second)) {
                        ss << "      " << subKind << ": " << count << "\n";
                    }
                }
            }
        }
        ss << "\n";
    }

    ss << "   [+] Asset files: " << result_.assetTotalFiles << ", total size "
       << formatBytes(result_.assetTotalBytes) << "\n";
    ss << "   [+] All project files (including assets): "
       << result_.totalFiles + result_.assetTotalFiles << "\n";

    ss << "\n";
    ss << BANNER << "\n";
    ss << "--- Code statistics (blank lines and comments excluded)\n";
    ss << BANNER << "\n";
    ss << "\n";

    const auto rows = sortedCodeRows();
    std::vector<uint64_t> lineValues;
    std::vector<uint64_t> charValues;
    for (const auto& [tag, stat] : rows) {
        lineValues.push_back(stat.codeLines);
        charValues.push_back(stat.codeChars);
    }
    const uint64_t totalLines = result_.codeLines();
    const uint64_t totalChars = result_.codeChars();
    const auto linePercents = PercentageNormalizer::normalize(lineValues, totalLines);
    const auto charPercents = PercentageNormalizer::normalize(charValues, totalChars);

    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& [tag, stat] = rows[i];
        ss << "   " << std::left << std::setw(10) << LanguageTags::codeLabel(tag) << std::right << ":"
           << " " << std::setw(4) << stat.files << " files,"
           << " " << std::setw(8) << formatInt(stat.codeLines) << " lines (" << formatPercent(linePercents[i]) << "),"
           << " " << std::setw(10) << formatInt(stat.codeChars) << " chars (" << formatPercent(charPercents[i]) << ")"
           << "\n";
    }

    ss << "\n";
    ss << "   [+] Total: " << result_.codeFiles() << " files, " << formatInt(totalLines)
       << " lines of code, " << formatInt(totalChars) << " characters\n";

    if (result_.cancelled) {
        ss << "\n";
        ss << "   [!] Scan cancelled, results are partial\n";
    }

    return ss.str();
}

std::string ReportWriter::renderMarkdown() const {
    std::ostringstream ss;

    ss << "## Project Size\n";
    ss << "\n";
    ss << "### Files\n";
    ss << "\n";
    ss << "- **Total files**: " << formatInt(result_.totalFiles + result_.assetTotalFiles) << "\n";
    for (const auto& [tag, count] : sortedFileCounts()) {
        if (count == 0) {
            continue;
        }
        ss << "  - " << LanguageTags::fileLabel(tag) << ": " << count << "\n";
    }

    ss << "\n";
    ss << "### Code\n";
    ss << "\n";

    const auto rows = sortedCodeRows();
    std::vector<uint64_t> lineValues;
    std::vector<uint64_t> charValues;
    for (const auto& [tag, stat] : rows) {
        lineValues.push_back(stat.codeLines);
        charValues.push_back(stat.codeChars);
    }
    const uint64_t totalLines = result_.codeLines();
    const uint64_t totalChars = result_.codeChars();
    const auto linePercents = PercentageNormalizer::normalize(lineValues, totalLines);
    const auto charPercents = PercentageNormalizer::normalize(charValues, totalChars);

    ss << "- **Lines of code**: " << formatInt(totalLines) << " (blank lines and comments excluded)\n";
    for (size_t i = 0; i < rows.size(); ++i) {
        ss << "  - " << LanguageTags::codeLabel(rows[i].first) << ": " << formatInt(rows[i].second.codeLines)
           << " lines (" << formatPercent(linePercents[i]) << ")\n";
    }

    ss << "\n";
    ss << "- **Characters**: " << formatInt(totalChars) << " (comments excluded)\n";
    for (size_t i = 0; i < rows.size(); ++i) {
        ss << "  - " << LanguageTags::codeLabel(rows[i].first) << ": " << formatInt(rows[i].second.codeChars)
           << " chars (" << formatPercent(charPercents[i]) << ")\n";
    }

    if (result_.assetTotalFiles > 0) {
        ss << "\n";
        ss << "### Assets\n";
        ss << "\n";
        ss << "- **Asset files**: " << result_.assetTotalFiles << "\n";
        ss << "- **Asset size**: " << formatBytes(result_.assetTotalBytes) << "\n";
        for (const auto& [category, stat] : sortedAssetRows()) {
            ss << "  - " << AssetClassifier::label(category) << ": " << stat.files << " files, "
               << formatBytes(stat.bytes) << "\n";
        }
    }

    return ss.str();
}

json ReportWriter::toJson() const {
    json report;

    const auto rows = sortedCodeRows();
    std::vector<uint64_t> lineValues;
    std::vector<uint64_t> charValues;
    for (const auto& [tag, stat] : rows) {
        lineValues.push_back(stat.codeLines);
        charValues.push_back(stat.codeChars);
    }
    const auto linePercents = PercentageNormalizer::normalize(lineValues, result_.codeLines());
    const auto charPercents = PercentageNormalizer::normalize(charValues, result_.codeChars());

    report["root"] = absoluteRoot();
    report["totalFiles"] = result_.totalFiles + result_.assetTotalFiles;
    report["textFiles"] = result_.totalFiles;
    report["totalCodeFiles"] = result_.codeFiles();
    report["totalCodeLines"] = result_.codeLines();
    report["totalCodeChars"] = result_.codeChars();
    report["totalAssetFiles"] = result_.assetTotalFiles;
    report["totalAssetBytes"] = result_.assetTotalBytes;
    report["cancelled"] = result_.cancelled;

    json fileCountsJson = json::object();
    for (const auto& [tag, count] : result_.fileCounts) {
        fileCountsJson[LanguageTags::toString(tag)] = count;
    }
    report["fileCounts"] = fileCountsJson;

    json codeJson = json::array();
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& [tag, stat] = rows[i];
        json row;
        row["name"] = LanguageTags::toString(tag);
        row["label"] = LanguageTags::codeLabel(tag);
        row["files"] = stat.files;
        row["lines"] = stat.codeLines;
        row["chars"] = stat.codeChars;
        row["linePercent"] = linePercents[i];
        row["charPercent"] = charPercents[i];
        codeJson.push_back(row);
    }
    report["codeStats"] = codeJson;

    json assetJson = json::array();
    for (const auto& [category, stat] : sortedAssetRows()) {
        json row;
        row["category"] = AssetClassifier::toString(category);
        row["name"] = AssetClassifier::label(category);
        row["files"] = stat.files;
        row["bytes"] = stat.bytes;

        json subKinds = json::object();
        const auto it = result_.assetSubKindCounts.find(category);
        if (it != result_.assetSubKindCounts.end()) {
            for (const auto& [subKind, count] : it->second) {
                subKinds[subKind] = count;
            }
        }
        row["subKinds"] = subKinds;
        assetJson.push_back(row);
    }
    report["assetStats"] = assetJson;

    if (result_.fileList) {
        report["fileList"] = *result_.fileList;
    }

    return report;
}

std::string ReportWriter::renderJson() const {
    return toJson().dump(2);
}

std::string ReportWriter::escapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string ReportWriter::renderHtml() const {
    const json data = toJson();

    // "</" would end the data block early
    std::string embedded = data.dump();
    for (size_t pos = embedded.find("</"); pos != std::string::npos; pos = embedded.find("</", pos + 3)) {
        embedded.replace(pos, 2, "<\\/");
    }

    std::ostringstream ss;
    ss << "<!DOCTYPE html>\n"
       << "<html lang=\"en\">\n"
       << "<head>\n"
       << "<meta charset=\"UTF-8\">\n"
       << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
       << "<title>Project statistics</title>\n"
       << "<style>\n"
       << "body { font-family: -apple-system, \"Segoe UI\", Roboto, Arial, sans-serif; background: #f4f6f8;"
          " color: #2c3e50; margin: 0; padding: 20px; }\n"
       << ".container { max-width: 1200px; margin: 0 auto; }\n"
       << "h1 { text-align: center; }\n"
       << ".dashboard { display: grid; grid-template-columns: repeat(auto-fit, minmax(200px, 1fr)); gap: 20px; }\n"
       << ".card, section { background: #fff; padding: 20px; border-radius: 8px; margin-bottom: 20px;"
          " box-shadow: 0 2px 12px rgba(0,0,0,0.05); }\n"
       << ".card { text-align: center; }\n"
       << ".card h3 { margin: 0 0 10px; font-size: 14px; color: #7f8c8d; text-transform: uppercase; }\n"
       << ".card .num { font-size: 32px; font-weight: bold; color: #3498db; }\n"
       << "table { width: 100%; border-collapse: collapse; }\n"
       << "th, td { padding: 6px 8px; border-bottom: 1px solid #eee; text-align: right; }\n"
       << "th:first-child, td:first-child { text-align: left; }\n"
       << ".bar { background: #3498db; height: 10px; border-radius: 2px; }\n"
       << "</style>\n"
       << "</head>\n"
       << "<body>\n"
       << "<div class=\"container\">\n"
       << "<h1>Project statistics</h1>\n"
       << "<p>Root: <code>" << escapeHtml(data["root"].get<std::string>()) << "</code></p>\n";

    if (result_.cancelled) {
        ss << "<p><strong>Scan cancelled, results are partial.</strong></p>\n";
    }

    ss << "<div class=\"dashboard\">\n"
       << "<div class=\"card\"><h3>Files</h3><div class=\"num\">"
       << formatInt(data["totalFiles"].get<uint64_t>()) << "</div></div>\n"
       << "<div class=\"card\"><h3>Code files</h3><div class=\"num\">"
       << formatInt(data["totalCodeFiles"].get<uint64_t>()) << "</div></div>\n"
       << "<div class=\"card\"><h3>Lines of code</h3><div class=\"num\">"
       << formatInt(data["totalCodeLines"].get<uint64_t>()) << "</div></div>\n"
       << "<div class=\"card\"><h3>Asset size</h3><div class=\"num\">"
       << formatBytes(data["totalAssetBytes"].get<uint64_t>()) << "</div></div>\n"
       << "</div>\n";

    ss << "<section>\n<h2>Code</h2>\n<table id=\"code-stats\">\n"
       << "<tr><th>Language</th><th>Files</th><th>Lines</th><th>%</th><th>Chars</th><th>%</th><th></th></tr>\n";
    for (const auto& row : data["codeStats"]) {
        const double linePercent = row["linePercent"].get<double>();
        ss << "<tr><td>" << escapeHtml(row["label"].get<std::string>()) << "</td>"
           << "<td>" << formatInt(row["files"].get<uint64_t>()) << "</td>"
           << "<td>" << formatInt(row["lines"].get<uint64_t>()) << "</td>"
           << "<td>" << formatPercent(linePercent) << "</td>"
           << "<td>" << formatInt(row["chars"].get<uint64_t>()) << "</td>"
           << "<td>" << formatPercent(row["charPercent"].get<double>()) << "</td>"
           << "<td style=\"width: 30%\"><div class=\"bar\" style=\"width: " << std::fixed
           << std::setprecision(1) << linePercent << "%\"></div></td></tr>\n";
    }
    ss << "</table>\n</section>\n";

    ss << "<section>\n<h2>Files</h2>\n<table id=\"file-counts\">\n"
       << "<tr><th>Type</th><th>Files</th></tr>\n";
    for (const auto& [tag, count] : sortedFileCounts()) {
        if (count == 0) {
            continue;
        }
        ss << "<tr><td>" << escapeHtml(LanguageTags::fileLabel(tag)) << "</td><td>" << formatInt(count)
           << "</td></tr>\n";
    }
    ss << "</table>\n</section>\n";

    if (!data["assetStats"].empty()) {
        ss << "<section>\n<h2>Assets</h2>\n<table id=\"asset-stats\">\n"
           << "<tr><th>Category</th><th>Files</th><th>Size</th></tr>\n";
        for (const auto& row : data["assetStats"]) {
            ss << "<tr><td>" << escapeHtml(row["name"].get<std::string>()) << "</td>"
               << "<td>" << formatInt(row["files"].get<uint64_t>()) << "</td>"
               << "<td>" << formatBytes(row["bytes"].get<uint64_t>()) << "</td></tr>\n";
        }
        ss << "</table>\n</section>\n";
    }

    ss << "</div>\n"
       << "<script type=\"application/json\" id=\"projstats-data\">" << embedded << "</script>\n"
       << "</body>\n"
       << "</html>\n";

    return ss.str();
}
