#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <CLI/CLI.hpp>
#include "ignore_filter.hpp"
#include "report_writer.hpp"
#include "stats_analyzer.hpp"

namespace {

// Analyzer the SIGINT handler asks to stop; set only while a scan runs
std::atomic<StatsAnalyzer*> activeAnalyzer{nullptr};

extern "C" void handleInterrupt(int) {
    StatsAnalyzer* analyzer = activeAnalyzer.load();
    if (analyzer != nullptr) {
        analyzer->stop();
    }
}

bool writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return false;
    }
    out << content;
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char** argv) {
    try {
        CLI::App app{"projstats - Count files, code lines and asset sizes of a project"};

        std::string rootStr = ".";
        AnalyzeOptions analyzeOptions;
        ReportOptions reportOptions;
        bool noIgnore = false;
        bool includeHidden = false;
        bool markdown = false;
        bool showTiming = false;
        std::string excludePatterns;
        std::string ignoreFile;
        std::string logFile;
        std::string jsonFile;
        std::string htmlFile;

        app.add_option("path", rootStr, "Project root directory (default: current directory)");

        app.add_flag("--assets", reportOptions.countAssets,
                     "Also count non-code files (images, audio, video, models, documents, ...)");
        app.add_flag("--detail", reportOptions.detail, "Show per-extension breakdowns");
        app.add_flag("--list-files", reportOptions.listFiles, "List every file relative to the root");

        app.add_flag("--no-ignore", noIgnore, "Do not skip common directories (.git, node_modules, ...)");
        app.add_flag("--include-hidden", includeHidden, "Include hidden files and directories");
        app.add_option("--exclude", excludePatterns,
                       "Comma-separated list of glob patterns to exclude (e.g. *.min.js,vendor/)");
        app.add_option("--ignore-file", ignoreFile, "File with one exclude pattern per line")
            ->check(CLI::ExistingFile);

        app.add_option("--log", logFile, "Also write the report to a file (default: projstats.log)")
            ->expected(0, 1)
            ->default_str("projstats.log");
        app.add_flag("--markdown", markdown, "Print a Markdown summary for README files");
        app.add_option("--json", jsonFile, "Write a JSON report (default: projstats_report.json)")
            ->expected(0, 1)
            ->default_str("projstats_report.json");
        app.add_option("--html", htmlFile, "Write an HTML report (default: projstats_report.html)")
            ->expected(0, 1)
            ->default_str("projstats_report.html");

        app.add_flag("-v,--verbose", analyzeOptions.verbose, "Enable verbose output");
        app.add_flag("-t,--timing", showTiming, "Show timing information");

        CLI11_PARSE(app, argc, argv);

        const bool writeLog = app.count("--log") > 0;
        const bool writeJson = app.count("--json") > 0;
        if (writeLog && logFile.empty()) {
            logFile = "projstats.log";
        }
        if (writeJson && jsonFile.empty()) {
            jsonFile = "projstats_report.json";
        }
        const bool writeHtml = app.count("--html") > 0;
        if (writeHtml && htmlFile.empty()) {
            htmlFile = "projstats_report.html";
        }

        const fs::path root(rootStr);
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            std::cerr << "Error: Path does not exist or is not a directory: " << root.string() << std::endl;
            return 2;
        }

        IgnoreFilter filter;
        filter.setNoIgnore(noIgnore);
        filter.setIncludeHidden(includeHidden);
        filter.addPatterns(excludePatterns);
        if (!ignoreFile.empty()) {
            filter.loadIgnoreFile(ignoreFile);
        }

        analyzeOptions.countAssets = reportOptions.countAssets;
        analyzeOptions.needFileList = reportOptions.listFiles;

        StatsAnalyzer analyzer(root, analyzeOptions, filter);

        if (analyzeOptions.verbose) {
            std::cout << "Processing directory: " << root.string() << std::endl;
        }

        auto startTime = std::chrono::steady_clock::now();

        activeAnalyzer = &analyzer;
        std::signal(SIGINT, handleInterrupt);

        AnalyzeResult result;
        try {
            result = analyzer.analyzeDirectory([&](const fs::path& filePath) {
                if (analyzeOptions.verbose) {
                    std::cout << "  " << filePath.string() << std::endl;
                }
            });
        } catch (const std::runtime_error& e) {
            std::signal(SIGINT, SIG_DFL);
            activeAnalyzer = nullptr;
            std::cerr << "Error: " << e.what() << std::endl;
            return 2;
        }

        std::signal(SIGINT, SIG_DFL);
        activeAnalyzer = nullptr;

        auto endTime = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

        ReportWriter writer(result, reportOptions);
        const std::string report = writer.renderText();
        std::cout << report;

        if (showTiming) {
            std::cout << std::endl;
            std::cout << "Timing Information:" << std::endl;
            std::cout << "- Scan time: " << duration.count() << " ms" << std::endl;
            if (duration.count() > 0) {
                const double filesPerSecond =
                    static_cast<double>(result.totalFiles + result.assetTotalFiles) / (duration.count() / 1000.0);
                std::cout << "- " << static_cast<uint64_t>(filesPerSecond) << " files/second" << std::endl;
            }
        }

        if (writeLog) {
            if (writeFile(logFile, report)) {
                std::cout << "[+] Report saved to " << logFile << std::endl;
            } else {
                std::cerr << "Warning: Failed to write log file " << logFile << std::endl;
            }
        }

        if (writeJson) {
            if (writeFile(jsonFile, writer.renderJson())) {
                std::cout << "[+] JSON report written to " << jsonFile << std::endl;
            } else {
                std::cerr << "Warning: Failed to write JSON report " << jsonFile << std::endl;
            }
        }

        if (writeHtml) {
            if (writeFile(htmlFile, writer.renderHtml())) {
                std::cout << "[+] HTML report written to " << htmlFile << std::endl;
            } else {
                std::cerr << "Warning: Failed to write HTML report " << htmlFile << std::endl;
            }
        }

        if (markdown) {
            const std::string banner(80, '=');
            std::cout << std::endl;
            std::cout << banner << std::endl;
            std::cout << "Markdown (ready to paste into README.md)" << std::endl;
            std::cout << banner << std::endl;
            std::cout << std::endl;
            std::cout << writer.renderMarkdown() << std::endl;
            std::cout << banner << std::endl;
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
