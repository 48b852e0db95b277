#pragma once

#include <filesystem>
#include <vector>
#include "ignore_filter.hpp"

namespace fs = std::filesystem;

// Recursively lists the regular files under a root that survive an
// IgnoreFilter, in sorted order
class FileWalker {
public:
    // Throws std::runtime_error if `root` is missing or not a directory
    FileWalker(const fs::path& root, const IgnoreFilter& filter);

    std::vector<fs::path> collect() const;

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    const IgnoreFilter& filter_;
};
