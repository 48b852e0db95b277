#include "file_walker.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>

FileWalker::FileWalker(const fs::path& root, const IgnoreFilter& filter)
    : root_(root), filter_(filter) {
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        throw std::runtime_error("Path does not exist: " + root_.string());
    }
    if (!fs::is_directory(root_, ec)) {
        throw std::runtime_error("Path is not a directory: " + root_.string());
    }
}

std::vector<fs::path> FileWalker::collect() const {
    std::vector<fs::path> files;
    files.reserve(1000);

    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Failed to open directory " + root_.string() + ": " + ec.message());
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            // Unreadable entry; keep walking its siblings
            ec.clear();
            continue;
        }

        const fs::directory_entry& entry = *it;
        const fs::path relative = entry.path().lexically_relative(root_);

        std::error_code statEc;
        if (entry.is_symlink(statEc) && entry.is_directory(statEc)) {
            it.disable_recursion_pending();
            continue;
        }
        if (entry.is_directory(statEc)) {
            if (filter_.isIgnoredDirectory(relative)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file(statEc) && !filter_.isIgnoredFile(relative)) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}
