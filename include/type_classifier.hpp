#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "language_tag.hpp"

namespace fs = std::filesystem;

class TypeClassifier {
public:
    // Resolve the tag of a path from its name alone; never opens the file.
    // License names win over extensions, unknown extensions give Other.
    static LanguageTag classify(const fs::path& filePath);

    // Tag for a lower-case extension with leading dot, Other if unknown
    static LanguageTag tagForExtension(const std::string& ext);

    // True for file names reported as License
    static bool isLicenseName(const std::string& lowerName);

    // Tags whose files contribute to code line/char statistics
    static bool isCodeCounted(LanguageTag tag);

    // Ordered tag -> extensions definitions the lookup table is built from
    static const std::vector<std::pair<LanguageTag, std::vector<std::string>>>& definitions();

private:
    static const std::unordered_map<std::string, LanguageTag>& extensionTable();
};
