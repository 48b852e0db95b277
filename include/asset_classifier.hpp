#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Non-code resource categories
enum class AssetCategory {
    Image,
    Texture,
    Video,
    Audio,
    AudioMiddleware,
    Daw,
    Adobe,
    ArtSource,
    Live2D,
    Spine,
    Model3D,
    GameModel,
    GameArchive,
    GameSave,
    Design,
    MobilePackage,
    Rom,
    Flash,
    VideoEdit,
    Office,
    Pdf,
    Archive,
    Font,
    Backup,
    OtherAsset
};

// Category plus a finer sub-kind, usually the extension
struct AssetKind {
    AssetCategory category;
    std::string subKind;

    bool operator==(const AssetKind& other) const {
        return category == other.category && subKind == other.subKind;
    }
};

class AssetClassifier {
public:
    // One step of the resolution chain. match() receives the lower-case
    // file name and suffix and returns the sub-kind when the rule applies.
    struct Rule {
        AssetCategory category;
        std::function<std::optional<std::string>(const std::string& name,
                                                 const std::string& ext)> match;
    };

    // Walks rules() in order and returns the first match. With no match,
    // binary files fall back to OtherAsset and text files give nullopt.
    static std::optional<AssetKind> classify(const fs::path& filePath);

    // Rule chain only, without the binary fallback
    static std::optional<AssetKind> classifyByName(const fs::path& filePath);

    // The ordered rule chain; most specific categories come first
    static const std::vector<Rule>& rules();

    // Stable key ("image", "audio_middleware", ...)
    static std::string toString(AssetCategory category);

    // Inverse of toString, throws std::runtime_error on unknown keys
    static AssetCategory fromString(const std::string& key);

    // Human readable label for reports
    static std::string label(AssetCategory category);

    // All categories in declaration order
    static const std::vector<AssetCategory>& all();
};
