#include "asset_classifier.hpp"
#include "binary_sniffer.hpp"
#include "file_utils.hpp"
#include <stdexcept>
#include <unordered_set>

namespace {

using ExtensionSet = std::unordered_set<std::string>;

const ExtensionSet BACKUP_EXTS = {".bak", ".old", ".orig", ".tmp", ".swp", ".~"};

const std::vector<std::string> LIVE2D_JSON_SUFFIXES = {
    ".model3.json", ".motion3.json", ".physics3.json", ".pose3.json",
    ".cdi3.json", ".exp3.json", ".cubism.json"
};

const ExtensionSet LIVE2D_BINARY_EXTS = {".moc3", ".moc"};

const ExtensionSet SPINE_EXTS = {".spine", ".skel", ".atlas"};

const ExtensionSet ADOBE_EXTS = {
    // Photoshop, brushes, actions, swatches, styles, patterns, gradients
    ".psd", ".psb", ".psdt", ".abr", ".atn", ".aco", ".ase", ".asl", ".pat", ".grd",
    // Illustrator
    ".ai", ".ait",
    // InDesign
    ".indd", ".idml", ".indt",
    // After Effects, Premiere, Audition, Lightroom, XD
    ".aep", ".aet", ".prproj", ".sesx", ".lrcat", ".xd",
    // Animate
    ".fla", ".xfl"
};

const ExtensionSet ART_SOURCE_EXTS = {
    ".clip", ".cmc",        // Clip Studio Paint
    ".sai", ".sai2",        // SAI
    ".kra", ".krz",         // Krita
    ".ase", ".aseprite",    // Aseprite
    ".procreate",
    ".ora",                 // OpenRaster
    ".mdp"                  // FireAlpaca / MediBang
};

const ExtensionSet DAW_EXTS = {
    ".flp", ".cpr", ".npr", ".als", ".logic", ".logicx", ".rpp", ".song",
    ".ptx", ".ptf", ".reason",
    // Scores
    ".mscz", ".mscx", ".sib", ".mus", ".musx",
    // Vocal synthesis
    ".vsqx", ".vpr", ".ust", ".svp"
};

const ExtensionSet VIDEO_EDIT_EXTS = {".veg", ".veg-bak", ".drp", ".fcpxml", ".edl"};

const ExtensionSet DESIGN_EXTS = {
    ".xmind", ".mm", ".km", ".fountain", ".fdx", ".articy",
    ".twee", ".tw", ".drawio", ".axure", ".rp"
};

const ExtensionSet MOBILE_PACKAGE_EXTS = {
    ".apk", ".aab", ".xapk", ".obb", ".ipa", ".app", ".so", ".dex"
};

const ExtensionSet ROM_EXTS = {
    ".nes", ".sfc", ".smc", ".gba", ".gbc", ".gb", ".nds", ".3ds", ".cia",
    ".nsp", ".xci", ".iso", ".wbfs", ".gcm", ".cso", ".n64", ".z64"
};

// .flv is also a video extension; Flash is checked first
const ExtensionSet FLASH_EXTS = {".swf", ".fla", ".flv"};

// .dat is also a game archive extension; saves are checked first
const ExtensionSet GAME_SAVE_EXTS = {
    ".sav", ".save", ".rpgsave", ".sol", ".dat", ".osr", ".srm", ".state"
};

const ExtensionSet AUDIO_MIDDLEWARE_EXTS = {
    ".bnk", ".pck",             // Wwise
    ".acb", ".awb",             // CRI ADX2
    ".fsb", ".fev", ".bank",    // FMOD
    ".wem", ".sab", ".sob"
};

const ExtensionSet GAME_ARCHIVE_EXTS = {
    ".pak", ".cpk", ".arc", ".bfa", ".bin", ".dat", ".cat", ".idx",
    ".assets", ".bundle", ".vpk", ".rgss3a", ".rgss2a", ".rgssad",
    ".xp3", ".npk", ".kpk", ".asar", ".bsp", ".wad"
};

const ExtensionSet TEXTURE_EXTS = {
    ".dds", ".ktx", ".ktx2", ".pvr", ".astc", ".pkm", ".atc", ".tex", ".mat",
    ".assetbundle", ".vtf", ".vmt"
};

const ExtensionSet IMAGE_EXTS = {
    ".png", ".jpg", ".jpeg", ".gif", ".webp", ".bmp", ".tiff", ".ico", ".svg",
    ".tga", ".exr", ".hdr", ".tif", ".heic", ".raw"
};

const ExtensionSet VIDEO_EXTS = {
    ".mp4", ".mkv", ".mov", ".avi", ".webm", ".wmv", ".flv", ".m4v", ".ogv", ".ts", ".3gp"
};

const ExtensionSet AUDIO_EXTS = {
    ".mp3", ".wav", ".flac", ".aac", ".ogg", ".m4a", ".opus", ".wma", ".mid",
    ".midi", ".aiff", ".caf", ".m4b"
};

const ExtensionSet MODEL3D_EXTS = {
    ".fbx", ".obj", ".gltf", ".glb", ".dae", ".3ds", ".blend", ".stl", ".ply",
    ".usd", ".usdz", ".abc", ".x", ".mqo", ".pmx", ".pmd", ".vmd", ".vpd",
    ".ma", ".mb", ".max", ".c4d"
};

const ExtensionSet OFFICE_EXTS = {
    ".xlsx", ".xls", ".xlsm", ".xlsb", ".docx", ".doc", ".pptx", ".ppt", ".ppsx", ".pps"
};

const ExtensionSet PDF_EXTS = {".pdf"};

const ExtensionSet ARCHIVE_EXTS = {
    ".zip", ".7z", ".rar", ".gz", ".tar", ".bz2", ".xz", ".iso", ".img", ".dmg", ".cab"
};

const ExtensionSet FONT_EXTS = {".woff", ".woff2", ".ttf", ".otf", ".eot", ".ttc"};

AssetClassifier::Rule extensionRule(AssetCategory category, const ExtensionSet& extensions) {
    return {category, [&extensions](const std::string&, const std::string& ext) -> std::optional<std::string> {
        if (extensions.count(ext) > 0) {
            return ext;
        }
        return std::nullopt;
    }};
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const std::vector<AssetClassifier::Rule>& AssetClassifier::rules() {
    static const std::vector<Rule> chain = {
        // Backups keep the previous suffix so "model.fbx.bak" reads ".fbx.bak"
        {AssetCategory::Backup, [](const std::string& name, const std::string& ext) -> std::optional<std::string> {
            if (BACKUP_EXTS.count(ext) == 0) {
                return std::nullopt;
            }
            return FileUtils::suffix(FileUtils::stem(name)) + ext;
        }},
        // Live2D json files are matched on the whole multi-part suffix
        {AssetCategory::Live2D, [](const std::string& name, const std::string&) -> std::optional<std::string> {
            for (const auto& suffix : LIVE2D_JSON_SUFFIXES) {
                if (endsWith(name, suffix)) {
                    return suffix;
                }
            }
            return std::nullopt;
        }},
        extensionRule(AssetCategory::Live2D, LIVE2D_BINARY_EXTS),
        extensionRule(AssetCategory::Spine, SPINE_EXTS),
        extensionRule(AssetCategory::Adobe, ADOBE_EXTS),
        extensionRule(AssetCategory::ArtSource, ART_SOURCE_EXTS),
        extensionRule(AssetCategory::Daw, DAW_EXTS),
        extensionRule(AssetCategory::VideoEdit, VIDEO_EDIT_EXTS),
        extensionRule(AssetCategory::Design, DESIGN_EXTS),
        extensionRule(AssetCategory::MobilePackage, MOBILE_PACKAGE_EXTS),
        extensionRule(AssetCategory::Rom, ROM_EXTS),
        extensionRule(AssetCategory::Flash, FLASH_EXTS),
        extensionRule(AssetCategory::GameSave, GAME_SAVE_EXTS),
        extensionRule(AssetCategory::AudioMiddleware, AUDIO_MIDDLEWARE_EXTS),
        extensionRule(AssetCategory::GameArchive, GAME_ARCHIVE_EXTS),
        extensionRule(AssetCategory::Texture, TEXTURE_EXTS),
        extensionRule(AssetCategory::Image, IMAGE_EXTS),
        extensionRule(AssetCategory::Video, VIDEO_EXTS),
        extensionRule(AssetCategory::Audio, AUDIO_EXTS),
        extensionRule(AssetCategory::Model3D, MODEL3D_EXTS),
        extensionRule(AssetCategory::Office, OFFICE_EXTS),
        extensionRule(AssetCategory::Pdf, PDF_EXTS),
        extensionRule(AssetCategory::Archive, ARCHIVE_EXTS),
        extensionRule(AssetCategory::Font, FONT_EXTS)
    };
    return chain;
}

std::optional<AssetKind> AssetClassifier::classifyByName(const fs::path& filePath) {
    const std::string name = FileUtils::lowerName(filePath);
    const std::string ext = FileUtils::suffix(name);

    for (const auto& rule : rules()) {
        if (auto subKind = rule.match(name, ext)) {
            return AssetKind{rule.category, *subKind};
        }
    }
    return std::nullopt;
}

std::optional<AssetKind> AssetClassifier::classify(const fs::path& filePath) {
    if (auto kind = classifyByName(filePath)) {
        return kind;
    }

    // Anything else that looks binary is still a resource
    if (BinarySniffer::isBinary(filePath)) {
        return AssetKind{AssetCategory::OtherAsset, FileUtils::extOrPlaceholder(filePath)};
    }

    return std::nullopt;
}

const std::vector<AssetCategory>& AssetClassifier::all() {
    static const std::vector<AssetCategory> categories = {
        AssetCategory::Image, AssetCategory::Texture, AssetCategory::Video,
        AssetCategory::Audio, AssetCategory::AudioMiddleware, AssetCategory::Daw,
        AssetCategory::Adobe, AssetCategory::ArtSource, AssetCategory::Live2D,
        AssetCategory::Spine, AssetCategory::Model3D, AssetCategory::GameModel,
        AssetCategory::GameArchive, AssetCategory::GameSave, AssetCategory::Design,
        AssetCategory::MobilePackage, AssetCategory::Rom, AssetCategory::Flash,
        AssetCategory::VideoEdit, AssetCategory::Office, AssetCategory::Pdf,
        AssetCategory::Archive, AssetCategory::Font, AssetCategory::Backup,
        AssetCategory::OtherAsset
    };
    return categories;
}

std::string AssetClassifier::toString(AssetCategory category) {
    switch (category) {
        case AssetCategory::Image:           return "image";
        case AssetCategory::Texture:         return "texture";
        case AssetCategory::Video:           return "video";
        case AssetCategory::Audio:           return "audio";
        case AssetCategory::AudioMiddleware: return "audio_middleware";
        case AssetCategory::Daw:             return "daw";
        case AssetCategory::Adobe:           return "adobe";
        case AssetCategory::ArtSource:       return "art_source";
        case AssetCategory::Live2D:          return "live2d";
        case AssetCategory::Spine:           return "spine";
        case AssetCategory::Model3D:         return "model3d";
        case AssetCategory::GameModel:       return "game_model";
        case AssetCategory::GameArchive:     return "game_archive";
        case AssetCategory::GameSave:        return "game_save";
        case AssetCategory::Design:          return "design";
        case AssetCategory::MobilePackage:   return "mobile_package";
        case AssetCategory::Rom:             return "rom";
        case AssetCategory::Flash:           return "flash";
        case AssetCategory::VideoEdit:       return "video_edit";
        case AssetCategory::Office:          return "office";
        case AssetCategory::Pdf:             return "pdf";
        case AssetCategory::Archive:         return "archive";
        case AssetCategory::Font:            return "font";
        case AssetCategory::Backup:          return "backup";
        case AssetCategory::OtherAsset:      return "other_asset";
    }
    throw std::runtime_error("Unknown asset category value");
}

AssetCategory AssetClassifier::fromString(const std::string& key) {
    for (const auto category : all()) {
        if (toString(category) == key) {
            return category;
        }
    }
    throw std::runtime_error("Unsupported asset category: " + key);
}

std::string AssetClassifier::label(AssetCategory category) {
    switch (category) {
        case AssetCategory::Image:           return "Images";
        case AssetCategory::Texture:         return "Textures";
        case AssetCategory::Video:           return "Videos";
        case AssetCategory::Audio:           return "Audio";
        case AssetCategory::AudioMiddleware: return "Audio middleware";
        case AssetCategory::Daw:             return "DAW projects/scores";
        case AssetCategory::Adobe:           return "Adobe projects";
        case AssetCategory::ArtSource:       return "Painting sources";
        case AssetCategory::Live2D:          return "Live2D models";
        case AssetCategory::Spine:           return "Spine animations";
        case AssetCategory::Model3D:         return "3D models";
        case AssetCategory::GameModel:       return "Engine models";
        case AssetCategory::GameArchive:     return "Game archives";
        case AssetCategory::GameSave:        return "Game saves";
        case AssetCategory::Design:          return "Design/mind maps";
        case AssetCategory::MobilePackage:   return "Mobile packages";
        case AssetCategory::Rom:             return "ROM images";
        case AssetCategory::Flash:           return "Flash files";
        case AssetCategory::VideoEdit:       return "Video edit projects";
        case AssetCategory::Office:          return "Office documents";
        case AssetCategory::Pdf:             return "PDF documents";
        case AssetCategory::Archive:         return "Archives";
        case AssetCategory::Font:            return "Fonts";
        case AssetCategory::Backup:          return "Backups";
        case AssetCategory::OtherAsset:      return "Other assets";
    }
    throw std::runtime_error("Unknown asset category value");
}
