#include "type_classifier.hpp"
#include "file_utils.hpp"

const std::vector<std::pair<LanguageTag, std::vector<std::string>>>& TypeClassifier::definitions() {
    static const std::vector<std::pair<LanguageTag, std::vector<std::string>>> defs = {
        // Web / markup / data
        {LanguageTag::JavaScript, {".js", ".mjs", ".cjs"}},
        {LanguageTag::TypeScript, {".ts", ".tsx", ".mts", ".cts"}},
        {LanguageTag::HTML, {".html", ".htm", ".xhtml"}},
        {LanguageTag::CSS, {".css"}},
        {LanguageTag::SCSS, {".scss", ".sass"}},
        {LanguageTag::Less, {".less"}},
        {LanguageTag::JSON, {".json", ".json5", ".jsonc"}},
        {LanguageTag::YAML, {".yml", ".yaml"}},
        {LanguageTag::XML, {".xml", ".xsl", ".xslt", ".svg", ".xaml"}},
        {LanguageTag::TOML, {".toml"}},
        {LanguageTag::INI, {".ini", ".cfg", ".conf", ".editorconfig", ".properties", ".prefs"}},
        {LanguageTag::Markdown, {".md", ".markdown", ".mdown", ".mkd"}},
        // C family / compiled
        {LanguageTag::C, {".c", ".h"}},
        {LanguageTag::Cpp, {".cc", ".cpp", ".cxx", ".hpp", ".hh", ".hxx", ".inl", ".inc"}},
        {LanguageTag::CSharp, {".cs", ".csx"}},
        {LanguageTag::ObjectiveC, {".m", ".mm"}},
        {LanguageTag::Java, {".java", ".jav", ".jsp"}},
        {LanguageTag::Kotlin, {".kt", ".kts"}},
        {LanguageTag::Swift, {".swift"}},
        {LanguageTag::Go, {".go"}},
        {LanguageTag::Rust, {".rs", ".rlib"}},
        {LanguageTag::Dart, {".dart"}},
        {LanguageTag::Scala, {".scala", ".sc"}},
        // Scripting
        {LanguageTag::Python, {".py", ".pyw", ".pyi"}},
        {LanguageTag::Ruby, {".rb", ".rake", ".gemspec"}},
        {LanguageTag::PHP, {".php", ".phtml", ".php3", ".php4", ".php5", ".phps"}},
        {LanguageTag::Perl, {".pl", ".pm", ".t"}},
        {LanguageTag::Lua, {".lua"}},
        {LanguageTag::R, {".r", ".rmd"}},
        {LanguageTag::SQL, {".sql", ".ddl", ".dml"}},
        {LanguageTag::Shell, {".sh", ".bash", ".zsh", ".fish", ".ksh"}},
        {LanguageTag::PowerShell, {".ps1", ".psm1", ".psd1"}},
        {LanguageTag::Batch, {".bat", ".cmd"}},
        // Game engines and shaders
        {LanguageTag::Shader, {".shader", ".cg", ".cginc", ".hlsl", ".glsl", ".vert", ".frag",
                               ".geom", ".comp", ".tesc", ".tese", ".vsh", ".fsh"}},
        {LanguageTag::Unity, {".unity", ".prefab", ".asset", ".meta", ".mat", ".controller",
                              ".anim", ".mask"}},
        {LanguageTag::Unreal, {".uproject", ".umap", ".uasset"}},
        {LanguageTag::Godot, {".gd", ".tscn", ".tres", ".godot"}},
        {LanguageTag::RenPy, {".rpy", ".rpyc", ".rpym"}},
        {LanguageTag::RPGMaker, {".rvdata2", ".rpgsave"}},
        {LanguageTag::Kirikiri, {".ks", ".tjs"}},
        {LanguageTag::ActionScript, {".as"}},
        {LanguageTag::Haxe, {".hx"}},
        {LanguageTag::WebAssembly, {".wat"}}  // .wasm is binary
    };
    return defs;
}

const std::unordered_map<std::string, LanguageTag>& TypeClassifier::extensionTable() {
    // Later definitions overwrite earlier ones for a shared extension
    static const std::unordered_map<std::string, LanguageTag> table = [] {
        std::unordered_map<std::string, LanguageTag> extToTag;
        for (const auto& [tag, extensions] : definitions()) {
            for (const auto& ext : extensions) {
                extToTag[FileUtils::toLower(ext)] = tag;
            }
        }
        return extToTag;
    }();
    return table;
}

bool TypeClassifier::isLicenseName(const std::string& lowerName) {
    static const std::unordered_set<std::string> licenseNames = {
        "license", "license.txt", "license.md",
        "copying", "copying.txt", "copying.md"
    };
    return licenseNames.count(lowerName) > 0 ||
           lowerName.rfind("license", 0) == 0 ||
           lowerName.rfind("copying", 0) == 0;
}

LanguageTag TypeClassifier::tagForExtension(const std::string& ext) {
    auto it = extensionTable().find(ext);
    return it != extensionTable().end() ? it->second : LanguageTag::Other;
}

LanguageTag TypeClassifier::classify(const fs::path& filePath) {
    const std::string name = FileUtils::lowerName(filePath);
    if (isLicenseName(name)) {
        return LanguageTag::License;
    }
    return tagForExtension(FileUtils::suffix(name));
}

bool TypeClassifier::isCodeCounted(LanguageTag tag) {
    static const std::unordered_set<LanguageTag> counted = {
        LanguageTag::JavaScript, LanguageTag::TypeScript, LanguageTag::HTML,
        LanguageTag::CSS, LanguageTag::SCSS, LanguageTag::Less,
        LanguageTag::Python, LanguageTag::Batch, LanguageTag::C,
        LanguageTag::Cpp, LanguageTag::CSharp, LanguageTag::ObjectiveC,
        LanguageTag::Java, LanguageTag::Kotlin, LanguageTag::Swift,
        LanguageTag::Go, LanguageTag::Rust, LanguageTag::Dart,
        LanguageTag::Scala, LanguageTag::Ruby, LanguageTag::PHP,
        LanguageTag::Perl, LanguageTag::Lua, LanguageTag::R,
        LanguageTag::SQL, LanguageTag::Shell, LanguageTag::PowerShell,
        LanguageTag::XML, LanguageTag::JSON, LanguageTag::YAML,
        LanguageTag::TOML, LanguageTag::INI
    };
    return counted.count(tag) > 0;
}
