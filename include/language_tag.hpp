#pragma once

#include <string>
#include <vector>
#include <unordered_map>

// Source categories a file can be counted under. Closed set: every file
// gets exactly one tag and Other is the catch-all.
enum class LanguageTag {
    // Web / markup / data
    JavaScript,
    TypeScript,
    HTML,
    CSS,
    SCSS,
    Less,
    JSON,
    YAML,
    XML,
    TOML,
    INI,
    Markdown,
    // C family / compiled
    C,
    Cpp,
    CSharp,
    ObjectiveC,
    Java,
    Kotlin,
    Swift,
    Go,
    Rust,
    Dart,
    Scala,
    // Scripting
    Python,
    Ruby,
    PHP,
    Perl,
    Lua,
    R,
    SQL,
    Shell,
    PowerShell,
    Batch,
    // Game engines and shaders
    Shader,
    Unity,
    Unreal,
    Godot,
    RenPy,
    RPGMaker,
    Kirikiri,
    ActionScript,
    Haxe,
    WebAssembly,
    // Special
    License,
    Other
};

class LanguageTags {
public:
    // Stable key used in reports and JSON ("C++", "Objective-C", ...)
    static std::string toString(LanguageTag tag);

    // Inverse of toString, throws std::runtime_error on unknown keys
    static LanguageTag fromString(const std::string& key);

    // Short name used in the code statistics table ("ObjC", "WASM(Text)")
    static std::string codeLabel(LanguageTag tag);

    // Name used in the file count section ("C++ files", "Python scripts")
    static std::string fileLabel(LanguageTag tag);

    // All tags in declaration order
    static const std::vector<LanguageTag>& all();

private:
    static const std::unordered_map<std::string, LanguageTag>& keyMap();
};
