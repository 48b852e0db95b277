#include "language_tag.hpp"
#include <stdexcept>

const std::vector<LanguageTag>& LanguageTags::all() {
    static const std::vector<LanguageTag> tags = {
        LanguageTag::JavaScript, LanguageTag::TypeScript, LanguageTag::HTML,
        LanguageTag::CSS, LanguageTag::SCSS, LanguageTag::Less,
        LanguageTag::JSON, LanguageTag::YAML, LanguageTag::XML,
        LanguageTag::TOML, LanguageTag::INI, LanguageTag::Markdown,
        LanguageTag::C, LanguageTag::Cpp, LanguageTag::CSharp,
        LanguageTag::ObjectiveC, LanguageTag::Java, LanguageTag::Kotlin,
        LanguageTag::Swift, LanguageTag::Go, LanguageTag::Rust,
        LanguageTag::Dart, LanguageTag::Scala, LanguageTag::Python,
        LanguageTag::Ruby, LanguageTag::PHP, LanguageTag::Perl,
        LanguageTag::Lua, LanguageTag::R, LanguageTag::SQL,
        LanguageTag::Shell, LanguageTag::PowerShell, LanguageTag::Batch,
        LanguageTag::Shader, LanguageTag::Unity, LanguageTag::Unreal,
        LanguageTag::Godot, LanguageTag::RenPy, LanguageTag::RPGMaker,
        LanguageTag::Kirikiri, LanguageTag::ActionScript, LanguageTag::Haxe,
        LanguageTag::WebAssembly, LanguageTag::License, LanguageTag::Other
    };
    return tags;
}

std::string LanguageTags::toString(LanguageTag tag) {
    switch (tag) {
        case LanguageTag::JavaScript:   return "JavaScript";
        case LanguageTag::TypeScript:   return "TypeScript";
        case LanguageTag::HTML:         return "HTML";
        case LanguageTag::CSS:          return "CSS";
        case LanguageTag::SCSS:         return "SCSS";
        case LanguageTag::Less:         return "Less";
        case LanguageTag::JSON:         return "JSON";
        case LanguageTag::YAML:         return "YAML";
        case LanguageTag::XML:          return "XML";
        case LanguageTag::TOML:         return "TOML";
        case LanguageTag::INI:          return "INI";
        case LanguageTag::Markdown:     return "Markdown";
        case LanguageTag::C:            return "C";
        case LanguageTag::Cpp:          return "C++";
        case LanguageTag::CSharp:       return "C#";
        case LanguageTag::ObjectiveC:   return "Objective-C";
        case LanguageTag::Java:         return "Java";
        case LanguageTag::Kotlin:       return "Kotlin";
        case LanguageTag::Swift:        return "Swift";
        case LanguageTag::Go:           return "Go";
        case LanguageTag::Rust:         return "Rust";
        case LanguageTag::Dart:         return "Dart";
        case LanguageTag::Scala:        return "Scala";
        case LanguageTag::Python:       return "Python";
        case LanguageTag::Ruby:         return "Ruby";
        case LanguageTag::PHP:          return "PHP";
        case LanguageTag::Perl:         return "Perl";
        case LanguageTag::Lua:          return "Lua";
        case LanguageTag::R:            return "R";
        case LanguageTag::SQL:          return "SQL";
        case LanguageTag::Shell:        return "Shell";
        case LanguageTag::PowerShell:   return "PowerShell";
        case LanguageTag::Batch:        return "Batch";
        case LanguageTag::Shader:       return "Shader";
        case LanguageTag::Unity:        return "Unity";
        case LanguageTag::Unreal:       return "Unreal";
        case LanguageTag::Godot:        return "Godot";
        case LanguageTag::RenPy:        return "RenPy";
        case LanguageTag::RPGMaker:     return "RPG Maker";
        case LanguageTag::Kirikiri:     return "Kirikiri";
        case LanguageTag::ActionScript: return "ActionScript";
        case LanguageTag::Haxe:         return "Haxe";
        case LanguageTag::WebAssembly:  return "WebAssembly";
        case LanguageTag::License:      return "License";
        case LanguageTag::Other:        return "Other";
    }
    throw std::runtime_error("Unknown language tag value");
}

const std::unordered_map<std::string, LanguageTag>& LanguageTags::keyMap() {
    static const std::unordered_map<std::string, LanguageTag> map = [] {
        std::unordered_map<std::string, LanguageTag> keys;
        for (const auto tag : all()) {
            keys.emplace(toString(tag), tag);
        }
        return keys;
    }();
    return map;
}

LanguageTag LanguageTags::fromString(const std::string& key) {
    auto it = keyMap().find(key);
    if (it != keyMap().end()) {
        return it->second;
    }
    throw std::runtime_error("Unsupported language tag: " + key);
}

std::string LanguageTags::codeLabel(LanguageTag tag) {
    switch (tag) {
        case LanguageTag::ObjectiveC:  return "ObjC";
        case LanguageTag::WebAssembly: return "WASM(Text)";
        default:
            return toString(tag);
    }
}

std::string LanguageTags::fileLabel(LanguageTag tag) {
    switch (tag) {
        case LanguageTag::SCSS:       return "SCSS/Sass files";
        case LanguageTag::INI:        return "INI/config files";
        case LanguageTag::Markdown:   return "Markdown documents";
        case LanguageTag::Python:
        case LanguageTag::Ruby:
        case LanguageTag::PHP:
        case LanguageTag::Perl:
        case LanguageTag::Lua:
        case LanguageTag::R:
        case LanguageTag::SQL:
        case LanguageTag::Shell:
        case LanguageTag::PowerShell:
        case LanguageTag::Batch:      return toString(tag) + " scripts";
        case LanguageTag::RenPy:      return "Ren'Py scripts";
        case LanguageTag::Unity:
        case LanguageTag::Unreal:     return toString(tag) + " project files";
        case LanguageTag::RPGMaker:   return "RPG Maker data";
        case LanguageTag::Shader:     return "Shader code";
        case LanguageTag::Other:      return "Other files";
        default:
            return toString(tag) + " files";
    }
}
