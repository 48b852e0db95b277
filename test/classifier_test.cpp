#include <catch2/catch_test_macros.hpp>
#include "asset_classifier.hpp"
#include "file_utils.hpp"
#include "language_tag.hpp"
#include "type_classifier.hpp"
#include "test_utils.hpp"
#include <stdexcept>

TEST_CASE("FileUtils suffix follows last-dot rules", "[FileUtils]") {
    REQUIRE(FileUtils::suffix(std::string("main.CPP")) == ".cpp");
    REQUIRE(FileUtils::suffix(std::string("archive.tar.gz")) == ".gz");
    REQUIRE(FileUtils::suffix(std::string(".bashrc")).empty());
    REQUIRE(FileUtils::suffix(std::string("Makefile")).empty());
    REQUIRE(FileUtils::suffix(std::string("trailing.")).empty());
    REQUIRE(FileUtils::stem("project.fbx.bak") == "project.fbx");
    REQUIRE(FileUtils::extOrPlaceholder(fs::path("dir/Makefile")) == NO_EXTENSION);
}

TEST_CASE("TypeClassifier maps names to language tags", "[TypeClassifier]") {
    SECTION("Extensions") {
        REQUIRE(TypeClassifier::classify("src/app.js") == LanguageTag::JavaScript);
        REQUIRE(TypeClassifier::classify("src/App.TSX") == LanguageTag::TypeScript);
        REQUIRE(TypeClassifier::classify("include/foo.hpp") == LanguageTag::Cpp);
        REQUIRE(TypeClassifier::classify("foo.h") == LanguageTag::C);
        REQUIRE(TypeClassifier::classify("script.py") == LanguageTag::Python);
        REQUIRE(TypeClassifier::classify("run.BAT") == LanguageTag::Batch);
        REQUIRE(TypeClassifier::classify("analysis.Rmd") == LanguageTag::R);
        REQUIRE(TypeClassifier::classify("setup.cfg") == LanguageTag::INI);
        REQUIRE(TypeClassifier::classify("shader.frag") == LanguageTag::Shader);
        REQUIRE(TypeClassifier::classify("module.wat") == LanguageTag::WebAssembly);
    }

    SECTION("License names win over extensions") {
        REQUIRE(TypeClassifier::classify("LICENSE") == LanguageTag::License);
        REQUIRE(TypeClassifier::classify("License.md") == LanguageTag::License);
        REQUIRE(TypeClassifier::classify("COPYING") == LanguageTag::License);
        REQUIRE(TypeClassifier::classify("LICENSE-APACHE.txt") == LanguageTag::License);
    }

    SECTION("Unknown extensions fall back to Other") {
        REQUIRE(TypeClassifier::classify("Makefile") == LanguageTag::Other);
        REQUIRE(TypeClassifier::classify("data.unknownext") == LanguageTag::Other);
        REQUIRE(TypeClassifier::classify(".gitignore") == LanguageTag::Other);
    }

    SECTION("Every defined extension resolves to its tag") {
        for (const auto& [tag, extensions] : TypeClassifier::definitions()) {
            for (const auto& ext : extensions) {
                REQUIRE(TypeClassifier::tagForExtension(ext) == tag);
            }
        }
        REQUIRE(TypeClassifier::tagForExtension(".svg") == LanguageTag::XML);
    }

    SECTION("Code-counted tags") {
        REQUIRE(TypeClassifier::isCodeCounted(LanguageTag::Cpp));
        REQUIRE(TypeClassifier::isCodeCounted(LanguageTag::INI));
        REQUIRE(TypeClassifier::isCodeCounted(LanguageTag::Batch));
        REQUIRE_FALSE(TypeClassifier::isCodeCounted(LanguageTag::Markdown));
        REQUIRE_FALSE(TypeClassifier::isCodeCounted(LanguageTag::Shader));
        REQUIRE_FALSE(TypeClassifier::isCodeCounted(LanguageTag::Other));
    }
}

TEST_CASE("LanguageTags keys and labels", "[LanguageTags]") {
    REQUIRE(LanguageTags::toString(LanguageTag::Cpp) == "C++");
    REQUIRE(LanguageTags::toString(LanguageTag::CSharp) == "C#");
    REQUIRE(LanguageTags::codeLabel(LanguageTag::ObjectiveC) == "ObjC");
    REQUIRE(LanguageTags::codeLabel(LanguageTag::WebAssembly) == "WASM(Text)");
    REQUIRE(LanguageTags::fileLabel(LanguageTag::Python) == "Python scripts");
    REQUIRE(LanguageTags::fileLabel(LanguageTag::Cpp) == "C++ files");

    for (const auto tag : LanguageTags::all()) {
        REQUIRE(LanguageTags::fromString(LanguageTags::toString(tag)) == tag);
    }
    REQUIRE_THROWS_AS(LanguageTags::fromString("Brainfuck"), std::runtime_error);
}

TEST_CASE("AssetClassifier resolves categories in order", "[AssetClassifier]") {
    auto kindOf = [](const std::string& name) {
        return AssetClassifier::classifyByName(fs::path(name));
    };

    SECTION("Backups win over the inner extension") {
        auto kind = kindOf("project.fbx.bak");
        REQUIRE(kind);
        REQUIRE(kind->category == AssetCategory::Backup);
        REQUIRE(kind->subKind == ".fbx.bak");

        kind = kindOf("notes.bak");
        REQUIRE(kind);
        REQUIRE(kind->subKind == ".bak");
    }

    SECTION("Live2D json suffixes match before plain json") {
        auto kind = kindOf("Hiyori.model3.json");
        REQUIRE(kind);
        REQUIRE(kind->category == AssetCategory::Live2D);
        REQUIRE(kind->subKind == ".model3.json");
        REQUIRE_FALSE(kindOf("package.json"));
    }

    SECTION("Overlapping extensions follow rule order") {
        REQUIRE(kindOf("intro.flv")->category == AssetCategory::Flash);
        REQUIRE(kindOf("slot1.dat")->category == AssetCategory::GameSave);
        REQUIRE(kindOf("bundle.bin")->category == AssetCategory::GameArchive);
        REQUIRE(kindOf("layer.ase")->category == AssetCategory::Adobe);
        REQUIRE(kindOf("disc.iso")->category == AssetCategory::Rom);
        REQUIRE(kindOf("libgame.so")->category == AssetCategory::MobilePackage);
    }

    SECTION("Common media") {
        REQUIRE(kindOf("logo.PNG")->category == AssetCategory::Image);
        REQUIRE(kindOf("logo.PNG")->subKind == ".png");
        REQUIRE(kindOf("bgm.ogg")->category == AssetCategory::Audio);
        REQUIRE(kindOf("hero.fbx")->category == AssetCategory::Model3D);
        REQUIRE(kindOf("report.docx")->category == AssetCategory::Office);
        REQUIRE(kindOf("manual.pdf")->category == AssetCategory::Pdf);
        REQUIRE(kindOf("font.woff2")->category == AssetCategory::Font);
    }

    SECTION("Source files are not assets") {
        REQUIRE_FALSE(kindOf("main.cpp"));
        REQUIRE_FALSE(kindOf("README.md"));
    }

    SECTION("Keys round-trip") {
        REQUIRE(AssetClassifier::all().size() == 25);
        REQUIRE(AssetClassifier::toString(AssetCategory::AudioMiddleware) == "audio_middleware");
        REQUIRE(AssetClassifier::fromString("other_asset") == AssetCategory::OtherAsset);
        REQUIRE_THROWS_AS(AssetClassifier::fromString("sprites"), std::runtime_error);
    }
}

TEST_CASE("AssetClassifier falls back on binary content", "[AssetClassifier]") {
    fs::path tempDir = makeTempDir("projstats_asset_test");

    createBinaryTestFile(tempDir / "blob.xyz", std::string("ab\0cd", 5), 5);
    createBinaryTestFile(tempDir / "BLOB", std::string("ab\0cd", 5), 5);
    createTestFile(tempDir / "notes.xyz", "plain text\n");

    auto kind = AssetClassifier::classify(tempDir / "blob.xyz");
    REQUIRE(kind);
    REQUIRE(kind->category == AssetCategory::OtherAsset);
    REQUIRE(kind->subKind == ".xyz");

    kind = AssetClassifier::classify(tempDir / "BLOB");
    REQUIRE(kind);
    REQUIRE(kind->subKind == NO_EXTENSION);

    REQUIRE_FALSE(AssetClassifier::classify(tempDir / "notes.xyz"));

    fs::remove_all(tempDir);
}
