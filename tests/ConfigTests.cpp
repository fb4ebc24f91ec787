#include "mo/utils/Config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace {

struct TempConfigDir {
    std::filesystem::path root;

    explicit TempConfigDir(const std::string& name)
        : root(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);
    }
    ~TempConfigDir() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::filesystem::path Write(const std::string& fileName, const std::string& content) const {
        const auto path = root / fileName;
        std::ofstream out(path);
        out << content;
        return path;
    }
};

} // namespace

TEST_CASE("ConfigLoader falls back to defaults when the file is missing", "[config]") {
    TempConfigDir dir("metaobjects_config_missing");
    const auto result = mo::utils::ConfigLoader::Load(dir.root / "absent.json");

    REQUIRE_FALSE(result.loadedFromFile);
    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.HasWarnings());
    REQUIRE(result.config.cache.computedCapacity == 256);
    REQUIRE(result.config.cache.promotionThreshold == 4);
    REQUIRE(result.config.validation.enforcePlacement);
    REQUIRE(result.config.validation.strictCompleteness);
}

TEST_CASE("ConfigLoader reads every section", "[config]") {
    TempConfigDir dir("metaobjects_config_full");
    const auto path = dir.Write("metaobjects.json", R"({
        "cache": { "computedCapacity": 64, "promotionThreshold": 0 },
        "validation": { "enforcePlacement": false, "strictCompleteness": false },
        "logging": { "debug": true, "level": "warning", "file": "logs/mo.log" }
    })");

    const auto result = mo::utils::ConfigLoader::Load(path);

    REQUIRE(result.loadedFromFile);
    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.config.cache.computedCapacity == 64);
    REQUIRE(result.config.cache.promotionThreshold == 0);
    REQUIRE_FALSE(result.config.validation.enforcePlacement);
    REQUIRE_FALSE(result.config.validation.strictCompleteness);
    REQUIRE(result.config.logging.debug);
    REQUIRE(result.config.logging.level == "warning");
    REQUIRE(result.config.logging.file.filename() == "mo.log");
    REQUIRE(result.config.logging.file.parent_path().filename() == "logs");
}

TEST_CASE("ConfigLoader clamps out-of-range cache values", "[config]") {
    TempConfigDir dir("metaobjects_config_clamp");
    const auto path = dir.Write("metaobjects.json", R"({
        "cache": { "computedCapacity": 2, "promotionThreshold": 5000 }
    })");

    const auto result = mo::utils::ConfigLoader::Load(path);

    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.HasWarnings());
    REQUIRE(result.config.cache.computedCapacity == 8);
    REQUIRE(result.config.cache.promotionThreshold == 1000);
}

TEST_CASE("ConfigLoader reports malformed input as errors", "[config]") {
    TempConfigDir dir("metaobjects_config_errors");

    SECTION("Broken JSON keeps the defaults") {
        const auto result = mo::utils::ConfigLoader::Load(dir.Write("broken.json", "{ \"cache\": "));
        REQUIRE(result.HasErrors());
        REQUIRE(result.config.cache.computedCapacity == 256);
    }

    SECTION("Root must be an object") {
        const auto result = mo::utils::ConfigLoader::Load(dir.Write("array.json", "[1, 2, 3]"));
        REQUIRE(result.HasErrors());
    }

    SECTION("Unknown log level resets to info") {
        const auto result =
            mo::utils::ConfigLoader::Load(dir.Write("level.json", R"({ "logging": { "level": "chatty" } })"));
        REQUIRE(result.HasErrors());
        REQUIRE(result.config.logging.level == "info");
    }

    SECTION("Wrongly typed values are reported") {
        const auto result = mo::utils::ConfigLoader::Load(
            dir.Write("types.json", R"({ "validation": { "enforcePlacement": "yes" } })"));
        REQUIRE(result.HasErrors());
        REQUIRE(result.config.validation.enforcePlacement);
    }
}
