#include "mo/utils/Config.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "mo/core/Logger.hpp"

namespace mo::utils {

namespace {

constexpr long long kMinComputedCapacity = 8;
constexpr long long kMaxComputedCapacity = 1000000;
constexpr long long kMaxPromotionThreshold = 1000;

std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        normalized = std::filesystem::absolute(path);
    }
    return normalized.lexically_normal();
}

std::filesystem::path ResolvePath(const std::filesystem::path& baseDir, const std::string& value) {
    std::filesystem::path raw(value);
    if (raw.is_relative()) {
        return NormalizePath(baseDir / raw);
    }
    return NormalizePath(raw);
}

template <typename T>
T GetOrDefault(const nlohmann::json& obj, const char* key, const T& fallback, ConfigLoadResult& result) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        result.errors.push_back(fmt::format("Invalid value for '{}': {}", key, e.what()));
        return fallback;
    }
}

nlohmann::json Section(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_object()) {
        return nlohmann::json::object();
    }
    return *it;
}

} // namespace

RegistryConfig ConfigLoader::CreateDefault(const std::filesystem::path& baseDir) {
    RegistryConfig config{};
    config.configDirectory = baseDir;
    return config;
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() ? std::filesystem::current_path()
                                                       : path.parent_path();

    ConfigLoadResult result;
    result.config = CreateDefault(baseDir);

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        result.warnings.push_back(fmt::format("Config file '{}' not found, using defaults",
                                              path.empty() ? "<none>" : path.string()));
        mo::core::Logger::Warning("[ConfigLoader] {}", result.warnings.back());
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        result.errors.push_back(fmt::format("Failed to open config file '{}'", path.string()));
        mo::core::Logger::Error("[ConfigLoader] {}", result.errors.back());
        return result;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        result.errors.push_back(fmt::format("Failed to parse JSON '{}': {}", path.string(), e.what()));
        mo::core::Logger::Error("[ConfigLoader] {}", result.errors.back());
        return result;
    }

    if (!json.is_object()) {
        result.errors.push_back(fmt::format("Config root in '{}' must be an object", path.string()));
        mo::core::Logger::Error("[ConfigLoader] {}", result.errors.back());
        return result;
    }

    // Sizes are read signed so negative input is reported instead of wrapping.
    const auto cacheObj = Section(json, "cache");
    const long long capacity = GetOrDefault<long long>(
        cacheObj, "computedCapacity", static_cast<long long>(result.config.cache.computedCapacity), result);
    const long long threshold = GetOrDefault<long long>(
        cacheObj, "promotionThreshold", static_cast<long long>(result.config.cache.promotionThreshold), result);

    if (capacity < kMinComputedCapacity || capacity > kMaxComputedCapacity) {
        result.warnings.push_back(
            fmt::format("cache.computedCapacity ({}) should be between {} and {}, clamping",
                        capacity, kMinComputedCapacity, kMaxComputedCapacity));
    }
    result.config.cache.computedCapacity =
        static_cast<std::size_t>(std::clamp(capacity, kMinComputedCapacity, kMaxComputedCapacity));

    if (threshold < 0 || threshold > kMaxPromotionThreshold) {
        result.warnings.push_back(
            fmt::format("cache.promotionThreshold ({}) should be between 0 and {}, clamping",
                        threshold, kMaxPromotionThreshold));
    }
    result.config.cache.promotionThreshold =
        static_cast<std::size_t>(std::clamp(threshold, 0LL, kMaxPromotionThreshold));

    const auto validationObj = Section(json, "validation");
    result.config.validation.enforcePlacement =
        GetOrDefault<bool>(validationObj, "enforcePlacement", result.config.validation.enforcePlacement, result);
    result.config.validation.strictCompleteness =
        GetOrDefault<bool>(validationObj, "strictCompleteness", result.config.validation.strictCompleteness, result);

    const auto loggingObj = Section(json, "logging");
    result.config.logging.debug = GetOrDefault<bool>(loggingObj, "debug", result.config.logging.debug, result);
    result.config.logging.level = GetOrDefault<std::string>(loggingObj, "level", result.config.logging.level, result);
    if (loggingObj.contains("file") && loggingObj["file"].is_string()) {
        const auto fileValue = loggingObj["file"].get<std::string>();
        if (!fileValue.empty()) {
            result.config.logging.file = ResolvePath(baseDir, fileValue);
        }
    }

    result.config.configDirectory = baseDir;
    result.loadedFromFile = true;

    ValidateConfig(result.config, result);

    for (const auto& warning : result.warnings) {
        mo::core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        mo::core::Logger::Error("[ConfigLoader] {}", error);
    }

    mo::core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    return result;
}

void ConfigLoader::ApplyLogging(const LoggingConfig& logging) {
    if (auto level = mo::core::ParseLogLevel(logging.level)) {
        mo::core::Logger::SetMinimumLevel(*level);
    }
    mo::core::Logger::SetDebugEnabled(logging.debug);
    if (!logging.file.empty()) {
        mo::core::Logger::SetLogFile(logging.file);
    }
}

void ConfigLoader::ValidateConfig(RegistryConfig& config, ConfigLoadResult& result) {
    ValidateCacheConfig(config.cache, result);
    ValidateLoggingConfig(config.logging, result);
}

void ConfigLoader::ValidateCacheConfig(CacheConfig& cache, ConfigLoadResult& result) {
    if (cache.promotionThreshold > 0 && cache.promotionThreshold >= cache.computedCapacity) {
        result.warnings.push_back(
            fmt::format("cache.promotionThreshold ({}) is not below cache.computedCapacity ({}); "
                        "entries may be evicted before promotion",
                        cache.promotionThreshold, cache.computedCapacity));
    }
}

void ConfigLoader::ValidateLoggingConfig(LoggingConfig& logging, ConfigLoadResult& result) {
    if (!mo::core::ParseLogLevel(logging.level)) {
        result.errors.push_back(
            fmt::format("logging.level '{}' is not one of debug, info, warning, error", logging.level));
        logging.level = "info";
    }
    if (!logging.file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(logging.file.parent_path(), ec);
        if (ec) {
            result.errors.push_back(fmt::format("Cannot create log directory '{}': {}",
                                                logging.file.parent_path().string(), ec.message()));
        }
    }
}

} // namespace mo::utils
