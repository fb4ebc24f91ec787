#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace mo::utils {

struct CacheConfig {
    std::size_t computedCapacity = 256;
    // Hits before a computed entry moves to the permanent tier. 0 disables promotion.
    std::size_t promotionThreshold = 4;
};

struct ValidationConfig {
    bool enforcePlacement = true;
    bool strictCompleteness = true;
};

struct LoggingConfig {
    bool debug = false;
    std::string level = "info";
    std::filesystem::path file;
};

struct RegistryConfig {
    CacheConfig cache;
    ValidationConfig validation;
    LoggingConfig logging;
    std::filesystem::path configDirectory;
};

struct ConfigLoadResult {
    RegistryConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Invalid values or unreadable files
    std::vector<std::string> warnings;    // Clamped values, missing file

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    static ConfigLoadResult Load(const std::filesystem::path& path);

    /**
     * @brief Push the logging section into the process logger (level, debug flag, log file).
     */
    static void ApplyLogging(const LoggingConfig& logging);

private:
    static RegistryConfig CreateDefault(const std::filesystem::path& baseDir);
    static void ValidateConfig(RegistryConfig& config, ConfigLoadResult& result);
    static void ValidateCacheConfig(CacheConfig& cache, ConfigLoadResult& result);
    static void ValidateLoggingConfig(LoggingConfig& logging, ConfigLoadResult& result);
};

} // namespace mo::utils
