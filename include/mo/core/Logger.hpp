#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>

namespace mo {
namespace core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

namespace detail {

inline std::string Lowercase(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::optional<bool> ParseSwitch(std::string_view text) {
    const std::string value = Lowercase(text);
    if (value == "1" || value == "true" || value == "on" || value == "yes") return true;
    if (value == "0" || value == "false" || value == "off" || value == "no") return false;
    return std::nullopt;
}

} // namespace detail

constexpr std::string_view ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "Debug";
        case LogLevel::Info:    return "Info";
        case LogLevel::Warning: return "Warning";
        case LogLevel::Error:   return "Error";
    }
    return "Unknown";
}

inline std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    const std::string value = detail::Lowercase(text);
    if (value == "debug") return LogLevel::Debug;
    if (value == "info") return LogLevel::Info;
    if (value == "warning" || value == "warn") return LogLevel::Warning;
    if (value == "error") return LogLevel::Error;
    return std::nullopt;
}

// Process-wide sink shared by the registry, the constraint engine and node
// trees. Lines go to stderr, to the optional log file and to listeners.
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
#ifdef MO_DEBUG
        if (IsDebugEnabled()) {
            Emit(LogLevel::Debug, format, std::forward<Args>(args)...);
        }
#else
        (void)format;
        (void)std::initializer_list<int>{((void)args, 0)...};
#endif
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        Emit(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Emit(LogLevel::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Emit(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    static void SetMinimumLevel(LogLevel level) {
        s_minimumLevel.store(level, std::memory_order_release);
    }

    static LogLevel GetMinimumLevel() {
        return s_minimumLevel.load(std::memory_order_acquire);
    }

    // No effect unless the library was built with MO_DEBUG.
    static void SetDebugEnabled(bool enabled) {
        s_environmentRead.store(true, std::memory_order_release);
        s_debugEnabled.store(enabled, std::memory_order_release);
    }

    static bool IsDebugEnabled() {
#ifdef MO_DEBUG
        bool expected = false;
        if (s_environmentRead.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            ReadEnvironment();
        }
        return s_debugEnabled.load(std::memory_order_acquire);
#else
        return false;
#endif
    }

    // MO_LOG_DEBUG toggles debug output, MO_LOG_LEVEL sets the threshold.
    static void ConfigureFromEnvironment() {
        s_environmentRead.store(true, std::memory_order_release);
        ReadEnvironment();
    }

    static void SetLogFile(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (s_file.is_open()) {
            s_file.close();
        }
        s_filePath = path;
        OpenFileLocked();
    }

    static size_t RegisterListener(LogCallback callback) {
        if (!callback) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(s_mutex);
        const size_t token = s_nextToken++;
        s_listeners.push_back(Listener{token, std::move(callback)});
        return token;
    }

    static void UnregisterListener(size_t token) {
        std::lock_guard<std::mutex> lock(s_mutex);
        s_listeners.erase(std::remove_if(s_listeners.begin(), s_listeners.end(),
                                         [token](const Listener& listener) { return listener.token == token; }),
                          s_listeners.end());
    }

private:
    struct Listener {
        size_t token = 0;
        LogCallback callback;
    };

    template<typename... Args>
    static void Emit(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (level < s_minimumLevel.load(std::memory_order_relaxed)) {
            return;
        }
        Dispatch(level, fmt::format(format, std::forward<Args>(args)...));
    }

    static void Dispatch(LogLevel level, const std::string& message) {
        const std::string line = fmt::format("[{}] [{}] {}", Timestamp(), ToString(level), message);
        fmt::print(stderr, "{}\n", line);

        std::vector<LogCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(s_mutex);
            if (s_file.is_open()) {
                s_file << line << std::endl;
            }
            callbacks.reserve(s_listeners.size());
            for (const auto& listener : s_listeners) {
                callbacks.push_back(listener.callback);
            }
        }

        // Listeners run unlocked so they may log themselves.
        for (const auto& callback : callbacks) {
            callback(level, line);
        }
    }

    static void OpenFileLocked() {
        if (s_filePath.empty()) {
            return;
        }
        std::error_code ec;
        if (s_filePath.has_parent_path()) {
            std::filesystem::create_directories(s_filePath.parent_path(), ec);
        }
        s_file.open(s_filePath, std::ios::out | std::ios::app);
    }

    static void ReadEnvironment() {
        if (const char* debug = std::getenv("MO_LOG_DEBUG")) {
            if (auto enabled = detail::ParseSwitch(debug)) {
                s_debugEnabled.store(*enabled, std::memory_order_release);
            }
        }
        if (const char* level = std::getenv("MO_LOG_LEVEL")) {
            if (auto parsed = ParseLogLevel(level)) {
                SetMinimumLevel(*parsed);
            }
        }
    }

    static std::string Timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const std::time_t seconds = system_clock::to_time_t(now);
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &seconds);
#else
        localtime_r(&seconds, &local);
#endif
        const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
                           local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
                           local.tm_hour, local.tm_min, local.tm_sec, millis);
    }

    static inline std::atomic<LogLevel> s_minimumLevel{LogLevel::Debug};
    static inline std::atomic<bool> s_debugEnabled{false};
    static inline std::atomic<bool> s_environmentRead{false};
    static inline std::mutex s_mutex{};
    static inline std::filesystem::path s_filePath{};
    static inline std::ofstream s_file{};
    static inline std::vector<Listener> s_listeners{};
    static inline size_t s_nextToken = 1;
};

}} // namespace mo::core
