#pragma once

// Avatar Combiner Logging System
//
// Features:
// - Multiple severity levels (NONE through TRACE)
// - Module-based filtering
// - Runtime level configuration
// - Consistent output formatting with timestamps
// - FATAL/ERROR always output at level NONE

#include <iostream>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <chrono>
#include <array>
#include <mutex>
#include <fmt/format.h>

// =============================================================================
// Log Levels
// =============================================================================
// Levels are hierarchical. Setting a level enables that level and all levels
// above it (lower numeric value). FATAL and ERROR always output at NONE.

enum LogLevel {
    LOG_NONE  = 0,  // Quiet mode - only FATAL/ERROR output
    LOG_FATAL = 1,  // Unrecoverable errors causing termination
    LOG_ERROR = 2,  // Errors preventing normal operation
    LOG_WARN  = 3,  // Unexpected but handled conditions
    LOG_INFO  = 4,  // Significant operational events
    LOG_DEBUG = 5,  // Detailed debugging information
    LOG_TRACE = 6   // Granular execution flow
};

// =============================================================================
// Log Modules
// =============================================================================

enum LogModule {
    MOD_SCAN = 0,       // Component folder discovery
    MOD_PARSE,          // Identifier parsing
    MOD_CLASSIFY,       // Skeleton/category grouping
    MOD_COMBINE,        // Combination generation
    MOD_NAMING,         // Combination naming
    MOD_EXPORT,         // Export coordination
    MOD_GRAPHICS_LOAD,  // Mesh and texture import
    MOD_GLTF,           // glTF assembly and writing
    MOD_CONFIG,         // Configuration loading
    MOD_MAIN,           // Main application logic
    MOD_COUNT           // Number of modules (must be last)
};

inline const char* GetModuleName(LogModule mod) {
    static const char* names[] = {
        "SCAN", "PARSE", "CLASSIFY", "COMBINE", "NAMING",
        "EXPORT", "GRAPHICS_LOAD", "GLTF", "CONFIG", "MAIN"
    };
    if (mod >= 0 && mod < MOD_COUNT) {
        return names[mod];
    }
    return "UNKNOWN";
}

// Parse module name from string (for command-line/config)
inline LogModule ParseModuleName(const char* name) {
    static const struct { const char* name; LogModule mod; } mapping[] = {
        {"SCAN", MOD_SCAN}, {"PARSE", MOD_PARSE}, {"CLASSIFY", MOD_CLASSIFY},
        {"COMBINE", MOD_COMBINE}, {"NAMING", MOD_NAMING}, {"EXPORT", MOD_EXPORT},
        {"GRAPHICS_LOAD", MOD_GRAPHICS_LOAD}, {"GLTF", MOD_GLTF},
        {"CONFIG", MOD_CONFIG}, {"MAIN", MOD_MAIN}
    };
    for (const auto& m : mapping) {
        if (strcmp(name, m.name) == 0) return m.mod;
    }
    return MOD_MAIN; // Default fallback
}

// =============================================================================
// Log Level Names
// =============================================================================

inline const char* GetLevelName(LogLevel level) {
    switch (level) {
        case LOG_NONE:  return "NONE ";
        case LOG_FATAL: return "FATAL";
        case LOG_ERROR: return "ERROR";
        case LOG_WARN:  return "WARN ";
        case LOG_INFO:  return "INFO ";
        case LOG_DEBUG: return "DEBUG";
        case LOG_TRACE: return "TRACE";
        default:        return "?????";
    }
}

inline LogLevel ParseLevelName(const char* name) {
    if (strcmp(name, "NONE") == 0 || strcmp(name, "OFF") == 0) return LOG_NONE;
    if (strcmp(name, "FATAL") == 0) return LOG_FATAL;
    if (strcmp(name, "ERROR") == 0) return LOG_ERROR;
    if (strcmp(name, "WARN") == 0)  return LOG_WARN;
    if (strcmp(name, "INFO") == 0)  return LOG_INFO;
    if (strcmp(name, "DEBUG") == 0) return LOG_DEBUG;
    if (strcmp(name, "TRACE") == 0) return LOG_TRACE;
    return LOG_NONE; // Default fallback
}

// =============================================================================
// Logging State Management
// =============================================================================

class LogManager {
public:
    static LogManager& Instance() {
        static LogManager instance;
        return instance;
    }

    // Global log level - affects all modules unless overridden
    int GetGlobalLevel() const { return m_global_level; }
    void SetGlobalLevel(int level) { m_global_level = level; }

    // Per-module log levels (-1 means use global level)
    int GetModuleLevel(LogModule mod) const {
        if (mod >= 0 && mod < MOD_COUNT) {
            return m_module_levels[mod];
        }
        return -1;
    }

    void SetModuleLevel(LogModule mod, int level) {
        if (mod >= 0 && mod < MOD_COUNT) {
            m_module_levels[mod] = level;
        }
    }

    bool ShouldLog(LogModule mod, LogLevel level) const {
        // FATAL and ERROR always output (unless module explicitly OFF)
        if (level <= LOG_ERROR) {
            int mod_level = (mod >= 0 && mod < MOD_COUNT) ? m_module_levels[mod] : -1;
            if (mod_level >= 0 && mod_level < level) {
                return false;
            }
            return true;
        }

        int effective_level = m_global_level;
        if (mod >= 0 && mod < MOD_COUNT && m_module_levels[mod] >= 0) {
            effective_level = m_module_levels[mod];
        }
        return level <= effective_level;
    }

    void IncreaseLevel() {
        if (m_global_level < LOG_TRACE) {
            m_global_level++;
        }
    }

    void DecreaseLevel() {
        if (m_global_level > LOG_NONE) {
            m_global_level--;
        }
    }

    // Get mutex for thread-safe output
    std::mutex& GetMutex() { return m_mutex; }

private:
    LogManager() : m_global_level(LOG_NONE) {
        m_module_levels.fill(-1);
    }

    int m_global_level;
    std::array<int, MOD_COUNT> m_module_levels;
    std::mutex m_mutex;
};

// =============================================================================
// Convenience Functions
// =============================================================================

inline int GetLogLevel() {
    return LogManager::Instance().GetGlobalLevel();
}

inline void SetLogLevel(int level) {
    LogManager::Instance().SetGlobalLevel(level);
}

inline void SetModuleLogLevel(LogModule mod, int level) {
    LogManager::Instance().SetModuleLevel(mod, level);
}

inline bool ShouldLog(LogModule mod, LogLevel level) {
    return LogManager::Instance().ShouldLog(mod, level);
}

// =============================================================================
// Timestamp Formatting
// =============================================================================

inline void FormatTimestamp(char* buffer, size_t size) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    int written = snprintf(buffer, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(ms.count()));
    (void)written;
}

// =============================================================================
// Core Logging Macro
// =============================================================================

#ifdef ACC_DEBUG

#define ACC_LOG_IMPL(module, level, ...) \
    do { \
        if (ShouldLog(module, level)) { \
            char _ts_buf[32]; \
            FormatTimestamp(_ts_buf, sizeof(_ts_buf)); \
            std::lock_guard<std::mutex> _lock(LogManager::Instance().GetMutex()); \
            try { \
                auto& _out = (level <= LOG_ERROR) ? std::cerr : std::cout; \
                _out << "[" << _ts_buf << "] [" << GetLevelName(level) << "] [" \
                     << GetModuleName(module) << "] " << fmt::format(__VA_ARGS__) << std::endl; \
            } catch (const fmt::format_error&) { \
                auto& _out = (level <= LOG_ERROR) ? std::cerr : std::cout; \
                _out << "[" << _ts_buf << "] [" << GetLevelName(level) << "] [" \
                     << GetModuleName(module) << "] (format error)" << std::endl; \
            } \
        } \
    } while(0)

#define LOG_FATAL(module, ...) ACC_LOG_IMPL(module, LOG_FATAL, __VA_ARGS__)
#define LOG_ERROR(module, ...) ACC_LOG_IMPL(module, LOG_ERROR, __VA_ARGS__)
#define LOG_WARN(module, ...)  ACC_LOG_IMPL(module, LOG_WARN, __VA_ARGS__)
#define LOG_INFO(module, ...)  ACC_LOG_IMPL(module, LOG_INFO, __VA_ARGS__)
#define LOG_DEBUG(module, ...) ACC_LOG_IMPL(module, LOG_DEBUG, __VA_ARGS__)
#define LOG_TRACE(module, ...) ACC_LOG_IMPL(module, LOG_TRACE, __VA_ARGS__)

// Conditional logging - only evaluate if condition is true AND level enabled
#define LOG_DEBUG_IF(module, condition, ...) \
    do { \
        if ((condition) && ShouldLog(module, LOG_DEBUG)) { \
            ACC_LOG_IMPL(module, LOG_DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#else // !ACC_DEBUG

// =============================================================================
// Release Build - Only FATAL/ERROR enabled
// =============================================================================

#define ACC_LOG_IMPL(module, level, ...) \
    do { \
        if (level <= LOG_ERROR && ShouldLog(module, level)) { \
            char _ts_buf[32]; \
            FormatTimestamp(_ts_buf, sizeof(_ts_buf)); \
            std::lock_guard<std::mutex> _lock(LogManager::Instance().GetMutex()); \
            try { \
                std::cerr << "[" << _ts_buf << "] [" << GetLevelName(level) << "] [" \
                          << GetModuleName(module) << "] " << fmt::format(__VA_ARGS__) << std::endl; \
            } catch (const fmt::format_error&) { \
                std::cerr << "[" << _ts_buf << "] [" << GetLevelName(level) << "] [" \
                          << GetModuleName(module) << "] (format error)" << std::endl; \
            } \
        } \
    } while(0)

#define LOG_FATAL(module, ...) ACC_LOG_IMPL(module, LOG_FATAL, __VA_ARGS__)
#define LOG_ERROR(module, ...) ACC_LOG_IMPL(module, LOG_ERROR, __VA_ARGS__)
#define LOG_WARN(module, ...)  ((void)0)
#define LOG_INFO(module, ...)  ((void)0)
#define LOG_DEBUG(module, ...) ((void)0)
#define LOG_TRACE(module, ...) ((void)0)

#define LOG_DEBUG_IF(module, condition, ...) ((void)0)

#endif // ACC_DEBUG

// =============================================================================
// Signal Handler Support
// =============================================================================
//   signal(SIGUSR1, [](int) { LogLevelIncrease(); });
//   signal(SIGUSR2, [](int) { LogLevelDecrease(); });

inline void LogLevelIncrease() {
    LogManager::Instance().IncreaseLevel();
}

inline void LogLevelDecrease() {
    LogManager::Instance().DecreaseLevel();
}

// =============================================================================
// Initialization Helper
// =============================================================================
// Call from main() to set up logging from command-line

inline void InitLogging(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        // --log-level=LEVEL
        if (strncmp(arg, "--log-level=", 12) == 0) {
            SetLogLevel(ParseLevelName(arg + 12));
        }
        // --log-module=MODULE:LEVEL
        else if (strncmp(arg, "--log-module=", 13) == 0) {
            const char* spec = arg + 13;
            const char* colon = strchr(spec, ':');
            if (colon) {
                char modName[32] = {0};
                size_t len = colon - spec;
                if (len < sizeof(modName)) {
                    strncpy(modName, spec, len);
                    LogModule mod = ParseModuleName(modName);
                    LogLevel level = ParseLevelName(colon + 1);
                    SetModuleLogLevel(mod, level);
                }
            }
        }
    }
}

// =============================================================================
// JSON Config Helper
// =============================================================================
// Include <json/json.h> before using this function
// Parses a "logging" section from config file:
// {
//   "logging": {
//     "level": "DEBUG",
//     "modules": {
//       "EXPORT": "TRACE",
//       "GLTF": "INFO"
//     }
//   }
// }

#ifdef JSONCPP_VERSION_STRING
inline void InitLoggingFromJson(const Json::Value& config) {
    if (!config.isMember("logging")) {
        return;
    }

    const Json::Value& logging = config["logging"];

    if (logging.isMember("level") && logging["level"].isString()) {
        std::string levelStr = logging["level"].asString();
        SetLogLevel(ParseLevelName(levelStr.c_str()));
    }

    if (logging.isMember("modules") && logging["modules"].isObject()) {
        const Json::Value& modules = logging["modules"];
        for (const auto& modName : modules.getMemberNames()) {
            if (modules[modName].isString()) {
                LogModule mod = ParseModuleName(modName.c_str());
                LogLevel level = ParseLevelName(modules[modName].asString().c_str());
                SetModuleLogLevel(mod, level);
            }
        }
    }
}
#endif
