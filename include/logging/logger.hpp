/**
 * @file logger.hpp
 * @brief Minimal leveled logger writing bracketed lines to a stream
 * @version 0.1
 * @date 2025-11-18
 *
 * Output format:
 * ```
 * [DEBUG] TX: 7E 00 01 10 00 00 00 EE
 * [WARN] GetStatus attempt 1/4 failed: ...
 * ```
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace ds205a {

    enum class LogLevel : int {
        SILENT = 0,
        ERROR,
        WARN,
        INFO,
        DEBUG
    };

    inline std::string log_level_to_string(LogLevel level) {
        switch (level) {
        case LogLevel::SILENT: return "silent";
        case LogLevel::ERROR:  return "error";
        case LogLevel::WARN:   return "warn";
        case LogLevel::INFO:   return "info";
        case LogLevel::DEBUG:  return "debug";
        default:               return "silent";
        }
    }

    /**
     * @brief Parse a level name (case-insensitive, "warning" accepted)
     * @param use_default Set to true if the string is not recognised
     */
    inline LogLevel log_level_from_string(const std::string& str, bool& use_default) {
        std::string lower = str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        use_default = false;
        if (lower == "silent" || lower == "none") return LogLevel::SILENT;
        if (lower == "error") return LogLevel::ERROR;
        if (lower == "warn" || lower == "warning") return LogLevel::WARN;
        if (lower == "info") return LogLevel::INFO;
        if (lower == "debug") return LogLevel::DEBUG;
        use_default = true;
        return LogLevel::SILENT;
    }

    class Logger {
        public:
            explicit Logger(LogLevel level = LogLevel::INFO, std::ostream& out = std::cerr)
                : level_(level), out_(&out) {}

            void error(const std::string& msg) { log(LogLevel::ERROR, "ERROR", msg); }
            void warn(const std::string& msg) { log(LogLevel::WARN, "WARN", msg); }
            void info(const std::string& msg) { log(LogLevel::INFO, "INFO", msg); }
            void debug(const std::string& msg) { log(LogLevel::DEBUG, "DEBUG", msg); }

            bool enabled(LogLevel level) const {
                std::lock_guard<std::mutex> lock(mutex_);
                return level != LogLevel::SILENT && level <= level_;
            }

            LogLevel level() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return level_;
            }

            void set_level(LogLevel level) {
                std::lock_guard<std::mutex> lock(mutex_);
                level_ = level;
            }

            /**
             * @brief A new logger that discards everything
             *
             * Each call returns its own instance, so raising its level never
             * affects another owner.
             */
            static std::shared_ptr<Logger> silent() {
                return std::make_shared<Logger>(LogLevel::SILENT);
            }

        private:
            void log(LogLevel level, const char* tag, const std::string& msg) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (level > level_) {
                    return;
                }
                (*out_) << "[" << tag << "] " << msg << std::endl;
            }

            LogLevel level_;
            std::ostream* out_;
            mutable std::mutex mutex_;
    };

} // namespace ds205a
