#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace seatledger {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

/// Unknown names map to Info.
inline LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

namespace detail {

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> threshold{[] {
        const char* env_level = std::getenv("SEATLEDGER_LOG_LEVEL");
        return static_cast<int>(env_level ? parse_log_level(env_level) : LogLevel::Info);
    }()};
    return threshold;
}

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

} // namespace detail

inline void set_log_level(LogLevel level) {
    detail::log_threshold().store(static_cast<int>(level));
}

inline LogLevel log_level() {
    return static_cast<LogLevel>(detail::log_threshold().load());
}

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

inline void log_at(LogLevel level, const std::string& domain, const std::string& message,
                   const nlohmann::json& fields = {}) {
    if (static_cast<int>(level) < detail::log_threshold().load()) return;

    nlohmann::json log_entry = {
        {"level", to_string(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    std::lock_guard<std::mutex> lock(detail::log_mutex());
    std::cout << log_entry.dump() << std::endl;
}

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_at(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_at(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_at(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_at(LogLevel::Error, domain, message, fields);
}

} // namespace seatledger
