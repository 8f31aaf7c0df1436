#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace floorstock {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

namespace detail {

inline nlohmann::json log_entry(const char* level, const std::string& domain,
                                const std::string& message, const nlohmann::json& fields) {
    nlohmann::json entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        entry[key] = value;
    }
    return entry;
}

} // namespace detail

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    std::cout << detail::log_entry("info", domain, message, fields).dump() << std::endl;
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    std::cout << detail::log_entry("warn", domain, message, fields).dump() << std::endl;
}

/// Same shape as log_info, written to stderr.
inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    std::cerr << detail::log_entry("error", domain, message, fields).dump() << std::endl;
}

} // namespace floorstock
