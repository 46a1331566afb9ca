#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace mergington {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

/// Emit one JSON log line. Lines from concurrent threads never interleave.
/// Invalid UTF-8 in any field is written as U+FFFD.
inline void log_entry(const std::string& level, const std::string& component,
                      const std::string& message, const nlohmann::json& fields) {
    nlohmann::json entry = {
        {"level", level},
        {"message", message},
        {"component", component},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        entry[key] = value;
    }

    static std::mutex out_mutex;
    std::lock_guard<std::mutex> lock(out_mutex);
    std::cout << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry("info", component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry("warn", component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_entry("error", component, message, fields);
}

}  // namespace mergington
