#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace locamat {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

/**
 * Write one JSON log line to stdout. Request threads log concurrently, so
 * the line is rendered first and written under a lock.
 */
inline void log_entry(const char* level, const std::string& domain, const std::string& message,
                      const nlohmann::json& fields) {
    nlohmann::json log_entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }
    const std::string line = log_entry.dump();

    static std::mutex sink_mutex;
    std::lock_guard<std::mutex> lock(sink_mutex);
    std::cout << line << std::endl;
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry("info", domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry("warn", domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_entry("error", domain, message, fields);
}

}  // namespace locamat
