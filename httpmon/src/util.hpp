
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace util {

// Logging
void setup_logging(const std::string& level, const std::optional<std::string>& log_file = std::nullopt);

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// String utilities
std::string to_upper(const std::string& str);
std::string to_lower(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);

// Time utilities
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::string format_clock_time(const std::chrono::system_clock::time_point& tp);

// Browser-like User-Agent for requests that do not set one
const char* random_user_agent();

} // namespace util
