#pragma once

#include <chrono>
#include <string>

namespace lucid_core::time_format {

// UTC, "YYYY-MM-DD HH:MM:SS". Storage format; sub-second precision is dropped.
std::string to_db_string(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point from_db_string(const std::string& time_str);

// UTC, "YYYY-MM-DDTHH:MM:SSZ". Used on the wire.
std::string to_iso8601(const std::chrono::system_clock::time_point& tp);

}  // namespace lucid_core::time_format
