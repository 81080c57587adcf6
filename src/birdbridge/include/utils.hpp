#pragma once
#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

using SystemTime = std::chrono::system_clock::time_point;

std::string now_timestamp_filename();   // e.g. 2025-08-15_12-34-56
bool ensure_dir(const std::string& path);

// ISO-8601 UTC with milliseconds: "2025-08-16T14:32:10.123Z"
std::string to_iso8601(SystemTime t);
std::optional<SystemTime> parse_iso8601(const std::string& s);

// Local calendar fields of a point in time.
std::tm local_tm(SystemTime t);
std::string local_date(SystemTime t);   // "2025-08-16"

std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char sep);

std::string url_decode(const std::string& s);
// Value of `name` in an a=b&c=d query string, decoded; empty when absent.
std::string query_param(const std::string& query, const std::string& name);

// Base-36 random token of `len` characters.
std::string random_token(std::size_t len);
