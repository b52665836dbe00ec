#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gambit::util {

std::int64_t unix_timestamp_now();
std::int64_t unix_millis_now();
std::string iso8601_utc(std::int64_t unix_seconds);

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::string to_hex(std::string_view bytes);
std::string from_hex(std::string_view hex);
bool is_hex_of_size(std::string_view text, std::size_t bytes);

std::vector<std::string> split(std::string_view text, char delimiter);
bool contains_case_insensitive(std::string_view haystack, std::string_view needle);

}  // namespace gambit::util
