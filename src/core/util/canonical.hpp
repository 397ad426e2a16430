#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fieldops::util {

std::int64_t unix_millis_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::vector<std::string> split_csv(std::string_view text);
std::string join_csv(const std::vector<std::string>& values);
std::vector<std::string_view> split_tabs(std::string_view line);

std::string to_hex(std::string_view bytes);
bool from_hex(std::string_view hex, std::string& out);

bool parse_int64(std::string_view text, std::int64_t& out);
bool parse_uint64(std::string_view text, std::uint64_t& out);

}  // namespace fieldops::util
