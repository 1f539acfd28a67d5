#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace textutil {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string s);

// trim + lowercase; every identity key goes through this before a lookup
std::string normalize_key(const std::string& s);

// split on a single delimiter, dropping empty pieces
std::vector<std::string> split(const std::string& s, char delim);

// strict numeric parsing: the whole (trimmed) string must be consumed.
// returns false for empty/garbage/NaN so callers can substitute a default.
bool parse_double(const std::string& s, double& out);
bool parse_int64(const std::string& s, int64_t& out);

}
