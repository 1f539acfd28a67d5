#pragma once
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

// Reads a JSON array of row objects ({"field": "value" | number, ...}).
// Throws std::runtime_error with the location of the first bad element.
std::vector<nlohmann::json> loadRows(const std::string& path);

// Same validation on an already-parsed document; `where` prefixes error messages.
std::vector<nlohmann::json> rowsFromJson(const nlohmann::json& j, const std::string& where);
