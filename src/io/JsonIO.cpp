#include "io/JsonIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static void require_row(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& v = it.value();
        if (v.is_string() || v.is_number() || v.is_boolean() || v.is_null()) continue;
        throw std::runtime_error(where + "." + it.key() + " must be a string or a number");
    }
}

std::vector<json> rowsFromJson(const json& j, const std::string& where) {
    // accept either a bare array or {"rows": [...]}
    const json* arr = &j;
    std::string arr_where = where;
    if (j.is_object() && j.contains("rows")) {
        arr = &j.at("rows");
        arr_where = where + ".rows";
    }
    require_array(*arr, arr_where);

    std::vector<json> rows;
    rows.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        std::ostringstream oss;
        oss << arr_where << "[" << i << "]";
        require_row(arr->at(i), oss.str());
        rows.push_back(arr->at(i));
    }
    return rows;
}

std::vector<json> loadRows(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open rows file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return rowsFromJson(j, "root");
}
