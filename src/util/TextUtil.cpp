#include "util/TextUtil.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace textutil {

std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string normalize_key(const std::string& s) {
    return to_lower_copy(trim_copy(s));
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;

    for (char c : s) {
        if (c == delim) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

bool parse_double(const std::string& s, double& out) {
    const std::string t = trim_copy(s);
    if (t.empty()) return false;

    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (errno == ERANGE || end != t.c_str() + t.size()) return false;
    if (!std::isfinite(v)) return false;

    out = v;
    return true;
}

bool parse_int64(const std::string& s, int64_t& out) {
    // accept "3", "3.0" and "3.7" (truncated) the way spreadsheet exports write integers
    double v = 0.0;
    if (!parse_double(s, v)) return false;
    if (v > 9.2e18 || v < -9.2e18) return false;

    out = static_cast<int64_t>(v);
    return true;
}

}
