#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Strict numeric parse: the whole trimmed token must be consumed and finite.
inline bool parseDouble(std::string_view raw, double& out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    const char* b = s.data();
    const char* e = b + s.size();
    if (*b == '+') {
        ++b;
        if (b == e || *b == '+' || *b == '-') return false;
    }
    double value = 0.0;
    auto [p, ec] = std::from_chars(b, e, value, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(value)) return false;
    out = value;
    return true;
}

inline bool parseInt(std::string_view raw, int64_t& out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    const char* b = s.data();
    const char* e = b + s.size();
    if (*b == '+') {
        ++b;
        if (b == e || *b == '+' || *b == '-') return false;
    }
    int64_t value = 0;
    auto [p, ec] = std::from_chars(b, e, value);
    if (ec != std::errc{} || p != e) return false;
    out = value;
    return true;
}

inline double parseDoubleOr(std::string_view raw, double fallback) {
    double value = 0.0;
    return parseDouble(raw, value) ? value : fallback;
}

inline double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

inline std::string toFixed(double value, int decimals) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(decimals) << value;
    return os.str();
}

// 1234567 -> "1,234,567"
inline std::string withThousands(size_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (digits.size() - i) % 3 == 0) out.push_back(',');
        out.push_back(digits[i]);
    }
    return out;
}

inline std::string titleCaseKey(std::string_view key) {
    std::string out;
    out.reserve(key.size());
    bool startWord = true;
    for (char c : key) {
        if (c == '_') {
            out.push_back(' ');
            startWord = true;
            continue;
        }
        const unsigned char uc = static_cast<unsigned char>(c);
        out.push_back(startWord ? static_cast<char>(std::toupper(uc)) : static_cast<char>(std::tolower(uc)));
        startWord = false;
    }
    return out;
}

} // namespace CommonUtils
