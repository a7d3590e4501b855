#pragma once
#include <vector>
#include <string>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <span>

namespace Utils {

inline std::string binToHex(std::span<const uint8_t> data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t b : data) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

inline std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::string item;
    std::istringstream in(s);
    while (std::getline(in, item, delimiter)) {
        parts.push_back(item);
    }
    return parts;
}

// Collapses any run of whitespace into a single space.
inline std::string joinWords(const std::string& text) {
    std::istringstream in(text);
    std::string word;
    std::string out;
    while (in >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

inline std::string urlDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < in.size()
                   && std::isxdigit(static_cast<unsigned char>(in[i + 1]))
                   && std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

inline std::string urlEncode(const std::string& in) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return out.str();
}

// "a=1&b=x%20y" -> {a: 1, b: "x y"}. Later duplicates win.
inline std::map<std::string, std::string> parseQueryString(const std::string& query) {
    std::map<std::string, std::string> params;
    for (const auto& pair : split(query, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            params[urlDecode(pair)] = "";
        } else {
            params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
        }
    }
    return params;
}

inline std::string buildQueryString(const std::map<std::string, std::string>& params) {
    std::string queryString;
    for (const auto& [key, value] : params) {
        queryString += urlEncode(key) + "=" + urlEncode(value) + "&";
    }
    if (!queryString.empty()) queryString.pop_back();
    return queryString;
}

// Decimal money string -> integer hundredths. "9.9" and "9.90" both give 990.
// Anything with more than two significant fractional digits is rejected.
inline std::optional<int64_t> parseMinorUnits(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    auto dot = s.find('.');
    std::string whole = s.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : s.substr(dot + 1);

    if (whole.empty() || whole.size() > 15) return std::nullopt;
    auto isDigits = [](const std::string& v) {
        return std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); });
    };
    if (!isDigits(whole) || !isDigits(frac)) return std::nullopt;

    while (frac.size() > 2 && frac.back() == '0') frac.pop_back();
    if (frac.size() > 2) return std::nullopt;
    frac.resize(2, '0');

    return std::stoll(whole) * 100 + std::stoll(frac);
}

}
