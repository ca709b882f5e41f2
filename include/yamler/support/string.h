// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <string>
#include <sstream>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <optional>
#include <cmath>
#include <cstdlib>
#include <cerrno>

#include <fmt/format.h>

#include <yamler/support/types.h>

namespace yamler {

// string quoting, in case std::quoted method is slow
inline
std::string quoted(const std::string& str) {
  std::stringstream ss;
  ss << std::quoted(str);
  return ss.str();
}

inline
std::string int_to_str(Int v) {
    return fmt::format("{}", v);
}

/// Format a double in the shortest form that reads back as the same double,
/// and that still reads back as a float (never as an integer).
inline
std::string float_to_str(Float v) {
    if (std::isnan(v)) return ".nan";
    if (std::isinf(v)) return v < 0? "-.inf": ".inf";
    auto str = fmt::format("{}", v);
    if (str.find_first_of(".eEn") == std::string::npos)
        str.append(".0");
    return str;
}

inline
std::string to_lower(const StringView& str) {
    std::string result{str};
    for (auto& c : result) c = (char)std::tolower((unsigned char)c);
    return result;
}

inline
bool is_blank(char c) { return c == ' ' || c == '\t'; }

inline
StringView ltrim(const StringView& str) {
    size_t pos = 0;
    while (pos < str.size() && std::isspace((unsigned char)str[pos])) ++pos;
    return str.substr(pos);
}

inline
StringView rtrim(const StringView& str) {
    size_t len = str.size();
    while (len > 0 && std::isspace((unsigned char)str[len - 1])) --len;
    return str.substr(0, len);
}

inline
StringView trim(const StringView& str) { return rtrim(ltrim(str)); }

inline
bool starts_with(const StringView& str, const StringView& prefix) {
    return str.substr(0, prefix.size()) == prefix;
}

/// Parse a complete decimal integer (optional sign), returning nothing on
/// syntax error or overflow.
inline
std::optional<Int> str_to_int(const StringView& str) {
    if (str.size() == 0) return {};
    const char* beg = str.data();
    const char* end = beg + str.size();
    if (*beg == '+') ++beg;
    if (beg == end) return {};
    Int value;
    auto [ptr, ec] = std::from_chars(beg, end, value);
    if (ec != std::errc{} || ptr != end) return {};
    return value;
}

/// Parse a complete integer in any of the notations recognized for plain
/// scalars: decimal, 0x hexadecimal, 0o octal.
inline
std::optional<Int> str_to_int_any_base(const StringView& str) {
    if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'o')) {
        int base = str[1] == 'x'? 16: 8;
        const char* beg = str.data() + 2;
        const char* end = str.data() + str.size();
        Int value;
        auto [ptr, ec] = std::from_chars(beg, end, value, base);
        if (ec != std::errc{} || ptr != end) return {};
        return value;
    }
    return str_to_int(str);
}

/// Parse a complete floating point number, including the .inf and .nan
/// spellings.
inline
std::optional<Float> str_to_float(const StringView& str) {
    if (str.size() == 0) return {};
    auto body = str;
    bool negative = false;
    if (body[0] == '-' || body[0] == '+') {
        negative = body[0] == '-';
        body = body.substr(1);
    }
    if (body == ".inf" || body == ".Inf" || body == ".INF")
        return negative? -INFINITY: INFINITY;
    if (str == ".nan" || str == ".NaN" || str == ".NAN")
        return NAN;

    std::string copy{str};
    char* end = nullptr;
    errno = 0;
    Float value = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size() || copy.size() == 0) return {};
    if (errno == ERANGE && std::isinf(value)) return {};
    for (char c : copy) {
        if (!(std::isdigit((unsigned char)c) || c == '.' || c == 'e' || c == 'E' || c == '-' || c == '+'))
            return {};
    }
    return value;
}

/// Interpret the textual booleans accepted by the typed getters.
inline
std::optional<bool> str_to_bool(const StringView& str) {
    auto lower = to_lower(str);
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
    if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
    return {};
}

} // namespace yamler
