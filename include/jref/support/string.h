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
#include <charconv>
#include <optional>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include <jref/support/types.h>
#include <jref/support/exception.h>

namespace jref {

inline
std::string int_to_str(Int v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%lld", (long long)v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string int_to_str(UInt v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%llu", (unsigned long long)v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

/// Round-trip text for a JSON number. Integral values keep a ".0"
/// so they read back as floats, and non-finite values are written as
/// Infinity, -Infinity and NaN.
inline
std::string float_to_str(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v < 0? "-Infinity": "Infinity";

    // log10(2**53) is 15.95, so 15 digits always survive, 17 always round-trip
    char buf[32];
    auto len = std::snprintf(buf, sizeof(buf), "%.15g", v);
    if (std::strtod(buf, nullptr) != v)
        len = std::snprintf(buf, sizeof(buf), "%.17g", v);
    ASSERT(len > 0);

    std::string str{buf, (size_t)len};
    if (str.find_first_of(".e") == std::string::npos)
        str += ".0";
    return str;
}

inline
Int str_to_int(const StringView& str) {
    Int value;
    const char* beg = str.data();
    const char* end = beg + str.size();
    auto result = std::from_chars(beg, end, value);
    ASSERT(result.ec == std::errc());
    return value;
}

/// Parse the whole of @p str as a number of type T.
template <typename T>
std::optional<T> str_to_number(const StringView& str) {
    T value;
    auto end = str.data() + str.size();
    auto result = std::from_chars(str.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) return {};
    return value;
}

/// Parse a base-10, non-negative array index. Signs, whitespace and empty strings are rejected.
inline
std::optional<UInt> str_to_index(const StringView& str) {
    if (str.size() == 0) return {};
    for (char c : str)
        if (c < '0' || c > '9') return {};
    UInt value;
    auto result = std::from_chars(str.data(), str.data() + str.size(), value, 10);
    if (result.ec != std::errc() || result.ptr != str.data() + str.size()) return {};
    return value;
}

inline
String to_lower(const StringView& str) {
    String result{str};
    for (auto& c : result)
        c = (char)std::tolower((unsigned char)c);
    return result;
}

/// Decode %XX escapes. Malformed escapes are copied through unchanged.
inline
String percent_decode(const StringView& str) {
    auto hex = [] (char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    String result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '%' && i + 2 < str.size()) {
            int hi = hex(str[i + 1]);
            int lo = hex(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result.push_back((char)((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        result.push_back(c);
    }
    return result;
}

} // jref namespace
