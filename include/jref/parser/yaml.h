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

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>

#include <yaml-cpp/yaml.h>

#include <jref/core/Object.h>
#include <jref/support/parse.h>

/////////////////////////////////////////////////////////////////////////////
/// YAML decoding with yaml-cpp.
/// Plain scalars are typed with the YAML 1.2 core schema (null, bool, int,
/// float, string).  Quoted scalars are always strings.
/////////////////////////////////////////////////////////////////////////////
namespace jref::yaml {

namespace impl {

inline
Object convert_integer(const String& text, int base) {
    auto digits = text;
    bool negative = false;
    if (digits[0] == '-' || digits[0] == '+') {
        negative = digits[0] == '-';
        digits = digits.substr(1);
    }
    if (base != 10) digits = digits.substr(2);

    errno = 0;
    auto value = std::strtoull(digits.c_str(), nullptr, base);
    if (errno == ERANGE) {
        errno = 0;
        return std::strtod(text.c_str(), nullptr);
    }
    if (!negative) {
        if (value <= (UInt)std::numeric_limits<Int>::max()) return (Int)value;
        return (UInt)value;
    }
    if (value <= (UInt)std::numeric_limits<Int>::max()) return -(Int)value;
    return -(Float)value;
}

inline
Object convert_scalar(const YAML::Node& node) {
    static std::regex int_re{R"([-+]?[0-9]+)"};
    static std::regex oct_re{R"(0o[0-7]+)"};
    static std::regex hex_re{R"(0x[0-9a-fA-F]+)"};
    static std::regex float_re{R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?)"};
    static std::regex inf_re{R"([-+]?\.(inf|Inf|INF))"};
    static std::regex nan_re{R"(\.(nan|NaN|NAN))"};

    auto& text = node.Scalar();
    if (node.Tag() == "!") return text;

    if (text.size() == 0 || text == "~" || text == "null" || text == "Null" || text == "NULL") return nil;
    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;
    if (std::regex_match(text, int_re)) return convert_integer(text, 10);
    if (std::regex_match(text, oct_re)) return convert_integer(text, 8);
    if (std::regex_match(text, hex_re)) return convert_integer(text, 16);
    if (std::regex_match(text, float_re)) return std::strtod(text.c_str(), nullptr);
    if (std::regex_match(text, inf_re))
        return text[0] == '-'? -std::numeric_limits<Float>::infinity(): std::numeric_limits<Float>::infinity();
    if (std::regex_match(text, nan_re)) return std::numeric_limits<Float>::quiet_NaN();
    return text;
}

inline
Object convert(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return convert_scalar(node);
        case YAML::NodeType::Sequence: {
            List list;
            for (const auto& child : node)
                list.push_back(convert(child));
            return list;
        }
        case YAML::NodeType::Map: {
            OrderedMap map;
            for (auto it = node.begin(); it != node.end(); ++it) {
                if (!it->first.IsScalar())
                    throw YAML::ParserException(it->first.Mark(), "map keys must be scalars");
                map.insert_or_assign(it->first.Scalar(), convert(it->second));
            }
            return map;
        }
        default:
            return nil;
    }
}

} // namespace impl

/// @brief Parse a YAML document.
/// @throws parse::SyntaxError on malformed input.
inline
Object parse(const String& text) {
    try {
        return impl::convert(YAML::Load(text));
    } catch (const YAML::Exception& error) {
        throw parse::SyntaxError(text, error.mark.pos < 0? 0: (size_t)error.mark.pos, "YAML parse error: " + error.msg);
    }
}

} // namespace jref::yaml
