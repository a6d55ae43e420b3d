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

#include <vector>

#include <fmt/format.h>

#include <jref/core/errors.h>
#include <jref/support/types.h>

/////////////////////////////////////////////////////////////////////////////
/// JSON Pointer (RFC 6901) segment handling.
/// - "~0" encodes "~" and "~1" encodes "/".
/// - Empty segments are ignored, so "/" and "" both address the root.  A
///   path holding an empty key therefore formats to a pointer that parses
///   without it.
/////////////////////////////////////////////////////////////////////////////
namespace jref::pointer {

using Segments = std::vector<String>;

inline
String escape(const StringView& segment) {
    String result;
    result.reserve(segment.size());
    for (char c : segment) {
        switch (c) {
            case '~': result += "~0"; break;
            case '/': result += "~1"; break;
            default:  result.push_back(c); break;
        }
    }
    return result;
}

inline
String unescape(const StringView& segment) {
    String result;
    result.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        char c = segment[i];
        if (c != '~') {
            result.push_back(c);
            continue;
        }
        if (i + 1 == segment.size())
            throw ReferenceParseError(fmt::format("Dangling '~' in pointer segment '{}'", segment));
        switch (segment[++i]) {
            case '0': result.push_back('~'); break;
            case '1': result.push_back('/'); break;
            default:
                throw ReferenceParseError(fmt::format("Invalid escape '~{}' in pointer segment '{}'", segment[i], segment));
        }
    }
    return result;
}

inline
Segments parse(const StringView& pointer) {
    Segments segments;
    if (pointer.size() == 0) return segments;
    if (pointer[0] != '/')
        throw ReferenceParseError(fmt::format("JSON pointer must start with '/': '{}'", pointer));

    size_t pos = 1;
    while (pos <= pointer.size()) {
        auto next = pointer.find('/', pos);
        if (next == StringView::npos) next = pointer.size();
        auto segment = pointer.substr(pos, next - pos);
        if (segment.size() > 0)
            segments.push_back(unescape(segment));
        pos = next + 1;
    }
    return segments;
}

template <typename Iterator>
String format(Iterator it, Iterator end) {
    if (it == end) return "/";
    String result;
    for (; it != end; ++it) {
        result.push_back('/');
        result += escape(*it);
    }
    return result;
}

inline
String format(const Segments& segments) {
    return pointer::format(segments.cbegin(), segments.cend());
}

} // namespace jref::pointer
