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

#include <optional>
#include <regex>
#include <sstream>
#include <vector>

#include <jref/support/string.h>
#include <jref/support/types.h>

namespace jref {

/////////////////////////////////////////////////////////////////////////////
/// @brief Components of a hierarchical URI (scheme://user@host:port/path?query#fragment).
/////////////////////////////////////////////////////////////////////////////
struct URI
{
    String scheme;
    String user;
    String host;
    std::optional<int> port;
    String path;
    String query;
    String fragment;

    static std::optional<URI> parse(const String& spec);

    String authority() const;
    String to_str() const;
};

/// True if @p spec starts with a URI scheme ("http:", "file:", "urn:").  Single letter schemes
/// are not recognized, so that Windows drive letters read as paths.
inline
bool has_scheme(const StringView& spec) {
    static std::regex scheme_re{R"(^[A-Za-z][A-Za-z0-9+.\-]+:)"};
    return std::regex_search(spec.begin(), spec.end(), scheme_re);
}

inline
std::optional<URI> URI::parse(const String& spec) {
    static std::regex uri_re{R"(([^:/?#]+)://(([^@/]+)@)?([^:/?#]*)(:(\d+))?((/[^?#]*)?(\?([^#]*))?(#(.*))?)?)"};

    std::smatch match;
    if (!std::regex_match(spec, match, uri_re))
        return {};

    URI uri;
    uri.scheme = to_lower(match[1].str());
    if (match[3].length() > 0) uri.user = match[3].str();
    if (match[4].length() > 0) uri.host = match[4].str();
    if (match[6].length() > 0) uri.port = (int)str_to_int(match[6].str());
    if (match[8].length() > 0) uri.path = match[8].str();
    if (match[10].matched)     uri.query = match[10].str();
    if (match[12].matched)     uri.fragment = match[12].str();
    return uri;
}

inline
String URI::authority() const {
    std::stringstream ss;
    ss << scheme << "://";
    if (user.size() > 0) ss << user << '@';
    ss << host;
    if (port) ss << ':' << *port;
    return ss.str();
}

inline
String URI::to_str() const {
    std::stringstream ss;
    ss << authority() << path;
    if (query.size() > 0) ss << '?' << query;
    if (fragment.size() > 0) ss << '#' << fragment;
    return ss.str();
}

/// Collapse "." and ".." segments of a '/' separated path.  Leading ".." segments of a relative
/// path are kept, and an absolute path never climbs above "/".
inline
String normalize_path(const StringView& path) {
    bool absolute = path.size() > 0 && path[0] == '/';
    std::vector<StringView> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == StringView::npos) next = path.size();
        auto part = path.substr(pos, next - pos);
        if (part == "..") {
            if (parts.size() > 0 && parts.back() != "..") {
                parts.pop_back();
            } else if (!absolute) {
                parts.push_back(part);
            }
        } else if (part.size() > 0 && part != ".") {
            parts.push_back(part);
        }
        pos = next + 1;
    }

    String result = absolute? "/": "";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result.push_back('/');
        result.append(parts[i].data(), parts[i].size());
    }
    if (path.size() > 1 && path.back() == '/' && parts.size() > 0)
        result.push_back('/');
    return result;
}

} // namespace jref
