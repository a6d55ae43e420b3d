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

#include <compare>
#include <functional>
#include <iostream>

#include <fmt/format.h>

#include <jref/core/errors.h>
#include <jref/core/pointer.h>
#include <jref/core/uri.h>
#include <jref/support/types.h>

namespace jref {

//////////////////////////////////////////////////////////////////////////////
/// @brief Immutable location of a value: a document identity and a path of
/// unescaped segments from the root of that document.
/// The canonical string form is "<document-id>#<json-pointer>", for example
/// "schemas/a.json#/definitions/a~1b".
/// Empty segments have no string form of their own: a path through a map key
/// "" prints without it, and parse() drops it.  Compare Address objects, not
/// strings, where such keys may occur.
//////////////////////////////////////////////////////////////////////////////
class Address
{
  public:
    Address(const String& document_id, const pointer::Segments& path = {});
    Address(String&& document_id, pointer::Segments&& path);

    static Address parse(const StringView& text);

    const String& document_id() const     { return m_document_id; }
    const pointer::Segments& path() const { return m_path; }
    bool is_root() const                  { return m_path.size() == 0; }

    Address root() const { return Address{m_document_id}; }
    Address child(const String& segment) const;
    Address child(const pointer::Segments& segments) const;

    template <typename ... Args>
    Address child(const String& first, const String& second, Args&& ... rest) const {
        return child(first).child(second, std::forward<Args>(rest)...);
    }

    Address parent() const;
    Address relative(const StringView& reference) const;

    String pointer() const { return pointer::format(m_path); }
    String to_str() const  { return m_document_id + "#" + pointer(); }
    size_t hash() const;

    bool operator == (const Address&) const = default;
    std::strong_ordering operator <=> (const Address&) const = default;

  private:
    static String join_document_id(const String& base, const StringView& reference);

  private:
    String m_document_id;
    pointer::Segments m_path;
};


inline
Address::Address(const String& document_id, const pointer::Segments& path)
  : m_document_id{document_id}, m_path{path} {
    if (m_document_id.size() == 0)
        throw ReferenceParseError("Address requires a document identifier");
}

inline
Address::Address(String&& document_id, pointer::Segments&& path)
  : m_document_id{std::forward<String>(document_id)}, m_path{std::forward<pointer::Segments>(path)} {
    if (m_document_id.size() == 0)
        throw ReferenceParseError("Address requires a document identifier");
}

/// @brief Parse "<document-id>[#<json-pointer>]".
/// A missing or empty fragment addresses the document root.
/// @throws ReferenceParseError if the document part is empty, or the fragment is not a pointer.
inline
Address Address::parse(const StringView& text) {
    auto hash_pos = text.find('#');
    auto document_id = text.substr(0, hash_pos);
    auto fragment = (hash_pos == StringView::npos)? StringView{}: text.substr(hash_pos + 1);
    if (document_id.size() == 0)
        throw ReferenceParseError(fmt::format("Couldn't parse '{}' as a valid reference: no document", text));
    try {
        return Address{String{document_id}, pointer::parse(fragment)};
    } catch (const ReferenceParseError& error) {
        throw ReferenceParseError(fmt::format("Couldn't parse '{}' as a valid reference: {}", text, error.what()));
    }
}

inline
Address Address::child(const String& segment) const {
    auto path = m_path;
    path.push_back(segment);
    return Address{String{m_document_id}, std::move(path)};
}

inline
Address Address::child(const pointer::Segments& segments) const {
    auto path = m_path;
    path.insert(path.end(), segments.begin(), segments.end());
    return Address{String{m_document_id}, std::move(path)};
}

inline
Address Address::parent() const {
    if (m_path.size() == 0) return *this;
    return Address{String{m_document_id}, pointer::Segments{m_path.begin(), m_path.end() - 1}};
}

/// @brief Resolve a reference string in the context of this address.
/// - "#/a/b" and "" stay in this document.
/// - "http://host/x.json#/a" and "/abs/x.json" are absolute.
/// - "other.json#/a" is joined to the directory of this document.
/// @throws ReferenceParseError if the reference is malformed or resolves to this address.
inline
Address Address::relative(const StringView& reference) const {
    auto hash_pos = reference.find('#');
    auto document_part = reference.substr(0, hash_pos);
    auto fragment = (hash_pos == StringView::npos)? StringView{}: reference.substr(hash_pos + 1);

    pointer::Segments path;
    try {
        path = pointer::parse(fragment);
    } catch (const ReferenceParseError& error) {
        throw ReferenceParseError(fmt::format("Couldn't parse reference '{}' at '{}': {}", reference, to_str(), error.what()));
    }

    String document_id;
    if (document_part.size() == 0) {
        document_id = m_document_id;
    } else if (has_scheme(document_part) || document_part[0] == '/') {
        document_id = String{document_part};
    } else {
        document_id = join_document_id(m_document_id, document_part);
    }

    Address result{std::move(document_id), std::move(path)};
    if (result == *this)
        throw ReferenceParseError(fmt::format("Reference '{}' at '{}' refers to itself", reference, to_str()));
    return result;
}

inline
String Address::join_document_id(const String& base, const StringView& reference) {
    if (auto uri = URI::parse(base); uri) {
        auto dir = uri->path.substr(0, uri->path.rfind('/') + 1);
        if (dir.size() == 0) dir = "/";
        auto path = normalize_path(dir + String{reference});
        return uri->authority() + path;
    }

    auto slash = base.rfind('/');
    String dir = (slash == String::npos)? String{}: base.substr(0, slash + 1);
    return normalize_path(dir + String{reference});
}

inline
size_t Address::hash() const {
    size_t result = std::hash<String>{}(m_document_id);
    for (auto& segment : m_path)
        result = result * 31 + std::hash<String>{}(segment);
    return result;
}

inline
std::ostream& operator << (std::ostream& os, const Address& address) {
    return os << address.to_str();
}

} // namespace jref

namespace std {

template <>
struct hash<jref::Address>
{
    size_t operator () (const jref::Address& address) const { return address.hash(); }
};

} // namespace std
