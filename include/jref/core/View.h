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
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <jref/core/Address.h>
#include <jref/core/Resolver.h>
#include <jref/core/errors.h>
#include <jref/support/string.h>

namespace jref {

class View;

/// A child of a View: a scalar, or a nested map/list View.
using Entry = std::variant<Object, View>;

//////////////////////////////////////////////////////////////////////////////
/// @brief Read-only map or list proxy over a resolved address.
///
/// Children are looked up in the node already held by the view.  A child that
/// is a reference node is resolved on access, so a View can be traversed like
/// a plain document without ever seeing "$ref".
///
/// A View does not own its Resolver, which must outlive it.
//////////////////////////////////////////////////////////////////////////////
class View
{
  public:
    enum Kind { MAP, LIST };

    View(Resolver& resolver, const Address& address);
    View(Resolver& resolver, const Address& address, Kind kind);

    static Entry from_address(Resolver& resolver, const Address& address);

    const Address& address() const { return m_address; }
    Kind kind() const              { return m_kind; }
    bool is_map() const            { return m_kind == MAP; }
    bool is_list() const           { return m_kind == LIST; }
    Resolver& resolver() const     { return *mp_resolver; }

    Entry get(const StringView& segment) const;
    Entry get(is_integral auto index) const;
    bool contains(const StringView& segment) const;
    size_t size() const { return m_node.size(); }

    KeyList keys() const;
    std::vector<std::pair<String, Entry>> items() const;
    std::vector<Entry> values() const;

    Object raw() const     { return m_node; }
    String to_json(int indent = 0) const { return m_node.to_json(indent); }
    Object expand() const;

    bool operator == (const View& other) const   { return expand() == other.expand(); }
    bool operator == (const Object& other) const { return expand() == other; }

  private:
    View(Resolver* p_resolver, const Address& address, Kind kind, const Object& node);

    static std::optional<Kind> classify(const Object& node);
    Entry wrap(const String& segment, const Object& child) const;
    Entry child_at(UInt index) const;
    Object expand(std::unordered_set<Address>& visiting) const;

  private:
    Resolver* mp_resolver;
    Address m_address;
    Kind m_kind;
    Object m_node;
};


inline
std::string_view kind_name(View::Kind kind) {
    return kind == View::MAP? "map": "list";
}

inline
std::optional<View::Kind> View::classify(const Object& node) {
    switch (node.type()) {
        case Object::OMAP: return MAP;
        case Object::LIST: return LIST;
        default:           return {};
    }
}

inline
View::View(Resolver* p_resolver, const Address& address, Kind kind, const Object& node)
  : mp_resolver{p_resolver}, m_address{address}, m_kind{kind}, m_node{node} {}

inline
View::View(Resolver& resolver, const Address& address)
  : mp_resolver{&resolver}, m_address{address}, m_kind{MAP} {
    auto resolved = resolver.resolve(address);
    auto kind = classify(resolved.value);
    if (!kind)
        throw ConstructionTypeError(fmt::format("The value at '{}' is not a map or list. Got {}",
            address.to_str(), resolved.value.type_name()));
    m_address = resolved.address;
    m_kind = *kind;
    m_node = resolved.value;
}

inline
View::View(Resolver& resolver, const Address& address, Kind kind)
  : View(resolver, address) {
    if (m_kind != kind)
        throw ConstructionTypeError(fmt::format("The value at '{}' is not a {}. Got {}",
            address.to_str(), kind_name(kind), m_node.type_name()));
}

/// @brief Resolve @p address and wrap the result.
/// @return A View for a map or list, otherwise the scalar value.
inline
Entry View::from_address(Resolver& resolver, const Address& address) {
    auto resolved = resolver.resolve(address);
    if (auto kind = classify(resolved.value); kind)
        return View{&resolver, resolved.address, *kind, resolved.value};
    return resolved.value;
}

inline
Entry View::wrap(const String& segment, const Object& child) const {
    auto child_address = m_address.child(segment);
    if (auto ref = reference_of(child); ref)
        return from_address(*mp_resolver, child_address.relative(*ref));
    if (auto kind = classify(child); kind)
        return View{mp_resolver, child_address, *kind, child};
    return child;
}

inline
Entry View::child_at(UInt index) const {
    if (index >= m_node.size())
        throw PointerResolutionError(fmt::format("Index {} out of range at {}", index, m_address.to_str()));
    return wrap(int_to_str(index), m_node.get(index));
}

inline
Entry View::get(const StringView& segment) const {
    if (m_kind == LIST) {
        auto index = str_to_index(segment);
        if (!index)
            throw PointerResolutionError(fmt::format("'{}' is not an array index at {}", segment, m_address.to_str()));
        return child_at(*index);
    }

    if (!m_node.contains(segment))
        throw PointerResolutionError(fmt::format("No key '{}' at {}", segment, m_address.to_str()));
    return wrap(String{segment}, m_node.get(segment));
}

inline
Entry View::get(is_integral auto index) const {
    if (m_kind != LIST)
        throw PointerResolutionError(fmt::format("Cannot index map at {} with {}", m_address.to_str(), index));
    if constexpr (std::is_signed<decltype(index)>::value) {
        if (index < 0)
            throw PointerResolutionError(fmt::format("Negative index {} at {}", index, m_address.to_str()));
    }
    return child_at((UInt)index);
}

inline
bool View::contains(const StringView& segment) const {
    if (m_kind == LIST) {
        auto index = str_to_index(segment);
        return index && *index < m_node.size();
    }
    return m_node.contains(segment);
}

inline
KeyList View::keys() const {
    return m_node.keys();
}

inline
std::vector<std::pair<String, Entry>> View::items() const {
    std::vector<std::pair<String, Entry>> items;
    for (auto& key : m_node.keys())
        items.emplace_back(key, get(key));
    return items;
}

inline
std::vector<Entry> View::values() const {
    std::vector<Entry> values;
    if (m_kind == LIST) {
        for (UInt i = 0; i < m_node.size(); ++i)
            values.push_back(child_at(i));
    } else {
        for (auto& key : m_node.keys())
            values.push_back(get(key));
    }
    return values;
}

/// @brief Returns a plain copy of this view with every reference replaced by its target.
/// @throws ReferenceParseError if the reference graph reachable from this view is cyclic.
inline
Object View::expand() const {
    std::unordered_set<Address> visiting;
    return expand(visiting);
}

inline
Object View::expand(std::unordered_set<Address>& visiting) const {
    if (!visiting.insert(m_address).second)
        throw ReferenceParseError(fmt::format("Cannot expand cyclic reference graph at {}", m_address.to_str()));

    auto expand_entry = [&visiting] (const Entry& entry) -> Object {
        if (auto p_view = std::get_if<View>(&entry); p_view)
            return p_view->expand(visiting);
        return std::get<Object>(entry).copy();
    };

    Object result;
    if (m_kind == LIST) {
        List list;
        for (auto& value : values())
            list.push_back(expand_entry(value));
        result = std::move(list);
    } else {
        OrderedMap map;
        for (auto& [key, value] : items())
            map.insert_or_assign(key, expand_entry(value));
        result = std::move(map);
    }

    visiting.erase(m_address);
    return result;
}

} // namespace jref
