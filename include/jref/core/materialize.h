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

#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <jref/core/View.h>
#include <jref/core/pointer.h>
#include <jref/support/exception.h>
#include <jref/support/string.h>

namespace jref {

struct MaterializeOptions
{
    /// Applied to every scalar leaf.
    std::function<Object(const Object&)> value_map;

    /// When not empty, only these keys are kept at each map level.
    std::unordered_set<String> include_keys;
    std::unordered_set<String> exclude_keys;

    /// Called with the address of each map; the returned entry is placed first in the map.
    std::function<std::pair<String, Object>(const String&)> label;
};

namespace impl {

class Materializer
{
  public:
    Materializer(const MaterializeOptions& options) : m_options{options} {}

    Object run(const View& root);

  private:
    struct Placement
    {
        pointer::Segments canonical;
        std::vector<pointer::Segments> aliases;
    };

    Object build(const Entry& entry, pointer::Segments& out_path);
    Object build(const View& view, pointer::Segments& out_path);
    bool keep_key(const String& key) const;
    void link(const Object& result) const;

    static Object follow(const Object& result, pointer::Segments::const_iterator it, pointer::Segments::const_iterator end);

  private:
    const MaterializeOptions& m_options;
    std::unordered_map<Address, Placement> m_placements;
};

inline
Object Materializer::run(const View& root) {
    pointer::Segments out_path;
    auto result = build(root, out_path);
    link(result);
    return result;
}

inline
Object Materializer::build(const Entry& entry, pointer::Segments& out_path) {
    if (auto p_view = std::get_if<View>(&entry); p_view)
        return build(*p_view, out_path);
    auto& value = std::get<Object>(entry);
    return m_options.value_map? m_options.value_map(value): value;
}

inline
Object Materializer::build(const View& view, pointer::Segments& out_path) {
    // an address already placed elsewhere is filled in by link()
    auto [it, inserted] = m_placements.try_emplace(view.address(), Placement{out_path, {}});
    if (!inserted) {
        it->second.aliases.push_back(out_path);
        return nil;
    }

    if (view.is_list()) {
        List list;
        UInt index = 0;
        for (auto& entry : view.values()) {
            out_path.push_back(int_to_str(index++));
            list.push_back(build(entry, out_path));
            out_path.pop_back();
        }
        return list;
    }

    OrderedMap map;
    if (m_options.label) {
        auto [key, value] = m_options.label(view.address().to_str());
        map.insert_or_assign(key, value);
    }
    for (auto& key : view.keys()) {
        if (!keep_key(key)) continue;
        out_path.push_back(key);
        map.insert_or_assign(key, build(view.get(key), out_path));
        out_path.pop_back();
    }
    return map;
}

inline
bool Materializer::keep_key(const String& key) const {
    if (m_options.include_keys.size() > 0 && !m_options.include_keys.contains(key))
        return false;
    return !m_options.exclude_keys.contains(key);
}

inline
void Materializer::link(const Object& result) const {
    for (auto& [address, placement] : m_placements) {
        if (placement.aliases.size() == 0) continue;
        auto target = follow(result, placement.canonical.cbegin(), placement.canonical.cend());
        for (auto& alias : placement.aliases) {
            ASSERT(alias.size() > 0);
            auto parent = follow(result, alias.cbegin(), alias.cend() - 1);
            if (parent.is_list()) {
                parent.set(*str_to_index(alias.back()), target);
            } else {
                parent.set(alias.back(), target);
            }
        }
    }
}

inline
Object Materializer::follow(const Object& result, pointer::Segments::const_iterator it, pointer::Segments::const_iterator end) {
    Object node = result;
    for (; it != end; ++it) {
        if (node.is_list()) {
            node = node.get(*str_to_index(*it));
        } else {
            node = node.get(*it);
        }
    }
    return node;
}

} // namespace impl

//////////////////////////////////////////////////////////////////////////////
/// @brief Convert a View into a plain document with every reference replaced
/// by its target.
///
/// Each distinct address is built once.  Every other place the same address
/// is reached receives the same Object, so shared targets stay shared, and a
/// cyclic reference graph produces a cyclic result.  A cyclic result must be
/// traversed with care: it cannot be printed or compared structurally, and
/// its reference counts never reach zero until it is passed to release().
//////////////////////////////////////////////////////////////////////////////
inline
Object materialize(const View& root, const MaterializeOptions& options = {}) {
    impl::Materializer materializer{options};
    return materializer.run(root);
}

/// @brief Empty every list and map reachable from @p result, breaking the
/// cycles of a materialized graph so its containers can be freed.
/// Containers shared with other Objects are emptied as well.
inline
void release(Object& result) {
    if (!result.is_list() && !result.is_map()) return;
    auto children = result.values();
    result.clear();
    for (auto& child : children)
        release(child);
}

} // namespace jref
