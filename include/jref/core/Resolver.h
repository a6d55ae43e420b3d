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
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include <jref/core/Address.h>
#include <jref/core/DocumentStore.h>
#include <jref/core/errors.h>
#include <jref/support/logging.h>
#include <jref/support/string.h>

namespace jref {

/// Returns the target of a reference node, a map with a string "$ref" entry.
inline
std::optional<String> reference_of(const Object& node) {
    if (!node.is_map()) return {};
    auto ref = node.get("$ref");
    if (!ref.is_str()) return {};
    return ref.as<String>();
}

struct Resolved
{
    Address address;  // where the value physically lives
    Object value;
};

//////////////////////////////////////////////////////////////////////////////
/// @brief Walks addresses through the documents of a DocumentStore, following
/// "$ref" nodes met at any step, including the document root.
///
/// Results are memoized by input address, unless disabled in Options.  The
/// resolver also rejects reference cycles (a -> b -> a) that would otherwise
/// recurse without bound.
//////////////////////////////////////////////////////////////////////////////
class Resolver
{
  public:
    struct Options
    {
        bool cache = true;
    };

    static constexpr size_t max_reference_depth = 256;

    Resolver(DocumentStore& store) : Resolver(store, Options{}) {}
    Resolver(DocumentStore& store, const Options& options) : m_store{store}, m_options{options} {}

    Resolved resolve(const Address& address);
    Resolved resolve(const Address& address, const Object& default_value);
    Object get(const Address& address) { return resolve(address).value; }
    std::pair<Object, String> to_last(const Address& address);

    void cache_clear()        { m_cache.clear(); }
    size_t cache_size() const { return m_cache.size(); }

    DocumentStore& store()    { return m_store; }

  private:
    Resolved walk(const Address& address);
    Item lookup(const Object& node, const Address& address, size_t depth) const;

    class InFlight
    {
      public:
        InFlight(std::unordered_set<Address>& set, const Address& address) : m_set{set}, m_address{address} {
            m_set.insert(m_address);
        }
        ~InFlight() { m_set.erase(m_address); }

      private:
        std::unordered_set<Address>& m_set;
        const Address& m_address;
    };

  private:
    DocumentStore& m_store;
    Options m_options;
    std::unordered_map<Address, Resolved> m_cache;
    std::unordered_set<Address> m_in_flight;
};


inline
Resolved Resolver::resolve(const Address& address) {
    if (m_options.cache) {
        if (auto it = m_cache.find(address); it != m_cache.end())
            return it->second;
    }

    if (m_in_flight.contains(address)) {
        WARN("Reference cycle through {}", address.to_str());
        throw ReferenceParseError(fmt::format("Reference cycle through {}", address.to_str()));
    }
    if (m_in_flight.size() >= max_reference_depth)
        throw ReferenceParseError(fmt::format("Reference chain too deep at {}", address.to_str()));

    InFlight in_flight{m_in_flight, address};
    auto result = walk(address);
    if (m_options.cache)
        m_cache.insert_or_assign(address, result);
    return result;
}

/// @brief Resolve @p address, returning @p default_value in place of a PointerResolutionError.
/// Errors loading documents, and malformed references, are still raised.
inline
Resolved Resolver::resolve(const Address& address, const Object& default_value) {
    try {
        return resolve(address);
    } catch (const PointerResolutionError& error) {
        DEBUG("Using default for {}: {}", address.to_str(), error.what());
        return Resolved{address, default_value};
    }
}

inline
std::pair<Object, String> Resolver::to_last(const Address& address) {
    if (address.is_root())
        return {get(address), ""};
    return {get(address.parent()), address.path().back()};
}

inline
Resolved Resolver::walk(const Address& address) {
    Object node;
    try {
        node = m_store.load(address.document_id());
    } catch (const DocumentParseError& error) {
        throw DocumentParseError(fmt::format("Failed to load base document of {}: {}", address.to_str(), error.what()));
    }

    auto& path = address.path();
    auto current = address.root();
    if (auto ref = reference_of(node); ref) {
        return resolve(current.relative(*ref).child(path));
    }

    for (size_t depth = 0; depth < path.size(); ++depth) {
        auto [key, child] = lookup(node, address, depth);
        node = child;
        current = current.child(key);
        if (auto ref = reference_of(node); ref) {
            pointer::Segments rest{path.begin() + depth + 1, path.end()};
            return resolve(current.relative(*ref).child(rest));
        }
    }

    return Resolved{current, node};
}

/// Returns the child at path[depth] with the key it is stored under, which
/// differs from the segment when the key was found by percent-decoding.
inline
Item Resolver::lookup(const Object& node, const Address& address, size_t depth) const {
    auto& path = address.path();
    auto& segment = path[depth];

    switch (node.type()) {
        case Object::OMAP: {
            if (node.contains(segment))
                return {segment, node.get(segment)};
            auto decoded = percent_decode(segment);
            if (decoded != segment && node.contains(decoded))
                return {decoded, node.get(decoded)};
            throw PointerResolutionError(fmt::format("Cannot resolve {}: no key '{}' at {}",
                address.to_str(), segment, pointer::format(path.begin(), path.begin() + depth)));
        }
        case Object::LIST: {
            auto index = str_to_index(segment);
            if (!index)
                throw PointerResolutionError(fmt::format("Cannot resolve {}: '{}' is not an array index at {}",
                    address.to_str(), segment, pointer::format(path.begin(), path.begin() + depth)));
            if (*index >= node.size())
                throw PointerResolutionError(fmt::format("Cannot resolve {}: index {} out of range at {}",
                    address.to_str(), *index, pointer::format(path.begin(), path.begin() + depth)));
            return {int_to_str(*index), node.get(*index)};
        }
        default:
            throw PointerResolutionError(fmt::format("Cannot resolve {}: {} at {} is not a container",
                address.to_str(), node.type_name(), pointer::format(path.begin(), path.begin() + depth)));
    }
}

/// Per-thread resolver over its own DocumentStore, for casual use.
inline
Resolver& default_resolver() {
    thread_local DocumentStore store;
    thread_local Resolver resolver{store};
    return resolver;
}

} // namespace jref
