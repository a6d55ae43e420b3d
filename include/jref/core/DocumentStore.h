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

#include <algorithm>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include <jref/core/DefaultLoader.h>
#include <jref/core/Loader.h>
#include <jref/core/errors.h>
#include <jref/support/logging.h>

namespace jref {

//////////////////////////////////////////////////////////////////////////////
/// @brief Cache of parsed documents keyed by document identifier.
/// Documents are obtained from a chain of Loader handlers, most recently
/// registered first.  The first handler that does not skip wins.  When every
/// handler skips, or the chain is empty, the DefaultLoader is used.
///
/// Handlers are not owned, and must outlive their registration.
//////////////////////////////////////////////////////////////////////////////
class DocumentStore
{
  public:
    DocumentStore() = default;
    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator = (const DocumentStore&) = delete;

    Object load(const String& document_id);

    void register_loader(Loader& loader);
    void unregister_loader(Loader& loader);
    bool is_registered(const Loader& loader) const;
    size_t loader_count() const { return m_loaders.size(); }

    void clear()       { m_loaders.clear(); }
    void cache_clear() { m_cache.clear(); }
    size_t cache_size() const { return m_cache.size(); }

    DefaultLoader& default_loader() { return m_default_loader; }

  private:
    Object fetch(const String& document_id);

  private:
    std::vector<Loader*> m_loaders;
    std::unordered_map<String, Object> m_cache;
    DefaultLoader m_default_loader;
};


inline
Object DocumentStore::load(const String& document_id) {
    if (auto it = m_cache.find(document_id); it != m_cache.end())
        return it->second;

    auto document = fetch(document_id);
    m_cache.insert_or_assign(document_id, document);
    return document;
}

inline
Object DocumentStore::fetch(const String& document_id) {
    DEBUG("Loading document {}", document_id);
    try {
        for (auto it = m_loaders.rbegin(); it != m_loaders.rend(); ++it) {
            auto document = (*it)->load(document_id);
            if (!document.is_empty()) return document;
        }
        return m_default_loader.load(document_id);
    } catch (const DocumentParseError&) {
        throw;
    } catch (const std::exception& error) {
        throw DocumentParseError(fmt::format("Failed to load document {}: {}", document_id, error.what()));
    }
}

inline
void DocumentStore::register_loader(Loader& loader) {
    if (is_registered(loader))
        throw LoaderRegistrationError("Loader is already registered");
    m_loaders.push_back(&loader);
}

inline
void DocumentStore::unregister_loader(Loader& loader) {
    auto it = std::find(m_loaders.begin(), m_loaders.end(), &loader);
    if (it == m_loaders.end())
        throw LoaderRegistrationError("Loader is not registered");
    m_loaders.erase(it);
}

inline
bool DocumentStore::is_registered(const Loader& loader) const {
    return std::find(m_loaders.begin(), m_loaders.end(), &loader) != m_loaders.end();
}

} // namespace jref
