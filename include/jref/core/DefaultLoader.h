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

#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <unordered_map>

#include <fmt/format.h>

#include <jref/core/Loader.h>
#include <jref/core/errors.h>
#include <jref/core/uri.h>
#include <jref/parser/json.h>
#include <jref/support/string.h>

#ifdef JREF_WITH_YAML
#include <jref/parser/yaml.h>
#endif

namespace jref {

//////////////////////////////////////////////////////////////////////////////
/// @brief Loader of last resort for a DocumentStore.
/// Fetches the text of a document by its identifier and decodes it.
/// - Identifiers with a URI scheme are fetched by the Fetcher registered for
///   that scheme.  Only the "file" scheme is registered by default.
/// - Other identifiers are filesystem paths, relative to the working directory.
/// - The decoder is chosen by file extension, then by content ('{' or '['
///   selects JSON), then the default decoder is used.
/// - When built with JREF_WITH_YAML (the jref_yaml target), ".yaml" and
///   ".yml" are decoded as YAML, and so are documents of undetermined type.
///   Otherwise the default decoder is JSON.
//////////////////////////////////////////////////////////////////////////////
class DefaultLoader : public Loader
{
  public:
    using Fetcher = std::function<String(const URI&)>;
    using Decoder = std::function<Object(const String&)>;

    DefaultLoader();

    Object load(const String& document_id) override;

    void register_scheme(const String& scheme, const Fetcher& fetcher);
    void remove_scheme(const String& scheme);

    void associate(const String& ext, const Decoder& decoder);
    void set_default_decoder(const Decoder& decoder);
    Decoder get_association(const String& locator) const;

    Object decode(const String& locator, const String& text) const;

    static String read_file(const std::filesystem::path& path);

  protected:
    std::unordered_map<String, Fetcher> m_scheme_map;
    std::unordered_map<String, Decoder> m_ext_map;
    Decoder m_default_decoder;
};


inline
DefaultLoader::DefaultLoader() {
    register_scheme("file", [] (const URI& uri) { return read_file(percent_decode(uri.path)); });
    associate(".json", [] (const String& text) { return json::parse(text); });
#ifdef JREF_WITH_YAML
    auto yaml_decoder = [] (const String& text) { return yaml::parse(text); };
    associate(".yaml", yaml_decoder);
    associate(".yml", yaml_decoder);
    set_default_decoder(yaml_decoder);
#else
    set_default_decoder([] (const String& text) { return json::parse(text); });
#endif
}

inline
void DefaultLoader::register_scheme(const String& scheme, const Fetcher& fetcher) {
    m_scheme_map[to_lower(scheme)] = fetcher;
}

inline
void DefaultLoader::remove_scheme(const String& scheme) {
    m_scheme_map.erase(to_lower(scheme));
}

inline
void DefaultLoader::associate(const String& ext, const Decoder& decoder) {
    m_ext_map[to_lower(ext)] = decoder;
}

inline
void DefaultLoader::set_default_decoder(const Decoder& decoder) {
    m_default_decoder = decoder;
}

inline
DefaultLoader::Decoder DefaultLoader::get_association(const String& locator) const {
    auto ext = to_lower(std::filesystem::path{locator}.extension().string());
    if (auto it = m_ext_map.find(ext); it != m_ext_map.end()) {
        return it->second;
    }
    return {};
}

inline
Object DefaultLoader::load(const String& document_id) {
    String locator;
    String text;

    if (has_scheme(document_id)) {
        auto uri = URI::parse(document_id);
        if (!uri)
            throw DocumentParseError(fmt::format("Unsupported document identifier: {}", document_id));

        auto it = m_scheme_map.find(uri->scheme);
        if (it == m_scheme_map.end())
            throw DocumentParseError(fmt::format("No fetcher for scheme '{}': {}", uri->scheme, document_id));

        locator = uri->path;
        text = it->second(*uri);
    } else {
        auto path = std::filesystem::absolute(std::filesystem::path{document_id});
        locator = path.string();
        text = read_file(path);
    }

    try {
        return decode(locator, text);
    } catch (const parse::SyntaxError& error) {
        throw DocumentParseError(fmt::format("Failed to decode {}: {}", document_id, error.what()));
    }
}

inline
Object DefaultLoader::decode(const String& locator, const String& text) const {
    if (auto decoder = get_association(locator); decoder)
        return decoder(text);

    if (auto type = json::peek_type(text); type == Object::OMAP || type == Object::LIST)
        return json::parse(text);

    if (!m_default_decoder)
        throw DocumentParseError(fmt::format("No decoder for {}", locator));
    return m_default_decoder(text);
}

inline
String DefaultLoader::read_file(const std::filesystem::path& path) {
    std::ifstream f_in{path, std::ios::in | std::ios::binary};
    if (!f_in.is_open())
        throw DocumentParseError(fmt::format("Error opening file: {}", path.string()));
    std::stringstream ss;
    ss << f_in.rdbuf();
    return ss.str();
}

} // namespace jref
