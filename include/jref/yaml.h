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

#include <jref/core/DefaultLoader.h>
#include <jref/parser/yaml.h>

namespace jref::yaml {

/// @brief Decode ".yaml" and ".yml" documents, and documents of undetermined type, as YAML.
inline
void configure(DefaultLoader& loader) {
    auto decoder = [] (const String& text) { return parse(text); };
    loader.associate(".yaml", decoder);
    loader.associate(".yml", decoder);
    loader.set_default_decoder(decoder);
}

} // namespace jref::yaml
