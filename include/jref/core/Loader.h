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

#include <jref/core/Object.h>

namespace jref {

//////////////////////////////////////////////////////////////////////////////
/// @brief A handler in the DocumentStore loader chain.
/// An implementation returns the parsed document, or an empty Object to let
/// the next handler in the chain try.
//////////////////////////////////////////////////////////////////////////////
class Loader
{
  public:
    virtual ~Loader() = default;
    virtual Object load(const String& document_id) = 0;
};


class FunctionLoader : public Loader
{
  public:
    using Function = std::function<Object(const String&)>;

    FunctionLoader(const Function& function) : m_function{function} {}

    Object load(const String& document_id) override { return m_function(document_id); }

  private:
    Function m_function;
};

} // namespace jref
