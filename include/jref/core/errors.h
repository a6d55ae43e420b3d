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

#include <jref/support/exception.h>

namespace jref {

/// Malformed reference string, or a reference that resolves to the address holding it.
struct ReferenceParseError : public JrefException
{
    ReferenceParseError(std::string&& error) : JrefException(std::forward<std::string>(error)) {}
};

/// A document could not be fetched or decoded.
struct DocumentParseError : public JrefException
{
    DocumentParseError(std::string&& error) : JrefException(std::forward<std::string>(error)) {}
};

/// A pointer could not be walked through a document.
struct PointerResolutionError : public JrefException
{
    PointerResolutionError(std::string&& error) : JrefException(std::forward<std::string>(error)) {}
};

/// A view was bound to a value of the wrong kind.
struct ConstructionTypeError : public JrefException
{
    ConstructionTypeError(std::string&& error) : JrefException(std::forward<std::string>(error)) {}
};

struct LoaderRegistrationError : public JrefException
{
    LoaderRegistrationError(std::string&& error) : JrefException(std::forward<std::string>(error)) {}
};

} // namespace jref
