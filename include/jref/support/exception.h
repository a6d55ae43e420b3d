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

#include <exception>
#include <string>

#define ASSERT(cond) { if (!(cond)) throw ::jref::Assert{std::string{__FILE__} + ":" + std::to_string(__LINE__) + ": " + #cond}; }

namespace jref {

class NoTraceException : public std::exception
{
  public:
    NoTraceException(std::string&& msg) : m_msg{std::move(msg)} {}
    const char* what() const noexcept override { return m_msg.data(); }
  private:
    std::string m_msg;
};

} // jref namespace

#if __has_include("cpptrace/cpptrace.hpp")
#include <cpptrace/cpptrace.hpp>
#define JREF_BASE_EXCEPTION cpptrace::exception_with_message
#else
#define JREF_BASE_EXCEPTION ::jref::NoTraceException
#endif

namespace jref {

/// Base of every exception thrown by jref.  Carries a stack trace when
/// cpptrace is available.
class JrefException : public JREF_BASE_EXCEPTION
{
  public:
    JrefException(std::string&& msg) : JREF_BASE_EXCEPTION(std::forward<std::string>(msg)) {}
};

/// Internal invariant violation, thrown by ASSERT.
class Assert : public JREF_BASE_EXCEPTION
{
  public:
    Assert(std::string&& msg) : JREF_BASE_EXCEPTION(std::forward<std::string>(msg)) {}
};

} // jref namespace
