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

#include <fmt/format.h>
#include <atomic>
#include <cstring>
#include <functional>
#include <iostream>
#include <string_view>

namespace jref {
namespace log {

enum Level
{
    FATAL,
    ERROR,
    WARNING,
    DEBUG,
};

/// Receives each enabled message with its trimmed source file name and line.
using Sink = std::function<void(Level, std::string_view file, int line, std::string_view message)>;

namespace impl {
inline std::atomic<int> level = WARNING;
inline Sink sink;
} // namespace impl

inline void set_level(Level new_level) { impl::level = new_level; }
inline Level get_level() { return (Level)impl::level.load(); }
inline bool enabled(Level level) { return impl::level >= level; }

/// Replace the colored std::clog output.  An empty sink restores it.
/// Not synchronized with concurrent logging: install the sink at startup.
inline void set_sink(Sink sink) { impl::sink = std::move(sink); }

inline
const char* level_name(Level level) {
    switch (level) {
        case FATAL:   return "FATAL";
        case ERROR:   return "ERROR";
        case WARNING: return "WARNING";
        case DEBUG:   return "DEBUG";
        default:      return "?";
    }
}

constexpr auto HEADING = "\033[38;5;39m";
constexpr auto MESSAGE = " \033[38;5;39m";
constexpr auto SOURCE = "\033[38;5;7m";
constexpr auto RESTORE = "\033[0m";

inline
std::string_view trim_file_name(const char* file) {
    auto len = std::strlen(file);
    return (len > 20)? std::string_view{(file + len - 20), 20}: std::string_view{file, len};
}

inline
void write(Level level, const char* file, int line, std::string_view message) {
    auto source = trim_file_name(file);
    if (impl::sink) {
        impl::sink(level, source, line, message);
        return;
    }
    std::clog << HEADING << '[' << level_name(level) << "] " << SOURCE << source << ':' << line << MESSAGE <<
        message << RESTORE << std::endl;
}

template <typename ... Args>
void log(Level level, const char* file, int line, fmt::format_string<Args...> format, Args&& ... args) {
    write(level, file, line, fmt::format(format, std::forward<Args>(args)...));
}

#define JREF_LOG(level, ...) do { if (::jref::log::enabled(level)) ::jref::log::log(level, __FILE__, __LINE__, __VA_ARGS__); } while (0)

#define DEBUG(...) JREF_LOG(::jref::log::DEBUG,   __VA_ARGS__)
#define WARN(...)  JREF_LOG(::jref::log::WARNING, __VA_ARGS__)
#define ERROR(...) JREF_LOG(::jref::log::ERROR,   __VA_ARGS__)
#define FATAL(...) JREF_LOG(::jref::log::FATAL,   __VA_ARGS__)

} // namespace log
} // namespace jref
