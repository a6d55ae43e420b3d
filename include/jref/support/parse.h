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
#include <array>
#include <sstream>
#include <string_view>

#include <jref/support/exception.h>

namespace jref::parse {

template <typename StreamType>
class StreamAdapter
{
  public:
    StreamAdapter(StreamType& stream) : m_stream{stream} {
        if (!m_stream.eof())
            fill();
    }

    char peek() { return m_buf_pos < m_buf_size? m_buf[m_buf_pos]: '\0'; }

    void next() {
        if (++m_buf_pos >= m_buf_size) {
            m_buf_pos = m_buf_size;
            if (!m_stream.eof())
                fill();
        }
    }

    size_t consumed() const { return m_pos + m_buf_pos; }
    bool done() const { return m_buf_pos == m_buf_size; }
    bool error() const { return m_stream.bad(); }

  private:
    void fill() {
        m_pos += m_buf_size;
        m_stream.read(m_buf.data(), m_buf.size());
        m_buf_size = m_stream.gcount();
        m_buf_pos = 0;
    }

  private:
    StreamType& m_stream;
    size_t m_pos = 0;
    std::array<char, 4096> m_buf;
    size_t m_buf_pos = 0;
    size_t m_buf_size = 0;
};


class StringStreamAdapter
{
  public:
    StringStreamAdapter(const std::string_view& str) : m_str{str} {}

    char peek() { return m_pos < m_str.size()? m_str[m_pos]: '\0'; }
    void next() { if (m_pos < m_str.size()) ++m_pos; }
    size_t consumed() const { return m_pos; }
    bool done() const { return m_pos == m_str.size(); }
    bool error() const { return false; }

  private:
    std::string_view m_str;
    size_t m_pos = 0;
};


constexpr size_t syntax_context = 72;

//////////////////////////////////////////////////////////////////////////////
/// Decoder syntax error.  When the source text is available the message
/// names the line and column and shows the offending line with a caret,
/// clipped to syntax_context characters around the error.
//////////////////////////////////////////////////////////////////////////////
struct SyntaxError : public JrefException
{
    static std::string make_message(std::string_view text, size_t offset, const std::string& message) {
        offset = std::min(offset, text.size());
        auto before = text.substr(0, offset);
        auto line_begin = before.rfind('\n');
        line_begin = (line_begin == std::string_view::npos)? 0: line_begin + 1;
        auto line_end = std::min(text.find('\n', offset), text.size());
        auto line = std::count(before.begin(), before.end(), '\n') + 1;
        auto column = offset - line_begin;

        auto clip_begin = column > syntax_context / 2? column - syntax_context / 2: 0;
        auto source = text.substr(line_begin, line_end - line_begin).substr(clip_begin, syntax_context);
        if (!source.empty() && source.back() == '\r') source.remove_suffix(1);

        std::stringstream ss;
        ss << message << " at line " << line << ", column " << (column + 1) << " (offset " << offset << ")" << std::endl;
        ss << source << std::endl;
        ss << std::string(column - clip_begin, ' ') << '^';
        return ss.str();
    }

    static std::string make_message(size_t offset, const std::string& message) {
        std::stringstream ss;
        ss << message << " at offset " << offset;
        return ss.str();
    }

    SyntaxError(std::string_view text, size_t offset, const std::string& message)
      : JrefException(make_message(text, offset, message)), offset{offset} {}

    SyntaxError(size_t offset, const std::string& message)
      : JrefException(make_message(offset, message)), offset{offset} {}

    size_t offset;
};

} // namespace jref::parse
