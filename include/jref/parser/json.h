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

#include <jref/core/Object.h>
#include <jref/support/parse.h>
#include <jref/support/exception.h>

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>

#include <fmt/format.h>

namespace jref {
namespace json {

namespace impl {

constexpr size_t default_max_depth = 512;

inline
void append_utf8(String& str, uint32_t cp) {
    if (cp < 0x80) {
        str.push_back((char)cp);
        return;
    }

    int n_cont = cp < 0x800? 1: cp < 0x10000? 2: 3;
    uint8_t lead = n_cont == 1? 0xC0: n_cont == 2? 0xE0: 0xF0;
    str.push_back((char)(lead | (cp >> (6 * n_cont))));
    for (int shift = 6 * (n_cont - 1); shift >= 0; shift -= 6)
        str.push_back((char)(0x80 | ((cp >> shift) & 0x3F)));
}

//////////////////////////////////////////////////////////////////////////////
/// Strict RFC 8259 decoder over a character source (see parse::StreamAdapter
/// and parse::StringStreamAdapter).
/// - The read_* members return false on error, leaving the message and the
///   source offset of the offending character in error_message() and
///   error_offset().
/// - Integers that fit Int are INT, larger non-negative integers that fit
///   UInt are UINT, and any other integer is decoded as a FLOAT.
/// - Duplicate keys keep the last value.
/// - Nesting deeper than the maximum depth is an error.
//////////////////////////////////////////////////////////////////////////////
template <typename Source>
class Decoder
{
  public:
    Decoder(Source&& source, size_t max_depth = default_max_depth)
      : m_src{std::forward<Source>(source)}, m_max_depth{max_depth} {}

    Decoder(const Decoder&) = delete;
    Decoder& operator = (const Decoder&) = delete;

    Object::ReprIX peek_type();
    bool read_document(Object& out);

    bool read_value(Object& out, size_t depth = 0);
    bool read_number(Object& out);
    bool read_string(String& out);
    bool read_list(Object& out, size_t depth = 0);
    bool read_map(Object& out, size_t depth = 0);

    size_t error_offset() const { return m_error_offset; }
    const String& error_message() const { return m_error_message; }

  private:
    bool read_literal(StringView word, const Object& value, Object& out);
    bool read_digits(String& text);
    bool read_escape(String& out);
    bool read_hex4(uint32_t& code_point);
    void skip_whitespace();
    bool fail(StringView message);

    Source m_src;
    size_t m_max_depth;
    String m_error_message;
    size_t m_error_offset = 0;
};

template <typename Source>
Object::ReprIX Decoder<Source>::peek_type() {
    skip_whitespace();
    switch (m_src.peek()) {
        case '{': return Object::OMAP;
        case '[': return Object::LIST;
        case '"': return Object::STR;
        case 'n': return Object::NIL;
        case 't':
        case 'f': return Object::BOOL;
        default: break;
    }

    Object number;
    if (!m_src.done() && read_number(number))
        return number.type();
    return Object::INVALID;
}

template <typename Source>
bool Decoder<Source>::read_document(Object& out) {
    skip_whitespace();
    if (m_src.done())
        return fail("Empty document");

    if (!read_value(out))
        return false;

    skip_whitespace();
    if (!m_src.done())
        return fail("Unexpected trailing characters");
    return true;
}

template <typename Source>
bool Decoder<Source>::read_value(Object& out, size_t depth) {
    skip_whitespace();
    if (m_src.done())
        return fail("Expected a value");

    char c = m_src.peek();
    switch (c) {
        case '{': return read_map(out, depth);
        case '[': return read_list(out, depth);
        case 't': return read_literal("true", true, out);
        case 'f': return read_literal("false", false, out);
        case 'n': return read_literal("null", nil, out);
        case '"': {
            String str;
            if (!read_string(str)) return false;
            out = std::move(str);
            return true;
        }
        default:
            if (c == '-' || std::isdigit((unsigned char)c))
                return read_number(out);
            return fail("Unexpected character");
    }
}

template <typename Source>
bool Decoder<Source>::read_digits(String& text) {
    auto size = text.size();
    while (std::isdigit((unsigned char)m_src.peek())) {
        text.push_back(m_src.peek());
        m_src.next();
    }
    return text.size() > size;
}

template <typename Source>
bool Decoder<Source>::read_number(Object& out) {
    String text;
    bool is_float = false;

    if (m_src.peek() == '-') {
        text.push_back('-');
        m_src.next();
    }

    // a leading zero is never followed by more integer digits
    if (m_src.peek() == '0') {
        text.push_back('0');
        m_src.next();
    } else if (!read_digits(text)) {
        return fail("Expected digit");
    }

    if (m_src.peek() == '.') {
        is_float = true;
        text.push_back('.');
        m_src.next();
        if (!read_digits(text))
            return fail("Expected digit after decimal point");
    }

    if (m_src.peek() == 'e' || m_src.peek() == 'E') {
        is_float = true;
        text.push_back('e');
        m_src.next();
        if (m_src.peek() == '+' || m_src.peek() == '-') {
            text.push_back(m_src.peek());
            m_src.next();
        }
        if (!read_digits(text))
            return fail("Expected exponent digits");
    }

    auto first = text.data();
    auto last = first + text.size();
    if (!is_float) {
        if (text[0] == '-') {
            Int value;
            if (std::from_chars(first, last, value).ec == std::errc{}) {
                out = value;
                return true;
            }
        } else {
            UInt value;
            if (std::from_chars(first, last, value).ec == std::errc{}) {
                if (value <= (UInt)std::numeric_limits<Int>::max())
                    out = (Int)value;
                else
                    out = value;
                return true;
            }
        }
    }

    errno = 0;
    Float value = std::strtod(first, nullptr);
    if (errno == ERANGE && std::isinf(value)) {
        errno = 0;
        return fail("Number out of range");
    }
    out = value;
    return true;
}

template <typename Source>
bool Decoder<Source>::read_hex4(uint32_t& code_point) {
    code_point = 0;
    for (int i = 0; i < 4; ++i) {
        m_src.next();
        char c = m_src.peek();
        code_point <<= 4;
        if (c >= '0' && c <= '9')      code_point |= (uint32_t)(c - '0');
        else if (c >= 'a' && c <= 'f') code_point |= (uint32_t)(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') code_point |= (uint32_t)(c - 'A' + 10);
        else return false;
    }
    return true;
}

template <typename Source>
bool Decoder<Source>::read_escape(String& out) {
    if (m_src.done())
        return fail("Unterminated string");

    char c = m_src.peek();
    switch (c) {
        case '"':
        case '\\':
        case '/': out.push_back(c); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
            uint32_t cp;
            if (!read_hex4(cp))
                return fail("Invalid unicode escape");
            if (cp >= 0xDC00 && cp <= 0xDFFF)
                return fail("Unpaired surrogate");
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                m_src.next();
                if (m_src.peek() != '\\')
                    return fail("Unpaired surrogate");
                m_src.next();
                uint32_t low;
                if (m_src.peek() != 'u' || !read_hex4(low) || low < 0xDC00 || low > 0xDFFF)
                    return fail("Unpaired surrogate");
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(out, cp);
            break;
        }
        default:
            return fail("Invalid escape sequence");
    }

    m_src.next();
    return true;
}

template <typename Source>
bool Decoder<Source>::read_string(String& out) {
    m_src.next();  // "
    while (!m_src.done()) {
        char c = m_src.peek();
        if (c == '"') {
            m_src.next();
            return true;
        }

        if (c == '\\') {
            m_src.next();
            if (!read_escape(out)) return false;
        } else if ((unsigned char)c < 0x20) {
            return fail("Control character in string");
        } else {
            out.push_back(c);
            m_src.next();
        }
    }
    return fail("Unterminated string");
}

template <typename Source>
bool Decoder<Source>::read_list(Object& out, size_t depth) {
    if (depth >= m_max_depth)
        return fail("Maximum nesting depth exceeded");

    List list;
    m_src.next();  // [
    skip_whitespace();
    if (m_src.peek() == ']') {
        m_src.next();
        out = std::move(list);
        return true;
    }

    for (;;) {
        Object item;
        if (!read_value(item, depth + 1))
            return false;
        list.push_back(item);

        skip_whitespace();
        if (m_src.peek() == ',') {
            m_src.next();
        } else if (m_src.peek() == ']') {
            m_src.next();
            out = std::move(list);
            return true;
        } else {
            return fail(m_src.done()? "Unterminated list": "Expected ',' or ']'");
        }
    }
}

template <typename Source>
bool Decoder<Source>::read_map(Object& out, size_t depth) {
    if (depth >= m_max_depth)
        return fail("Maximum nesting depth exceeded");

    OrderedMap map;
    m_src.next();  // {
    skip_whitespace();
    if (m_src.peek() == '}') {
        m_src.next();
        out = std::move(map);
        return true;
    }

    for (;;) {
        skip_whitespace();
        if (m_src.peek() != '"')
            return fail(m_src.done()? "Unterminated map": "Expected string key");

        String key;
        if (!read_string(key))
            return false;

        skip_whitespace();
        if (m_src.peek() != ':')
            return fail("Expected ':'");
        m_src.next();

        Object value;
        if (!read_value(value, depth + 1))
            return false;
        map.insert_or_assign(std::move(key), value);

        skip_whitespace();
        if (m_src.peek() == ',') {
            m_src.next();
        } else if (m_src.peek() == '}') {
            m_src.next();
            out = std::move(map);
            return true;
        } else {
            return fail(m_src.done()? "Unterminated map": "Expected ',' or '}'");
        }
    }
}

template <typename Source>
bool Decoder<Source>::read_literal(StringView word, const Object& value, Object& out) {
    for (char c : word) {
        if (m_src.done() || m_src.peek() != c)
            return fail("Invalid literal");
        m_src.next();
    }
    out = value;
    return true;
}

template <typename Source>
void Decoder<Source>::skip_whitespace() {
    for (;;) {
        switch (m_src.peek()) {
            case ' ':
            case '\t':
            case '\r':
            case '\n':
                m_src.next();
                continue;
            default:
                return;
        }
    }
}

template <typename Source>
bool Decoder<Source>::fail(StringView message) {
    m_error_message = fmt::format("JSON parse error: {}", message);
    m_error_offset = m_src.consumed();
    return false;
}

} // namespace impl


/// @brief Classify a JSON text by its first token without decoding it.
/// @return Object::INVALID if the text does not start with a JSON value.
inline
Object::ReprIX peek_type(StringView text) {
    impl::Decoder decoder{parse::StringStreamAdapter{text}};
    return decoder.peek_type();
}

/// @brief Parse a JSON document.
/// @throws parse::SyntaxError on malformed input, with the offending line
/// of text in the message.
inline
Object parse(StringView text) {
    impl::Decoder decoder{parse::StringStreamAdapter{text}};
    Object result;
    if (!decoder.read_document(result))
        throw parse::SyntaxError(text, decoder.error_offset(), decoder.error_message());
    return result;
}

inline
Object parse_file(const String& file_name) {
    std::ifstream f_in{file_name, std::ios::in | std::ios::binary};
    if (!f_in.is_open()) {
        throw JrefException(fmt::format("Error opening file: {}", file_name));
    }

    impl::Decoder decoder{parse::StreamAdapter{f_in}};
    Object result;
    if (!decoder.read_document(result))
        throw parse::SyntaxError(decoder.error_offset(), decoder.error_message());
    return result;
}

} // namespace json


inline
Object operator ""_json (const char* str, size_t size) {
    return json::parse({str, size});
}

} // namespace jref
