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
#include <cstdint>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <tsl/ordered_map.h>

#include <fmt/format.h>

#include <jref/support/exception.h>
#include <jref/support/string.h>
#include <jref/support/types.h>

namespace jref {

struct EmptyReference : public JrefException
{
    EmptyReference() : JrefException(std::string{"uninitialized object"}) {}
};

struct WrongType : public JrefException
{
    WrongType(const std::string_view& actual)
      : JrefException(fmt::format("wrong type: {}", actual)) {}
    WrongType(const std::string_view& actual, const std::string_view& expected)
      : JrefException(fmt::format("wrong type: expected {}, got {}", expected, actual)) {}
};

class Object;

using List = std::vector<Object>;
using OrderedMap = tsl::ordered_map<String, Object>;

using Item = std::pair<String, Object>;
using KeyList = std::vector<String>;
using ItemList = std::vector<Item>;

// inplace reference count types
using IRCString = std::tuple<String, refcnt_t>;
using IRCList = std::tuple<List, refcnt_t>;
using IRCOMap = std::tuple<OrderedMap, refcnt_t>;

using IRCStringPtr = IRCString*;
using IRCListPtr = IRCList*;
using IRCOMapPtr = IRCOMap*;


//////////////////////////////////////////////////////////////////////////////
/// @brief Dynamic document value.
/// - Scalars are held by value; strings, lists and maps are reference counted
///   and shared between copies of the Object.
/// - A container may be referenced from several parents, so a tree built by
///   hand (or by jref::materialize) may contain cycles.  Cyclic structures
///   must not be passed to operator ==, copy() or to_json().
//////////////////////////////////////////////////////////////////////////////
class Object
{
  public:
    enum ReprIX {
        EMPTY,   // uninitialized reference
        NIL,     // json null
        BOOL,
        INT,
        UINT,
        FLOAT,
        STR,
        LIST,
        OMAP,    // ordered map
        INVALID = 31
    };

    union Repr {
        Repr()                : z{nullptr} {}
        Repr(bool v)          : b{v} {}
        Repr(Int v)           : i{v} {}
        Repr(UInt v)          : u{v} {}
        Repr(Float v)         : f{v} {}
        Repr(IRCStringPtr p)  : ps{p} {}
        Repr(IRCListPtr p)    : pl{p} {}
        Repr(IRCOMapPtr p)    : pom{p} {}

        void*         z;
        bool          b;
        Int           i;
        UInt          u;
        Float         f;
        IRCStringPtr  ps;
        IRCListPtr    pl;
        IRCOMapPtr    pom;
    };

  public:
    static std::string_view type_name(uint8_t repr_ix) {
      switch (repr_ix) {
          case EMPTY: return "empty";
          case NIL:   return "null";
          case BOOL:  return "bool";
          case INT:   return "int";
          case UINT:  return "uint";
          case FLOAT: return "float";
          case STR:   return "string";
          case LIST:  return "list";
          case OMAP:  return "map";
          case INVALID: return "invalid";
          default:    return "<undefined>";
      }
    }

  public:
    static constexpr refcnt_t no_ref_count = std::numeric_limits<refcnt_t>::max();

    Object()                           : m_repr{}, m_repr_ix{EMPTY} {}
    Object(nil_t)                      : m_repr{}, m_repr_ix{NIL} {}
    Object(const String& str)          : m_repr{new IRCString{str, 1}}, m_repr_ix{STR} {}
    Object(String&& str)               : m_repr{new IRCString{std::forward<String>(str), 1}}, m_repr_ix{STR} {}
    Object(const StringView& sv)       : m_repr{new IRCString{String{sv.data(), sv.size()}, 1}}, m_repr_ix{STR} {}
    Object(const char* v)              : m_repr{new IRCString{String{v}, 1}}, m_repr_ix{STR} {}
    Object(bool v)                     : m_repr{v}, m_repr_ix{BOOL} {}
    Object(is_like_Float auto v)       : m_repr{(Float)v}, m_repr_ix{FLOAT} {}
    Object(is_like_Int auto v)         : m_repr{(Int)v}, m_repr_ix{INT} {}
    Object(is_like_UInt auto v)        : m_repr{(UInt)v}, m_repr_ix{UINT} {}

    Object(const List&);
    Object(const OrderedMap&);
    Object(List&&);
    Object(OrderedMap&&);

    Object(const Object& other);
    Object(Object&& other);

    ~Object() { dec_ref_count(); }

    ReprIX type() const { return (ReprIX)m_repr_ix; }
    std::string_view type_name() const { return type_name(m_repr_ix); }

    bool is_empty() const     { return m_repr_ix == EMPTY; }
    bool is_nil() const       { return m_repr_ix == NIL; }
    bool is_bool() const      { return m_repr_ix == BOOL; }
    bool is_int() const       { return m_repr_ix == INT; }
    bool is_uint() const      { return m_repr_ix == UINT; }
    bool is_float() const     { return m_repr_ix == FLOAT; }
    bool is_str() const       { return m_repr_ix == STR; }
    bool is_list() const      { return m_repr_ix == LIST; }
    bool is_map() const       { return m_repr_ix == OMAP; }
    bool is_num() const       { return m_repr_ix == INT || m_repr_ix == UINT || m_repr_ix == FLOAT; }

    template <typename T>
    bool is_type() const;

    template <typename T>
    T as() const requires is_byvalue<T>;

    template <typename T>
    const T& as() const requires std::is_same<T, String>::value {
        if (m_repr_ix == STR) return std::get<0>(*m_repr.ps);
        throw wrong_type(m_repr_ix, STR);
    }

    bool to_bool() const;
    Int to_int() const;
    UInt to_uint() const;
    Float to_float() const;
    String to_str() const;

    String to_json(int indent = 0) const;
    void to_json(std::ostream&, int indent = 0) const;

    size_t size() const;

    const KeyList keys() const;
    const ItemList items() const;
    const List values() const;

    Object get(is_integral auto index) const;
    Object get(const StringView& key) const;
    bool contains(const StringView& key) const;

    Object set(is_integral auto index, const Object& value);
    Object set(const StringView& key, const Object& value);
    void append(const Object& value);

    void del(is_integral auto index);
    void del(const StringView& key);
    void clear();

    bool operator == (const Object&) const;
    bool operator == (nil_t) const;

    bool is(const Object& other) const;
    Object copy() const;
    refcnt_t ref_count() const;

    Object& operator = (const Object& other);
    Object& operator = (Object&& other);

    static WrongType wrong_type(uint8_t actual)                   { return type_name(actual); };
    static WrongType wrong_type(uint8_t actual, uint8_t expected) { return {type_name(actual), type_name(expected)}; };
    static EmptyReference empty_reference()                       { return {}; }

  protected:
    static bool norm_index(is_integral auto& index, UInt size);
    static bool equal(UInt lhs, Int rhs) { return rhs >= 0 && lhs == (UInt)rhs; }
    static bool equal_numbers(const Object& lhs, const Object& rhs);

    refcnt_t* p_ref_count() const;  // nullptr for values held inline
    void inc_ref_count() const;
    void dec_ref_count() const;
    void write_json(std::ostream&, int indent, int depth) const;

  protected:
    Repr m_repr;
    uint8_t m_repr_ix;
};


inline
Object::Object(const Object& other) : m_repr{other.m_repr}, m_repr_ix{other.m_repr_ix} {
    inc_ref_count();
}

inline
Object::Object(Object&& other) : m_repr{other.m_repr}, m_repr_ix{other.m_repr_ix} {
    other.m_repr_ix = EMPTY;
    other.m_repr.z = nullptr;
}

inline
Object::Object(const List& list) : m_repr{new IRCList{list, 1}}, m_repr_ix{LIST} {}

inline
Object::Object(const OrderedMap& map) : m_repr{new IRCOMap{map, 1}}, m_repr_ix{OMAP} {}

inline
Object::Object(List&& list) : m_repr{new IRCList{std::forward<List>(list), 1}}, m_repr_ix{LIST} {}

inline
Object::Object(OrderedMap&& map) : m_repr{new IRCOMap{std::forward<OrderedMap>(map), 1}}, m_repr_ix{OMAP} {}

template <typename T>
bool Object::is_type() const {
    if constexpr (std::is_same<T, bool>::value)            return m_repr_ix == BOOL;
    else if constexpr (std::is_same<T, Int>::value)        return m_repr_ix == INT;
    else if constexpr (std::is_same<T, UInt>::value)       return m_repr_ix == UINT;
    else if constexpr (std::is_same<T, Float>::value)      return m_repr_ix == FLOAT;
    else if constexpr (std::is_same<T, String>::value)     return m_repr_ix == STR;
    else if constexpr (std::is_same<T, List>::value)       return m_repr_ix == LIST;
    else if constexpr (std::is_same<T, OrderedMap>::value) return m_repr_ix == OMAP;
    else return false;
}

template <typename T>
T Object::as() const requires is_byvalue<T> {
    if constexpr (std::is_same<T, bool>::value) {
        if (m_repr_ix == BOOL) return m_repr.b;
        throw wrong_type(m_repr_ix, BOOL);
    } else if constexpr (is_like_Float<T>) {
        if (m_repr_ix == FLOAT) return (T)m_repr.f;
        throw wrong_type(m_repr_ix, FLOAT);
    } else if constexpr (std::is_signed<T>::value) {
        if (m_repr_ix == INT) return (T)m_repr.i;
        throw wrong_type(m_repr_ix, INT);
    } else {
        if (m_repr_ix == UINT) return (T)m_repr.u;
        throw wrong_type(m_repr_ix, UINT);
    }
}

inline
size_t Object::size() const {
    switch (m_repr_ix) {
        case STR:   return std::get<0>(*m_repr.ps).size();
        case LIST:  return std::get<0>(*m_repr.pl).size();
        case OMAP:  return std::get<0>(*m_repr.pom).size();
        default:    return 0;
    }
}

inline
const KeyList Object::keys() const {
    KeyList keys;
    if (m_repr_ix == OMAP) {
        auto& map = std::get<0>(*m_repr.pom);
        keys.reserve(map.size());
        for (auto& [key, value] : map)
            keys.push_back(key);
    }
    return keys;
}

inline
const ItemList Object::items() const {
    ItemList items;
    if (m_repr_ix == OMAP) {
        auto& map = std::get<0>(*m_repr.pom);
        items.reserve(map.size());
        for (auto& [key, value] : map)
            items.emplace_back(key, value);
    }
    return items;
}

inline
const List Object::values() const {
    switch (m_repr_ix) {
        case LIST: return std::get<0>(*m_repr.pl);
        case OMAP: {
            List values;
            auto& map = std::get<0>(*m_repr.pom);
            values.reserve(map.size());
            for (auto& [key, value] : map)
                values.push_back(value);
            return values;
        }
        default:   return {};
    }
}

inline
bool Object::norm_index(is_integral auto& index, UInt size) {
    if constexpr (std::is_signed<std::remove_reference_t<decltype(index)>>::value) {
        if (index < 0) index += size;
        if (index < 0) return false;
    }
    return (UInt)index < size;
}

inline
Object Object::get(is_integral auto index) const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case LIST: {
            auto& list = std::get<0>(*m_repr.pl);
            if (!norm_index(index, list.size())) return nil;
            return list[index];
        }
        case OMAP:  throw wrong_type(m_repr_ix, LIST);
        default:    return nil;
    }
}

inline
Object Object::get(const StringView& key) const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case OMAP: {
            auto& map = std::get<0>(*m_repr.pom);
            auto it = map.find(String{key});
            if (it == map.end()) return nil;
            return it->second;
        }
        case LIST:  throw wrong_type(m_repr_ix, OMAP);
        default:    return nil;
    }
}

inline
bool Object::contains(const StringView& key) const {
    if (m_repr_ix != OMAP) return false;
    auto& map = std::get<0>(*m_repr.pom);
    return map.find(String{key}) != map.end();
}

inline
Object Object::set(is_integral auto index, const Object& value) {
    if (m_repr_ix != LIST) throw wrong_type(m_repr_ix, LIST);
    auto& list = std::get<0>(*m_repr.pl);
    if (!norm_index(index, list.size())) throw std::out_of_range(fmt::format("list index {}", index));
    list[index] = value;
    return value;
}

inline
Object Object::set(const StringView& key, const Object& value) {
    if (m_repr_ix != OMAP) throw wrong_type(m_repr_ix, OMAP);
    auto& map = std::get<0>(*m_repr.pom);
    map.insert_or_assign(String{key}, value);
    return value;
}

inline
void Object::append(const Object& value) {
    if (m_repr_ix != LIST) throw wrong_type(m_repr_ix, LIST);
    std::get<0>(*m_repr.pl).push_back(value);
}

inline
void Object::del(is_integral auto index) {
    if (m_repr_ix != LIST) throw wrong_type(m_repr_ix, LIST);
    auto& list = std::get<0>(*m_repr.pl);
    if (norm_index(index, list.size()))
        list.erase(list.begin() + index);
}

inline
void Object::del(const StringView& key) {
    if (m_repr_ix != OMAP) throw wrong_type(m_repr_ix, OMAP);
    std::get<0>(*m_repr.pom).erase(String{key});
}

/// Remove every entry of a list or map.
inline
void Object::clear() {
    switch (m_repr_ix) {
        case LIST: std::get<0>(*m_repr.pl).clear(); break;
        case OMAP: std::get<0>(*m_repr.pom).clear(); break;
        default:   throw wrong_type(m_repr_ix);
    }
}

/// Containers are true when not empty; strings must read "true" or "false".
inline
bool Object::to_bool() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case NIL:   return false;
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i != 0;
        case UINT:  return m_repr.u != 0;
        case FLOAT: return m_repr.f != 0;
        case STR: {
            auto& str = std::get<0>(*m_repr.ps);
            if (str == "true") return true;
            if (str == "false") return false;
            throw WrongType(fmt::format("string '{}'", str), type_name(BOOL));
        }
        case LIST:
        case OMAP:  return size() > 0;
        default:    throw wrong_type(m_repr_ix, BOOL);
    }
}

inline
Int Object::to_int() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i;
        case UINT:  return (Int)m_repr.u;
        case FLOAT: return (Int)m_repr.f;
        case STR: {
            auto& str = std::get<0>(*m_repr.ps);
            if (auto value = str_to_number<Int>(str); value) return *value;
            throw WrongType(fmt::format("string '{}'", str), type_name(INT));
        }
        default:    throw wrong_type(m_repr_ix, INT);
    }
}

inline
UInt Object::to_uint() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case BOOL:  return m_repr.b;
        case INT:   return (UInt)m_repr.i;
        case UINT:  return m_repr.u;
        case FLOAT: return (UInt)m_repr.f;
        case STR: {
            auto& str = std::get<0>(*m_repr.ps);
            if (auto value = str_to_number<UInt>(str); value) return *value;
            throw WrongType(fmt::format("string '{}'", str), type_name(UINT));
        }
        default:    throw wrong_type(m_repr_ix, UINT);
    }
}

inline
Float Object::to_float() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case BOOL:  return m_repr.b;
        case INT:   return (Float)m_repr.i;
        case UINT:  return (Float)m_repr.u;
        case FLOAT: return m_repr.f;
        case STR: {
            auto& str = std::get<0>(*m_repr.ps);
            if (auto value = str_to_number<Float>(str); value) return *value;
            throw WrongType(fmt::format("string '{}'", str), type_name(FLOAT));
        }
        default:    throw wrong_type(m_repr_ix, FLOAT);
    }
}

/// Strings are returned unquoted; containers are written as compact JSON.
inline
String Object::to_str() const {
    switch (m_repr_ix) {
        case STR:   return std::get<0>(*m_repr.ps);
        default:    return to_json();
    }
}

inline
bool Object::equal_numbers(const Object& lhs, const Object& rhs) {
    if (lhs.m_repr_ix == FLOAT || rhs.m_repr_ix == FLOAT)
        return lhs.to_float() == rhs.to_float();
    if (lhs.m_repr_ix == rhs.m_repr_ix)
        return lhs.m_repr_ix == INT? lhs.m_repr.i == rhs.m_repr.i: lhs.m_repr.u == rhs.m_repr.u;
    return lhs.m_repr_ix == UINT? equal(lhs.m_repr.u, rhs.m_repr.i): equal(rhs.m_repr.u, lhs.m_repr.i);
}

/// Structural equality. Numbers compare by value across INT, UINT and FLOAT;
/// bool never equals a number.
inline
bool Object::operator == (const Object& obj) const {
    if (is_empty() || obj.is_empty()) throw empty_reference();
    if (is(obj)) return true;

    switch (m_repr_ix) {
        case NIL:   return obj.m_repr_ix == NIL;
        case BOOL:  return obj.m_repr_ix == BOOL && m_repr.b == obj.m_repr.b;
        case INT:
        case UINT:
        case FLOAT: return obj.is_num() && equal_numbers(*this, obj);
        case STR:   return obj.m_repr_ix == STR && std::get<0>(*m_repr.ps) == std::get<0>(*obj.m_repr.ps);
        case LIST: {
            if (obj.m_repr_ix != LIST) return false;
            auto& lhs = std::get<0>(*m_repr.pl);
            auto& rhs = std::get<0>(*obj.m_repr.pl);
            return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin());
        }
        case OMAP: {
            if (obj.m_repr_ix != OMAP) return false;
            auto& lhs = std::get<0>(*m_repr.pom);
            auto& rhs = std::get<0>(*obj.m_repr.pom);
            if (lhs.size() != rhs.size()) return false;
            for (auto& [key, value] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end() || !(value == it->second))
                    return false;
            }
            return true;
        }
        default:     throw wrong_type(m_repr_ix);
    }
}

inline
bool Object::operator == (nil_t) const {
    return m_repr_ix == NIL;
}

inline
void json_quote(std::ostream& os, const String& str) {
    os << '"';
    for (unsigned char c : str) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) os << fmt::format("\\u{:04x}", (unsigned)c);
                else os << (char)c;
                break;
        }
    }
    os << '"';
}

inline
String Object::to_json(int indent) const {
    StringStream ss;
    to_json(ss, indent);
    return ss.str();
}

inline
void Object::to_json(std::ostream& os, int indent) const {
    write_json(os, indent, 0);
}

/// Containers are written on one line when indent is zero, otherwise one
/// member per line.
inline
void Object::write_json(std::ostream& os, int indent, int depth) const {
    auto newline = [&os, indent] (int level) {
        if (indent == 0) return;
        os << '\n' << String(indent * level, ' ');
    };
    auto separator = indent == 0? ", ": ",";

    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case NIL:   os << "null"; break;
        case BOOL:  os << (m_repr.b? "true": "false"); break;
        case INT:   os << int_to_str(m_repr.i); break;
        case UINT:  os << int_to_str(m_repr.u); break;
        case FLOAT: os << float_to_str(m_repr.f); break;
        case STR:   json_quote(os, std::get<0>(*m_repr.ps)); break;
        case LIST: {
            auto& list = std::get<0>(*m_repr.pl);
            os << '[';
            for (List::size_type i = 0; i < list.size(); ++i) {
                if (i > 0) os << separator;
                newline(depth + 1);
                list[i].write_json(os, indent, depth + 1);
            }
            if (list.size() > 0) newline(depth);
            os << ']';
            break;
        }
        case OMAP: {
            auto& map = std::get<0>(*m_repr.pom);
            os << '{';
            bool first = true;
            for (auto& [key, value] : map) {
                if (!first) os << separator;
                first = false;
                newline(depth + 1);
                json_quote(os, key);
                os << ": ";
                value.write_json(os, indent, depth + 1);
            }
            if (map.size() > 0) newline(depth);
            os << '}';
            break;
        }
        default:    throw wrong_type(m_repr_ix);
    }
}

inline
bool Object::is(const Object& other) const {
    auto repr_ix = m_repr_ix;
    if (other.m_repr_ix != repr_ix) return false;
    switch (repr_ix) {
        case EMPTY: throw empty_reference();
        case NIL:   return true;
        case BOOL:  return m_repr.b == other.m_repr.b;
        case INT:   return m_repr.i == other.m_repr.i;
        case UINT:  return m_repr.u == other.m_repr.u;
        case FLOAT: return m_repr.f == other.m_repr.f;
        case STR:   return m_repr.ps == other.m_repr.ps;
        case LIST:  return m_repr.pl == other.m_repr.pl;
        case OMAP:  return m_repr.pom == other.m_repr.pom;
        default:    throw wrong_type(m_repr_ix);
    }
}

/// Deep copy of containers. Strings get a new buffer and scalars are
/// returned as is.
inline
Object Object::copy() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case STR:   return String{std::get<0>(*m_repr.ps)};
        case LIST: {
            List list;
            list.reserve(size());
            for (auto& value : std::get<0>(*m_repr.pl))
                list.push_back(value.copy());
            return list;
        }
        case OMAP: {
            OrderedMap map;
            for (auto& [key, value] : std::get<0>(*m_repr.pom))
                map.insert({key, value.copy()});
            return map;
        }
        default:    return *this;
    }
}

inline
refcnt_t* Object::p_ref_count() const {
    switch (m_repr_ix) {
        case STR:  return &std::get<1>(*m_repr.ps);
        case LIST: return &std::get<1>(*m_repr.pl);
        case OMAP: return &std::get<1>(*m_repr.pom);
        default:   return nullptr;
    }
}

inline
refcnt_t Object::ref_count() const {
    auto p_count = p_ref_count();
    return p_count == nullptr? no_ref_count: *p_count;
}

inline
void Object::inc_ref_count() const {
    if (auto p_count = p_ref_count(); p_count != nullptr)
        ++(*p_count);
}

inline
void Object::dec_ref_count() const {
    auto p_count = p_ref_count();
    if (p_count == nullptr || --(*p_count) > 0) return;
    switch (m_repr_ix) {
        case STR:  delete m_repr.ps; break;
        case LIST: delete m_repr.pl; break;
        case OMAP: delete m_repr.pom; break;
        default:   break;
    }
}

inline
Object& Object::operator = (const Object& other) {
    Object keep{other};
    return *this = std::move(keep);
}

inline
Object& Object::operator = (Object&& other) {
    if (this == &other) return *this;
    Object keep{std::move(other)};  // other may be owned by this object's container
    std::swap(m_repr, keep.m_repr);
    std::swap(m_repr_ix, keep.m_repr_ix);
    return *this;
}

inline
std::ostream& operator << (std::ostream& os, const Object& obj) {
    if (obj.is_empty()) return os << "<empty>";
    obj.to_json(os);
    return os;
}

} // namespace jref
