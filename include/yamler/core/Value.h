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

#include <string>
#include <string_view>
#include <vector>
#include <initializer_list>
#include <tsl/ordered_map.h>

#include <yamler/support/types.h>
#include <yamler/support/string.h>
#include <yamler/support/exception.h>

namespace yamler {

class Value;

using List = std::vector<Value>;
using Map = tsl::ordered_map<String, Value>;

//////////////////////////////////////////////////////////////////////////////
/// @brief Native value exchanged with callers.
/// A Value is a closed sum of the scalar types a document can hold, plus
/// lists and string-keyed maps which preserve insertion order.  Containers
/// are owned exclusively, so copying a Value copies the whole tree.
//////////////////////////////////////////////////////////////////////////////
class Value
{
  public:
    enum ReprIX {
        NIL,
        BOOL,
        INT,
        FLOAT,
        STR,
        LIST,
        MAP
    };

  private:
    union Repr {
        Repr()         : z{nullptr} {}
        Repr(bool v)   : b{v} {}
        Repr(Int v)    : i{v} {}
        Repr(Float v)  : f{v} {}
        Repr(String* p): ps{p} {}
        Repr(List* p)  : pl{p} {}
        Repr(Map* p)   : pm{p} {}

        void*   z;
        bool    b;
        Int     i;
        Float   f;
        String* ps;
        List*   pl;
        Map*    pm;
    };

  public:
    static std::string_view type_name(ReprIX repr_ix) {
      switch (repr_ix) {
          case NIL:   return "null";
          case BOOL:  return "bool";
          case INT:   return "int";
          case FLOAT: return "float";
          case STR:   return "string";
          case LIST:  return "list";
          case MAP:   return "map";
          default:    return "<undefined>";
      }
    }

  public:
    Value()                       : m_repr{}, m_repr_ix{NIL} {}
    Value(nil_t)                  : m_repr{}, m_repr_ix{NIL} {}
    Value(bool v)                 : m_repr{v}, m_repr_ix{BOOL} {}
    Value(is_like_Int auto v)     : m_repr{(Int)v}, m_repr_ix{INT} {}
    Value(is_like_UInt auto v)    : m_repr{(Int)v}, m_repr_ix{INT} {}
    Value(is_like_Float auto v)   : m_repr{(Float)v}, m_repr_ix{FLOAT} {}
    Value(const char* v)          : Value{checked_str(v)} {}
    Value(const String& str)      : m_repr{new String{str}}, m_repr_ix{STR} {}
    Value(String&& str)           : m_repr{new String{std::forward<String>(str)}}, m_repr_ix{STR} {}
    Value(const StringView& sv)   : m_repr{new String{sv}}, m_repr_ix{STR} {}
    Value(const List& list)       : m_repr{new List(list)}, m_repr_ix{LIST} {}
    Value(List&& list)            : m_repr{new List(std::forward<List>(list))}, m_repr_ix{LIST} {}
    Value(const Map& map)         : m_repr{new Map(map)}, m_repr_ix{MAP} {}
    Value(Map&& map)              : m_repr{new Map(std::forward<Map>(map))}, m_repr_ix{MAP} {}
    Value(ReprIX type);

    Value(const Value& other);
    Value(Value&& other);
    ~Value() { release(); }

    Value& operator = (const Value& other);
    Value& operator = (Value&& other);

    ReprIX type() const                { return m_repr_ix; }
    std::string_view type_name() const { return type_name(m_repr_ix); }

    bool is_nil() const   { return m_repr_ix == NIL; }
    bool is_bool() const  { return m_repr_ix == BOOL; }
    bool is_int() const   { return m_repr_ix == INT; }
    bool is_float() const { return m_repr_ix == FLOAT; }
    bool is_num() const   { return m_repr_ix == INT || m_repr_ix == FLOAT; }
    bool is_str() const   { return m_repr_ix == STR; }
    bool is_list() const  { return m_repr_ix == LIST; }
    bool is_map() const   { return m_repr_ix == MAP; }

    template <typename V> const V& as() const;
    template <typename V> V& as();

    size_t size() const;

    bool operator == (const Value& other) const;
    bool operator != (const Value& other) const { return !operator == (other); }

    String to_str() const;

  private:
    static String checked_str(const char* v) { YAMLER_ASSERT(v != nullptr); return v; }
    void release();
    void copy_from(const Value& other);
    WrongType wrong_type(ReprIX expected) const { return {type_name(m_repr_ix), type_name(expected)}; }

  private:
    Repr m_repr;
    ReprIX m_repr_ix;
};

inline
Value::Value(ReprIX type) : m_repr{}, m_repr_ix{type} {
    switch (type) {
        case NIL:   break;
        case BOOL:  m_repr.b = false; break;
        case INT:   m_repr.i = 0; break;
        case FLOAT: m_repr.f = 0; break;
        case STR:   m_repr.ps = new String{}; break;
        case LIST:  m_repr.pl = new List{}; break;
        case MAP:   m_repr.pm = new Map{}; break;
    }
}

inline
Value::Value(const Value& other) : m_repr{}, m_repr_ix{NIL} {
    copy_from(other);
}

inline
Value::Value(Value&& other) : m_repr{other.m_repr}, m_repr_ix{other.m_repr_ix} {
    other.m_repr.z = nullptr;
    other.m_repr_ix = NIL;
}

inline
Value& Value::operator = (const Value& other) {
    if (this == &other) return *this;
    Value copy{other};
    return operator = (std::move(copy));
}

inline
Value& Value::operator = (Value&& other) {
    if (this == &other) return *this;
    release();
    m_repr = other.m_repr;
    m_repr_ix = other.m_repr_ix;
    other.m_repr.z = nullptr;
    other.m_repr_ix = NIL;
    return *this;
}

inline
void Value::release() {
    switch (m_repr_ix) {
        case STR:  delete m_repr.ps; break;
        case LIST: delete m_repr.pl; break;
        case MAP:  delete m_repr.pm; break;
        default:   break;
    }
    m_repr.z = nullptr;
    m_repr_ix = NIL;
}

inline
void Value::copy_from(const Value& other) {
    switch (other.m_repr_ix) {
        case NIL:   m_repr.z = nullptr; break;
        case BOOL:  m_repr.b = other.m_repr.b; break;
        case INT:   m_repr.i = other.m_repr.i; break;
        case FLOAT: m_repr.f = other.m_repr.f; break;
        case STR:   m_repr.ps = new String{*other.m_repr.ps}; break;
        case LIST:  m_repr.pl = new List(*other.m_repr.pl); break;
        case MAP:   m_repr.pm = new Map(*other.m_repr.pm); break;
    }
    m_repr_ix = other.m_repr_ix;
}

template <> inline const bool& Value::as<bool>() const     { if (m_repr_ix != BOOL) throw wrong_type(BOOL); return m_repr.b; }
template <> inline const Int& Value::as<Int>() const       { if (m_repr_ix != INT) throw wrong_type(INT); return m_repr.i; }
template <> inline const Float& Value::as<Float>() const   { if (m_repr_ix != FLOAT) throw wrong_type(FLOAT); return m_repr.f; }
template <> inline const String& Value::as<String>() const { if (m_repr_ix != STR) throw wrong_type(STR); return *m_repr.ps; }
template <> inline const List& Value::as<List>() const     { if (m_repr_ix != LIST) throw wrong_type(LIST); return *m_repr.pl; }
template <> inline const Map& Value::as<Map>() const       { if (m_repr_ix != MAP) throw wrong_type(MAP); return *m_repr.pm; }

template <> inline bool& Value::as<bool>()     { if (m_repr_ix != BOOL) throw wrong_type(BOOL); return m_repr.b; }
template <> inline Int& Value::as<Int>()       { if (m_repr_ix != INT) throw wrong_type(INT); return m_repr.i; }
template <> inline Float& Value::as<Float>()   { if (m_repr_ix != FLOAT) throw wrong_type(FLOAT); return m_repr.f; }
template <> inline String& Value::as<String>() { if (m_repr_ix != STR) throw wrong_type(STR); return *m_repr.ps; }
template <> inline List& Value::as<List>()     { if (m_repr_ix != LIST) throw wrong_type(LIST); return *m_repr.pl; }
template <> inline Map& Value::as<Map>()       { if (m_repr_ix != MAP) throw wrong_type(MAP); return *m_repr.pm; }

inline
size_t Value::size() const {
    switch (m_repr_ix) {
        case STR:  return m_repr.ps->size();
        case LIST: return m_repr.pl->size();
        case MAP:  return m_repr.pm->size();
        default:   return 0;
    }
}

inline
bool Value::operator == (const Value& other) const {
    if (m_repr_ix != other.m_repr_ix) {
        if (is_num() && other.is_num()) {
            Float lhs = is_int()? (Float)m_repr.i: m_repr.f;
            Float rhs = other.is_int()? (Float)other.m_repr.i: other.m_repr.f;
            return lhs == rhs;
        }
        return false;
    }

    switch (m_repr_ix) {
        case NIL:   return true;
        case BOOL:  return m_repr.b == other.m_repr.b;
        case INT:   return m_repr.i == other.m_repr.i;
        case FLOAT: return m_repr.f == other.m_repr.f;
        case STR:   return *m_repr.ps == *other.m_repr.ps;
        case LIST:  return *m_repr.pl == *other.m_repr.pl;
        case MAP: {
            auto& lhs = *m_repr.pm;
            auto& rhs = *other.m_repr.pm;
            if (lhs.size() != rhs.size()) return false;
            for (auto& [key, value] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end() || it->second != value) return false;
            }
            return true;
        }
    }
    return false;
}

inline
String Value::to_str() const {
    switch (m_repr_ix) {
        case NIL:   return "null";
        case BOOL:  return m_repr.b? "true": "false";
        case INT:   return int_to_str(m_repr.i);
        case FLOAT: return float_to_str(m_repr.f);
        case STR:   return *m_repr.ps;
        case LIST: {
            StringStream ss;
            ss << '[';
            bool first = true;
            for (auto& item : *m_repr.pl) {
                if (!first) ss << ", ";
                ss << (item.is_str()? quoted(item.to_str()): item.to_str());
                first = false;
            }
            ss << ']';
            return ss.str();
        }
        case MAP: {
            StringStream ss;
            ss << '{';
            bool first = true;
            for (auto& [key, value] : *m_repr.pm) {
                if (!first) ss << ", ";
                ss << quoted(key) << ": " << (value.is_str()? quoted(value.to_str()): value.to_str());
                first = false;
            }
            ss << '}';
            return ss.str();
        }
    }
    return "";
}

inline
std::ostream& operator<< (std::ostream& ostream, const Value& value) {
    ostream << value.to_str();
    return ostream;
}

} // namespace yamler
