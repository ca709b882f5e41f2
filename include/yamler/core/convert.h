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
#include <string>
#include <vector>

#include <yamler/core/Node.h>
#include <yamler/core/Path.h>
#include <yamler/core/Value.h>
#include <yamler/support/exception.h>
#include <yamler/support/string.h>

namespace yamler::codec {

/// Styles and ordering applied to nodes created from values.
struct Options
{
    Node::Style sequence_style = Node::FLOW;
    Node::Style mapping_style = Node::BLOCK;
    bool sort_map_keys = true;
};

/// Convert a node subtree to a value.
inline
Value decode(const Node& node, const Path& path = {}) {
    switch (node.kind) {
        case Node::ALIAS:
            throw UnsupportedNode(path.to_str(), fmt::format("alias *{}", node.value));

        case Node::SEQUENCE: {
            List list;
            list.reserve(node.children.size());
            for (size_t i = 0; i < node.children.size(); ++i)
                list.push_back(decode(node.children[i], path.child((Int)i)));
            return list;
        }

        case Node::MAPPING: {
            Map map;
            for (size_t i = 0; i < node.size(); ++i) {
                auto& key = node.key_at(i).value;
                map.insert_or_assign(key, decode(node.value_at(i), path.child(Segment{key})));
            }
            return map;
        }

        default: break;
    }

    switch (node.tag) {
        case Node::NUL:  return nil;
        case Node::BOOL: return to_lower(node.value) == "true";
        case Node::INT: {
            if (auto value = str_to_int_any_base(node.value); value) return *value;
            if (auto value = str_to_float(node.value); value) return *value;
            throw TypeMismatch(path.to_str(), fmt::format("invalid integer: {}", node.value));
        }
        case Node::FLOAT: {
            if (auto value = str_to_float(node.value); value) return *value;
            if (auto value = str_to_int_any_base(node.value); value) return (Float)*value;
            throw TypeMismatch(path.to_str(), fmt::format("invalid float: {}", node.value));
        }
        default:
            return node.value;
    }
}

/// Convert a value to a node subtree without layout.
inline
Node encode(const Value& value, const Options& options = {}) {
    switch (value.type()) {
        case Value::NIL:   return Node::scalar("null", Node::NUL);
        case Value::BOOL:  return Node::scalar(value.as<bool>()? "true": "false", Node::BOOL);
        case Value::INT:   return Node::scalar(int_to_str(value.as<Int>()), Node::INT);
        case Value::FLOAT: return Node::scalar(float_to_str(value.as<Float>()), Node::FLOAT);
        case Value::STR:   return Node::scalar(value.as<String>(), Node::STR);

        case Value::LIST: {
            Node seq = Node::sequence(options.sequence_style);
            for (auto& item : value.as<List>()) {
                Node child = encode(item, options);
                if (seq.children.size() > 0) child.layout.pre = " ";
                seq.children.push_back(std::move(child));
            }
            return seq;
        }

        case Value::MAP: {
            auto& map = value.as<Map>();
            std::vector<const String*> keys;
            keys.reserve(map.size());
            for (auto& [key, _] : map) keys.push_back(&key);
            if (options.sort_map_keys)
                std::sort(keys.begin(), keys.end(), [] (auto lhs, auto rhs) { return *lhs < *rhs; });

            Node node = Node::mapping(options.mapping_style);
            for (auto key : keys) {
                Node key_node = Node::scalar(*key, Node::STR);
                if (node.children.size() > 0) key_node.layout.pre = " ";
                node.children.push_back(std::move(key_node));
                node.children.push_back(encode(map.at(*key), options));
            }
            return node;
        }

        default:
            throw WrongType(value.type_name(), "value");
    }
}

inline
String to_string(const Value& value, const Path& path = {}) {
    if (value.is_str()) return value.as<String>();
    throw TypeMismatch(path.to_str(), "string", value.type_name());
}

inline
Int to_int(const Value& value, const Path& path = {}) {
    if (value.is_int()) return value.as<Int>();
    if (value.is_str()) {
        if (auto result = str_to_int(value.as<String>()); result) return *result;
        throw TypeMismatch(path.to_str(), fmt::format("cannot convert {} to int", quoted(value.as<String>())));
    }
    throw TypeMismatch(path.to_str(), "int", value.type_name());
}

inline
Float to_float(const Value& value, const Path& path = {}) {
    if (value.is_float()) return value.as<Float>();
    if (value.is_int()) return (Float)value.as<Int>();
    if (value.is_str()) {
        if (auto result = str_to_float(value.as<String>()); result) return *result;
        throw TypeMismatch(path.to_str(), fmt::format("cannot convert {} to float", quoted(value.as<String>())));
    }
    throw TypeMismatch(path.to_str(), "float", value.type_name());
}

inline
bool to_bool(const Value& value, const Path& path = {}) {
    if (value.is_bool()) return value.as<bool>();
    if (value.is_str()) {
        if (auto result = str_to_bool(value.as<String>()); result) return *result;
        throw TypeMismatch(path.to_str(), fmt::format("cannot convert {} to bool", quoted(value.as<String>())));
    }
    throw TypeMismatch(path.to_str(), "bool", value.type_name());
}

inline
List to_list(const Value& value, const Path& path = {}) {
    if (value.is_list()) return value.as<List>();
    throw TypeMismatch(path.to_str(), "list", value.type_name());
}

inline
Map to_map(const Value& value, const Path& path = {}) {
    if (value.is_map()) return value.as<Map>();
    throw TypeMismatch(path.to_str(), "map", value.type_name());
}

} // namespace yamler::codec
