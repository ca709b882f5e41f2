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

#include <regex>
#include <unordered_set>

#include <yamler/core/Node.h>
#include <yamler/core/Path.h>
#include <yamler/core/convert.h>
#include <yamler/schema/Rule.h>
#include <yamler/serializer/yaml.h>

namespace yamler::schema {

namespace impl {

inline
void check_enum(const Node& node, const Value& value, const Rule& rule, const Path& path) {
    if (!rule.enum_values) return;
    for (auto& allowed : *rule.enum_values) {
        if (allowed == value) return;
    }
    throw EnumViolation(path.to_str(), node.value);
}

inline
void check_bounds(Float value, const Rule& rule, const Path& path) {
    if (rule.minimum && value < *rule.minimum)
        throw ConstraintViolation(path.to_str(), fmt::format("value {} is less than minimum {}", value, *rule.minimum));
    if (rule.maximum && value > *rule.maximum)
        throw ConstraintViolation(path.to_str(), fmt::format("value {} is greater than maximum {}", value, *rule.maximum));
    if (rule.exclusive_minimum && value <= *rule.exclusive_minimum)
        throw ConstraintViolation(path.to_str(), fmt::format("value {} is not greater than exclusive minimum {}", value, *rule.exclusive_minimum));
    if (rule.exclusive_maximum && value >= *rule.exclusive_maximum)
        throw ConstraintViolation(path.to_str(), fmt::format("value {} is not less than exclusive maximum {}", value, *rule.exclusive_maximum));
}

inline
void validate_string(const Node& node, const Rule& rule, const Path& path) {
    if (!node.is_scalar() || node.tag != Node::STR) throw TypeMismatch(path.to_str(), "string", node.type_name());
    auto& value = node.value;
    Int length = (Int)value.size();
    if (rule.min_length && length < *rule.min_length)
        throw ConstraintViolation(path.to_str(), fmt::format("string length {} is less than minimum {}", length, *rule.min_length));
    if (rule.max_length && length > *rule.max_length)
        throw ConstraintViolation(path.to_str(), fmt::format("string length {} is greater than maximum {}", length, *rule.max_length));

    if (rule.pattern) {
        std::regex re;
        try {
            re = std::regex{*rule.pattern, std::regex::ECMAScript};
        } catch (const std::regex_error& error) {
            throw InvalidPattern(path.to_str(), fmt::format("invalid pattern {}: {}", *rule.pattern, error.what()));
        }
        if (!std::regex_search(value, re))
            throw ConstraintViolation(path.to_str(), fmt::format("string does not match pattern {}", *rule.pattern));
    }

    check_enum(node, Value{value}, rule, path);
}

inline
void validate_int(const Node& node, const Rule& rule, const Path& path) {
    if (!node.is_scalar() || node.tag != Node::INT) throw TypeMismatch(path.to_str(), "int", node.type_name());
    auto value = codec::decode(node, path);
    check_bounds(codec::to_float(value, path), rule, path);
    check_enum(node, value, rule, path);
}

inline
void validate_float(const Node& node, const Rule& rule, const Path& path) {
    if (!node.is_scalar() || (node.tag != Node::INT && node.tag != Node::FLOAT))
        throw TypeMismatch(path.to_str(), "float", node.type_name());
    auto value = codec::decode(node, path);
    check_bounds(codec::to_float(value, path), rule, path);
    check_enum(node, value, rule, path);
}

inline
void validate_bool(const Node& node, const Rule& rule, const Path& path) {
    if (!node.is_scalar() || node.tag != Node::BOOL) throw TypeMismatch(path.to_str(), "bool", node.type_name());
    check_enum(node, codec::decode(node, path), rule, path);
}

} // namespace impl

/// Validate a subtree against a rule, throwing the first failure found.
inline
void validate(const Node& node, const Rule& rule, const Path& path = {}) {
    if (rule.nullable && node.is_null()) return;

    auto& type = rule.type;
    if (type == "string") {
        impl::validate_string(node, rule, path);
    } else if (type == "int") {
        impl::validate_int(node, rule, path);
    } else if (type == "float") {
        impl::validate_float(node, rule, path);
    } else if (type == "bool") {
        impl::validate_bool(node, rule, path);
    } else if (type == "array") {
        if (!node.is_sequence()) throw TypeMismatch(path.to_str(), "array", node.type_name());
        Int count = (Int)node.children.size();
        if (rule.min_items && count < *rule.min_items)
            throw ConstraintViolation(path.to_str(), fmt::format("array length {} is less than minimum {}", count, *rule.min_items));
        if (rule.max_items && count > *rule.max_items)
            throw ConstraintViolation(path.to_str(), fmt::format("array length {} is greater than maximum {}", count, *rule.max_items));
        if (rule.unique_items) {
            std::unordered_set<String> seen;
            for (size_t i = 0; i < node.children.size(); ++i) {
                if (!seen.insert(yaml::to_flow(node.children[i])).second)
                    throw ConstraintViolation(path.to_str(), fmt::format("duplicate item at index {}", i));
            }
        }
        if (rule.items) {
            for (size_t i = 0; i < node.children.size(); ++i)
                validate(node.children[i], *rule.items, path.child((Int)i));
        }
    } else if (type == "map") {
        if (!node.is_mapping()) throw TypeMismatch(path.to_str(), "map", node.type_name());
        for (auto& name : rule.required) {
            if (node.find(name) == nullptr) throw RequiredFieldMissing(path.to_str(), name);
        }
        for (size_t i = 0; i < node.size(); ++i) {
            auto& key = node.key_at(i).value;
            auto it = rule.properties.find(key);
            if (it != rule.properties.end()) {
                validate(node.value_at(i), *it->second, path.child(Segment{key}));
            } else if (rule.additional_properties && !*rule.additional_properties) {
                throw AdditionalPropertyNotAllowed(path.to_str(), key);
            }
        }
    } else if (type != "any") {
        throw UnsupportedType(path.to_str(), type);
    }
}

} // namespace yamler::schema
