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

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <tsl/ordered_map.h>

#include <yamler/core/Node.h>
#include <yamler/core/Path.h>
#include <yamler/core/Value.h>
#include <yamler/core/convert.h>
#include <yamler/parser/yaml.h>
#include <yamler/support/file.h>
#include <yamler/support/logging.h>

namespace yamler::schema {

//////////////////////////////////////////////////////////////////////////////
/// @brief Validation rule for one node of a document.
/// The type is one of "string", "int", "float", "bool", "array", "map" or
/// "any".  Constraints that do not apply to the type are ignored.
//////////////////////////////////////////////////////////////////////////////
struct Rule
{
    using RulePtr = std::shared_ptr<Rule>;
    using Properties = tsl::ordered_map<String, RulePtr>;

    String type;
    bool nullable = false;
    std::optional<List> enum_values;

    // string
    std::optional<Int> min_length;
    std::optional<Int> max_length;
    std::optional<String> pattern;

    // int and float
    std::optional<Float> minimum;
    std::optional<Float> maximum;
    std::optional<Float> exclusive_minimum;
    std::optional<Float> exclusive_maximum;

    // array
    std::optional<Int> min_items;
    std::optional<Int> max_items;
    bool unique_items = false;
    RulePtr items;

    // map
    std::vector<String> required;
    Properties properties;
    std::optional<bool> additional_properties;

    static Rule from_node(const Node& node, const Path& path = {});
};

inline
Rule Rule::from_node(const Node& node, const Path& path) {
    if (!node.is_mapping()) throw NotAMapping(path.to_str(), node.type_name());

    Rule rule;
    for (size_t i = 0; i < node.size(); ++i) {
        auto& key = node.key_at(i).value;
        auto& value_node = node.value_at(i);
        auto field = path.child(Segment{key});

        if (key == "properties") {
            if (!value_node.is_mapping()) throw NotAMapping(field.to_str(), value_node.type_name());
            for (size_t j = 0; j < value_node.size(); ++j) {
                auto& name = value_node.key_at(j).value;
                rule.properties.insert_or_assign(name, std::make_shared<Rule>(
                    from_node(value_node.value_at(j), field.child(Segment{name}))));
            }
            continue;
        }
        if (key == "items") {
            rule.items = std::make_shared<Rule>(from_node(value_node, field));
            continue;
        }

        auto value = codec::decode(value_node, field);
        if (key == "type")                      rule.type = codec::to_string(value, field);
        else if (key == "nullable")             rule.nullable = codec::to_bool(value, field);
        else if (key == "enum")                 rule.enum_values = codec::to_list(value, field);
        else if (key == "minLength")            rule.min_length = codec::to_int(value, field);
        else if (key == "maxLength")            rule.max_length = codec::to_int(value, field);
        else if (key == "pattern")              rule.pattern = codec::to_string(value, field);
        else if (key == "minimum")              rule.minimum = codec::to_float(value, field);
        else if (key == "maximum")              rule.maximum = codec::to_float(value, field);
        else if (key == "exclusiveMinimum")     rule.exclusive_minimum = codec::to_float(value, field);
        else if (key == "exclusiveMaximum")     rule.exclusive_maximum = codec::to_float(value, field);
        else if (key == "minItems")             rule.min_items = codec::to_int(value, field);
        else if (key == "maxItems")             rule.max_items = codec::to_int(value, field);
        else if (key == "uniqueItems")          rule.unique_items = codec::to_bool(value, field);
        else if (key == "additionalProperties") rule.additional_properties = codec::to_bool(value, field);
        else if (key == "required") {
            for (auto& name : codec::to_list(value, field))
                rule.required.push_back(codec::to_string(name, field));
        } else {
            YAMLER_WARN("ignoring unknown schema keyword {} at {}", key, field.to_str());
        }
    }
    return rule;
}

/// Read a rule tree written in the document markup.
inline
Rule load(const StringView& text) {
    auto tree = yaml::parse(text);
    return Rule::from_node(tree.root);
}

inline
Rule load_file(const std::filesystem::path& fpath) {
    return load(read_file(fpath));
}

} // namespace yamler::schema
