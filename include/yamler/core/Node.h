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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yamler/support/types.h>
#include <yamler/support/exception.h>

namespace yamler {

//////////////////////////////////////////////////////////////////////////////
/// @brief Document tree node.
/// A node is a scalar, a sequence, a mapping or an (unresolved) alias.
/// Mapping children alternate key, value; keys are string scalars.  Children
/// are owned by value, so copying a node copies its subtree.
///
/// Besides the semantic content, every node carries the comments attached to
/// it and the layout trivia recorded by the parser, which lets an unmodified
/// node print back exactly as it was read.
//////////////////////////////////////////////////////////////////////////////
class Node
{
  public:
    enum Kind { SCALAR, SEQUENCE, MAPPING, ALIAS };
    enum Tag { STR, INT, FLOAT, BOOL, NUL };
    enum Style { BLOCK, FLOW };
    enum ScalarStyle { PLAIN, SINGLE_QUOTED, DOUBLE_QUOTED, LITERAL, FOLDED };

    struct Layout
    {
        std::optional<String> raw;    // scalar token as written (block scalars: the header)
        String body;                  // block scalar content lines, verbatim
        String props;                 // anchor and tag text as written, with trailing blanks
        String sep;                   // mapping key: text up to the value; sequence item: the dash
        String lead;                  // text between separator and a value that starts on a later line
        String gap;                   // blanks before the line comment
        String pre;                   // flow item: trivia before the item
        String post;                  // flow item: trivia after the item
        String tail;                  // flow collection: trivia after a trailing comma, or of an empty collection
        int indent = -1;              // block collection: column of the entries, -1 when not yet placed
        bool trailing_comma = false;
        bool next_line = false;       // sequence item: block collection starts on the next line
        bool reindent = false;        // head and foot lines carry no indentation
    };

    static std::string_view kind_name(Kind kind) {
        switch (kind) {
            case SCALAR:   return "scalar";
            case SEQUENCE: return "sequence";
            case MAPPING:  return "mapping";
            case ALIAS:    return "alias";
            default:       return "<undefined>";
        }
    }

    static std::string_view tag_name(Tag tag) {
        switch (tag) {
            case STR:   return "string";
            case INT:   return "int";
            case FLOAT: return "float";
            case BOOL:  return "bool";
            case NUL:   return "null";
            default:    return "<undefined>";
        }
    }

  public:
    Node() = default;
    Node(Kind kind, Style style = BLOCK) : kind{kind}, style{style} {}

    static Node scalar(const StringView& value, Tag tag);
    static Node mapping(Style style = BLOCK) { return Node{MAPPING, style}; }
    static Node sequence(Style style = FLOW) { return Node{SEQUENCE, style}; }

    std::string_view kind_name() const { return kind_name(kind); }
    std::string_view type_name() const { return kind == SCALAR? tag_name(tag): kind_name(kind); }

    bool is_scalar() const   { return kind == SCALAR; }
    bool is_sequence() const { return kind == SEQUENCE; }
    bool is_mapping() const  { return kind == MAPPING; }
    bool is_alias() const    { return kind == ALIAS; }
    bool is_null() const     { return kind == SCALAR && tag == NUL; }
    bool is_block_collection() const { return (kind == MAPPING || kind == SEQUENCE) && style == BLOCK; }

    size_t size() const { return kind == MAPPING? children.size() / 2: children.size(); }

    // mapping access
    size_t find_entry(const StringView& key) const;
    Node* find(const StringView& key);
    const Node* find(const StringView& key) const;
    Node& key_at(size_t entry)               { return children[entry * 2]; }
    const Node& key_at(size_t entry) const   { return children[entry * 2]; }
    Node& value_at(size_t entry)             { return children[entry * 2 + 1]; }
    const Node& value_at(size_t entry) const { return children[entry * 2 + 1]; }
    Node& add_entry(const StringView& key, Node&& value);

    // sequence access
    Node& insert_item(size_t index, Node&& item);
    void remove_item(size_t index);
    Node& replace_item(size_t index, Node&& item);

    void replace_with(Node&& other);
    void copy_comments_from(const Node& other);
    void copy_missing_comments_from(const Node& other);
    void clear_placement();
    Node clone_detached() const;

  public:
    Kind kind = SCALAR;
    Tag tag = NUL;
    Style style = BLOCK;
    ScalarStyle scalar_style = PLAIN;

    String value;            // scalar content, or the alias name
    String anchor;
    String type_tag;         // explicit tag, such as "!!str"

    String head;             // comment and blank lines before the node
    String line;             // comment on the line of the node, starting with '#'
    String foot;             // comment and blank lines after the node

    std::vector<Node> children;
    Layout layout;

  private:
    void reflow_inserted(size_t index);
};

inline
Node Node::scalar(const StringView& value, Tag tag) {
    Node node{SCALAR};
    node.value = value;
    node.tag = tag;
    return node;
}

inline
size_t Node::find_entry(const StringView& key) const {
    if (kind != MAPPING) return std::string::npos;
    for (size_t i = 0; i + 1 < children.size(); i += 2) {
        if (children[i].value == key)
            return i / 2;
    }
    return std::string::npos;
}

inline
Node* Node::find(const StringView& key) {
    auto entry = find_entry(key);
    return entry == std::string::npos? nullptr: &value_at(entry);
}

inline
const Node* Node::find(const StringView& key) const {
    auto entry = find_entry(key);
    return entry == std::string::npos? nullptr: &value_at(entry);
}

inline
Node& Node::add_entry(const StringView& key, Node&& value) {
    YAMLER_ASSERT(kind == MAPPING);
    Node key_node = scalar(key, STR);
    if (style == FLOW && children.size() > 0) {
        key_node.layout.pre = children[children.size() - 2].layout.pre;
        if (key_node.layout.pre.size() == 0) key_node.layout.pre = " ";
        value.layout.post = children.back().layout.post;
        children.back().layout.post.clear();
    } else if (style == FLOW) {
        if (layout.tail.find('\n') == std::string::npos) layout.tail.clear();
    }
    children.push_back(std::move(key_node));
    children.push_back(std::forward<Node>(value));
    return children.back();
}

/// Re-distribute flow trivia after an item was inserted, so that the
/// separators of the collection keep their shape.
inline
void Node::reflow_inserted(size_t index) {
    if (style != FLOW) return;

    struct Slot { String pre; String post; };
    std::vector<Slot> slots;
    for (size_t i = 0; i < children.size(); ++i) {
        if (i != index)
            slots.push_back({children[i].layout.pre, children[i].layout.post});
    }

    auto n = slots.size();
    std::vector<Slot> result;
    if (n == 0) {
        result.push_back({"", ""});
        if (layout.tail.find('\n') == std::string::npos) layout.tail.clear();
    } else if (n == 1) {
        auto& only = slots[0];
        String pre = only.pre.find('\n') != std::string::npos? only.pre: (only.pre.size() == 0? String{" "}: only.pre);
        String first_post = only.post.find('\n') != std::string::npos? String{}: only.post;
        result.push_back({only.pre, first_post});
        result.push_back({pre, only.post});
    } else {
        for (size_t i = 0; i + 1 < n; ++i)
            result.push_back(slots[i]);
        result.push_back({slots[n - 1].pre, slots[n - 2].post});
        result.push_back(slots[n - 1]);
    }

    for (size_t i = 0; i < children.size(); ++i) {
        children[i].layout.pre = result[i].pre;
        children[i].layout.post = result[i].post;
    }
}

inline
Node& Node::insert_item(size_t index, Node&& item) {
    YAMLER_ASSERT(kind == SEQUENCE && index <= children.size());
    if (style == BLOCK && children.size() > 0) {
        auto& neighbor = children[index < children.size()? index: children.size() - 1];
        auto& dash = neighbor.layout.sep;
        item.layout.sep = (dash.size() > 0 && dash.back() == ' ')? dash: String{"- "};
    }
    children.insert(children.begin() + index, std::forward<Node>(item));
    reflow_inserted(index);
    return children[index];
}

inline
void Node::remove_item(size_t index) {
    YAMLER_ASSERT(kind == SEQUENCE && index < children.size());
    if (style == FLOW) {
        // drop the format slot before the last one, the last slot keeps the closing trivia
        std::vector<std::pair<String, String>> slots;
        for (auto& child : children) slots.emplace_back(child.layout.pre, child.layout.post);
        auto n = slots.size();
        if (n >= 2) slots.erase(slots.begin() + (n - 2));
        else slots.clear();
        children.erase(children.begin() + index);
        for (size_t i = 0; i < children.size(); ++i) {
            children[i].layout.pre = slots[i].first;
            children[i].layout.post = slots[i].second;
        }
        if (children.size() == 0 && layout.tail.find('\n') == std::string::npos)
            layout.tail.clear();
        if (children.size() == 0)
            layout.trailing_comma = false;
        return;
    }
    children.erase(children.begin() + index);
}

inline
Node& Node::replace_item(size_t index, Node&& item) {
    YAMLER_ASSERT(kind == SEQUENCE && index < children.size());
    children[index].replace_with(std::forward<Node>(item));
    return children[index];
}

/// Replace the content of this node, keeping the comments and the position
/// trivia that belong to the slot rather than to the value.
inline
void Node::replace_with(Node&& other) {
    Node old = std::move(*this);
    *this = std::forward<Node>(other);
    copy_comments_from(old);
    layout.pre = old.layout.pre;
    layout.post = old.layout.post;
    layout.sep = old.layout.sep;
    if (kind == SCALAR && old.kind == SCALAR) layout.lead = old.layout.lead;
    if (kind == old.kind && kind != SCALAR) {
        style = old.style;
        layout.indent = old.layout.indent;
        layout.next_line = old.layout.next_line;
    } else if (old.layout.next_line && is_block_collection()) {
        layout.next_line = true;
    }
    if (kind == SCALAR && old.kind == SCALAR && tag == STR && old.tag == STR &&
        (old.scalar_style == SINGLE_QUOTED || old.scalar_style == DOUBLE_QUOTED) && !layout.raw) {
        scalar_style = old.scalar_style;
    }
}

inline
void Node::copy_comments_from(const Node& other) {
    head = other.head;
    line = other.line;
    foot = other.foot;
    layout.gap = other.layout.gap;
    layout.reindent = other.layout.reindent;
}

inline
void Node::copy_missing_comments_from(const Node& other) {
    if (head.size() == 0 && other.head.size() > 0) {
        head = other.head;
        layout.reindent = other.layout.reindent;
    }
    if (line.size() == 0 && other.line.size() > 0) {
        line = other.line;
        layout.gap = other.layout.gap;
    }
    if (foot.size() == 0) foot = other.foot;
}

/// Forget where this subtree was placed in its source text, so it can be
/// printed at another depth.
inline
void Node::clear_placement() {
    layout.indent = -1;
    layout.lead.clear();
    layout.next_line = false;
    if (head.size() > 0 || foot.size() > 0) {
        auto strip = [] (const String& text) {
            String result;
            size_t pos = 0;
            while (pos < text.size()) {
                auto end = text.find('\n', pos);
                if (end == std::string::npos) end = text.size();
                auto first = text.find_first_not_of(' ', pos);
                if (first == std::string::npos || first > end) first = end;
                result.append(text, first, end - first);
                result.push_back('\n');
                pos = end + 1;
            }
            return result;
        };
        if (!layout.reindent) {
            head = strip(head);
            foot = strip(foot);
            layout.reindent = true;
        }
    }
    if (kind == SCALAR && (scalar_style == LITERAL || scalar_style == FOLDED)) {
        // block scalar bodies are indented relative to their parent
        layout.raw.reset();
        layout.body.clear();
    }
    for (auto& child : children)
        child.clear_placement();
}

inline
Node Node::clone_detached() const {
    Node copy = *this;
    copy.clear_placement();
    return copy;
}

} // namespace yamler
