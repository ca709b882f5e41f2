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
#include <string_view>

#include <fmt/format.h>

#include <yamler/core/Node.h>
#include <yamler/parser/yaml.h>
#include <yamler/support/string.h>

namespace yamler::yaml {

enum class CommentAlignment
{
    RELATIVE,   // keep the original spacing before each comment
    ABSOLUTE,   // start every line comment at a fixed column
    DISABLED    // omit line comments
};

struct EmitOptions
{
    int indent = 2;
    CommentAlignment comment_alignment = CommentAlignment::RELATIVE;
    int comment_column = 0;
};

/// Test whether a string can be written as a plain scalar and read back as
/// the same string.
inline
bool is_plain_safe(const StringView& str, bool flow) {
    if (str.size() == 0) return false;
    if (resolve(str) != Node::STR) return false;

    auto lower = to_lower(str);
    if (lower == "yes" || lower == "no" || lower == "on" || lower == "off" || lower == "y" || lower == "n")
        return false;

    char first = str[0];
    if (first == '-' || first == '?' || first == ':') {
        if (str.size() == 1 || str[1] == ' ' || str[1] == '\t') return false;
    }
    if (StringView{",[]{}#&*!|>'\"%@`"}.find(first) != StringView::npos) return false;
    if (starts_with(str, "---") || starts_with(str, "...")) return false;

    if (is_blank(first) || is_blank(str.back())) return false;
    if (str.back() == ':') return false;
    if (str.find(": ") != StringView::npos || str.find(" #") != StringView::npos) return false;

    for (char c : str) {
        if ((unsigned char)c < 0x20 || c == 0x7F) return false;
        if (flow && (c == ',' || c == '[' || c == ']' || c == '{' || c == '}')) return false;
    }
    return true;
}

inline
String double_quote(const StringView& str) {
    String result{"\""};
    for (char c : str) {
        switch (c) {
            case '"':  result.append("\\\""); break;
            case '\\': result.append("\\\\"); break;
            case '\n': result.append("\\n"); break;
            case '\t': result.append("\\t"); break;
            case '\r': result.append("\\r"); break;
            case '\0': result.append("\\0"); break;
            default:
                if ((unsigned char)c < 0x20 || c == 0x7F)
                    result.append(fmt::format("\\x{:02X}", (unsigned char)c));
                else
                    result.push_back(c);
        }
    }
    result.push_back('"');
    return result;
}

inline
String single_quote(const StringView& str) {
    String result{"'"};
    for (char c : str) {
        if (c == '\'') result.push_back('\'');
        result.push_back(c);
    }
    result.push_back('\'');
    return result;
}

/// Test whether a string is written as a literal block scalar in block context.
inline
bool wants_block_scalar(const StringView& str) {
    if (str.find('\n') == StringView::npos) return false;
    if (str.size() == 0 || str[0] == ' ' || str[0] == '\t' || str[0] == '\n') return false;
    for (char c : str) {
        if (((unsigned char)c < 0x20 && c != '\n' && c != '\t') || c == 0x7F) return false;
    }
    return true;
}

/// Render a string scalar as a single token.
inline
String quote_string(const StringView& str, Node::ScalarStyle style, bool flow) {
    if (style == Node::DOUBLE_QUOTED) return double_quote(str);
    if (style == Node::SINGLE_QUOTED && str.find('\n') == StringView::npos) return single_quote(str);
    if (is_plain_safe(str, flow)) return String{str};
    return double_quote(str);
}

/// Render a scalar or alias as a single token, ignoring the source text
/// when the node was written as a block scalar.
inline
String scalar_token(const Node& node, bool flow) {
    if (node.kind == Node::ALIAS) return node.layout.raw? *node.layout.raw: fmt::format("*{}", node.value);
    bool block = node.scalar_style == Node::LITERAL || node.scalar_style == Node::FOLDED;
    bool unsafe = flow && node.scalar_style == Node::PLAIN && node.tag == Node::STR && !is_plain_safe(node.value, true);
    if (node.layout.raw && !block && !unsafe) return *node.layout.raw;
    switch (node.tag) {
        case Node::NUL:   return "null";
        case Node::BOOL:
        case Node::INT:
        case Node::FLOAT: return node.value;
        default:          return quote_string(node.value, block? Node::PLAIN: node.scalar_style, flow);
    }
}

namespace impl {

inline
void to_flow(const Node& node, String& out) {
    switch (node.kind) {
        case Node::SEQUENCE: {
            out.push_back('[');
            for (size_t i = 0; i < node.children.size(); ++i) {
                if (i > 0) out.append(", ");
                to_flow(node.children[i], out);
            }
            out.push_back(']');
            break;
        }
        case Node::MAPPING: {
            out.push_back('{');
            for (size_t i = 0; i < node.size(); ++i) {
                if (i > 0) out.append(", ");
                out.append(quote_string(node.key_at(i).value, Node::PLAIN, true));
                out.append(": ");
                to_flow(node.value_at(i), out);
            }
            out.push_back('}');
            break;
        }
        case Node::ALIAS: {
            out.append(fmt::format("*{}", node.value));
            break;
        }
        default: {
            switch (node.tag) {
                case Node::NUL: out.append("null"); break;
                case Node::STR: out.append(quote_string(node.value, Node::PLAIN, true)); break;
                default:        out.append(node.value); break;
            }
        }
    }
}

//////////////////////////////////////////////////////////////////////////////
/// @brief Writes a node tree back to text.
/// Nodes that carry layout recorded by the parser are written exactly as
/// they were read.  Nodes without layout (created or moved by an edit) are
/// placed relative to their parent using the configured indentation width.
//////////////////////////////////////////////////////////////////////////////
class Emitter
{
  public:
    Emitter(const EmitOptions& options) : m_options{options} {}

    String emit(const Node& root, const String& prologue, const String& epilogue);

  private:
    void write(const StringView& text);
    void write_indent(int col) { if (col > 0) write(String(col, ' ')); }
    void write_trivia(const String& text, int col, bool reindent);
    void write_comment(const Node& node);
    void newline() { write("\n"); }

    int child_column(const Node& node, int parent_col) const {
        return node.layout.indent >= 0? node.layout.indent: parent_col + m_options.indent;
    }

    void emit_block_mapping(const Node& map, int col, bool inline_first);
    void emit_block_sequence(const Node& seq, int col, bool inline_first);
    void emit_value(const Node& value, int parent_col, const String& sep);
    void emit_block_scalar(const Node& node, int parent_col);
    void emit_flow(const Node& node);
    void emit_flow_item(const Node& node);
    bool is_block_scalar(const Node& node) const;
    String key_token(const Node& key, bool flow) const;

  private:
    EmitOptions m_options;
    String m_out;
    int m_column = 0;
};

inline
void Emitter::write(const StringView& text) {
    m_out.append(text);
    auto nl = text.rfind('\n');
    if (nl == StringView::npos) m_column += (int)text.size();
    else m_column = (int)(text.size() - nl - 1);
}

/// Write comment and blank lines.  Lines of a moved node are re-indented to
/// the column of the node.
inline
void Emitter::write_trivia(const String& text, int col, bool reindent) {
    if (text.size() == 0) return;
    if (!reindent) {
        write(text);
        if (text.back() != '\n') newline();
        return;
    }
    size_t pos = 0;
    while (pos < text.size()) {
        auto end = text.find('\n', pos);
        if (end == String::npos) end = text.size();
        if (end > pos) {
            write_indent(col);
            write(StringView{text}.substr(pos, end - pos));
        }
        newline();
        pos = end + 1;
    }
}

inline
void Emitter::write_comment(const Node& node) {
    auto alignment = m_options.comment_alignment;
    if (alignment == CommentAlignment::DISABLED) return;
    if (node.line.size() == 0) {
        write(node.layout.gap);
        return;
    }
    if (alignment == CommentAlignment::ABSOLUTE) {
        write_indent(std::max(1, m_options.comment_column - m_column));
    } else {
        write(node.layout.gap.size() > 0? StringView{node.layout.gap}: StringView{" "});
    }
    write(node.line);
}

inline
String Emitter::key_token(const Node& key, bool flow) const {
    if (key.layout.raw) return *key.layout.raw;
    return quote_string(key.value, key.scalar_style == Node::SINGLE_QUOTED || key.scalar_style == Node::DOUBLE_QUOTED?
                                   key.scalar_style: Node::PLAIN, flow);
}

inline
String Emitter::emit(const Node& root, const String& prologue, const String& epilogue) {
    m_out.clear();
    m_column = 0;
    write(prologue);
    write_trivia(root.head, 0, root.layout.reindent);

    if (root.is_block_collection() && root.children.size() > 0) {
        int col = std::max(root.layout.indent, 0);
        if (root.is_mapping()) emit_block_mapping(root, col, false);
        else emit_block_sequence(root, col, false);
    } else if (root.kind != Node::SCALAR && root.style == Node::FLOW) {
        emit_flow(root);
        write_comment(root);
        newline();
    }

    write_trivia(root.foot, 0, root.layout.reindent);
    write(epilogue);
    if (m_out.size() > 0 && m_out.back() != '\n') newline();
    return std::move(m_out);
}

/// Write the entries of a block mapping at a column.  When inline_first is
/// set, the cursor is already positioned for the first key.
inline
void Emitter::emit_block_mapping(const Node& map, int col, bool inline_first) {
    for (size_t i = 0; i < map.size(); ++i) {
        auto& key = map.key_at(i);
        auto& value = map.value_at(i);
        if (i > 0 || !inline_first) {
            write_trivia(key.head, col, key.layout.reindent);
            write_indent(col);
        }
        write(key_token(key, false));
        emit_value(value, col, key.layout.sep.size() > 0? key.layout.sep: String{":"});
        write_trivia(key.foot, col, key.layout.reindent);
        write_trivia(value.foot, col, value.layout.reindent);
    }
}

inline
void Emitter::emit_block_sequence(const Node& seq, int col, bool inline_first) {
    for (size_t i = 0; i < seq.children.size(); ++i) {
        auto& item = seq.children[i];
        if (i > 0 || !inline_first) {
            write_trivia(item.head, col, item.layout.reindent);
            write_indent(col);
        }
        String dash = item.layout.sep.size() > 0? item.layout.sep: String{"- "};

        bool compact = item.is_block_collection() && item.children.size() > 0 &&
                       !item.layout.next_line && item.layout.props.size() == 0 &&
                       item.line.size() == 0;
        if (compact) {
            if (dash.back() != ' ') dash.push_back(' ');
            write(dash);
            if (item.is_mapping()) emit_block_mapping(item, m_column, true);
            else emit_block_sequence(item, m_column, true);
        } else {
            emit_value(item, col, dash);
        }
        write_trivia(item.foot, col, item.layout.reindent);
    }
}

inline
bool Emitter::is_block_scalar(const Node& node) const {
    if (node.kind != Node::SCALAR || node.tag != Node::STR) return false;
    bool block = node.scalar_style == Node::LITERAL || node.scalar_style == Node::FOLDED;
    if (node.layout.raw) return block;
    if (node.scalar_style == Node::SINGLE_QUOTED || node.scalar_style == Node::DOUBLE_QUOTED) return false;
    return wants_block_scalar(node.value);
}

/// Write the separator and the value of a mapping entry or sequence item.
inline
void Emitter::emit_value(const Node& value, int parent_col, const String& sep) {
    auto& props = value.layout.props;

    if (value.is_block_collection() && value.children.size() > 0) {
        if (props.size() > 0) {
            write(sep);
            if (!is_blank(sep.back())) write(" ");
            write(props);
        } else {
            write(rtrim(sep));
        }
        write_comment(value);
        newline();
        int col = child_column(value, parent_col);
        if (value.is_mapping()) emit_block_mapping(value, col, false);
        else emit_block_sequence(value, col, false);
        return;
    }

    bool block_scalar = is_block_scalar(value);
    bool is_collection = value.kind == Node::MAPPING || value.kind == Node::SEQUENCE;
    String token = (is_collection || block_scalar)? String{}: scalar_token(value, false);

    write(sep);
    if (value.layout.lead.size() > 0) {
        write(props);
        write(value.layout.lead);
    } else {
        bool empty = !is_collection && !block_scalar && token.size() == 0 && props.size() == 0;
        if (!empty && !is_blank(sep.back())) write(" ");
        write(props);
    }

    if (block_scalar) {
        emit_block_scalar(value, parent_col);
        return;
    }
    if (is_collection) emit_flow(value);
    else write(token);
    write_comment(value);
    newline();
}

inline
void Emitter::emit_block_scalar(const Node& node, int parent_col) {
    if (node.layout.raw) {
        write(*node.layout.raw);
        write_comment(node);
        newline();
        write(node.layout.body);
        return;
    }

    auto& value = node.value;
    size_t trailing = 0;
    while (trailing < value.size() && value[value.size() - 1 - trailing] == '\n') ++trailing;
    write(trailing == 0? "|-": (trailing == 1? "|": "|+"));
    write_comment(node);
    newline();

    int col = parent_col + m_options.indent;
    StringView content{value.data(), value.size() - trailing};
    size_t pos = 0;
    while (pos <= content.size()) {
        auto end = content.find('\n', pos);
        if (end == StringView::npos) end = content.size();
        if (end > pos) {
            write_indent(col);
            write(content.substr(pos, end - pos));
        }
        newline();
        pos = end + 1;
    }
    for (size_t i = 1; i < trailing; ++i) newline();
}

inline
void Emitter::emit_flow_item(const Node& node) {
    auto& props = node.layout.props;
    if (props.size() > 0) {
        write(props);
        if (!is_blank(props.back())) write(" ");
    }
    emit_flow(node);
}

/// Write a node in flow style.  Trivia recorded inside a flow collection is
/// kept; block collections nested in a flow context use default spacing.
inline
void Emitter::emit_flow(const Node& node) {
    if (node.kind == Node::SCALAR || node.kind == Node::ALIAS) {
        write(scalar_token(node, true));
        return;
    }

    bool is_seq = node.is_sequence();
    bool own = node.style == Node::FLOW;
    write(is_seq? "[": "{");
    auto count = node.size();
    for (size_t i = 0; i < count; ++i) {
        StringView pre = i == 0? "": " ";
        if (is_seq) {
            auto& item = node.children[i];
            write(own? StringView{item.layout.pre}: pre);
            emit_flow_item(item);
            if (own) write(item.layout.post);
        } else {
            auto& key = node.key_at(i);
            auto& value = node.value_at(i);
            write(own? StringView{key.layout.pre}: pre);
            write(own? key_token(key, true): quote_string(key.value, Node::PLAIN, true));
            bool key_only = value.is_null() && value.layout.raw && value.layout.raw->size() == 0;
            if (own && key.layout.sep.size() > 0) write(key.layout.sep);
            else if (!key_only) write(": ");
            emit_flow_item(value);
            if (own) write(value.layout.post);
        }
        if (i + 1 < count || (own && node.layout.trailing_comma)) write(",");
    }
    if (own) write(node.layout.tail);
    write(is_seq? "]": "}");
}

} // namespace impl

/// Write a document tree back to text.
inline
String emit(const Node& root, const String& prologue = {}, const String& epilogue = {}, const EmitOptions& options = {}) {
    impl::Emitter emitter{options};
    return emitter.emit(root, prologue, epilogue);
}

/// Canonical single-line flow rendering of a subtree, without comments.
inline
String to_flow(const Node& node) {
    String out;
    impl::to_flow(node, out);
    return out;
}

} // namespace yamler::yaml
