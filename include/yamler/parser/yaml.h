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
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <yamler/core/Node.h>
#include <yamler/support/logging.h>
#include <yamler/support/parse.h>
#include <yamler/support/string.h>

namespace yamler::yaml {

struct Options
{
    int default_indent = 2;
};

/// Result of parsing one document.
struct Tree
{
    Node root;
    String prologue;   // directives and comments up to and including "---"
    String epilogue;   // "..." and what follows it
    int indent = 2;
};

/// Resolve the type of a plain scalar (YAML 1.2 core schema).
inline
Node::Tag resolve(const StringView& plain) {
    if (plain.size() == 0 || plain == "~" || plain == "null" || plain == "Null" || plain == "NULL")
        return Node::NUL;
    if (plain == "true" || plain == "True" || plain == "TRUE" ||
        plain == "false" || plain == "False" || plain == "FALSE")
        return Node::BOOL;

    char first = plain[0];
    if (!(std::isdigit((unsigned char)first) || first == '-' || first == '+' || first == '.'))
        return Node::STR;

    if (str_to_int_any_base(plain)) return Node::INT;

    // integers too large for 64 bits still read as numbers
    bool all_digits = plain.size() > 0;
    for (size_t i = (first == '-' || first == '+')? 1: 0; i < plain.size(); ++i)
        if (!std::isdigit((unsigned char)plain[i])) all_digits = false;
    if (all_digits && plain.size() > 1) return Node::FLOAT;

    if (str_to_float(plain)) {
        // "1e3", "1.5", ".5", ".inf"; reject lone signs and dots
        for (char c : plain)
            if (std::isdigit((unsigned char)c)) return Node::FLOAT;
        auto body = (first == '-' || first == '+')? plain.substr(1): plain;
        if (body == ".inf" || body == ".Inf" || body == ".INF" ||
            plain == ".nan" || plain == ".NaN" || plain == ".NAN")
            return Node::FLOAT;
    }
    return Node::STR;
}

namespace impl {

inline
void append_utf8(String& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

//////////////////////////////////////////////////////////////////////////////
/// @brief Recursive descent parser for one block-structured document.
/// Every parse function starts at the first character of its construct.
/// Block constructs return with the cursor at the start of the first line
/// that does not belong to them, and with the comment and blank lines that
/// precede that line held in m_pending, so the caller can attach them to the
/// next entry.
//////////////////////////////////////////////////////////////////////////////
class Parser
{
  public:
    Parser(const StringView& text, const Options& options) : m_text{text}, m_options{options} {}

    Tree parse();

  private:
    bool done() const                  { return m_pos >= m_text.size(); }
    char peek(size_t ahead = 0) const  { auto pos = m_pos + ahead; return pos < m_text.size()? m_text[pos]: 0; }
    char at(size_t pos) const          { return pos < m_text.size()? m_text[pos]: 0; }
    bool is_blank(size_t pos) const    { char c = at(pos); return c == ' ' || c == '\t' || c == '\r'; }
    bool is_eol(size_t pos) const      { return pos >= m_text.size() || m_text[pos] == '\n'; }
    bool is_break(size_t pos) const    { return is_eol(pos) || is_blank(pos); }

    size_t line_begin(size_t pos) const;
    size_t line_end(size_t pos) const;
    int column() const                 { return (int)(m_pos - line_begin(m_pos)); }
    int indentation() const;
    bool is_trivia_line(size_t pos) const;
    bool at_marker(const char* marker) const;
    bool at_document_boundary() const  { return done() || at_marker("---") || at_marker("..."); }

    bool is_sequence_entry(size_t pos) const { return at(pos) == '-' && is_break(pos + 1); }
    bool is_mapping_key(size_t pos) const;

    void skip_blanks()                 { while (is_blank(m_pos)) ++m_pos; }
    void skip_newline()                { if (!done() && m_text[m_pos] == '\n') ++m_pos; }
    String take_trivia();
    String read_comment();

    Node parse_block_mapping(int col);
    Node parse_block_sequence(int col);
    Node parse_value(int parent_col, String& sep, bool in_sequence);
    Node parse_inline(int parent_col, bool in_sequence);
    void parse_line_end(Node& node);
    String parse_props(Node& node, bool flow);
    Node parse_key();
    Node parse_plain(int parent_col, bool flow);
    Node parse_quoted();
    Node parse_block_scalar(int parent_col);
    Node parse_alias(bool flow);
    Node parse_flow_collection();
    Node parse_flow_node();
    String flow_trivia();
    void apply_tag(Node& node);

    [[noreturn]] void error(const std::string& message) const { throw ParseError(m_text, m_pos, message); }

  private:
    StringView m_text;
    Options m_options;
    size_t m_pos = 0;
    String m_pending;
};

inline
size_t Parser::line_begin(size_t pos) const {
    while (pos > 0 && m_text[pos - 1] != '\n') --pos;
    return pos;
}

inline
size_t Parser::line_end(size_t pos) const {
    auto end = m_text.find('\n', pos);
    return end == StringView::npos? m_text.size(): end;
}

/// Indentation of the line starting at the cursor.
inline
int Parser::indentation() const {
    size_t pos = m_pos;
    while (at(pos) == ' ') ++pos;
    if (at(pos) == '\t') throw UnsupportedIndentation(m_text, pos);
    return (int)(pos - m_pos);
}

inline
bool Parser::is_trivia_line(size_t pos) const {
    while (is_blank(pos)) ++pos;
    return is_eol(pos) || at(pos) == '#';
}

inline
bool Parser::at_marker(const char* marker) const {
    if (line_begin(m_pos) != m_pos) return false;
    if (m_text.substr(m_pos, 3) != marker) return false;
    return is_break(m_pos + 3);
}

/// Test whether a block mapping key followed by ':' begins at a position.
inline
bool Parser::is_mapping_key(size_t pos) const {
    char c = at(pos);
    if (c == '[' || c == '{' || c == '#' || c == '|' || c == '>' || c == '*' || c == 0 || c == '\n')
        return false;
    if (is_sequence_entry(pos)) return false;
    if (c == '"' || c == '\'') {
        size_t end = pos + 1;
        while (end < m_text.size() && m_text[end] != '\n') {
            if (m_text[end] == '\\' && c == '"') { end += 2; continue; }
            if (m_text[end] == c) {
                if (c == '\'' && at(end + 1) == '\'') { end += 2; continue; }
                break;
            }
            ++end;
        }
        if (at(end) != c) return false;
        ++end;
        while (is_blank(end)) ++end;
        return at(end) == ':' && is_break(end + 1);
    }
    for (size_t i = pos; !is_eol(i); ++i) {
        if (m_text[i] == ':' && is_break(i + 1)) return true;
        if (m_text[i] == '#' && i > pos && is_blank(i - 1)) return false;
    }
    return false;
}

/// Consume whole comment and blank lines, verbatim.
inline
String Parser::take_trivia() {
    String trivia;
    while (!done() && is_trivia_line(m_pos)) {
        auto end = line_end(m_pos);
        trivia.append(m_text.substr(m_pos, end - m_pos));
        trivia.push_back('\n');
        m_pos = end < m_text.size()? end + 1: end;
    }
    return trivia;
}

inline
String Parser::read_comment() {
    auto end = line_end(m_pos);
    String comment{m_text.substr(m_pos, end - m_pos)};
    m_pos = end;
    return comment;
}

inline
Tree Parser::parse() {
    Tree tree;
    String lead = take_trivia();

    bool directives = false;
    while (!done() && peek() == '%' ) {
        auto end = line_end(m_pos);
        lead.append(m_text.substr(m_pos, end - m_pos));
        lead.push_back('\n');
        m_pos = end;
        skip_newline();
        lead += take_trivia();
        directives = true;
    }

    if (at_marker("---")) {
        auto end = line_end(m_pos);
        size_t pos = m_pos + 3;
        while (is_blank(pos)) ++pos;
        if (!is_eol(pos) && at(pos) != '#') {
            m_pos = pos;
            error("content on the document start line is not supported");
        }
        lead.append(m_text.substr(m_pos, end - m_pos));
        lead.push_back('\n');
        m_pos = end;
        skip_newline();
        tree.prologue = std::move(lead);
        lead = take_trivia();
    } else if (directives) {
        error("directives must be followed by a document start marker");
    }

    m_pending = std::move(lead);
    if (at_document_boundary()) {
        tree.root = Node::mapping();
        tree.root.head = std::exchange(m_pending, {});
    } else {
        int col = indentation();
        m_pos += col;
        char c = peek();
        if (is_sequence_entry(m_pos)) {
            tree.root = parse_block_sequence(col);
        } else if (c == '[' || c == '{') {
            String head = std::exchange(m_pending, {});
            tree.root = parse_flow_collection();
            tree.root.head = std::move(head);
            parse_line_end(tree.root);
        } else if (c == '&' || c == '!') {
            error("properties on the document root are not supported");
        } else if (is_mapping_key(m_pos)) {
            tree.root = parse_block_mapping(col);
        } else {
            error("document root must be a mapping or a sequence");
        }
    }

    if (!done()) {
        if (at_marker("...")) {
            tree.root.foot = std::exchange(m_pending, {});
            tree.epilogue = String{m_text.substr(m_pos, line_end(m_pos) - m_pos)} + '\n';
            m_pos = line_end(m_pos);
            skip_newline();
            tree.epilogue += take_trivia();
            if (!done()) error("multiple documents are not supported");
        } else if (at_marker("---")) {
            error("multiple documents are not supported");
        } else {
            m_pos += indentation();
            error("unexpected content, check the indentation");
        }
    }
    tree.root.foot += std::exchange(m_pending, {});

    tree.indent = m_options.default_indent;
    return tree;
}

inline
Node Parser::parse_block_mapping(int col) {
    Node map = Node::mapping(Node::BLOCK);
    map.layout.indent = col;

    while (true) {
        if (!is_mapping_key(m_pos)) {
            if (peek() == '?' && is_break(m_pos + 1)) error("complex mapping keys are not supported");
            error("expected a mapping key");
        }

        Node key = parse_key();
        key.head = std::exchange(m_pending, {});
        size_t sep_begin = m_pos;
        skip_blanks();
        if (peek() != ':') error("expected ':' after mapping key");
        ++m_pos;
        String sep{m_text.substr(sep_begin, m_pos - sep_begin)};

        Node value = parse_value(col, sep, false);
        key.layout.sep = std::move(sep);
        map.children.push_back(std::move(key));
        map.children.push_back(std::move(value));

        if (at_document_boundary()) break;
        int indent = indentation();
        if (indent < col) break;
        if (indent > col) {
            m_pos += indent;
            error("bad indentation of a mapping entry");
        }
        m_pos += indent;
        if (is_sequence_entry(m_pos)) error("block sequence entries are not allowed here");
    }
    return map;
}

inline
Node Parser::parse_block_sequence(int col) {
    Node seq = Node::sequence(Node::BLOCK);
    seq.layout.indent = col;

    while (true) {
        String head = std::exchange(m_pending, {});
        String dash{"-"};
        ++m_pos;
        Node item = parse_value(col, dash, true);
        item.head = std::move(head);
        item.layout.sep = std::move(dash);
        seq.children.push_back(std::move(item));

        if (at_document_boundary()) break;
        int indent = indentation();
        if (indent < col) break;
        if (indent > col) {
            m_pos += indent;
            error("bad indentation of a sequence entry");
        }
        if (!is_sequence_entry(m_pos + indent)) break;
        m_pos += indent;
    }
    return seq;
}

/// Parse the value following a ':' or a '-' indicator.  The indicator and
/// the blanks before an inline value are appended to sep.
inline
Node Parser::parse_value(int parent_col, String& sep, bool in_sequence) {
    size_t blanks_begin = m_pos;
    skip_blanks();
    String blanks{m_text.substr(blanks_begin, m_pos - blanks_begin)};

    Node props_node;
    String props;
    if (peek() == '&' || peek() == '!') {
        sep += blanks;
        props = parse_props(props_node, false);
        blanks_begin = m_pos;
        skip_blanks();
        blanks = m_text.substr(blanks_begin, m_pos - blanks_begin);
    }

    auto apply_props = [&props, &props_node] (Node& node) {
        node.layout.props = props;
        node.anchor = props_node.anchor;
        node.type_tag = props_node.type_tag;
    };

    if (is_eol(m_pos) || peek() == '#') {
        String comment = peek() == '#'? read_comment(): String{};
        skip_newline();
        String trivia = take_trivia();

        if (!at_document_boundary()) {
            int indent = indentation();
            size_t content = m_pos + indent;
            bool nested = indent > parent_col ||
                          (!in_sequence && indent == parent_col && is_sequence_entry(content));
            if (nested && (is_sequence_entry(content) || is_mapping_key(content))) {
                m_pending = std::move(trivia);
                m_pos = content;
                Node node = is_sequence_entry(content)? parse_block_sequence(indent): parse_block_mapping(indent);
                apply_props(node);
                node.layout.gap = std::move(blanks);
                node.line = std::move(comment);
                node.layout.next_line = in_sequence;
                return node;
            }
            if (nested) {
                m_pos = content;
                Node node = parse_inline(parent_col, false);
                apply_props(node);
                apply_tag(node);
                node.layout.lead = blanks + comment + '\n' + trivia + String(indent, ' ');
                if (node.scalar_style != Node::LITERAL && node.scalar_style != Node::FOLDED)
                    parse_line_end(node);
                return node;
            }
        }

        Node node = Node::scalar("", Node::NUL);
        node.layout.raw = "";
        apply_props(node);
        apply_tag(node);
        node.layout.gap = std::move(blanks);
        node.line = std::move(comment);
        m_pending = std::move(trivia);
        return node;
    }

    if (props.size() > 0) props += blanks;
    else sep += blanks;
    Node node = parse_inline(parent_col, in_sequence);
    apply_props(node);
    apply_tag(node);
    if (node.is_block_collection() || node.scalar_style == Node::LITERAL || node.scalar_style == Node::FOLDED)
        return node;
    parse_line_end(node);
    return node;
}

/// Parse a value that begins on the current line.
inline
Node Parser::parse_inline(int parent_col, bool in_sequence) {
    char c = peek();
    if (c == '[' || c == '{') return parse_flow_collection();
    if (c == '|' || c == '>') return parse_block_scalar(parent_col);
    if (c == '*') return parse_alias(false);
    if (c == '?' && is_break(m_pos + 1)) error("complex mapping keys are not supported");
    if (c == '@' || c == '`') error("reserved indicator cannot start a plain scalar");
    if (is_sequence_entry(m_pos)) {
        if (!in_sequence) error("block sequence entries are not allowed here");
        return parse_block_sequence(column());
    }
    if (is_mapping_key(m_pos)) {
        if (!in_sequence) error("mapping values are not allowed here");
        return parse_block_mapping(column());
    }
    if (c == '"' || c == '\'') return parse_quoted();
    return parse_plain(parent_col, false);
}

/// Consume trailing blanks, an optional comment and the line break.
inline
void Parser::parse_line_end(Node& node) {
    size_t blanks_begin = m_pos;
    skip_blanks();
    node.layout.gap = m_text.substr(blanks_begin, m_pos - blanks_begin);
    if (peek() == '#') {
        if (node.layout.gap.size() == 0) error("comments must be separated from other tokens by white space");
        node.line = read_comment();
    } else if (!is_eol(m_pos)) {
        error("unexpected characters after value");
    }
    skip_newline();
    m_pending = take_trivia();
}

inline
String Parser::parse_props(Node& node, bool flow) {
    size_t begin = m_pos;
    size_t end = m_pos;
    while (peek() == '&' || peek() == '!') {
        size_t token_begin = m_pos;
        while (!is_break(m_pos) && !(flow && (peek() == ',' || peek() == ']' || peek() == '}')))
            ++m_pos;
        auto token = m_text.substr(token_begin, m_pos - token_begin);
        if (token[0] == '&') {
            if (token.size() == 1) error("anchor name expected");
            node.anchor = token.substr(1);
        } else {
            node.type_tag = token;
        }
        end = m_pos;
        size_t save = m_pos;
        skip_blanks();
        if (peek() != '&' && peek() != '!') m_pos = save;
    }
    return String{m_text.substr(begin, end - begin)};
}

inline
void Parser::apply_tag(Node& node) {
    if (node.type_tag.size() == 0 || node.kind != Node::SCALAR) return;
    auto& tag = node.type_tag;
    if (tag == "!!str" || tag == "!") node.tag = Node::STR;
    else if (tag == "!!int") node.tag = Node::INT;
    else if (tag == "!!float") node.tag = Node::FLOAT;
    else if (tag == "!!bool") node.tag = Node::BOOL;
    else if (tag == "!!null") node.tag = Node::NUL;
}

inline
Node Parser::parse_key() {
    char c = peek();
    if (c == '"' || c == '\'') {
        Node key = parse_quoted();
        key.tag = Node::STR;
        return key;
    }
    size_t begin = m_pos;
    while (!(peek() == ':' && is_break(m_pos + 1))) ++m_pos;
    size_t end = m_pos;
    while (end > begin && is_blank(end - 1)) --end;
    m_pos = end;
    auto text = m_text.substr(begin, end - begin);
    Node key = Node::scalar(text, Node::STR);
    key.layout.raw = String{text};
    return key;
}

/// Parse a plain scalar.  In block context the scalar may continue on more
/// indented lines, which fold into single spaces.
inline
Node Parser::parse_plain(int parent_col, bool flow) {
    size_t begin = m_pos;
    auto scan_line = [this, flow] (size_t pos) {
        size_t end = pos;
        while (!is_eol(pos)) {
            char c = m_text[pos];
            if (c == '#' && pos > 0 && is_blank(pos - 1)) break;
            if (flow) {
                if (c == ',' || c == '[' || c == ']' || c == '{' || c == '}') break;
                if (c == ':') {
                    char n = at(pos + 1);
                    if (is_break(pos + 1) || n == ',' || n == ']' || n == '}') break;
                }
            } else if (c == ':' && is_break(pos + 1)) {
                break;
            }
            ++pos;
            if (!is_blank(pos - 1)) end = pos;
        }
        return end;
    };

    size_t end = scan_line(m_pos);
    String value{m_text.substr(begin, end - begin)};
    m_pos = end;

    if (!flow) {
        while (true) {
            size_t pos = m_pos;
            while (is_blank(pos)) ++pos;
            if (!is_eol(pos)) break;

            // look ahead over blank lines for a more indented continuation line
            size_t breaks = 0;
            size_t line = pos;
            while (line < m_text.size()) {
                line += 1;
                size_t content = line;
                while (at(content) == ' ') ++content;
                if (is_trivia_line(content) && at(content) != '#' && content < m_text.size()) {
                    ++breaks;
                    line = line_end(content);
                    continue;
                }
                break;
            }
            if (line >= m_text.size()) break;
            size_t content = line;
            while (at(content) == ' ') ++content;
            if (at(content) == '\t') throw UnsupportedIndentation(m_text, content);
            if ((int)(content - line) <= parent_col || at(content) == '#') break;
            if (is_mapping_key(content) || is_sequence_entry(content)) break;

            size_t next_end = scan_line(content);
            if (next_end == content) break;
            value += breaks > 0? String(breaks, '\n'): String{" "};
            value.append(m_text.substr(content, next_end - content));
            end = next_end;
            m_pos = end;
        }
    }

    Node node = Node::scalar(value, resolve(value));
    node.layout.raw = String{m_text.substr(begin, end - begin)};
    return node;
}

inline
Node Parser::parse_quoted() {
    size_t begin = m_pos;
    char quote = peek();
    ++m_pos;
    String value;

    auto fold_break = [this, &value] () {
        while (value.size() > 0 && (value.back() == ' ' || value.back() == '\t')) value.pop_back();
        size_t breaks = 0;
        ++m_pos;
        while (true) {
            while (is_blank(m_pos)) ++m_pos;
            if (peek() != '\n') break;
            ++breaks;
            ++m_pos;
        }
        if (done()) error("unterminated quoted scalar");
        value += breaks > 0? String(breaks, '\n'): String{" "};
    };

    while (true) {
        if (done()) {
            m_pos = begin;
            error("unterminated quoted scalar");
        }
        char c = peek();
        if (c == quote) {
            if (quote == '\'' && peek(1) == '\'') {
                value.push_back('\'');
                m_pos += 2;
                continue;
            }
            ++m_pos;
            break;
        }
        if (c == '\n') {
            fold_break();
            continue;
        }
        if (quote == '"' && c == '\\') {
            char e = peek(1);
            m_pos += 2;
            switch (e) {
                case '0':  value.push_back('\0'); break;
                case 'a':  value.push_back('\a'); break;
                case 'b':  value.push_back('\b'); break;
                case 't':  value.push_back('\t'); break;
                case '\t': value.push_back('\t'); break;
                case 'n':  value.push_back('\n'); break;
                case 'v':  value.push_back('\v'); break;
                case 'f':  value.push_back('\f'); break;
                case 'r':  value.push_back('\r'); break;
                case 'e':  value.push_back('\x1b'); break;
                case ' ':  value.push_back(' '); break;
                case '"':  value.push_back('"'); break;
                case '/':  value.push_back('/'); break;
                case '\\': value.push_back('\\'); break;
                case 'N':  append_utf8(value, 0x85); break;
                case '_':  append_utf8(value, 0xA0); break;
                case 'L':  append_utf8(value, 0x2028); break;
                case 'P':  append_utf8(value, 0x2029); break;
                case '\n': {
                    while (is_blank(m_pos)) ++m_pos;
                    break;
                }
                case 'x':
                case 'u':
                case 'U': {
                    size_t digits = e == 'x'? 2: (e == 'u'? 4: 8);
                    uint32_t cp = 0;
                    auto hex = m_text.substr(m_pos, digits);
                    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), cp, 16);
                    if (hex.size() != digits || ec != std::errc{} || ptr != hex.data() + hex.size())
                        error("invalid escape sequence");
                    m_pos += digits;
                    append_utf8(value, cp);
                    break;
                }
                default:
                    m_pos -= 2;
                    error("invalid escape sequence");
            }
            continue;
        }
        value.push_back(c);
        ++m_pos;
    }

    Node node = Node::scalar(value, Node::STR);
    node.scalar_style = quote == '"'? Node::DOUBLE_QUOTED: Node::SINGLE_QUOTED;
    node.layout.raw = String{m_text.substr(begin, m_pos - begin)};
    return node;
}

inline
Node Parser::parse_block_scalar(int parent_col) {
    size_t begin = m_pos;
    bool literal = peek() == '|';
    ++m_pos;
    int explicit_indent = 0;
    char chomp = 0;
    for (int i = 0; i < 2; ++i) {
        char c = peek();
        if (c >= '1' && c <= '9' && explicit_indent == 0) { explicit_indent = c - '0'; ++m_pos; }
        else if ((c == '+' || c == '-') && chomp == 0) { chomp = c; ++m_pos; }
    }

    Node node = Node::scalar("", Node::STR);
    node.scalar_style = literal? Node::LITERAL: Node::FOLDED;
    node.layout.raw = String{m_text.substr(begin, m_pos - begin)};

    size_t blanks_begin = m_pos;
    skip_blanks();
    node.layout.gap = m_text.substr(blanks_begin, m_pos - blanks_begin);
    if (peek() == '#') node.line = read_comment();
    if (!is_eol(m_pos)) error("unexpected characters after block scalar indicator");
    skip_newline();

    // find the content indentation
    size_t body_begin = m_pos;
    int content_indent = explicit_indent > 0? std::max(parent_col, 0) + explicit_indent: -1;
    if (content_indent < 0) {
        size_t pos = m_pos;
        while (pos < m_text.size()) {
            size_t content = pos;
            while (at(content) == ' ') ++content;
            if (!is_eol(content) && !(at(content) == '\r' && is_eol(content + 1))) {
                content_indent = (int)(content - pos);
                break;
            }
            pos = is_eol(content) && content < m_text.size()? content + 1: line_end(content) + 1;
        }
        if (content_indent <= parent_col) content_indent = parent_col + 1;
    }

    // collect the lines of the body
    std::vector<StringView> lines;
    size_t content_end = body_begin;
    size_t content_lines = 0;
    size_t pos = body_begin;
    while (pos < m_text.size()) {
        auto end = line_end(pos);
        size_t content = pos;
        while (at(content) == ' ') ++content;
        bool blank = content >= end || (at(content) == '\r' && content + 1 >= end);
        if (!blank && (int)(content - pos) < content_indent) {
            if (at(content) == '\t') throw UnsupportedIndentation(m_text, content);
            break;
        }
        auto text = m_text.substr(pos, end - pos);
        if (text.size() > 0 && text.back() == '\r') text.remove_suffix(1);
        lines.push_back(blank? StringView{}: text.substr(content_indent));
        pos = end < m_text.size()? end + 1: end;
        if (!blank) {
            content_end = pos;
            content_lines = lines.size();
        }
    }
    size_t body_end = chomp == '+'? pos: content_end;
    size_t trailing = chomp == '+'? lines.size() - content_lines: 0;
    lines.resize(content_lines);

    String value;
    if (literal) {
        for (auto& line : lines) {
            value.append(line);
            value.push_back('\n');
        }
        while (value.size() > 0 && value.back() == '\n') value.pop_back();
    } else {
        bool first = true;
        bool prev_more = false;
        size_t breaks = 0;
        for (auto& line : lines) {
            if (line.size() == 0) { ++breaks; continue; }
            bool more = line[0] == ' ' || line[0] == '\t';
            if (first) {
                value.append(breaks, '\n');
            } else if (breaks == 0) {
                value.push_back((more || prev_more)? '\n': ' ');
            } else {
                value.append(breaks + ((more || prev_more)? 1: 0), '\n');
            }
            value.append(line);
            first = false;
            prev_more = more;
            breaks = 0;
        }
    }
    if (content_lines > 0 && chomp != '-') value.push_back('\n');
    if (chomp == '+') value.append(trailing, '\n');

    node.value = std::move(value);
    node.layout.body = m_text.substr(body_begin, body_end - body_begin);
    if (node.layout.body.size() > 0 && node.layout.body.back() != '\n')
        node.layout.body.push_back('\n');
    m_pos = body_end;
    m_pending = take_trivia();
    return node;
}

inline
Node Parser::parse_alias(bool flow) {
    size_t begin = m_pos;
    ++m_pos;
    while (!is_break(m_pos) && !(flow && (peek() == ',' || peek() == ']' || peek() == '}'))) ++m_pos;
    if (m_pos == begin + 1) error("alias name expected");
    Node node{Node::ALIAS};
    node.value = m_text.substr(begin + 1, m_pos - begin - 1);
    node.layout.raw = String{m_text.substr(begin, m_pos - begin)};
    return node;
}

/// Consume blanks, line breaks and comments inside a flow collection.
inline
String Parser::flow_trivia() {
    size_t begin = m_pos;
    while (!done()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            ++m_pos;
        } else if (c == '#' && (m_pos == 0 || is_break(m_pos - 1))) {
            m_pos = line_end(m_pos);
        } else {
            break;
        }
    }
    return String{m_text.substr(begin, m_pos - begin)};
}

inline
Node Parser::parse_flow_collection() {
    size_t begin = m_pos;
    bool is_seq = peek() == '[';
    char close = is_seq? ']': '}';
    Node node = is_seq? Node::sequence(Node::FLOW): Node::mapping(Node::FLOW);
    ++m_pos;

    bool after_comma = false;
    while (true) {
        String pre = flow_trivia();
        if (done()) {
            m_pos = begin;
            error("unterminated flow collection");
        }
        char c = peek();
        if (c == close) {
            if (node.children.size() == 0 || after_comma) node.layout.tail = std::move(pre);
            node.layout.trailing_comma = after_comma;
            ++m_pos;
            break;
        }
        if (node.children.size() > 0 && !after_comma) error(fmt::format("expected ',' or '{}'", close));
        if (c == ',') error("unexpected ','");

        if (is_seq) {
            Node item = parse_flow_node();
            item.layout.pre = std::move(pre);
            size_t save = m_pos;
            String post = flow_trivia();
            if (peek() == ':' && is_break(m_pos + 1)) {
                m_pos = save;
                error("single pair mappings in flow sequences are not supported");
            }
            item.layout.post = std::move(post);
            node.children.push_back(std::move(item));
        } else {
            Node key;
            char k = peek();
            if (k == '"' || k == '\'') {
                key = parse_quoted();
            } else if (k == '[' || k == '{') {
                error("collection keys are not supported");
            } else {
                key = parse_plain(-1, true);
                key.tag = Node::STR;
            }
            key.layout.pre = std::move(pre);

            size_t sep_begin = m_pos;
            flow_trivia();
            Node value;
            if (peek() == ':') {
                ++m_pos;
                flow_trivia();
                key.layout.sep = m_text.substr(sep_begin, m_pos - sep_begin);
                if (peek() == ',' || peek() == close) {
                    value = Node::scalar("", Node::NUL);
                    value.layout.raw = "";
                } else {
                    value = parse_flow_node();
                }
                value.layout.post = flow_trivia();
            } else {
                m_pos = sep_begin;
                value = Node::scalar("", Node::NUL);
                value.layout.raw = "";
                value.layout.post = flow_trivia();
            }
            node.children.push_back(std::move(key));
            node.children.push_back(std::move(value));
        }

        after_comma = false;
        if (peek() == ',') {
            ++m_pos;
            after_comma = true;
        } else if (peek() != close) {
            error(fmt::format("expected ',' or '{}'", close));
        }
    }
    return node;
}

inline
Node Parser::parse_flow_node() {
    Node props_node;
    String props;
    if (peek() == '&' || peek() == '!') {
        size_t begin = m_pos;
        parse_props(props_node, true);
        skip_blanks();
        props = m_text.substr(begin, m_pos - begin);
    }

    Node node;
    char c = peek();
    if (c == '[' || c == '{') node = parse_flow_collection();
    else if (c == '"' || c == '\'') node = parse_quoted();
    else if (c == '*') node = parse_alias(true);
    else if (c == ',' || c == ']' || c == '}') {
        node = Node::scalar("", Node::NUL);
        node.layout.raw = "";
    } else {
        node = parse_plain(-1, true);
    }

    node.layout.props = std::move(props);
    node.anchor = props_node.anchor;
    node.type_tag = props_node.type_tag;
    apply_tag(node);
    return node;
}

inline
void detect_indent(const Node& node, int& result) {
    if (result > 0) return;
    if (node.is_mapping() && node.style == Node::BLOCK) {
        for (size_t i = 0; i < node.size(); ++i) {
            auto& value = node.value_at(i);
            if (value.is_mapping() && value.style == Node::BLOCK && value.layout.indent > node.layout.indent && node.layout.indent >= 0) {
                result = value.layout.indent - node.layout.indent;
                return;
            }
        }
    }
    for (auto& child : node.children) {
        detect_indent(child, result);
        if (result > 0) return;
    }
}

} // namespace impl

/// Parse the text of one document.
inline
Tree parse(const StringView& text, const Options& options = {}) {
    impl::Parser parser{text, options};
    Tree tree = parser.parse();

    int indent = 0;
    impl::detect_indent(tree.root, indent);
    if (indent == 2 || indent == 4 || indent == 6 || indent == 8) {
        tree.indent = indent;
    } else {
        if (indent > 0) YAMLER_DEBUG("unusual indentation width {}, using {}", indent, options.default_indent);
        tree.indent = options.default_indent;
    }
    return tree;
}

} // namespace yamler::yaml
