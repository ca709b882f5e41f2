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
#include <ostream>

#include <yamler/core/Node.h>
#include <yamler/support/exception.h>
#include <yamler/support/parse.h>
#include <yamler/support/string.h>
#include <yamler/support/types.h>

namespace yamler {

//////////////////////////////////////////////////////////////////////////////
/// @brief One step of a Path or a Pattern.
//////////////////////////////////////////////////////////////////////////////
struct Segment
{
    enum Kind {
        KEY,
        INDEX,
        ANY_KEY,       // '*', one key or one index
        ANY_INDEX,     // '[*]', one index
        RECURSIVE      // '**', zero or more segments
    };

    Segment(const StringView& key) : kind{KEY}, key{key} {}
    Segment(Int index)             : kind{INDEX}, index{index} {}
    Segment(Kind kind)             : kind{kind} {}

    bool is_key() const      { return kind == KEY; }
    bool is_index() const    { return kind == INDEX; }
    bool is_wildcard() const { return kind == ANY_KEY || kind == ANY_INDEX || kind == RECURSIVE; }

    bool operator == (const Segment& other) const {
        if (kind != other.kind) return false;
        if (kind == KEY) return key == other.key;
        if (kind == INDEX) return index == other.index;
        return true;
    }

    void to_step(std::ostream& stream, bool is_first = false) const {
        switch (kind) {
            case KEY:       if (!is_first) stream << '.'; stream << key; break;
            case INDEX:     stream << '[' << index << ']'; break;
            case ANY_KEY:   if (!is_first) stream << '.'; stream << '*'; break;
            case ANY_INDEX: stream << "[*]"; break;
            case RECURSIVE: if (!is_first) stream << '.'; stream << "**"; break;
        }
    }

    Kind kind;
    String key;
    Int index = 0;
};

using SegmentList = std::vector<Segment>;

//////////////////////////////////////////////////////////////////////////////
/// @brief Address of a node within a document.
/// The textual form is a sequence of '.'-separated keys, each optionally
/// followed by one or more '[index]' suffixes, for example "a.b[2].c".  A
/// path may begin with an index to address into a sequence root.  The empty
/// path denotes the root.
//////////////////////////////////////////////////////////////////////////////
class Path
{
  public:
    using Iterator = SegmentList::iterator;
    using ConstIterator = SegmentList::const_iterator;

    /// Kind of node created for the last segment of a write walk.
    enum Leaf { SCALAR, MAPPING, SEQUENCE };

    Path() {}
    Path(const StringView& spec);
    Path(const char* spec) : Path{StringView{spec}} {}
    Path(const String& spec) : Path{StringView{spec}} {}
    Path(const SegmentList& segments) : m_segments{segments} {}
    Path(SegmentList&& segments)      : m_segments{std::forward<SegmentList>(segments)} {}

    static SegmentList parse(const StringView& spec, bool allow_wildcards);

    void append(const Segment& segment) { m_segments.push_back(segment); }
    void append(Segment&& segment)      { m_segments.emplace_back(std::forward<Segment>(segment)); }

    Path child(const Segment& segment) const {
        Path path{*this};
        path.append(segment);
        return path;
    }

    Path parent() const {
        if (m_segments.size() == 0) return {};
        return SegmentList{m_segments.begin(), m_segments.end() - 1};
    }

    Path operator + (const Path& other) const {
        Path path{*this};
        for (auto& segment : other) path.append(segment);
        return path;
    }

    const Segment& leaf() const { return m_segments.back(); }
    size_t size() const         { return m_segments.size(); }
    bool is_root() const        { return m_segments.size() == 0; }

    const Node& lookup(const Node& root) const;
    Node& lookup(Node& root) const;
    const Node* find(const Node& root) const;
    void check_writable(const Node& root) const;
    Node& create(Node& root, Leaf leaf, Node::Style sequence_style = Node::FLOW) const;

    String to_str() const {
        StringStream ss;
        bool first = true;
        for (auto& segment : m_segments) {
            segment.to_step(ss, first);
            first = false;
        }
        return ss.str();
    }

    bool operator == (const Path& other) const { return m_segments == other.m_segments; }

    Iterator begin()            { return m_segments.begin(); }
    Iterator end()              { return m_segments.end(); }
    ConstIterator begin() const { return m_segments.cbegin(); }
    ConstIterator end() const   { return m_segments.cend(); }

  private:
    static Segment parse_index(const StringView& spec, size_t& pos, bool allow_wildcards);

    static Node make_container(const Segment& next, Node::Style sequence_style);

  private:
    SegmentList m_segments;
};

inline
Path::Path(const StringView& spec) : m_segments{parse(spec, false)} {}

inline
Segment Path::parse_index(const StringView& spec, size_t& pos, bool allow_wildcards) {
    auto start = pos++;
    auto close = spec.find(']', pos);
    if (close == StringView::npos) throw InvalidPath{spec, start, "missing closing ']'"};
    auto text = spec.substr(pos, close - pos);
    pos = close + 1;
    if (text == "*") {
        if (!allow_wildcards) throw InvalidPath{spec, start, "wildcard not allowed in path"};
        return Segment{Segment::ANY_INDEX};
    }
    auto index = str_to_int(text);
    if (!index || text.find('+') != StringView::npos) throw InvalidPath{spec, start + 1, "expected integer index"};
    return Segment{*index};
}

inline
SegmentList Path::parse(const StringView& spec, bool allow_wildcards) {
    SegmentList segments;
    if (spec.size() == 0) return segments;

    size_t pos = 0;
    bool expect_key = spec[0] != '[';
    while (pos <= spec.size()) {
        if (expect_key) {
            auto key_start = pos;
            while (pos < spec.size() && spec[pos] != '.' && spec[pos] != '[') {
                if (spec[pos] == ']') throw InvalidPath{spec, pos, "unexpected ']'"};
                ++pos;
            }
            auto key = spec.substr(key_start, pos - key_start);
            if (key.size() == 0) throw InvalidPath{spec, key_start, "expected key"};
            if (key == "*" || key == "**") {
                if (!allow_wildcards) throw InvalidPath{spec, key_start, "wildcard not allowed in path"};
                segments.emplace_back(key == "*"? Segment::ANY_KEY: Segment::RECURSIVE);
            } else {
                if (allow_wildcards && key.find('*') != StringView::npos)
                    throw InvalidPattern("", fmt::format("wildcard must be a whole segment: {}", spec));
                segments.emplace_back(key);
            }
        }

        while (pos < spec.size() && spec[pos] == '[')
            segments.push_back(parse_index(spec, pos, allow_wildcards));

        if (pos == spec.size()) break;
        if (spec[pos] != '.') throw InvalidPath{spec, pos, "expected '.' or '['"};
        ++pos;
        expect_key = true;
    }
    return segments;
}

inline
const Node* Path::find(const Node& root) const {
    const Node* node = &root;
    for (auto& segment : m_segments) {
        if (segment.is_key()) {
            if (!node->is_mapping()) return nullptr;
            node = node->find(segment.key);
            if (node == nullptr) return nullptr;
        } else {
            if (!node->is_sequence()) return nullptr;
            if (segment.index < 0 || segment.index >= (Int)node->children.size()) return nullptr;
            node = &node->children[segment.index];
        }
    }
    return node;
}

inline
const Node& Path::lookup(const Node& root) const {
    const Node* node = &root;
    for (auto& segment : m_segments) {
        if (segment.is_key()) {
            if (!node->is_mapping()) throw NotAMapping(to_str(), node->type_name());
            auto child = node->find(segment.key);
            if (child == nullptr) throw KeyNotFound(to_str(), segment.key);
            node = child;
        } else if (segment.is_index()) {
            if (!node->is_sequence()) throw NotASequence(to_str(), node->type_name());
            if (segment.index < 0 || segment.index >= (Int)node->children.size())
                throw IndexOutOfBounds(to_str(), segment.index, node->children.size());
            node = &node->children[segment.index];
        } else {
            throw InvalidPattern(to_str(), "wildcards cannot be resolved directly");
        }
    }
    return *node;
}

inline
Node& Path::lookup(Node& root) const {
    return const_cast<Node&>(lookup(const_cast<const Node&>(root)));
}

/// Perform every check of a write walk without changing the tree, so that a
/// failing write leaves the document untouched.
inline
void Path::check_writable(const Node& root) const {
    const Node* node = &root;
    for (auto& segment : m_segments) {
        if (node == nullptr) {
            // the rest of the path will be created, new sequences start empty
            if (segment.is_index() && segment.index != 0) throw IndexOutOfBounds(to_str(), segment.index, 0);
            if (segment.is_wildcard()) throw InvalidPattern(to_str(), "wildcards cannot be resolved directly");
            continue;
        }
        if (segment.is_key()) {
            if (node->is_sequence()) throw NotAMapping(to_str(), node->type_name());
            node = node->is_mapping()? node->find(segment.key): nullptr;
        } else if (segment.is_index()) {
            if (node->is_mapping()) throw NotASequence(to_str(), node->type_name());
            Int size = node->is_sequence()? (Int)node->children.size(): 0;
            if (segment.index < 0 || segment.index > size)
                throw IndexOutOfBounds(to_str(), segment.index, size);
            node = segment.index < size? &node->children[segment.index]: nullptr;
        } else {
            throw InvalidPattern(to_str(), "wildcards cannot be resolved directly");
        }
    }
}

inline
Node Path::make_container(const Segment& next, Node::Style sequence_style) {
    return next.is_index()? Node::sequence(sequence_style): Node::mapping();
}

/// Walk the path, creating missing keys and promoting scalars met on the way
/// to the container the next segment requires.  An index equal to the length
/// of a sequence appends a new element.
inline
Node& Path::create(Node& root, Leaf leaf, Node::Style sequence_style) const {
    check_writable(root);

    auto leaf_node = [leaf, sequence_style] () {
        switch (leaf) {
            case MAPPING:  return Node::mapping();
            case SEQUENCE: return Node::sequence(sequence_style);
            default:       return Node{};
        }
    };

    Node* node = &root;
    for (size_t i = 0; i < m_segments.size(); ++i) {
        auto& segment = m_segments[i];
        bool is_last = i + 1 == m_segments.size();
        Node fresh = is_last? leaf_node(): make_container(m_segments[i + 1], sequence_style);

        if (segment.is_key()) {
            if (!node->is_mapping()) node->replace_with(Node::mapping());
            auto child = node->find(segment.key);
            node = child != nullptr? child: &node->add_entry(segment.key, std::move(fresh));
        } else {
            if (!node->is_sequence()) node->replace_with(Node::sequence(sequence_style));
            if (segment.index == (Int)node->children.size())
                node = &node->insert_item(node->children.size(), std::move(fresh));
            else
                node = &node->children[segment.index];
        }
    }
    return *node;
}

inline
std::ostream& operator<< (std::ostream& ostream, const Path& path) {
    ostream << path.to_str();
    return ostream;
}

inline
Path operator ""_path (const char* str, size_t size) {
    return Path{StringView{str, size}};
}

} // namespace yamler
