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
#include <filesystem>
#include <map>
#include <vector>

#include <yamler/core/Node.h>
#include <yamler/core/Path.h>
#include <yamler/core/Pattern.h>
#include <yamler/core/Value.h>
#include <yamler/core/convert.h>
#include <yamler/core/merge.h>
#include <yamler/parser/yaml.h>
#include <yamler/schema/Rule.h>
#include <yamler/schema/validate.h>
#include <yamler/serializer/yaml.h>
#include <yamler/support/file.h>
#include <yamler/support/logging.h>

namespace yamler {

using Bytes = std::vector<uint8_t>;

//////////////////////////////////////////////////////////////////////////////
/// @brief An editable document that keeps its comments and formatting.
/// The root is a mapping, or a sequence for array-root documents.  Every
/// operation edits the node tree in place and leaves the tree unchanged
/// when it throws.  Text is produced on demand by to_string(), so any number
/// of edits can be applied before the document is written.
//////////////////////////////////////////////////////////////////////////////
class Document
{
  public:
    Document() : m_root{Node::mapping()} {}
    Document(Node&& root) : m_root{std::forward<Node>(root)} {}

    static Document load(const StringView& text, const yaml::Options& options = {});
    static Document load_bytes(const Bytes& bytes, const yaml::Options& options = {});
    static Document load_file(const std::filesystem::path& fpath, const yaml::Options& options = {});

    String to_string() const;
    String str() const { return to_string(); }
    Bytes to_bytes() const;
    void save(const std::filesystem::path& fpath) const;

    const Node& root() const { return m_root; }

    // get and set
    Value get(const Path& path) const;
    void set(const Path& path, const Value& value);

    String get_string(const Path& path) const { return codec::to_string(get(path), path); }
    Int get_int(const Path& path) const       { return codec::to_int(get(path), path); }
    Float get_float(const Path& path) const   { return codec::to_float(get(path), path); }
    bool get_bool(const Path& path) const     { return codec::to_bool(get(path), path); }
    List get_list(const Path& path) const     { return codec::to_list(get(path), path); }
    Map get_map(const Path& path) const       { return codec::to_map(get(path), path); }

    std::vector<String> get_string_list(const Path& path) const;
    std::vector<Int> get_int_list(const Path& path) const;
    std::vector<Float> get_float_list(const Path& path) const;
    std::vector<bool> get_bool_list(const Path& path) const;
    std::vector<Map> get_map_list(const Path& path) const;

    // arrays
    void append_to_array(const Path& path, const Value& value);
    void insert_into_array(const Path& path, Int index, const Value& value);
    void remove_from_array(const Path& path, Int index);
    void update_array_element(const Path& path, Int index, const Value& value);
    size_t get_array_length(const Path& path) const;
    Value get_array_element(const Path& path, Int index) const;
    Value get_typed_array_element(const Path& path, Int index, const StringView& type) const;

    // array-root documents
    bool is_array_root() const { return m_root.is_sequence(); }
    void set_array_element(Int index, const Path& sub_path, const Value& value);
    Value get_array_document_element(Int index, const Path& sub_path) const;
    void add_array_element(const Value& value);
    size_t get_array_document_length() const;

    // wildcards
    std::map<String, Value> get_all(const Pattern& pattern) const;
    void set_all(const Pattern& pattern, const Value& value);
    std::vector<String> get_keys(const Pattern& pattern) const;
    std::vector<String> get_paths() const;

    // merge and validation
    void merge(const Document& other);
    void merge(const Document* other);
    void merge_at(const Path& path, const Document& other);
    void merge_at(const Path& path, const Document* other);
    void validate(const schema::Rule& rule) const { schema::validate(m_root, rule); }

    // formatting
    int indent() const                                 { return m_emit_options.indent; }
    void set_indent(int indent)                        { m_emit_options.indent = indent; }
    void set_comment_alignment(yaml::CommentAlignment alignment) { m_emit_options.comment_alignment = alignment; }
    void set_absolute_comment_alignment(int column);
    const yaml::EmitOptions& emit_options() const      { return m_emit_options; }
    codec::Options& codec_options()                    { return m_codec_options; }

  private:
    template <typename T, typename Convert>
    std::vector<T> get_list_of(const Path& path, Convert&& convert) const;

    const Node& array_at(const Path& path) const;
    Node& array_at(const Path& path);
    void check_index(const Path& path, const Node& seq, Int index, bool allow_end) const;
    Path element_path(Int index, const Path& sub_path) const;

  private:
    Node m_root;
    String m_prologue;
    String m_epilogue;
    yaml::EmitOptions m_emit_options;
    codec::Options m_codec_options;
};

inline
Document Document::load(const StringView& text, const yaml::Options& options) {
    auto tree = yaml::parse(text, options);
    Document doc{std::move(tree.root)};
    doc.m_prologue = std::move(tree.prologue);
    doc.m_epilogue = std::move(tree.epilogue);
    doc.m_emit_options.indent = tree.indent;
    YAMLER_DEBUG("loaded document, indent={}", tree.indent);
    return doc;
}

inline
Document Document::load_bytes(const Bytes& bytes, const yaml::Options& options) {
    return load(String(bytes.begin(), bytes.end()), options);
}

inline
Document Document::load_file(const std::filesystem::path& fpath, const yaml::Options& options) {
    return load(read_file(fpath), options);
}

inline
String Document::to_string() const {
    return yaml::emit(m_root, m_prologue, m_epilogue, m_emit_options);
}

inline
Bytes Document::to_bytes() const {
    auto text = to_string();
    return Bytes(text.begin(), text.end());
}

inline
void Document::save(const std::filesystem::path& fpath) const {
    write_file(fpath, to_string());
}

inline
Value Document::get(const Path& path) const {
    return codec::decode(path.lookup(m_root), path);
}

/// Set the value at a path, creating missing keys.  An existing node keeps
/// its comments and, when a string replaces a string, its quoting.
inline
void Document::set(const Path& path, const Value& value) {
    Node node = codec::encode(value, m_codec_options);
    if (path.is_root()) {
        if (!node.is_mapping() && !node.is_sequence())
            throw TypeMismatch("", "mapping or sequence", value.type_name());
        m_root.replace_with(std::move(node));
        return;
    }
    path.create(m_root, Path::SCALAR).replace_with(std::move(node));
}

template <typename T, typename Convert>
std::vector<T> Document::get_list_of(const Path& path, Convert&& convert) const {
    auto value = get(path);
    if (!value.is_list()) throw TypeMismatch(path.to_str(), "list", value.type_name());
    std::vector<T> result;
    auto& list = value.as<List>();
    for (size_t i = 0; i < list.size(); ++i)
        result.push_back(convert(list[i], path.child((Int)i)));
    return result;
}

inline
std::vector<String> Document::get_string_list(const Path& path) const {
    return get_list_of<String>(path, [] (const Value& v, const Path& p) { return codec::to_string(v, p); });
}

inline
std::vector<Int> Document::get_int_list(const Path& path) const {
    return get_list_of<Int>(path, [] (const Value& v, const Path& p) { return codec::to_int(v, p); });
}

inline
std::vector<Float> Document::get_float_list(const Path& path) const {
    return get_list_of<Float>(path, [] (const Value& v, const Path& p) { return codec::to_float(v, p); });
}

inline
std::vector<bool> Document::get_bool_list(const Path& path) const {
    return get_list_of<bool>(path, [] (const Value& v, const Path& p) { return codec::to_bool(v, p); });
}

inline
std::vector<Map> Document::get_map_list(const Path& path) const {
    return get_list_of<Map>(path, [] (const Value& v, const Path& p) { return codec::to_map(v, p); });
}

inline
const Node& Document::array_at(const Path& path) const {
    auto& node = path.lookup(m_root);
    if (!node.is_sequence()) throw NotAnArray(path.to_str(), node.type_name());
    return node;
}

inline
Node& Document::array_at(const Path& path) {
    auto& node = path.lookup(m_root);
    if (!node.is_sequence()) throw NotAnArray(path.to_str(), node.type_name());
    return node;
}

inline
void Document::check_index(const Path& path, const Node& seq, Int index, bool allow_end) const {
    Int size = (Int)seq.children.size();
    if (index < 0 || index > size || (index == size && !allow_end))
        throw IndexOutOfBounds(path.to_str(), index, seq.children.size());
}

/// Append to the sequence at a path, creating it as an empty sequence when
/// the path does not exist.
inline
void Document::append_to_array(const Path& path, const Value& value) {
    auto existing = path.find(m_root);
    if (existing != nullptr && !existing->is_sequence())
        throw NotAnArray(path.to_str(), existing->type_name());

    Node& seq = existing != nullptr? path.lookup(m_root): path.create(m_root, Path::SEQUENCE, m_codec_options.sequence_style);
    seq.insert_item(seq.children.size(), codec::encode(value, m_codec_options));
}

inline
void Document::insert_into_array(const Path& path, Int index, const Value& value) {
    auto& seq = array_at(path);
    check_index(path, seq, index, true);
    seq.insert_item(index, codec::encode(value, m_codec_options));
}

inline
void Document::remove_from_array(const Path& path, Int index) {
    auto& seq = array_at(path);
    check_index(path, seq, index, false);
    seq.remove_item(index);
}

inline
void Document::update_array_element(const Path& path, Int index, const Value& value) {
    auto& seq = array_at(path);
    check_index(path, seq, index, false);
    seq.replace_item(index, codec::encode(value, m_codec_options));
}

inline
size_t Document::get_array_length(const Path& path) const {
    return array_at(path).children.size();
}

inline
Value Document::get_array_element(const Path& path, Int index) const {
    auto& seq = array_at(path);
    check_index(path, seq, index, false);
    return codec::decode(seq.children[index], path.child(index));
}

inline
Value Document::get_typed_array_element(const Path& path, Int index, const StringView& type) const {
    if (type != "string" && type != "int" && type != "float" && type != "bool")
        throw UnsupportedType(path.to_str(), type);

    auto value = get_array_element(path, index);
    auto item_path = path.child(index);
    if (type == "string") return codec::to_string(value, item_path);
    if (type == "int")    return codec::to_int(value, item_path);
    if (type == "float")  return codec::to_float(value, item_path);
    return codec::to_bool(value, item_path);
}

/// Path of an element of an array-root document, checking that the element
/// exists.
inline
Path Document::element_path(Int index, const Path& sub_path) const {
    if (!m_root.is_sequence()) throw NotASequence("", m_root.type_name());
    Path path{SegmentList{Segment{index}}};
    check_index(path, m_root, index, false);
    return path + sub_path;
}

inline
void Document::set_array_element(Int index, const Path& sub_path, const Value& value) {
    set(element_path(index, sub_path), value);
}

inline
Value Document::get_array_document_element(Int index, const Path& sub_path) const {
    return get(element_path(index, sub_path));
}

inline
void Document::add_array_element(const Value& value) {
    if (!m_root.is_sequence()) throw NotASequence("", m_root.type_name());
    m_root.insert_item(m_root.children.size(), codec::encode(value, m_codec_options));
}

inline
size_t Document::get_array_document_length() const {
    if (!m_root.is_sequence()) throw NotASequence("", m_root.type_name());
    return m_root.children.size();
}

inline
std::map<String, Value> Document::get_all(const Pattern& pattern) const {
    std::map<String, Value> result;
    pattern.walk(m_root, [&result] (const Path& path, const Node& node) {
        result.insert_or_assign(path.to_str(), codec::decode(node, path));
    });
    return result;
}

/// Set every node matching a pattern.  A match below another match is
/// skipped, since the outer node is replaced anyway.
inline
void Document::set_all(const Pattern& pattern, const Value& value) {
    std::vector<Path> targets;
    for (auto& [path, node] : pattern.find_all(m_root)) {
        bool covered = std::any_of(targets.begin(), targets.end(), [&path] (const Path& target) {
            if (target.size() > path.size()) return false;
            return std::equal(target.begin(), target.end(), path.begin());
        });
        if (!covered) targets.push_back(path);
    }
    if (targets.size() == 0) YAMLER_DEBUG("pattern {} matched nothing", pattern.spec());

    Node backup = m_root;
    try {
        for (auto& path : targets) set(path, value);
    } catch (const Error&) {
        m_root = std::move(backup);
        throw;
    }
}

inline
std::vector<String> Document::get_keys(const Pattern& pattern) const {
    std::vector<String> keys;
    for (auto& match : pattern.find_all(m_root)) keys.push_back(match.first.to_str());
    std::sort(keys.begin(), keys.end());
    return keys;
}

/// Every path in the document, sorted.
inline
std::vector<String> Document::get_paths() const {
    std::vector<String> paths;
    Pattern{"**"}.walk(m_root, [&paths] (const Path& path, const Node&) {
        if (!path.is_root()) paths.push_back(path.to_str());
    });
    std::sort(paths.begin(), paths.end());
    return paths;
}

inline
void Document::merge(const Document& other) {
    yamler::merge(m_root, other.m_root);
}

inline
void Document::merge(const Document* other) {
    if (other == nullptr) throw NilDocument();
    merge(*other);
}

/// Merge another document into the subtree at a path.  A missing path is
/// created as an empty mapping, and a target that is not a mapping becomes
/// one.
inline
void Document::merge_at(const Path& path, const Document& other) {
    if (path.is_root()) {
        merge(other);
        return;
    }
    auto& target = path.create(m_root, Path::MAPPING);
    if (!target.is_mapping()) target.replace_with(Node::mapping());
    yamler::merge(target, other.m_root);
}

inline
void Document::merge_at(const Path& path, const Document* other) {
    if (other == nullptr) throw NilDocument();
    merge_at(path, *other);
}

inline
void Document::set_absolute_comment_alignment(int column) {
    m_emit_options.comment_alignment = yaml::CommentAlignment::ABSOLUTE;
    m_emit_options.comment_column = column;
}

} // namespace yamler
