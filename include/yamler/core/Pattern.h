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

#include <functional>
#include <map>
#include <utility>
#include <vector>

#include <yamler/core/Node.h>
#include <yamler/core/Path.h>
#include <yamler/core/Value.h>
#include <yamler/support/logging.h>

namespace yamler {

//////////////////////////////////////////////////////////////////////////////
/// @brief Compiled wildcard path pattern.
/// Segments are the states of a small automaton.  A concrete path matches
/// when the automaton can reach the final state after consuming every
/// segment of the path.  '*' consumes one key or index, '[*]' one index,
/// and '**' any number of segments, including none.
//////////////////////////////////////////////////////////////////////////////
class Pattern
{
  public:
    using StateSet = std::vector<bool>;
    using Match = std::pair<Path, const Node*>;
    using Visitor = std::function<void(const Path&, const Node&)>;

    Pattern(const StringView& spec) : m_spec{spec}, m_segments{Path::parse(spec, true)} {}
    Pattern(const char* spec) : Pattern{StringView{spec}} {}
    Pattern(const String& spec) : Pattern{StringView{spec}} {}

    const String& spec() const { return m_spec; }

    bool matches(const Path& path) const;
    void walk(const Node& root, const Visitor& visitor) const;
    std::vector<Match> find_all(const Node& root) const;

  private:
    StateSet start() const;
    StateSet step(const StateSet& states, const Segment& segment) const;
    void close(StateSet& states) const;
    bool is_empty(const StateSet& states) const;
    bool is_final(const StateSet& states) const { return states[m_segments.size()]; }
    void walk(const Node& node, Path& path, const StateSet& states, const Visitor& visitor) const;

  private:
    String m_spec;
    SegmentList m_segments;
};

inline
void Pattern::close(StateSet& states) const {
    for (size_t s = 0; s < m_segments.size(); ++s) {
        if (states[s] && m_segments[s].kind == Segment::RECURSIVE)
            states[s + 1] = true;
    }
}

inline
Pattern::StateSet Pattern::start() const {
    StateSet states(m_segments.size() + 1, false);
    states[0] = true;
    close(states);
    return states;
}

inline
bool Pattern::is_empty(const StateSet& states) const {
    for (auto state : states)
        if (state) return false;
    return true;
}

inline
Pattern::StateSet Pattern::step(const StateSet& states, const Segment& segment) const {
    StateSet next(m_segments.size() + 1, false);
    for (size_t s = 0; s < m_segments.size(); ++s) {
        if (!states[s]) continue;
        auto& expect = m_segments[s];
        switch (expect.kind) {
            case Segment::KEY:       if (segment.is_key() && segment.key == expect.key) next[s + 1] = true; break;
            case Segment::INDEX:     if (segment.is_index() && segment.index == expect.index) next[s + 1] = true; break;
            case Segment::ANY_KEY:   next[s + 1] = true; break;
            case Segment::ANY_INDEX: if (segment.is_index()) next[s + 1] = true; break;
            case Segment::RECURSIVE: next[s] = true; break;
        }
    }
    close(next);
    return next;
}

inline
bool Pattern::matches(const Path& path) const {
    auto states = start();
    for (auto& segment : path) {
        states = step(states, segment);
        if (is_empty(states)) return false;
    }
    return is_final(states);
}

inline
void Pattern::walk(const Node& node, Path& path, const StateSet& states, const Visitor& visitor) const {
    if (is_final(states)) visitor(path, node);

    if (node.is_mapping()) {
        for (size_t i = 0; i < node.size(); ++i) {
            Segment segment{node.key_at(i).value};
            auto next = step(states, segment);
            if (is_empty(next)) continue;
            path.append(segment);
            walk(node.value_at(i), path, next, visitor);
            path = path.parent();
        }
    } else if (node.is_sequence()) {
        for (size_t i = 0; i < node.children.size(); ++i) {
            Segment segment{(Int)i};
            auto next = step(states, segment);
            if (is_empty(next)) continue;
            path.append(segment);
            walk(node.children[i], path, next, visitor);
            path = path.parent();
        }
    }
}

/// Visit every node whose path matches, parents before children.
inline
void Pattern::walk(const Node& root, const Visitor& visitor) const {
    Path path;
    walk(root, path, start(), visitor);
}

inline
std::vector<Pattern::Match> Pattern::find_all(const Node& root) const {
    std::vector<Match> matches;
    walk(root, [&matches] (const Path& path, const Node& node) {
        matches.emplace_back(path, &node);
    });
    YAMLER_DEBUG("pattern {} matched {} nodes", m_spec, matches.size());
    return matches;
}

/// Select the entries of a path-keyed map whose keys match a pattern.
/// Keys that are not valid paths are skipped.
template <typename T>
std::map<String, T> filter_by_pattern(const std::map<String, T>& data, const Pattern& pattern) {
    std::map<String, T> result;
    for (auto& [key, value] : data) {
        try {
            if (pattern.matches(Path{key}))
                result.emplace(key, value);
        } catch (const InvalidPath& error) {
            YAMLER_DEBUG("skipping {}: {}", key, error.what());
        }
    }
    return result;
}

} // namespace yamler
