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
#include <iomanip>
#include <sstream>

#include <yamler/support/exception.h>
#include <yamler/support/types.h>

namespace yamler::parse {

constexpr int syntax_context = 72;

struct Location
{
    size_t line = 1;
    size_t column = 1;
};

inline
Location locate(const StringView& text, size_t offset) {
    Location loc;
    offset = std::min(offset, text.size());
    for (size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            ++loc.line;
            loc.column = 1;
        } else {
            ++loc.column;
        }
    }
    return loc;
}

/// Render a message followed by the offending source line and a caret
/// pointing at the column where the error was detected.
inline
std::string make_syntax_message(const StringView& text, size_t offset, const std::string& message) {
    offset = std::min(offset, text.size());
    auto loc = locate(text, offset);

    size_t line_begin = offset;
    while (line_begin > 0 && text[line_begin - 1] != '\n') --line_begin;
    auto line_end = text.find('\n', line_begin);
    if (line_end == StringView::npos) line_end = text.size();

    size_t ctx_begin = line_begin;
    if (offset - ctx_begin > (size_t)syntax_context) ctx_begin = offset - syntax_context;
    size_t ctx_end = std::min(line_end, ctx_begin + syntax_context);

    std::stringstream ss;
    ss << message << " at line " << loc.line << ", column " << loc.column << std::endl;
    ss << text.substr(ctx_begin, ctx_end - ctx_begin) << std::endl;
    ss << std::setfill('-') << std::setw(offset - ctx_begin + 1) << '^';
    return ss.str();
}

struct SyntaxError : public Error
{
    SyntaxError(ErrorCode code, const StringView& text, size_t offset, const std::string& message)
      : Error(code, "", make_syntax_message(text, offset, message))
      , location{locate(text, offset)}
    {}

    Location location;
};

} // namespace yamler::parse

namespace yamler {

struct ParseError : public parse::SyntaxError
{
    ParseError(const StringView& text, size_t offset, const std::string& message)
      : parse::SyntaxError(ErrorCode::PARSE_ERROR, text, offset, message) {}
};

struct InvalidPath : public parse::SyntaxError
{
    InvalidPath(const StringView& spec, size_t offset, const std::string& message)
      : parse::SyntaxError(ErrorCode::INVALID_PATH, spec, offset, message) {}
};

struct UnsupportedIndentation : public parse::SyntaxError
{
    UnsupportedIndentation(const StringView& text, size_t offset)
      : parse::SyntaxError(ErrorCode::UNSUPPORTED_INDENTATION, text, offset, "tab characters are not allowed in indentation") {}
};

} // namespace yamler
