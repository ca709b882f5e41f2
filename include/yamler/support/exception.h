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

#include <exception>
#include <string>
#include <string_view>

#include <fmt/format.h>

#define YAMLER_ASSERT(cond) { if (!(cond)) throw ::yamler::Assert{#cond}; }

class NoTraceException : public std::exception
{
  public:
    NoTraceException(std::string&& msg) : m_msg{msg} {}
    const char* what() const noexcept override { return m_msg.data(); }
  private:
    std::string m_msg;
};

#ifdef YAMLER_HAS_CPPTRACE
#include <cpptrace/cpptrace.hpp>
#define BASE_EXCEPTION cpptrace::exception_with_message
#else
#define BASE_EXCEPTION NoTraceException
#endif

namespace yamler {

class YamlerException : public BASE_EXCEPTION
{
  public:
    YamlerException(std::string&& msg) : BASE_EXCEPTION(std::forward<std::string>(msg)) {}
    YamlerException() : YamlerException{""} {}
};

class Assert : public BASE_EXCEPTION
{
  public:
    Assert(std::string&& msg) : BASE_EXCEPTION(std::forward<std::string>(msg)) {}
};

struct WrongType : public YamlerException
{
    WrongType(std::string_view actual, std::string_view expected)
      : YamlerException(fmt::format("type={}, expected={}", actual, expected)) {}
};

enum class ErrorCode
{
    KEY_NOT_FOUND,
    INDEX_OUT_OF_BOUNDS,
    NOT_A_MAPPING,
    NOT_A_SEQUENCE,
    NOT_AN_ARRAY,
    TYPE_MISMATCH,
    UNSUPPORTED_TYPE,
    UNSUPPORTED_NODE,
    INVALID_PATTERN,
    INVALID_PATH,
    REQUIRED_FIELD_MISSING,
    ADDITIONAL_PROPERTY_NOT_ALLOWED,
    ENUM_VIOLATION,
    CONSTRAINT_VIOLATION,
    NIL_DOCUMENT,
    PARSE_ERROR,
    UNSUPPORTED_INDENTATION,
    IO_ERROR,
};

inline
std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::KEY_NOT_FOUND:                   return "KeyNotFound";
        case ErrorCode::INDEX_OUT_OF_BOUNDS:             return "IndexOutOfBounds";
        case ErrorCode::NOT_A_MAPPING:                   return "NotAMapping";
        case ErrorCode::NOT_A_SEQUENCE:                  return "NotASequence";
        case ErrorCode::NOT_AN_ARRAY:                    return "NotAnArray";
        case ErrorCode::TYPE_MISMATCH:                   return "TypeMismatch";
        case ErrorCode::UNSUPPORTED_TYPE:                return "UnsupportedType";
        case ErrorCode::UNSUPPORTED_NODE:                return "UnsupportedNode";
        case ErrorCode::INVALID_PATTERN:                 return "InvalidPattern";
        case ErrorCode::INVALID_PATH:                    return "InvalidPath";
        case ErrorCode::REQUIRED_FIELD_MISSING:          return "RequiredFieldMissing";
        case ErrorCode::ADDITIONAL_PROPERTY_NOT_ALLOWED: return "AdditionalPropertyNotAllowed";
        case ErrorCode::ENUM_VIOLATION:                  return "EnumViolation";
        case ErrorCode::CONSTRAINT_VIOLATION:            return "ConstraintViolation";
        case ErrorCode::NIL_DOCUMENT:                    return "NilDocument";
        case ErrorCode::PARSE_ERROR:                     return "ParseError";
        case ErrorCode::UNSUPPORTED_INDENTATION:         return "UnsupportedIndentation";
        case ErrorCode::IO_ERROR:                        return "IOError";
        default:                                         return "<undefined>";
    }
}

//////////////////////////////////////////////////////////////////////////////
/// @brief Base of every error raised by a document operation.
/// Carries a machine-readable code and the rendered path where the failure
/// was detected (empty for the document root or when no path applies).
//////////////////////////////////////////////////////////////////////////////
class Error : public YamlerException
{
  public:
    Error(ErrorCode code, const std::string& path, std::string&& msg)
      : YamlerException(make_message(path, std::forward<std::string>(msg)))
      , m_code{code}
      , m_path{path}
    {}

    ErrorCode code() const             { return m_code; }
    std::string_view code_name() const { return error_code_name(m_code); }
    const std::string& path() const    { return m_path; }

  private:
    static std::string make_message(const std::string& path, std::string&& msg) {
        if (path.size() == 0) return msg;
        return fmt::format("path {}: {}", path, msg);
    }

    ErrorCode m_code;
    std::string m_path;
};

struct KeyNotFound : public Error
{
    KeyNotFound(const std::string& path, std::string_view key)
      : Error(ErrorCode::KEY_NOT_FOUND, path, fmt::format("key {} not found", key)) {}
};

struct IndexOutOfBounds : public Error
{
    IndexOutOfBounds(const std::string& path, int64_t index, size_t size)
      : Error(ErrorCode::INDEX_OUT_OF_BOUNDS, path, fmt::format("index {} out of bounds (length {})", index, size)) {}
};

struct NotAMapping : public Error
{
    NotAMapping(const std::string& path, std::string_view actual)
      : Error(ErrorCode::NOT_A_MAPPING, path, fmt::format("expected mapping, got {}", actual)) {}
};

struct NotASequence : public Error
{
    NotASequence(const std::string& path, std::string_view actual)
      : Error(ErrorCode::NOT_A_SEQUENCE, path, fmt::format("expected sequence, got {}", actual)) {}
};

struct NotAnArray : public Error
{
    NotAnArray(const std::string& path, std::string_view actual)
      : Error(ErrorCode::NOT_AN_ARRAY, path, fmt::format("path is not an array ({})", actual)) {}
};

struct TypeMismatch : public Error
{
    TypeMismatch(const std::string& path, std::string_view expected, std::string_view actual)
      : Error(ErrorCode::TYPE_MISMATCH, path, fmt::format("expected {}, got {}", expected, actual)) {}

    TypeMismatch(const std::string& path, std::string&& msg)
      : Error(ErrorCode::TYPE_MISMATCH, path, std::forward<std::string>(msg)) {}
};

struct UnsupportedType : public Error
{
    UnsupportedType(const std::string& path, std::string_view type)
      : Error(ErrorCode::UNSUPPORTED_TYPE, path, fmt::format("unsupported type: {}", type)) {}
};

struct UnsupportedNode : public Error
{
    UnsupportedNode(const std::string& path, std::string_view what)
      : Error(ErrorCode::UNSUPPORTED_NODE, path, fmt::format("unsupported node: {}", what)) {}
};

struct InvalidPattern : public Error
{
    InvalidPattern(const std::string& path, std::string&& msg)
      : Error(ErrorCode::INVALID_PATTERN, path, std::forward<std::string>(msg)) {}
};

struct RequiredFieldMissing : public Error
{
    RequiredFieldMissing(const std::string& path, std::string_view field)
      : Error(ErrorCode::REQUIRED_FIELD_MISSING, path, fmt::format("required field {} is missing", field)) {}
};

struct AdditionalPropertyNotAllowed : public Error
{
    AdditionalPropertyNotAllowed(const std::string& path, std::string_view key)
      : Error(ErrorCode::ADDITIONAL_PROPERTY_NOT_ALLOWED, path, fmt::format("additional property {} is not allowed", key)) {}
};

struct EnumViolation : public Error
{
    EnumViolation(const std::string& path, std::string_view value)
      : Error(ErrorCode::ENUM_VIOLATION, path, fmt::format("value {} is not one of the allowed values", value)) {}
};

struct ConstraintViolation : public Error
{
    ConstraintViolation(const std::string& path, std::string&& msg)
      : Error(ErrorCode::CONSTRAINT_VIOLATION, path, std::forward<std::string>(msg)) {}
};

struct NilDocument : public Error
{
    NilDocument() : Error(ErrorCode::NIL_DOCUMENT, "", "document is nil") {}
};

struct IOError : public Error
{
    IOError(std::string_view file_name, std::string_view what)
      : Error(ErrorCode::IO_ERROR, "", fmt::format("{}: {}", file_name, what)) {}
};

} // namespace yamler
