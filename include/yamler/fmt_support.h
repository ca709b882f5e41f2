#pragma once

#include <fmt/format.h>
#include <yamler/core/Node.h>
#include <yamler/core/Path.h>
#include <yamler/core/Value.h>
#include <yamler/serializer/yaml.h>

namespace fmt {

template <>
struct formatter<yamler::Value> : formatter<std::string> {
  auto format(const yamler::Value& value, format_context& ctx) const {
    return formatter<std::string>::format(value.to_str(), ctx);
  }
};

template <>
struct formatter<yamler::Path> : formatter<std::string> {
  auto format(const yamler::Path& path, format_context& ctx) const {
    return formatter<std::string>::format(path.to_str(), ctx);
  }
};

template <>
struct formatter<yamler::Node> : formatter<std::string> {
  auto format(const yamler::Node& node, format_context& ctx) const {
    return formatter<std::string>::format(yamler::yaml::to_flow(node), ctx);
  }
};

} // namespace fmt
