#pragma once

#include <json/json.h>

#include <string>

namespace demark {
namespace detail {

/// Two-space indented JSON text, the layout used by every file this library writes
std::string to_json_text(const Json::Value& value);

} // namespace detail
} // namespace demark
