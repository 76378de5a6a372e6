#include "JsonFormat.hpp"

namespace demark {
namespace detail {

std::string to_json_text(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

} // namespace detail
} // namespace demark
