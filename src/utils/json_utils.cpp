#include "utils/json_utils.h"
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace tradebot {
namespace utils {

std::string pretty_json(std::string_view raw) {
    rapidjson::Document d;
    d.Parse<rapidjson::kParseFullPrecisionFlag>(raw.data(), raw.size());
    if (d.HasParseError()) {
        return std::string(raw);
    }
    rapidjson::StringBuffer sb;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(sb);
    writer.SetIndent(' ', 2);
    d.Accept(writer);
    return sb.GetString();
}

} // namespace utils
} // namespace tradebot
