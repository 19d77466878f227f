/**
 * @file order_result.cpp
 */

#include "engine/order_result.h"
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace tradebot {

std::string OrderResult::to_json() const {
    if (ok()) return payload();
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
    writer.StartObject();
    writer.Key("error");
    writer.String(error().message.c_str(), static_cast<rapidjson::SizeType>(error().message.size()));
    writer.EndObject();
    return sb.GetString();
}

} // namespace tradebot
