#include "utils/json_rpc.hpp"

using json = nlohmann::json;

namespace JsonRpcUtil {
  std::string BuildToolCall(long long id, const std::string& tool, const json& arguments) {
    json j = {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"method", "tools/call"},
      {"params", {{"name", tool}, {"arguments", arguments}}}
    };
    return j.dump();
  }
  std::string ExtractError(const json& response) {
    if (!response.is_object()) return std::string();
    auto it = response.find("error");
    if (it == response.end() || it->is_null()) return std::string();
    return it->dump();
  }
  std::optional<std::string> ExtractToolText(const json& response) {
    if (!response.is_object()) return std::nullopt;
    auto result = response.find("result");
    if (result == response.end() || !result->is_object()) return std::nullopt;
    auto content = result->find("content");
    if (content == result->end() || !content->is_array() || content->empty()) return std::nullopt;
    const auto& first = (*content)[0];
    if (!first.is_object()) return std::nullopt;
    auto text = first.find("text");
    if (text == first.end() || !text->is_string()) return std::nullopt;
    return text->get<std::string>();
  }
  bool IsToolError(const json& response) {
    if (!response.is_object()) return false;
    auto result = response.find("result");
    if (result == response.end() || !result->is_object()) return false;
    auto flag = result->find("isError");
    return flag != result->end() && flag->is_boolean() && flag->get<bool>();
  }
}
