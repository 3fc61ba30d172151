#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // {"jsonrpc":"2.0","id":id,"method":"tools/call","params":{"name":tool,"arguments":arguments}}
  // Throws nlohmann::json::exception when a string is not valid UTF-8.
  std::string BuildToolCall(long long id, const std::string& tool, const nlohmann::json& arguments);
  // Top-level "error" member dumped verbatim, empty if absent
  std::string ExtractError(const nlohmann::json& response);
  // result.content[0].text
  std::optional<std::string> ExtractToolText(const nlohmann::json& response);
  // MCP tool-level failure flag: result.isError == true
  bool IsToolError(const nlohmann::json& response);
}
