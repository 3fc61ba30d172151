#pragma once
#include "common/result.hpp"
#include <string>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

class HttpClient;

// JSON-RPC "tools/call" client for the ledger's MCP gateway. One POST per call, no retries.
class McpClient {
public:
  McpClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt,
            int timeout_ms = 30000);
  // Returns result.content[0].text decoded as JSON, or as a JSON string when the
  // text is not JSON. Transport, remote and envelope failures come back as errors.
  Result<nlohmann::json> CallTool(const std::string& tool, const nlohmann::json& arguments);

  const std::string& Endpoint() const { return endpoint_; }
  long long LastRequestId() const { return next_id_ - 1; }
private:
  HttpClient& http_;
  std::string endpoint_;
  int timeout_ms_;
  long long next_id_ = 1;
  std::unordered_map<std::string, std::string> default_headers_;
};
