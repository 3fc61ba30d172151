#include "node_connection/mcp_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include <cctype>
#include <string>

using json = nlohmann::json;

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    // "Bearer x:y" style values have a space in the part before the colon
    if (!name.empty() && !value.empty() && name.find(' ') == std::string::npos) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

McpClient::McpClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header,
                     int timeout_ms)
  : http_(http), endpoint_(endpoint_url), timeout_ms_(timeout_ms) {
  default_headers_["Content-Type"] = "application/json";
  default_headers_["Accept"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

Result<json> McpClient::CallTool(const std::string& tool, const json& arguments) {
  const long long id = next_id_++;
  std::string payload;
  try {
    payload = JsonRpcUtil::BuildToolCall(id, tool, arguments);
  } catch (const json::exception& e) {
    return MakeError(ErrorKind::USAGE, tool, std::string("cannot encode request: ") + e.what());
  }

  Logger::Info("tools/call " + tool + " id=" + std::to_string(id) + " -> " + endpoint_);
  auto resp = http_.Post(endpoint_, payload, default_headers_, timeout_ms_);
  if (!resp.error.empty() || resp.status == 0) {
    std::string why = resp.error.empty() ? "no response" : resp.error;
    return MakeError(ErrorKind::TRANSPORT, tool, "request failed: " + why);
  }
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("HTTP POST failed status=" + std::to_string(resp.status));
    return MakeError(ErrorKind::TRANSPORT, tool, "HTTP status " + std::to_string(resp.status));
  }

  json body = json::parse(resp.body, nullptr, false);
  if (body.is_discarded()) {
    return MakeError(ErrorKind::PROTOCOL_VIOLATION, tool, "response is not valid JSON");
  }
  std::string remote_error = JsonRpcUtil::ExtractError(body);
  if (!remote_error.empty()) {
    Logger::Warning("tools/call " + tool + " rejected: " + remote_error);
    return MakeError(ErrorKind::REMOTE_REJECTED, tool, remote_error);
  }
  auto text = JsonRpcUtil::ExtractToolText(body);
  if (JsonRpcUtil::IsToolError(body)) {
    std::string detail = text ? *text : body["result"].dump();
    Logger::Warning("tools/call " + tool + " reported tool error: " + detail);
    return MakeError(ErrorKind::REMOTE_REJECTED, tool, detail);
  }
  if (!text) {
    return MakeError(ErrorKind::PROTOCOL_VIOLATION, tool, "response has no result.content[0].text");
  }
  json decoded = json::parse(*text, nullptr, false);
  if (decoded.is_discarded()) return json(*text);
  return decoded;
}
