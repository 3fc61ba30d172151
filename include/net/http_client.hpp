#pragma once
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;     // 0 when the request never produced an HTTP status
  std::string body;
  std::string error;   // transport failure description, empty on success
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct HttpClientOptions {
  bool verify_tls = true;
  int connect_timeout_ms = 10000;
  bool enable_tcp_keepalive = true;
  std::string user_agent = "ama-sign/0.1";
};

// Factory for a libcurl-based client.
HttpClient* CreateCurlHttpClient(const HttpClientOptions& options = HttpClientOptions());
