#pragma once
#include <string>
#include <optional>

struct NetworkConfig {
  std::string mcp_url;
  std::string default_network;
  int timeout_ms = 30000;
  int connect_timeout_ms = 10000;
  bool verify_tls = true;
  bool verify_before_submit = true;
  std::optional<std::string> auth_header;
  std::optional<std::string> log_file;
  std::string log_level = "info";
};

// Loads endpoint and client settings from ConfigManager (AMA_* keys).
NetworkConfig LoadNetworkConfig();
