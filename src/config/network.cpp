#include "config/network.hpp"
#include "common/config_manager.hpp"
#include "constants/amadeus.hpp"

NetworkConfig LoadNetworkConfig() {
  NetworkConfig cfg;
  cfg.mcp_url = ConfigManager::GetOr("AMA_MCP_URL", AmadeusConstants::MCP_URL);
  cfg.default_network = ConfigManager::GetOr("AMA_DEFAULT_NETWORK", AmadeusConstants::MAINNET);
  int timeout = ConfigManager::GetIntOr("AMA_HTTP_TIMEOUT_MS", cfg.timeout_ms);
  if (timeout > 0) cfg.timeout_ms = timeout;
  int connect_timeout = ConfigManager::GetIntOr("AMA_CONNECT_TIMEOUT_MS", cfg.connect_timeout_ms);
  if (connect_timeout > 0) cfg.connect_timeout_ms = connect_timeout;
  cfg.verify_tls = ConfigManager::GetBoolOr("AMA_TLS_VERIFY", true);
  cfg.verify_before_submit = ConfigManager::GetBoolOr("AMA_VERIFY_BEFORE_SUBMIT", true);
  if (auto a = ConfigManager::Get("AMA_AUTH_HEADER")) {
    if (!a->empty()) cfg.auth_header = *a;
  }
  if (auto f = ConfigManager::Get("AMA_LOG_FILE")) {
    if (!f->empty()) cfg.log_file = *f;
  }
  cfg.log_level = ConfigManager::GetOr("AMA_LOG_LEVEL", cfg.log_level);
  return cfg;
}
