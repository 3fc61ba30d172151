#include "cli/invocation.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "common/result.hpp"
#include "config/network.hpp"
#include "net/http_client.hpp"
#include "node_connection/mcp_client.hpp"
#include "wallet/keypair.hpp"
#include "wallet/tx_submitter.hpp"
#include <cryptopp/misc.h>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace {

int ReportError(const SignerError& error) {
  std::cerr << "error " << error.ToString() << std::endl;
  return ExitCodeFor(error.kind);
}

void PrintResult(const nlohmann::json& result) {
  if (result.is_string()) std::cout << result.get<std::string>() << std::endl;
  else std::cout << result.dump(2) << std::endl;
}

// Wipes the seed text when the invocation is done with it
class SeedText {
public:
  explicit SeedText(std::string text) : text_(std::move(text)) {}
  ~SeedText() { if (!text_.empty()) CryptoPP::SecureWipeBuffer(&text_[0], text_.size()); }
  SeedText(const SeedText&) = delete;
  SeedText& operator=(const SeedText&) = delete;
  const std::string& Get() const { return text_; }
private:
  std::string text_;
};

std::string ResolveSeed(const std::string& arg) {
  if (arg != "-") return arg;
  std::string line;
  std::getline(std::cin, line);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' ')) line.pop_back();
  return line;
}

int Execute(const Invocation& inv, const NetworkConfig& net, const std::string& program) {
  if (inv.command == Command::HELP) {
    std::cout << UsageText(program);
    return 0;
  }

  if (inv.command == Command::SHOW_PUBKEY) {
    SeedText seed(ResolveSeed(inv.seed_b58));
    auto keys = DeriveKeypair(seed.Get());
    if (!keys) return ReportError(keys.Error());
    std::cout << keys.Value().PublicKeyBase58() << std::endl;
    return 0;
  }

  HttpClientOptions http_options;
  http_options.verify_tls = net.verify_tls;
  http_options.connect_timeout_ms = net.connect_timeout_ms;
  std::unique_ptr<HttpClient> http(CreateCurlHttpClient(http_options));
  McpClient mcp(*http, net.mcp_url, net.auth_header, net.timeout_ms);

  if (inv.command == Command::BALANCE) {
    auto balance = QueryBalance(mcp, inv.address_b58);
    if (!balance) return ReportError(balance.Error());
    PrintResult(balance.Value());
    return 0;
  }

  SubmitOptions submit_options;
  submit_options.verify_before_submit = net.verify_before_submit;
  SeedText seed(ResolveSeed(inv.seed_b58));
  auto result = SignAndSubmit(seed.Get(), inv.request, mcp, submit_options);
  if (!result) return ReportError(result.Error());
  PrintResult(result.Value());
  return 0;
}

}

int main(int argc, char** argv) {
  const std::string program = argc > 0 ? argv[0] : "ama-sign";
  int rc = 1;
  try {
    ConfigManager::Initialize(".env");
    NetworkConfig net = LoadNetworkConfig();
    if (net.log_file) Logger::Initialize(*net.log_file, Logger::ParseLevel(net.log_level));
    Logger::Info("ama-sign starting, endpoint " + net.mcp_url);

    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
    auto inv = ParseInvocation(args, net.default_network);
    if (!inv) {
      std::cerr << "error " << inv.Error().ToString() << "\n\n" << UsageText(program);
      rc = ExitCodeFor(inv.Error().kind);
    } else {
      rc = Execute(inv.Value(), net, program);
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    Logger::Critical(std::string("unhandled exception: ") + e.what());
    rc = 1;
  }
  Logger::Shutdown();
  return rc;
}
