#pragma once
#include <string>

namespace AmadeusConstants {
  // Public MCP gateway that builds and relays transactions
  inline const std::string MCP_URL = "https://mcp.ama.one";
  inline const std::string MAINNET = "mainnet";
  inline const std::string TESTNET = "testnet";
  // Domain separation tag for transaction signatures; verifiers must use the same bytes
  inline const std::string TX_DST = "AMADEUS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_TX_";
  // MCP tool names
  inline const std::string TOOL_CREATE_TRANSACTION = "create_transaction";
  inline const std::string TOOL_SUBMIT_TRANSACTION = "submit_transaction";
  inline const std::string TOOL_GET_ACCOUNT_BALANCE = "get_account_balance";
  // Native coin contract
  inline const std::string COIN_CONTRACT = "Coin";
  inline const std::string COIN_TRANSFER = "transfer";
}
