#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// Key/value settings from a .env file; process environment variables win over file values.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOr(const std::string& key, const std::string& default_value);
  static int GetIntOr(const std::string& key, int default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Test hook: replaces the file-backed values without touching the environment.
  static void Set(const std::string& key, const std::string& value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static bool LoadEnvFile(const std::string& env_path);
};
