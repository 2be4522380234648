#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "lucid_core/llm/chat_provider.hpp"
#include "lucid_core/llm/embedding_provider.hpp"

namespace lucid_api {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Config {
 public:
  static constexpr const char* DEFAULT_FILE = "lucidrc.json";

  std::string api_base_url;
  std::string chunk_store;
  std::string database_path;
  int db_pool_size;

  // Providers
  std::string provider;
  std::string openai_api_key;
  std::string openai_base_url;
  std::string ollama_url;
  std::string embedding_model;
  std::string chat_model;

  // Pipeline
  int chunk_size;
  int chunk_overlap;
  int top_k;
  double threshold;
  int request_timeout_ms;
  int index_workers;

  // Reads $LUCID_CONFIG, else lucidrc.json when present, else defaults only.
  static Config load() {
    if (const char* path = std::getenv("LUCID_CONFIG"); path != nullptr && *path != '\0') {
      return from_file(path);
    }
    if (std::filesystem::exists(DEFAULT_FILE)) {
      return from_file(DEFAULT_FILE);
    }
    Config config = from_json(nlohmann::json::object());
    config.apply_environment();
    return config;
  }

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::parse_error& e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    Config config = from_json(json_config);
    config.apply_environment();
    return config;
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Config root must be a JSON object");
    }
    Config config;

    config.api_base_url = read(json_config, "api_base_url", std::string("127.0.0.1:3030"));
    config.chunk_store = read(json_config, "chunk_store", std::string("sqlite"));
    config.database_path = read(json_config, "database_path", std::string("./data/lucid.db"));

    config.provider = read(json_config, "provider", std::string("openai"));
    config.openai_api_key = read(json_config, "openai_api_key", std::string());
    config.openai_base_url =
        read(json_config, "openai_base_url", std::string("https://api.openai.com/v1"));
    config.ollama_url = read(json_config, "ollama_url", std::string("http://localhost:11434"));
    config.embedding_model =
        read(json_config, "embedding_model", std::string(lucid_core::DEFAULT_EMBEDDING_MODEL));
    config.chat_model =
        read(json_config, "chat_model", std::string(lucid_core::DEFAULT_CHAT_MODEL));

    config.chunk_size = read(json_config, "chunk_size", 512);
    config.chunk_overlap = read(json_config, "chunk_overlap", 50);
    config.top_k = read(json_config, "top_k", 5);
    config.threshold = read(json_config, "threshold", 0.7);
    config.request_timeout_ms = read(json_config, "request_timeout_ms", 30000);

    // Wrong types fall back to the default for these two.
    config.db_pool_size = read_or_default(json_config, "db_pool_size", 4);
    config.index_workers = read_or_default(json_config, "index_workers", 1);

    config.validate();
    return config;
  }

  // Secrets left out of the file may come from the environment.
  void apply_environment() {
    if (openai_api_key.empty()) {
      if (const char* key = std::getenv("OPENAI_API_KEY"); key != nullptr) {
        openai_api_key = key;
      }
    }
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.rfind(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.rfind(':') + 1));
  }

 private:
  template <typename T>
  static T read(const nlohmann::json& json_config, const char* key, T default_value) {
    if (!json_config.contains(key)) {
      return default_value;
    }
    try {
      return json_config.at(key).get<T>();
    } catch (const nlohmann::json::type_error& e) {
      throw ConfigError(std::string("Invalid type for config key '") + key + "': " + e.what());
    }
  }

  static int read_or_default(const nlohmann::json& json_config, const char* key, int default_value) {
    const auto it = json_config.find(key);
    if (it == json_config.end() || !it->is_number_integer()) {
      return default_value;
    }
    return it->get<int>();
  }

  void validate() const {
    const auto colon = api_base_url.rfind(':');
    if (api_base_url.empty() || colon == std::string::npos || colon == 0 ||
        colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw ConfigError("api_base_url must have the form host:port");
    }
    const long port_number = std::stol(api_base_url.substr(colon + 1));
    if (port_number <= 0 || port_number > 65535) {
      throw ConfigError("api_base_url port must be between 1 and 65535");
    }
    if (chunk_store != "sqlite" && chunk_store != "memory") {
      throw ConfigError("chunk_store must be 'sqlite' or 'memory'");
    }
    if (chunk_store == "sqlite" && database_path.empty()) {
      throw ConfigError("database_path cannot be empty when chunk_store is 'sqlite'");
    }
    if (db_pool_size <= 0) {
      throw ConfigError("db_pool_size must be greater than 0");
    }
    if (provider != "openai" && provider != "ollama" && provider != "none") {
      throw ConfigError("provider must be 'openai', 'ollama' or 'none'");
    }
    if (openai_base_url.empty()) {
      throw ConfigError("openai_base_url cannot be empty");
    }
    if (ollama_url.empty()) {
      throw ConfigError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigError("embedding_model cannot be empty");
    }
    if (chat_model.empty()) {
      throw ConfigError("chat_model cannot be empty");
    }
    if (top_k <= 0) {
      throw ConfigError("top_k must be greater than 0");
    }
    if (!(threshold > 0.0 && threshold <= 1.0)) {
      throw ConfigError("threshold must be in (0, 1]");
    }
    if (request_timeout_ms <= 0) {
      throw ConfigError("request_timeout_ms must be greater than 0");
    }
    if (index_workers <= 0) {
      throw ConfigError("index_workers must be greater than 0");
    }
  }
};

}  // namespace lucid_api
