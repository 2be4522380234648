#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <unistd.h>

#include "lucid_api/config.hpp"

using lucid_api::Config;
using lucid_api::ConfigError;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/lucid_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

// Restores an environment variable when the test ends
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    if (const char* old = std::getenv(name)) {
      old_ = old;
    }
    if (value) {
      setenv(name, value, 1);
    } else {
      unsetenv(name);
    }
  }
  ~ScopedEnv() {
    if (old_) {
      setenv(name_.c_str(), old_->c_str(), 1);
    } else {
      unsetenv(name_.c_str());
    }
  }

 private:
  std::string name_;
  std::optional<std::string> old_;
};

} // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3030");
  EXPECT_EQ(cfg.chunk_store, "sqlite");
  EXPECT_EQ(cfg.database_path, "./data/lucid.db");
  EXPECT_EQ(cfg.db_pool_size, 4);
  EXPECT_EQ(cfg.provider, "openai");
  EXPECT_EQ(cfg.openai_base_url, "https://api.openai.com/v1");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "text-embedding-ada-002");
  EXPECT_EQ(cfg.chat_model, "gpt-3.5-turbo");
  EXPECT_EQ(cfg.chunk_size, 512);
  EXPECT_EQ(cfg.chunk_overlap, 50);
  EXPECT_EQ(cfg.top_k, 5);
  EXPECT_DOUBLE_EQ(cfg.threshold, 0.7);
  EXPECT_EQ(cfg.request_timeout_ms, 30000);
  EXPECT_EQ(cfg.index_workers, 1);
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"api_base_url", "0.0.0.0:8080"},
      {"chunk_store", "memory"},
      {"provider", "ollama"},
      {"ollama_url", "http://gpu-box:11434"},
      {"embedding_model", "mxbai-embed-large"},
      {"chat_model", "llama3"},
      {"chunk_size", 256},
      {"chunk_overlap", 32},
      {"top_k", 8},
      {"threshold", 0.5},
      {"index_workers", 4}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.host(), "0.0.0.0");
  EXPECT_EQ(cfg.port(), 8080);
  EXPECT_EQ(cfg.chunk_store, "memory");
  EXPECT_EQ(cfg.provider, "ollama");
  EXPECT_EQ(cfg.ollama_url, "http://gpu-box:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.chat_model, "llama3");
  EXPECT_EQ(cfg.chunk_size, 256);
  EXPECT_EQ(cfg.chunk_overlap, 32);
  EXPECT_EQ(cfg.top_k, 8);
  EXPECT_DOUBLE_EQ(cfg.threshold, 0.5);
  EXPECT_EQ(cfg.index_workers, 4);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "database_path": "./db/chunks.db",
    "openai_api_key": "sk-from-file",
    "request_timeout_ms": 5000
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.port(), 4000);
  EXPECT_EQ(cfg.database_path, "./db/chunks.db");
  EXPECT_EQ(cfg.openai_api_key, "sk-from-file");
  EXPECT_EQ(cfg.request_timeout_ms, 5000);
}

TEST(ConfigTest, ApiKeyFallsBackToEnvironment) {
  ScopedEnv env("OPENAI_API_KEY", "sk-from-env");

  std::string path = write_temp_file("{}");
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);
  EXPECT_EQ(cfg.openai_api_key, "sk-from-env");

  Config explicit_key = Config::from_json({{"openai_api_key", "sk-file"}});
  explicit_key.apply_environment();
  EXPECT_EQ(explicit_key.openai_api_key, "sk-file");
}

TEST(ConfigTest, LoadUsesLucidConfigPath) {
  std::string path = write_temp_file(R"({"top_k": 3})");
  ScopedEnv env("LUCID_CONFIG", path.c_str());

  Config cfg;
  try {
    cfg = Config::load();
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);
  EXPECT_EQ(cfg.top_k, 3);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, ConfigError);
}

TEST(ConfigTest, MalformedFileThrows) {
  std::string path = write_temp_file("{ \"top_k\": ");
  EXPECT_THROW({ (void)Config::from_file(path); }, ConfigError);
  remove_file(path);
}

TEST(ConfigTest, NonObjectRootThrows) {
  EXPECT_THROW({ (void)Config::from_json(nlohmann::json::array()); }, ConfigError);
}

TEST(ConfigTest, WrongTypeNamesTheKey) {
  try {
    (void)Config::from_json({{"top_k", "five"}});
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("'top_k'"));
  }
}

TEST(ConfigTest, WrongTypePoolAndWorkersFallBackToDefaults) {
  Config cfg = Config::from_json({{"db_pool_size", "eight"}, {"index_workers", 2.5}});
  EXPECT_EQ(cfg.db_pool_size, 4);
  EXPECT_EQ(cfg.index_workers, 1);
}

TEST(ConfigTest, InvalidAddressThrows) {
  for (const char* address : {"", "localhost", ":3030", "localhost:", "localhost:http",
                              "localhost:0", "localhost:70000"}) {
    EXPECT_THROW({ (void)Config::from_json({{"api_base_url", address}}); }, ConfigError)
        << address;
  }
}

TEST(ConfigTest, UnknownChoicesThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"chunk_store", "postgres"}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"provider", "anthropic"}}); }, ConfigError);
  EXPECT_NO_THROW({ (void)Config::from_json({{"provider", "none"}}); });
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"database_path", ""}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"embedding_model", ""}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"chat_model", ""}}); }, ConfigError);

  // An in-memory store has no database file
  EXPECT_NO_THROW(
      { (void)Config::from_json({{"chunk_store", "memory"}, {"database_path", ""}}); });
}

TEST(ConfigTest, OutOfRangeNumbersThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"db_pool_size", 0}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"top_k", 0}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"threshold", 0.0}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"threshold", 1.5}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"request_timeout_ms", -1}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"index_workers", 0}}); }, ConfigError);
  EXPECT_NO_THROW({ (void)Config::from_json({{"threshold", 1.0}}); });
}
