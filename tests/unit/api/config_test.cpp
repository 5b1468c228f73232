#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include "rentwise_api/config.hpp"

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/rentwise_config_test_XXXXXX.json";
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

class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    setenv(name, value, 1);
  }
  ~ScopedEnv() {
    unsetenv(name_);
  }

 private:
  const char* name_;
};

} // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3030");
  EXPECT_EQ(cfg.server_threads, 4);
  EXPECT_EQ(cfg.index_dir, "./data/faiss");
  EXPECT_EQ(cfg.index_name, "singapore_rental");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.llm_base_url, "https://api.deepseek.com/v1");
  EXPECT_EQ(cfg.llm_model, "deepseek-chat");
  EXPECT_DOUBLE_EQ(cfg.llm_temperature, 0.3);
  EXPECT_EQ(cfg.llm_max_tokens, 2000);
  EXPECT_EQ(cfg.initial_k, 15);
  EXPECT_EQ(cfg.final_k, 8);
  EXPECT_EQ(cfg.search_type, "similarity");
  EXPECT_EQ(cfg.chunk_size, 500);
  EXPECT_EQ(cfg.chunk_overlap, 100);
  EXPECT_EQ(cfg.min_content_length, 100);
  EXPECT_THAT(cfg.allowed_domains, testing::ElementsAre("gov.sg", "hdb.gov.sg", "cea.gov.sg", "ura.gov.sg"));
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"api_base_url", "0.0.0.0:8080"},
      {"index_dir", "/var/lib/rentwise"},
      {"initial_k", 20},
      {"final_k", 5},
      {"search_type", "mmr"},
      {"mmr_lambda", 0.7},
      {"allowed_domains", {"gov.sg"}}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.index_dir, "/var/lib/rentwise");
  EXPECT_EQ(cfg.initial_k, 20);
  EXPECT_EQ(cfg.final_k, 5);
  EXPECT_EQ(cfg.search_type, "mmr");
  EXPECT_DOUBLE_EQ(cfg.mmr_lambda, 0.7);
  EXPECT_THAT(cfg.allowed_domains, testing::ElementsAre("gov.sg"));
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(Config::from_json({{"api_base_url", "localhost"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"server_threads", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"initial_k", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"initial_k", 5}, {"final_k", 8}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"search_type", "hybrid"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"mmr_lambda", 1.5}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"llm_temperature", 3.0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"chunk_size", 100}, {"chunk_overlap", 100}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"allowed_domains", nlohmann::json::array()}}), std::runtime_error);
}

TEST(ConfigTest, WrongTypeIsReported) {
  EXPECT_THROW(Config::from_json({{"initial_k", "fifteen"}}), std::runtime_error);
}

TEST(ConfigTest, LoadsFromFile) {
  const std::string path = write_temp_file(R"({"api_base_url": "127.0.0.1:4000", "final_k": 4})");

  Config cfg = Config::from_file(path);
  remove_file(path);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:4000");
  EXPECT_EQ(cfg.final_k, 4);
}

TEST(ConfigTest, EnvironmentOverridesLlmSettings) {
  const std::string path = write_temp_file(R"({"llm_api_key": "from-file", "llm_model": "deepseek-chat"})");
  ScopedEnv key("OPENAI_API_KEY", "sk-from-env");
  ScopedEnv model("MODEL_NAME", "deepseek-reasoner");

  Config cfg = Config::from_file(path);
  remove_file(path);

  EXPECT_EQ(cfg.llm_api_key, "sk-from-env");
  EXPECT_EQ(cfg.llm_model, "deepseek-reasoner");
}

TEST(ConfigTest, FileErrors) {
  EXPECT_THROW(Config::from_file("/nonexistent/rentwiserc.json"), std::runtime_error);

  const std::string malformed = write_temp_file("{ not json");
  EXPECT_THROW(Config::from_file(malformed), std::runtime_error);
  remove_file(malformed);

  const std::string not_object = write_temp_file("[1, 2, 3]");
  EXPECT_THROW(Config::from_file(not_object), std::runtime_error);
  remove_file(not_object);
}
