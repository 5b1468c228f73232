#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  int server_threads;

  // Vector index location
  std::string index_dir;
  std::string index_name;

  // Embeddings
  std::string ollama_url;
  std::string embedding_model;
  int embedding_timeout_seconds;

  // Cross-encoder
  std::string reranker_model_path;
  std::string reranker_vocab_path;

  // Text generation
  std::string llm_api_key;
  std::string llm_base_url;
  std::string llm_model;
  double llm_temperature;
  int llm_max_tokens;
  int llm_timeout_seconds;

  // Retrieval
  int initial_k;
  int final_k;
  std::string search_type;
  int mmr_fetch_multiplier;
  double mmr_lambda;

  // Ingestion
  int chunk_size;
  int chunk_overlap;
  int min_content_length;
  std::vector<std::string> allowed_domains;

  // Load configuration from a JSON file at the given path. OPENAI_API_KEY,
  // OPENAI_BASE_URL and MODEL_NAME override the LLM keys when set.
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }
    if (!json_config.is_object()) {
      throw std::runtime_error("Config file '" + filename + "' must contain a JSON object");
    }

    apply_env_overrides(json_config);
    return from_json(json_config);
  }

  static void apply_env_overrides(nlohmann::json& json_config) {
    if (const char* key = std::getenv("OPENAI_API_KEY"); key && *key) {
      json_config["llm_api_key"] = key;
    }
    if (const char* base_url = std::getenv("OPENAI_BASE_URL"); base_url && *base_url) {
      json_config["llm_base_url"] = base_url;
    }
    if (const char* model = std::getenv("MODEL_NAME"); model && *model) {
      json_config["llm_model"] = model;
    }
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.server_threads = json_config.value("server_threads", 4);
      config.index_dir = json_config.value("index_dir", std::string("./data/faiss"));
      config.index_name = json_config.value("index_name", std::string("singapore_rental"));

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.embedding_timeout_seconds = json_config.value("embedding_timeout_seconds", 60);

      config.reranker_model_path = json_config.value(
          "reranker_model_path", std::string("./models/ms-marco-MiniLM-L-6-v2/model.onnx"));
      config.reranker_vocab_path = json_config.value(
          "reranker_vocab_path", std::string("./models/ms-marco-MiniLM-L-6-v2/vocab.txt"));

      config.llm_api_key = json_config.value("llm_api_key", std::string(""));
      config.llm_base_url = json_config.value("llm_base_url", std::string("https://api.deepseek.com/v1"));
      config.llm_model = json_config.value("llm_model", std::string("deepseek-chat"));
      config.llm_temperature = json_config.value("llm_temperature", 0.3);
      config.llm_max_tokens = json_config.value("llm_max_tokens", 2000);
      config.llm_timeout_seconds = json_config.value("llm_timeout_seconds", 60);

      config.initial_k = json_config.value("initial_k", 15);
      config.final_k = json_config.value("final_k", 8);
      config.search_type = json_config.value("search_type", std::string("similarity"));
      config.mmr_fetch_multiplier = json_config.value("mmr_fetch_multiplier", 2);
      config.mmr_lambda = json_config.value("mmr_lambda", 0.5);

      config.chunk_size = json_config.value("chunk_size", 500);
      config.chunk_overlap = json_config.value("chunk_overlap", 100);
      config.min_content_length = json_config.value("min_content_length", 100);
      config.allowed_domains = json_config.value(
          "allowed_domains",
          std::vector<std::string>{"gov.sg", "hdb.gov.sg", "cea.gov.sg", "ura.gov.sg"});
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (server_threads <= 0) {
      throw std::runtime_error("server_threads must be greater than 0");
    }
    if (index_dir.empty()) {
      throw std::runtime_error("index_dir cannot be empty");
    }
    if (index_name.empty()) {
      throw std::runtime_error("index_name cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_timeout_seconds <= 0 || llm_timeout_seconds <= 0) {
      throw std::runtime_error("timeouts must be greater than 0");
    }
    if (reranker_model_path.empty() || reranker_vocab_path.empty()) {
      throw std::runtime_error("reranker_model_path and reranker_vocab_path cannot be empty");
    }
    if (llm_base_url.empty()) {
      throw std::runtime_error("llm_base_url cannot be empty");
    }
    if (llm_model.empty()) {
      throw std::runtime_error("llm_model cannot be empty");
    }
    if (llm_temperature < 0.0 || llm_temperature > 2.0) {
      throw std::runtime_error("llm_temperature must be between 0 and 2");
    }
    if (llm_max_tokens <= 0) {
      throw std::runtime_error("llm_max_tokens must be greater than 0");
    }
    if (initial_k <= 0 || final_k <= 0) {
      throw std::runtime_error("initial_k and final_k must be greater than 0");
    }
    if (final_k > initial_k) {
      throw std::runtime_error("final_k cannot be larger than initial_k");
    }
    if (search_type != "similarity" && search_type != "mmr") {
      throw std::runtime_error("search_type must be 'similarity' or 'mmr'");
    }
    if (mmr_fetch_multiplier <= 0) {
      throw std::runtime_error("mmr_fetch_multiplier must be greater than 0");
    }
    if (mmr_lambda < 0.0 || mmr_lambda > 1.0) {
      throw std::runtime_error("mmr_lambda must be between 0 and 1");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (min_content_length < 0) {
      throw std::runtime_error("min_content_length cannot be negative");
    }
    if (allowed_domains.empty()) {
      throw std::runtime_error("allowed_domains cannot be empty");
    }
  }
};
