#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "rentwise_api/config.hpp"
#include "rentwise_api/routes.hpp"
#include "rentwise_api/server.hpp"
#include "rentwise_core/db/vector_store.hpp"
#include "rentwise_core/llm/model_registry.hpp"
#include "rentwise_core/llm/ollama_client.hpp"
#include "rentwise_core/llm/openai_chat_client.hpp"
#include "rentwise_core/ranking/onnx_cross_encoder.hpp"
#include "rentwise_core/ranking/reranker.hpp"
#include "rentwise_core/retrieval/retriever.hpp"
#include "rentwise_core/services/ingestion_service.hpp"
#include "rentwise_core/services/query_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char *argv[]) {
  const std::string config_path = argc > 1 ? argv[1] : "rentwiserc.json";

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "Error starting server: failed to initialize libcurl" << std::endl;
    return 1;
  }

  int exit_code = 0;
  try {
    Config config = Config::from_file(config_path);

    std::cout << "Starting Rentwise API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Index: " << config.index_dir << "/" << config.index_name << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Reranker Model: " << config.reranker_model_path << std::endl;
    std::cout << "LLM: " << config.llm_model << " at " << config.llm_base_url << std::endl;
    std::cout << "Retrieval: " << config.search_type << ", initial_k=" << config.initial_k
              << ", final_k=" << config.final_k << std::endl;

    auto registry = std::make_shared<rentwise_core::ModelRegistry>(
        [&config](const std::string &model_id) {
          return std::make_shared<rentwise_core::OllamaClient>(config.ollama_url, model_id,
                                                              config.embedding_timeout_seconds);
        },
        [&config](const std::string &model_path) {
          return std::make_shared<rentwise_core::OnnxCrossEncoder>(model_path,
                                                                  config.reranker_vocab_path);
        });

    auto embeddings = registry->embedding_provider(config.embedding_model);
    std::shared_ptr<rentwise_core::VectorStore> vector_store =
        rentwise_core::VectorStore::load(config.index_dir, config.index_name, embeddings);
    if (!vector_store) {
      std::cout << "No usable vector index found; starting empty. Questions will be answered "
                   "as not covered until documents are ingested."
                << std::endl;
      vector_store = std::make_shared<rentwise_core::VectorStore>(embeddings);
    }

    rentwise_core::RetrieverOptions retriever_options;
    retriever_options.k = static_cast<size_t>(config.initial_k);
    retriever_options.mode = rentwise_core::search_mode_from_string(config.search_type);
    retriever_options.fetch_multiplier = static_cast<size_t>(config.mmr_fetch_multiplier);
    retriever_options.mmr_lambda = static_cast<float>(config.mmr_lambda);
    auto retriever = std::make_shared<rentwise_core::Retriever>(vector_store, retriever_options);

    auto reranker =
        std::make_shared<rentwise_core::Reranker>(registry, config.reranker_model_path);

    rentwise_core::OpenAiChatOptions chat_options;
    chat_options.api_key = config.llm_api_key;
    chat_options.base_url = config.llm_base_url;
    chat_options.model = config.llm_model;
    chat_options.temperature = config.llm_temperature;
    chat_options.max_tokens = config.llm_max_tokens;
    chat_options.timeout_seconds = config.llm_timeout_seconds;
    auto generation_service = std::make_shared<rentwise_core::OpenAiChatClient>(chat_options);

    auto query_service = std::make_shared<rentwise_core::QueryService>(
        vector_store, retriever, reranker, generation_service,
        rentwise_core::QueryServiceOptions{static_cast<size_t>(config.final_k)});

    rentwise_core::IngestionOptions ingestion_options;
    ingestion_options.persist_dir = config.index_dir;
    ingestion_options.index_name = config.index_name;
    ingestion_options.chunk_size = static_cast<size_t>(config.chunk_size);
    ingestion_options.chunk_overlap = static_cast<size_t>(config.chunk_overlap);
    ingestion_options.min_content_length = static_cast<size_t>(config.min_content_length);
    ingestion_options.allowed_domains = config.allowed_domains;
    auto ingestion_service =
        std::make_shared<rentwise_core::IngestionService>(vector_store, ingestion_options);

    rentwise_api::Server server(rentwise_api::parse_listen_address(config.api_base_url),
                                static_cast<unsigned int>(config.server_threads));
    rentwise_api::Routes routes(query_service, ingestion_service, vector_store, config.index_dir,
                                config.index_name);
    routes.register_routes(server);

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop();
    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    exit_code = 1;
  }

  curl_global_cleanup();
  return exit_code;
}
