#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "server.hpp"

namespace rentwise_core {
class QueryService;
class IngestionService;
class VectorStore;
}  // namespace rentwise_core

namespace rentwise_api {

class Routes {
 public:
  Routes(std::shared_ptr<rentwise_core::QueryService> query_service,
         std::shared_ptr<rentwise_core::IngestionService> ingestion_service,
         std::shared_ptr<const rentwise_core::VectorStore> vector_store,
         std::string index_dir,
         std::string index_name);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

 private:
  std::shared_ptr<rentwise_core::QueryService> query_service_;
  std::shared_ptr<rentwise_core::IngestionService> ingestion_service_;
  std::shared_ptr<const rentwise_core::VectorStore> vector_store_;
  std::string index_dir_;
  std::string index_name_;

  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ask(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_index_stats(const crow::request &req);

  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace rentwise_api
