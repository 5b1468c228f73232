#include "rentwise_api/routes.hpp"

#include <iostream>
#include <stdexcept>

#include "rentwise_api/json_mapping.hpp"
#include "rentwise_core/db/vector_store.hpp"
#include "rentwise_core/services/ingestion_service.hpp"
#include "rentwise_core/services/query_service.hpp"

namespace rentwise_api {
Routes::Routes(std::shared_ptr<rentwise_core::QueryService> query_service,
               std::shared_ptr<rentwise_core::IngestionService> ingestion_service,
               std::shared_ptr<const rentwise_core::VectorStore> vector_store,
               std::string index_dir,
               std::string index_name)
    : query_service_(std::move(query_service)),
      ingestion_service_(std::move(ingestion_service)),
      vector_store_(std::move(vector_store)),
      index_dir_(std::move(index_dir)),
      index_name_(std::move(index_name)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/ask").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ask(req);
  });

  CROW_ROUTE(app, "/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/index/stats")
  ([this](const crow::request &req) { return handle_index_stats(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("Rentwise API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["index_ready"] = !vector_store_->empty();
  return create_json_response(response);
}

crow::response Routes::handle_ask(const crow::request &req) {
  rentwise_core::QueryRequest request;
  try {
    request = query_request_from_json(nlohmann::json::parse(req.body));
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON: " + std::string(e.what())),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }

  try {
    std::cout << "Question: " << request.question << std::endl;
    rentwise_core::QueryOutcome outcome = query_service_->answer(request);
    std::cout << "Outcome: " << rentwise_core::to_string(outcome.status) << " with "
              << outcome.citations.size() << " citations" << std::endl;

    nlohmann::json response = create_success_response("Question processed", outcome_to_json(outcome));
    return create_json_response(response);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ask: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_ingest(const crow::request &req) {
  std::vector<rentwise_core::SourceDocument> documents;
  try {
    documents = documents_from_json(nlohmann::json::parse(req.body));
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON: " + std::string(e.what())),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }

  try {
    std::cout << "Ingesting " << documents.size() << " documents" << std::endl;
    rentwise_core::IngestionReport report = ingestion_service_->ingest(documents);
    return create_json_response(create_success_response("Ingestion finished", report_to_json(report)));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_index_stats(const crow::request &) {
  nlohmann::json data = stats_to_json(vector_store_->stats());
  data["index_dir"] = index_dir_;
  data["index_name"] = index_name_;
  return create_json_response(create_success_response("Index statistics", data));
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

}  // namespace rentwise_api
