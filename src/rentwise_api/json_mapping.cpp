#include "rentwise_api/json_mapping.hpp"

#include <stdexcept>

namespace rentwise_api {

namespace {

std::string optional_string(const nlohmann::json &object, const std::string &key) {
  if (!object.contains(key) || object[key].is_null()) {
    return "";
  }
  if (!object[key].is_string()) {
    throw std::invalid_argument("'" + key + "' must be a string");
  }
  return object[key].get<std::string>();
}

}  // namespace

nlohmann::json citation_to_json(const rentwise_core::Citation &citation) {
  return {{"title", citation.title}, {"url", citation.url}, {"snippet", citation.snippet}};
}

nlohmann::json outcome_to_json(const rentwise_core::QueryOutcome &outcome) {
  nlohmann::json citations = nlohmann::json::array();
  for (const auto &citation : outcome.citations) {
    citations.push_back(citation_to_json(citation));
  }

  nlohmann::json json;
  json["answer"] = outcome.answer;
  json["citations"] = citations;
  json["status"] = rentwise_core::to_string(outcome.status);
  json["failure"] = rentwise_core::to_string(outcome.failure);
  json["stage"] = rentwise_core::to_string(outcome.stage);
  if (!outcome.error_detail.empty()) {
    json["error"] = outcome.error_detail;
  }
  json["timings_ms"] = {{"retrieval", outcome.timings.retrieval_ms},
                        {"rerank", outcome.timings.rerank_ms},
                        {"generation", outcome.timings.generation_ms},
                        {"total", outcome.timings.total_ms}};
  return json;
}

nlohmann::json report_to_json(const rentwise_core::IngestionReport &report) {
  nlohmann::json failures = nlohmann::json::array();
  for (const auto &failure : report.failures) {
    failures.push_back({{"url", failure.url}, {"reason", failure.reason}});
  }
  return {{"documents_accepted", report.documents_accepted},
          {"chunks_added", report.chunks_added},
          {"duplicates_skipped", report.duplicates_skipped},
          {"saved", report.saved},
          {"failures", failures}};
}

nlohmann::json stats_to_json(const rentwise_core::VectorStoreStats &stats) {
  return {{"vector_count", stats.vector_count},
          {"dimension", stats.dimension},
          {"embedding_model", stats.embedding_model}};
}

rentwise_core::QueryRequest query_request_from_json(const nlohmann::json &body) {
  if (!body.is_object()) {
    throw std::invalid_argument("Request body must be a JSON object");
  }
  if (!body.contains("question") || !body["question"].is_string()) {
    throw std::invalid_argument("'question' is required and must be a string");
  }

  rentwise_core::QueryRequest request;
  request.question = body["question"].get<std::string>();
  request.identity = optional_string(body, "identity");
  return request;
}

std::vector<rentwise_core::SourceDocument> documents_from_json(const nlohmann::json &body) {
  if (!body.is_object() || !body.contains("documents") || !body["documents"].is_array()) {
    throw std::invalid_argument("'documents' is required and must be an array");
  }

  std::vector<rentwise_core::SourceDocument> documents;
  for (const auto &entry : body["documents"]) {
    if (!entry.is_object()) {
      throw std::invalid_argument("Every document must be a JSON object");
    }
    rentwise_core::SourceDocument document;
    document.url = optional_string(entry, "url");
    document.title = optional_string(entry, "title");
    document.category = optional_string(entry, "category");
    document.content = optional_string(entry, "content");
    if (document.url.empty()) {
      throw std::invalid_argument("Every document needs a 'url'");
    }
    documents.push_back(std::move(document));
  }
  return documents;
}

}  // namespace rentwise_api
