#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "rentwise_core/db/vector_store.hpp"
#include "rentwise_core/services/ingestion_service.hpp"
#include "rentwise_core/services/query_service.hpp"

namespace rentwise_api {

nlohmann::json citation_to_json(const rentwise_core::Citation &citation);

// {answer, citations, status, failure, stage, error, timings_ms}
nlohmann::json outcome_to_json(const rentwise_core::QueryOutcome &outcome);

nlohmann::json report_to_json(const rentwise_core::IngestionReport &report);

nlohmann::json stats_to_json(const rentwise_core::VectorStoreStats &stats);

// Parses {"question": ..., "identity": ...}. Throws std::invalid_argument when
// the question is missing or not a string.
rentwise_core::QueryRequest query_request_from_json(const nlohmann::json &body);

// Parses {"documents": [{url, title, category, content}, ...]}. Throws
// std::invalid_argument on a malformed document.
std::vector<rentwise_core::SourceDocument> documents_from_json(const nlohmann::json &body);

}  // namespace rentwise_api
