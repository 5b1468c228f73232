#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rentwise_core/db/vector_store.hpp"
#include "rentwise_core/llm/generation_service.hpp"
#include "rentwise_core/ranking/reranker.hpp"
#include "rentwise_core/retrieval/retriever.hpp"
#include "rentwise_core/types/citation.hpp"

namespace rentwise_core {

inline constexpr const char *NOT_COVERED_ANSWER =
    "The knowledge base does not cover this question. Please consult official agencies (HDB, "
    "CEA, or URA).";
// Identity value that means "no identity given"
inline constexpr const char *UNSPECIFIED_IDENTITY = "Not Sure";

enum class QueryStatus { Answered, NotCovered, Failed };
enum class FailureKind { None, ModelUnavailable, GenerationFailure, Internal };
enum class QueryStage { Received, Retrieving, Reranking, ContextAssembled, Generating, Answered, Failed };

std::string to_string(QueryStatus status);
std::string to_string(FailureKind kind);
std::string to_string(QueryStage stage);

struct QueryRequest {
  std::string question;
  // Optional caller annotation, e.g. "Student Pass holder"
  std::string identity;
};

struct StageTimings {
  double retrieval_ms = 0.0;
  double rerank_ms = 0.0;
  double generation_ms = 0.0;
  double total_ms = 0.0;
};

struct QueryOutcome {
  QueryStatus status = QueryStatus::Failed;
  FailureKind failure = FailureKind::None;
  // Always user-presentable text, also on failure
  std::string answer;
  // Projection of `sources`, same order and count
  std::vector<Citation> citations;
  std::vector<RerankedChunk> sources;
  std::string error_detail;
  // Last stage entered; for failures, the stage that failed
  QueryStage stage = QueryStage::Received;
  StageTimings timings;
};

struct QueryServiceOptions {
  size_t final_k = 8;
};

// Runs one question through retrieve -> rerank -> context -> generate. The
// chunks that form the generation context are computed once and the
// citations are derived from exactly those chunks.
class QueryService {
 public:
  QueryService(std::shared_ptr<const VectorStore> vector_store,
               std::shared_ptr<const Retriever> retriever,
               std::shared_ptr<const Reranker> reranker,
               std::shared_ptr<GenerationService> generation_service,
               QueryServiceOptions options = {});

  // Throws std::invalid_argument for a blank question; every other failure
  // is reported through the outcome.
  QueryOutcome answer(const QueryRequest &request) const;

  // Question as sent to retrieval, rerank and generation
  static std::string annotate_question(const QueryRequest &request);

 private:
  static QueryOutcome not_covered(QueryStage stage);
  static void fail(QueryOutcome &outcome, FailureKind kind, const std::string &detail);

  std::shared_ptr<const VectorStore> vector_store_;
  std::shared_ptr<const Retriever> retriever_;
  std::shared_ptr<const Reranker> reranker_;
  std::shared_ptr<GenerationService> generation_service_;
  QueryServiceOptions options_;
};

}  // namespace rentwise_core
