#include "rentwise_core/services/query_service.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "rentwise_core/errors.hpp"
#include "rentwise_core/text/text_cleaner.hpp"

namespace rentwise_core {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point since) {
  return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

std::string failure_answer(FailureKind kind) {
  switch (kind) {
    case FailureKind::ModelUnavailable:
      return "Sorry, the search models are unavailable right now, so this question could not be "
             "answered. Please try again later.";
    case FailureKind::GenerationFailure:
      return "Sorry, an answer could not be generated right now. The sources found for your "
             "question are listed below; please try again later.";
    default:
      return "Sorry, something went wrong while answering this question. Please try again.";
  }
}

}  // namespace

std::string to_string(QueryStatus status) {
  switch (status) {
    case QueryStatus::Answered:
      return "answered";
    case QueryStatus::NotCovered:
      return "not_covered";
    case QueryStatus::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

std::string to_string(FailureKind kind) {
  switch (kind) {
    case FailureKind::None:
      return "none";
    case FailureKind::ModelUnavailable:
      return "model_unavailable";
    case FailureKind::GenerationFailure:
      return "generation_failure";
    case FailureKind::Internal:
      return "internal";
    default:
      return "unknown";
  }
}

std::string to_string(QueryStage stage) {
  switch (stage) {
    case QueryStage::Received:
      return "received";
    case QueryStage::Retrieving:
      return "retrieving";
    case QueryStage::Reranking:
      return "reranking";
    case QueryStage::ContextAssembled:
      return "context_assembled";
    case QueryStage::Generating:
      return "generating";
    case QueryStage::Answered:
      return "answered";
    case QueryStage::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

QueryService::QueryService(std::shared_ptr<const VectorStore> vector_store,
                           std::shared_ptr<const Retriever> retriever,
                           std::shared_ptr<const Reranker> reranker,
                           std::shared_ptr<GenerationService> generation_service,
                           QueryServiceOptions options)
    : vector_store_(std::move(vector_store)),
      retriever_(std::move(retriever)),
      reranker_(std::move(reranker)),
      generation_service_(std::move(generation_service)),
      options_(options) {
  if (!vector_store_ || !retriever_ || !reranker_ || !generation_service_) {
    throw std::invalid_argument("QueryService requires a store, retriever, reranker and generator");
  }
  if (options_.final_k == 0) {
    throw std::invalid_argument("final_k must be positive");
  }
}

std::string QueryService::annotate_question(const QueryRequest &request) {
  const std::string identity = trim_whitespace(request.identity);
  if (identity.empty() || identity == UNSPECIFIED_IDENTITY) {
    return request.question;
  }
  return "(User identity: " + identity + ") " + request.question;
}

QueryOutcome QueryService::not_covered(QueryStage stage) {
  QueryOutcome outcome;
  outcome.status = QueryStatus::NotCovered;
  outcome.answer = NOT_COVERED_ANSWER;
  outcome.stage = stage;
  return outcome;
}

void QueryService::fail(QueryOutcome &outcome, FailureKind kind, const std::string &detail) {
  outcome.status = QueryStatus::Failed;
  outcome.failure = kind;
  outcome.answer = failure_answer(kind);
  outcome.error_detail = detail;
  std::cerr << "Query failed at " << to_string(outcome.stage) << " (" << to_string(kind)
            << "): " << detail << std::endl;
}

QueryOutcome QueryService::answer(const QueryRequest &request) const {
  if (trim_whitespace(request.question).empty()) {
    throw std::invalid_argument("Question must not be empty");
  }

  const auto query_start = Clock::now();
  const std::string question = annotate_question(request);

  if (vector_store_->empty()) {
    std::cout << "Vector index is empty; answering as not covered" << std::endl;
    return not_covered(QueryStage::Received);
  }

  QueryOutcome outcome;
  outcome.stage = QueryStage::Retrieving;
  std::vector<CandidateChunk> candidates;
  auto stage_start = Clock::now();
  try {
    candidates = retriever_->retrieve(question);
  } catch (const VectorStoreError &e) {
    std::cerr << "Vector search failed, answering as not covered: " << e.what() << std::endl;
    return not_covered(QueryStage::Retrieving);
  } catch (const ModelUnavailableError &e) {
    fail(outcome, FailureKind::ModelUnavailable, e.what());
    return outcome;
  } catch (const std::exception &e) {
    fail(outcome, FailureKind::Internal, e.what());
    return outcome;
  }
  outcome.timings.retrieval_ms = elapsed_ms(stage_start);
  std::cout << "[Performance] Retrieval: " << outcome.timings.retrieval_ms << " ms ("
            << candidates.size() << " candidates)" << std::endl;

  outcome.stage = QueryStage::Reranking;
  stage_start = Clock::now();
  try {
    outcome.sources = reranker_->rerank(question, candidates, options_.final_k);
  } catch (const ModelUnavailableError &e) {
    fail(outcome, FailureKind::ModelUnavailable, e.what());
    return outcome;
  } catch (const std::exception &e) {
    fail(outcome, FailureKind::Internal, e.what());
    return outcome;
  }
  outcome.timings.rerank_ms = elapsed_ms(stage_start);
  std::cout << "[Performance] Rerank: " << outcome.timings.rerank_ms << " ms ("
            << outcome.sources.size() << " kept)" << std::endl;

  if (outcome.sources.empty()) {
    QueryOutcome empty = not_covered(QueryStage::ContextAssembled);
    empty.timings = outcome.timings;
    return empty;
  }

  outcome.stage = QueryStage::ContextAssembled;
  const std::string context = format_context(outcome.sources);
  outcome.citations = make_citations(outcome.sources);

  outcome.stage = QueryStage::Generating;
  stage_start = Clock::now();
  try {
    std::string generated = generation_service_->generate(build_rag_prompt(context, question));
    if (trim_whitespace(generated).empty()) {
      throw GenerationError("Generation service returned an empty answer");
    }
    outcome.answer = std::move(generated);
  } catch (const std::exception &e) {
    // Citations stay: retrieval and rerank already succeeded
    fail(outcome, FailureKind::GenerationFailure, e.what());
    outcome.timings.generation_ms = elapsed_ms(stage_start);
    outcome.timings.total_ms = elapsed_ms(query_start);
    return outcome;
  }
  outcome.timings.generation_ms = elapsed_ms(stage_start);
  outcome.timings.total_ms = elapsed_ms(query_start);
  std::cout << "[Performance] Generation: " << outcome.timings.generation_ms << " ms, total "
            << outcome.timings.total_ms << " ms" << std::endl;

  outcome.status = QueryStatus::Answered;
  outcome.stage = QueryStage::Answered;
  return outcome;
}

}  // namespace rentwise_core
