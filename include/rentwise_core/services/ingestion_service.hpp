#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rentwise_core/db/vector_store.hpp"
#include "rentwise_core/text/domain_allow_list.hpp"
#include "rentwise_core/text/text_splitter.hpp"

namespace rentwise_core {

// One page handed over by the fetcher
struct SourceDocument {
  std::string url;
  std::string title;
  std::string category;
  std::string content;
};

struct IngestionFailure {
  std::string url;
  std::string reason;
};

struct IngestionReport {
  size_t documents_accepted = 0;
  size_t chunks_added = 0;
  size_t duplicates_skipped = 0;
  std::vector<IngestionFailure> failures;
  bool saved = false;
};

struct IngestionOptions {
  std::filesystem::path persist_dir = "./data/faiss";
  std::string index_name = "singapore_rental";
  size_t chunk_size = 500;
  size_t chunk_overlap = 100;
  size_t min_content_length = 100;
  std::vector<std::string> allowed_domains = default_allowed_domains();
};

// Turns fetched pages into chunks, appends the new ones to the shared store
// and persists it. Documents are checked independently; one bad page does
// not stop the run.
class IngestionService {
 public:
  IngestionService(std::shared_ptr<VectorStore> vector_store, IngestionOptions options);

  // Throws VectorStoreError, DocStoreError or ModelUnavailableError when
  // embedding or saving fails. Chunks added before a failed save stay in the
  // store and are written by the next ingest, even one that adds nothing.
  IngestionReport ingest(const std::vector<SourceDocument> &documents);

  // Cleaned, split chunks of one document. Empty when the cleaned text is
  // shorter than min_content_length.
  std::vector<DocumentChunk> chunk_document(const SourceDocument &document) const;

 private:
  std::shared_ptr<VectorStore> vector_store_;
  IngestionOptions options_;
  TextSplitter splitter_;
  // One run at a time, so saves never interleave
  std::mutex ingest_mutex_;
};

}  // namespace rentwise_core
