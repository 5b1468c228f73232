#include "rentwise_core/services/ingestion_service.hpp"

#include <iostream>
#include <stdexcept>

#include "rentwise_core/text/text_cleaner.hpp"
#include "rentwise_core/text/utf8_prefix.hpp"

namespace rentwise_core {

IngestionService::IngestionService(std::shared_ptr<VectorStore> vector_store,
                                   IngestionOptions options)
    : vector_store_(std::move(vector_store)),
      options_(std::move(options)),
      splitter_(TextSplitterOptions{options_.chunk_size, options_.chunk_overlap}) {
  if (!vector_store_) {
    throw std::invalid_argument("IngestionService requires a vector store");
  }
  if (options_.index_name.empty()) {
    throw std::invalid_argument("index_name must not be empty");
  }
}

std::vector<DocumentChunk> IngestionService::chunk_document(const SourceDocument &document) const {
  const std::string cleaned = clean_text(document.content);
  if (utf8_length(cleaned) < options_.min_content_length) {
    return {};
  }

  ChunkMetadata metadata;
  metadata.title = document.title.empty() ? UNKNOWN_TITLE : document.title;
  metadata.url = document.url;
  metadata.category = document.category;

  std::vector<DocumentChunk> chunks;
  for (auto &piece : splitter_.split_text(cleaned)) {
    chunks.push_back(DocumentChunk{std::move(piece), metadata});
  }
  return chunks;
}

IngestionReport IngestionService::ingest(const std::vector<SourceDocument> &documents) {
  std::lock_guard<std::mutex> lock(ingest_mutex_);
  IngestionReport report;
  std::vector<DocumentChunk> all_chunks;

  for (const auto &document : documents) {
    if (!check_domain_allowed(document.url, options_.allowed_domains)) {
      std::cerr << "Skipping " << document.url << ": domain is not on the allow-list"
                << std::endl;
      report.failures.push_back({document.url, "domain not allowed"});
      continue;
    }

    auto chunks = chunk_document(document);
    if (chunks.empty()) {
      std::cerr << "Skipping " << document.url << ": content shorter than "
                << options_.min_content_length << " characters after cleaning" << std::endl;
      report.failures.push_back({document.url, "content too short"});
      continue;
    }

    std::cout << "Prepared " << chunks.size() << " chunks from " << document.url << std::endl;
    ++report.documents_accepted;
    all_chunks.insert(all_chunks.end(), std::make_move_iterator(chunks.begin()),
                      std::make_move_iterator(chunks.end()));
  }

  if (all_chunks.empty()) {
    std::cout << "No documents to ingest" << std::endl;
    return report;
  }

  report.chunks_added = vector_store_->add_chunks(all_chunks);
  report.duplicates_skipped = all_chunks.size() - report.chunks_added;

  // A failed save earlier leaves chunks in memory that a retry skips as
  // duplicates, so the dirty flag decides rather than chunks_added
  if (vector_store_->has_unsaved_changes()) {
    vector_store_->save(options_.persist_dir, options_.index_name);
    report.saved = true;
  }

  std::cout << "Ingestion finished: " << report.documents_accepted << " documents, "
            << report.chunks_added << " chunks added, " << report.duplicates_skipped
            << " duplicates skipped, " << report.failures.size() << " failures" << std::endl;
  return report;
}

}  // namespace rentwise_core
