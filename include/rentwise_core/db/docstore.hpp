#pragma once

#include <sqlite_modern_cpp.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "rentwise_core/types/chunk.hpp"

namespace rentwise_core {

// Describes the vector file a docstore was written alongside.
struct DocStoreManifest {
  int format_version = 0;
  int64_t vector_count = 0;
  int dimension = 0;
  std::string embedding_model;
  std::string index_sha256;
};

struct StoredChunk {
  DocumentChunk chunk;
  std::string content_hash;
};

struct DocStoreContents {
  DocStoreManifest manifest;
  // Indexed by vector ordinal
  std::vector<StoredChunk> chunks;
};

// Sidecar of a vector index: one row per vector ordinal holding the chunk
// text (zstd-compressed) and its metadata, plus a manifest used to check
// that the pair on disk belongs together.
class DocStore {
 public:
  static constexpr int FORMAT_VERSION = 1;

  // Writes a fresh docstore at path, replacing any file already there.
  // Throws DocStoreError.
  static void write(const std::filesystem::path &path, const DocStoreManifest &manifest,
                    const std::vector<StoredChunk> &chunks);

  // Throws DocStoreError if the file is missing, unreadable or malformed
  static DocStoreContents read(const std::filesystem::path &path);

 private:
  static void create_schema(sqlite::database &db);
  static DocStoreManifest read_manifest(sqlite::database &db);
};

}  // namespace rentwise_core
