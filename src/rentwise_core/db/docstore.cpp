#include "rentwise_core/db/docstore.hpp"

#include <zstd.h>

#include <iostream>
#include <map>
#include <stdexcept>

#include "rentwise_core/errors.hpp"

namespace rentwise_core {

namespace {

constexpr int COMPRESSION_LEVEL = 3;

// All rows of a docstore land in one transaction; an unfinished batch is
// rolled back when it goes out of scope.
class WriteBatch {
 public:
  explicit WriteBatch(sqlite::database &db) : db_(db) {
    db_ << "BEGIN IMMEDIATE;";
  }

  WriteBatch(const WriteBatch &) = delete;
  WriteBatch &operator=(const WriteBatch &) = delete;

  ~WriteBatch() {
    if (committed_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "Warning: docstore rollback failed: " << e.what() << std::endl;
    }
  }

  void commit() {
    db_ << "COMMIT;";
    committed_ = true;
  }

 private:
  sqlite::database &db_;
  bool committed_ = false;
};

std::string describe_sqlite_error(const std::string &operation,
                                  const sqlite::sqlite_exception &e) {
  std::string reason;
  switch (e.get_code()) {
    case SQLITE_NOTADB:
      reason = "not a docstore file";
      break;
    case SQLITE_CORRUPT:
      reason = "file is corrupt";
      break;
    case SQLITE_CANTOPEN:
      reason = "cannot open file";
      break;
    case SQLITE_READONLY:
      reason = "file is read-only";
      break;
    case SQLITE_FULL:
      reason = "disk is full";
      break;
    case SQLITE_IOERR:
      reason = "I/O error";
      break;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      reason = "file is locked";
      break;
    default:
      reason = "sqlite code " + std::to_string(e.get_extended_code());
      break;
  }
  return operation + " failed (" + reason + "): " + e.what();
}

std::vector<char> compress(std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::vector<char> compressed_buffer(ZSTD_compressBound(data.size()));

  size_t const compressed_size = ZSTD_compress(compressed_buffer.data(), compressed_buffer.size(),
                                               data.data(), data.size(), COMPRESSION_LEVEL);
  if (ZSTD_isError(compressed_size)) {
    throw DocStoreError("ZSTD compression failed: " +
                        std::string(ZSTD_getErrorName(compressed_size)));
  }
  compressed_buffer.resize(compressed_size);
  return compressed_buffer;
}

std::string decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  unsigned long long const decompressed_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (decompressed_size == ZSTD_CONTENTSIZE_ERROR || decompressed_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw DocStoreError("Chunk content is not a zstd frame");
  }

  std::string decompressed_buffer(decompressed_size, '\0');
  size_t const actual_size = ZSTD_decompress(decompressed_buffer.data(), decompressed_buffer.size(),
                                             compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual_size) || actual_size != decompressed_size) {
    throw DocStoreError("ZSTD decompression failed: " +
                        std::string(ZSTD_getErrorName(actual_size)));
  }
  return decompressed_buffer;
}

int64_t parse_int(const std::map<std::string, std::string> &values, const std::string &key) {
  auto it = values.find(key);
  if (it == values.end()) {
    throw DocStoreError("Docstore manifest is missing '" + key + "'");
  }
  try {
    return std::stoll(it->second);
  } catch (const std::exception &) {
    throw DocStoreError("Docstore manifest has a malformed '" + key + "': " + it->second);
  }
}

}  // namespace

void DocStore::create_schema(sqlite::database &db) {
  db << R"(
      CREATE TABLE manifest (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE TABLE chunks (
          ordinal INTEGER PRIMARY KEY,
          content BLOB,
          content_hash TEXT NOT NULL,
          title TEXT NOT NULL,
          url TEXT NOT NULL,
          category TEXT NOT NULL
      )
    )";
}

void DocStore::write(const std::filesystem::path &path, const DocStoreManifest &manifest,
                     const std::vector<StoredChunk> &chunks) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw DocStoreError("Cannot replace docstore " + path.string() + ": " + ec.message());
  }

  try {
    sqlite::database db(path.string());
    create_schema(db);

    WriteBatch batch(db);
    auto insert_manifest = [&](const std::string &key, const std::string &value) {
      db << "INSERT INTO manifest (key, value) VALUES (?, ?)" << key << value;
    };
    insert_manifest("format_version", std::to_string(FORMAT_VERSION));
    insert_manifest("vector_count", std::to_string(manifest.vector_count));
    insert_manifest("dimension", std::to_string(manifest.dimension));
    insert_manifest("embedding_model", manifest.embedding_model);
    insert_manifest("index_sha256", manifest.index_sha256);

    {
      auto insert_chunk = db << "INSERT INTO chunks (ordinal, content, content_hash, title, url, "
                                "category) VALUES (?, ?, ?, ?, ?, ?)";
      for (size_t ordinal = 0; ordinal < chunks.size(); ++ordinal) {
        const auto &stored = chunks[ordinal];
        insert_chunk << static_cast<int64_t>(ordinal) << compress(stored.chunk.content)
                     << stored.content_hash << stored.chunk.metadata.title
                     << stored.chunk.metadata.url << stored.chunk.metadata.category;
        insert_chunk++;
      }
      // Every row is already inserted; nothing left to run on destruction
      insert_chunk.used(true);
    }
    batch.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw DocStoreError(describe_sqlite_error("DocStore::write " + path.string(), e));
  }
}

DocStoreManifest DocStore::read_manifest(sqlite::database &db) {
  std::map<std::string, std::string> values;
  db << "SELECT key, value FROM manifest" >> [&](std::string key, std::string value) {
    values.emplace(std::move(key), std::move(value));
  };

  DocStoreManifest manifest;
  manifest.format_version = static_cast<int>(parse_int(values, "format_version"));
  manifest.vector_count = parse_int(values, "vector_count");
  manifest.dimension = static_cast<int>(parse_int(values, "dimension"));
  if (auto it = values.find("embedding_model"); it != values.end()) {
    manifest.embedding_model = it->second;
  }
  if (auto it = values.find("index_sha256"); it != values.end()) {
    manifest.index_sha256 = it->second;
  }
  return manifest;
}

DocStoreContents DocStore::read(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw DocStoreError("Docstore not found: " + path.string());
  }

  try {
    sqlite::sqlite_config config;
    config.flags = sqlite::OpenFlags::READONLY;
    sqlite::database db(path.string(), config);

    DocStoreContents contents;
    contents.manifest = read_manifest(db);
    if (contents.manifest.format_version != FORMAT_VERSION) {
      throw DocStoreError("Unsupported docstore format version " +
                          std::to_string(contents.manifest.format_version));
    }

    int64_t expected_ordinal = 0;
    db << "SELECT ordinal, content, content_hash, title, url, category FROM chunks "
          "ORDER BY ordinal" >>
        [&](int64_t ordinal, std::vector<char> content, std::string content_hash,
            std::string title, std::string url, std::string category) {
          if (ordinal != expected_ordinal) {
            throw DocStoreError("Docstore ordinals are not contiguous at " +
                                std::to_string(expected_ordinal));
          }
          ++expected_ordinal;

          StoredChunk stored;
          stored.chunk.content = decompress(content);
          stored.chunk.metadata.title = std::move(title);
          stored.chunk.metadata.url = std::move(url);
          stored.chunk.metadata.category = std::move(category);
          stored.content_hash = std::move(content_hash);
          contents.chunks.push_back(std::move(stored));
        };
    return contents;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocStoreError(describe_sqlite_error("DocStore::read " + path.string(), e));
  }
}

}  // namespace rentwise_core
