#include "rentwise_core/util/content_hash.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace rentwise_core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext new_sha256_context() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }
  return ctx;
}

void update(EVP_MD_CTX *ctx, const void *data, size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("Failed to update SHA256 digest");
  }
}

std::string finish_hex(EVP_MD_CTX *ctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string sha256_hex(std::string_view data) {
  auto ctx = new_sha256_context();
  update(ctx.get(), data.data(), data.size());
  return finish_hex(ctx.get());
}

std::string sha256_file_hex(const std::filesystem::path &file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for hashing: " + file_path.string());
  }

  auto ctx = new_sha256_context();
  char buffer[4096];
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    update(ctx.get(), buffer, static_cast<size_t>(file.gcount()));
  }
  if (file.bad()) {
    throw std::runtime_error("Failed while reading file for hashing: " + file_path.string());
  }
  return finish_hex(ctx.get());
}

}  // namespace rentwise_core
