#pragma once

#include <exception>
#include <string>

namespace rentwise_core {

// An embedding or cross-encoder backend could not be initialized or failed to
// produce a result.
class ModelUnavailableError : public std::exception {
 public:
  explicit ModelUnavailableError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The text-generation backend errored, returned garbage or timed out.
class GenerationError : public std::exception {
 public:
  explicit GenerationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A FAISS operation failed or the index was used with the wrong dimension.
class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DocStoreError : public std::exception {
 public:
  explicit DocStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace rentwise_core
