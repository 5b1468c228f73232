#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rentwise_core/ranking/cross_encoder.hpp"
#include "rentwise_core/ranking/wordpiece_tokenizer.hpp"

namespace rentwise_core {

// Cross-encoder exported to ONNX (for example ms-marco-MiniLM-L-6-v2) run on
// the CPU through ONNX Runtime. Scores are the raw logits of the first
// output. Ort::Session::Run is safe to call concurrently, so predict takes
// no lock.
class OnnxCrossEncoder : public CrossEncoder {
 public:
  // Throws ModelUnavailableError if the model or vocab cannot be loaded
  OnnxCrossEncoder(const std::filesystem::path &model_path,
                   const std::filesystem::path &vocab_path,
                   int intra_op_threads = 1);
  ~OnnxCrossEncoder() override;

  OnnxCrossEncoder(const OnnxCrossEncoder &) = delete;
  OnnxCrossEncoder &operator=(const OnnxCrossEncoder &) = delete;

  std::vector<float> predict(const std::vector<TextPair> &pairs) override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace rentwise_core
