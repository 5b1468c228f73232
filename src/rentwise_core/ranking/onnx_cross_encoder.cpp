#include "rentwise_core/ranking/onnx_cross_encoder.hpp"

#include <onnxruntime_cxx_api.h>

#include <iostream>

#include "rentwise_core/errors.hpp"

namespace rentwise_core {

class OnnxCrossEncoder::Impl {
 public:
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "rentwise-cross-encoder"};
  std::unique_ptr<Ort::Session> session;
  std::unique_ptr<WordPieceTokenizer> tokenizer;
  std::vector<std::string> input_names;
  std::string output_name;
  bool wants_token_type_ids = false;
};

OnnxCrossEncoder::OnnxCrossEncoder(const std::filesystem::path &model_path,
                                   const std::filesystem::path &vocab_path,
                                   int intra_op_threads)
    : impl_(std::make_unique<Impl>()) {
  if (!std::filesystem::exists(model_path)) {
    throw ModelUnavailableError("Cross-encoder model not found: " + model_path.string());
  }

  try {
    impl_->tokenizer = std::make_unique<WordPieceTokenizer>(vocab_path);
  } catch (const std::exception &e) {
    throw ModelUnavailableError("Cross-encoder tokenizer failed to load: " +
                                std::string(e.what()));
  }

  try {
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(intra_op_threads);
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    impl_->session = std::make_unique<Ort::Session>(impl_->env, model_path.c_str(), options);

    Ort::AllocatorWithDefaultOptions allocator;
    const size_t input_count = impl_->session->GetInputCount();
    for (size_t i = 0; i < input_count; ++i) {
      auto name = impl_->session->GetInputNameAllocated(i, allocator);
      impl_->input_names.emplace_back(name.get());
      if (impl_->input_names.back() == "token_type_ids") {
        impl_->wants_token_type_ids = true;
      }
    }
    if (impl_->session->GetOutputCount() == 0) {
      throw ModelUnavailableError("Cross-encoder model has no outputs: " + model_path.string());
    }
    impl_->output_name = impl_->session->GetOutputNameAllocated(0, allocator).get();
  } catch (const Ort::Exception &e) {
    throw ModelUnavailableError("Failed to load cross-encoder " + model_path.string() + ": " +
                                e.what());
  }

  std::cout << "Cross-encoder ready: " << model_path << " (" << impl_->tokenizer->vocab_size()
            << " vocab entries)" << std::endl;
}

OnnxCrossEncoder::~OnnxCrossEncoder() = default;

std::vector<float> OnnxCrossEncoder::predict(const std::vector<TextPair> &pairs) {
  if (pairs.empty()) {
    return {};
  }

  auto batch = impl_->tokenizer->encode_pairs(pairs);
  const int64_t shape[2] = {static_cast<int64_t>(batch.batch_size),
                            static_cast<int64_t>(batch.sequence_length)};

  try {
    Ort::MemoryInfo memory_info =
        Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<Ort::Value> inputs;
    std::vector<const char *> input_names;
    for (const auto &name : impl_->input_names) {
      std::vector<int64_t> *source = nullptr;
      if (name == "input_ids") {
        source = &batch.input_ids;
      } else if (name == "attention_mask") {
        source = &batch.attention_mask;
      } else if (name == "token_type_ids") {
        source = &batch.token_type_ids;
      } else {
        throw ModelUnavailableError("Cross-encoder expects unsupported input '" + name + "'");
      }
      inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, source->data(),
                                                         source->size(), shape, 2));
      input_names.push_back(name.c_str());
    }

    const char *output_names[1] = {impl_->output_name.c_str()};
    std::vector<Ort::Value> outputs =
        impl_->session->Run(Ort::RunOptions{nullptr}, input_names.data(), inputs.data(),
                            inputs.size(), output_names, 1);

    if (outputs.empty() || !outputs[0].IsTensor()) {
      throw ModelUnavailableError("Cross-encoder returned no tensor output");
    }

    const auto type_info = outputs[0].GetTensorTypeAndShapeInfo();
    const size_t element_count = type_info.GetElementCount();
    const size_t stride = element_count / pairs.size();
    if (stride == 0 || element_count % pairs.size() != 0) {
      throw ModelUnavailableError("Cross-encoder output shape does not match the batch");
    }

    // Single-logit models score directly; two-class models use the positive class
    const float *logits = outputs[0].GetTensorData<float>();
    std::vector<float> scores;
    scores.reserve(pairs.size());
    for (size_t i = 0; i < pairs.size(); ++i) {
      scores.push_back(logits[i * stride + (stride - 1)]);
    }
    return scores;
  } catch (const Ort::Exception &e) {
    throw ModelUnavailableError("Cross-encoder inference failed: " + std::string(e.what()));
  }
}

}  // namespace rentwise_core
