#include "rentwise_core/llm/openai_chat_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "rentwise_core/errors.hpp"

namespace rentwise_core {

namespace {

size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string extract_message_content(const nlohmann::json &json) {
  if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
    throw GenerationError("Chat completion response has no choices");
  }
  const auto &choice = json["choices"][0];
  if (!choice.contains("message") || !choice["message"].is_object()) {
    throw GenerationError("Chat completion choice has no message");
  }
  const auto &message = choice["message"];
  if (!message.contains("content") || !message["content"].is_string()) {
    throw GenerationError("Chat completion message has no text content");
  }
  return message["content"].get<std::string>();
}

}  // namespace

OpenAiChatClient::OpenAiChatClient(OpenAiChatOptions options) : options_(std::move(options)) {
  if (options_.api_key.empty()) {
    throw std::invalid_argument("LLM API key is not configured (set OPENAI_API_KEY)");
  }
  if (options_.base_url.empty()) {
    throw std::invalid_argument("LLM base URL must not be empty");
  }
  if (options_.model.empty()) {
    throw std::invalid_argument("LLM model name must not be empty");
  }
}

std::string OpenAiChatClient::completions_url() const {
  std::string url = options_.base_url;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url + "/chat/completions";
}

std::string OpenAiChatClient::generate(const ChatPrompt &prompt) {
  nlohmann::json body;
  body["model"] = options_.model;
  body["temperature"] = options_.temperature;
  body["max_tokens"] = options_.max_tokens;
  body["messages"] = nlohmann::json::array({
      {{"role", "system"}, {"content", prompt.system}},
      {{"role", "user"}, {"content", prompt.user}},
  });
  const std::string request_json = body.dump();

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw GenerationError("Failed to initialize CURL");
  }

  const std::string auth_header = "Authorization: Bearer " + options_.api_key;
  curl_slist *raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  raw_headers = curl_slist_append(raw_headers, auth_header.c_str());
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers,
                                                                       &curl_slist_free_all);

  const std::string url = completions_url();
  std::string response_buffer;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_json.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(std::min(options_.timeout_seconds, 10)));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw GenerationError("Chat completion request failed: " +
                          std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code >= 400) {
    throw GenerationError("Chat completion endpoint returned HTTP " + std::to_string(http_code) +
                          ": " + response_buffer.substr(0, 500));
  }

  try {
    return extract_message_content(nlohmann::json::parse(response_buffer));
  } catch (const nlohmann::json::exception &e) {
    throw GenerationError("Failed to parse chat completion response: " + std::string(e.what()));
  }
}

}  // namespace rentwise_core
