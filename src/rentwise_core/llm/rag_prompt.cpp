#include "rentwise_core/llm/rag_prompt.hpp"

namespace rentwise_core {

namespace {

constexpr const char *SYSTEM_INSTRUCTIONS =
    "You are a Singapore rental (HDB and private residential) information assistant. Help "
    "ordinary tenants, students and workers make a decision and act on it; do not recite "
    "policy in full.\n\n"
    "Answer in three plain paragraphs with no numbering, headings or other formatting. The "
    "first paragraph answers the question directly in one or two sentences. The second "
    "explains the rule or practical reason behind it. The third gives two or three concrete "
    "things the user can check or do next.\n\n"
    "Use a calm, patient tone and prefer \"usually\" or \"in most cases\" over absolute "
    "statements. Every fact must come from the context below. If the context does not "
    "contain the answer, say that the knowledge base does not cover this question.";

}  // namespace

std::string format_context(const std::vector<RerankedChunk> &chunks) {
  std::string context;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (i > 0) {
      context += "\n\n";
    }
    context += chunks[i].chunk.content;
  }
  return context;
}

ChatPrompt build_rag_prompt(const std::string &context, const std::string &question) {
  ChatPrompt prompt;
  prompt.system = std::string(SYSTEM_INSTRUCTIONS) + "\n\nContext information:\n" + context +
                  "\n\nUser question:\n" + question;
  prompt.user = question;
  return prompt;
}

}  // namespace rentwise_core
