#pragma once

#include <string>
#include <vector>

namespace rentwise_cli
{

  struct EvaluationQuestion
  {
    std::string question;
    std::string category = "unknown";
  };

  struct EvaluationRecord
  {
    std::string question;
    std::string category;
    std::string answer;
    std::string status;
    size_t citation_count = 0;
    // Set when the request itself failed
    std::string error;

    bool has_citations() const { return citation_count > 0; }
    // Not failed, at least one citation and a non-blank answer
    bool is_success() const;
  };

  struct EvaluationSummary
  {
    size_t total = 0;
    size_t success_count = 0;
    size_t citation_count = 0;
    size_t failed_count = 0;
    double success_rate = 0.0;
    double citation_rate = 0.0;
  };

  // Reads a JSON array of {question, category}. Throws CliError.
  std::vector<EvaluationQuestion> load_evaluation_questions(const std::string &path);

  EvaluationSummary summarize(const std::vector<EvaluationRecord> &records);

  std::string render_markdown_report(const std::vector<EvaluationRecord> &records,
                                     const std::string &generated_at);

}
