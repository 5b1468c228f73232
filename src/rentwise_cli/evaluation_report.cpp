#include "rentwise_cli/evaluation_report.hpp"

#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

#include "rentwise_cli/cli_handler.hpp"
#include "rentwise_core/text/text_cleaner.hpp"
#include "rentwise_core/text/utf8_prefix.hpp"

namespace rentwise_cli {

namespace {

constexpr size_t ANSWER_PREVIEW_CHARS = 200;
constexpr size_t QUESTION_PREVIEW_CHARS = 50;

std::string shorten(const std::string& text, size_t max_chars) {
    if (rentwise_core::utf8_length(text) <= max_chars) {
        return text;
    }
    return rentwise_core::utf8_prefix(text, max_chars) + "...";
}

// Keeps a value on one table row
std::string table_cell(const std::string& text) {
    std::string cell;
    for (char c : text) {
        if (c == '|') {
            cell += "\\|";
        } else if (c == '\n' || c == '\r') {
            cell += ' ';
        } else {
            cell += c;
        }
    }
    return cell;
}

std::string percent(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value << "%";
    return out.str();
}

}  // namespace

bool EvaluationRecord::is_success() const {
    return error.empty() && status != "failed" && has_citations() &&
           !rentwise_core::trim_whitespace(answer).empty();
}

std::vector<EvaluationQuestion> load_evaluation_questions(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CliError("Evaluation questions file not found: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        throw CliError("Failed to parse evaluation questions: " + std::string(e.what()));
    }
    if (!json.is_array()) {
        throw CliError("Evaluation questions file must contain a JSON array");
    }

    std::vector<EvaluationQuestion> questions;
    for (const auto& entry : json) {
        if (!entry.is_object() || !entry.contains("question") || !entry["question"].is_string()) {
            throw CliError("Every evaluation entry needs a string 'question'");
        }
        EvaluationQuestion question;
        question.question = entry["question"].get<std::string>();
        if (entry.contains("category") && entry["category"].is_string()) {
            question.category = entry["category"].get<std::string>();
        }
        questions.push_back(std::move(question));
    }
    return questions;
}

EvaluationSummary summarize(const std::vector<EvaluationRecord>& records) {
    EvaluationSummary summary;
    summary.total = records.size();
    for (const auto& record : records) {
        if (record.is_success()) {
            ++summary.success_count;
        } else {
            ++summary.failed_count;
        }
        if (record.has_citations()) {
            ++summary.citation_count;
        }
    }
    if (summary.total > 0) {
        summary.success_rate = 100.0 * summary.success_count / summary.total;
        summary.citation_rate = 100.0 * summary.citation_count / summary.total;
    }
    return summary;
}

std::string render_markdown_report(const std::vector<EvaluationRecord>& records,
                                   const std::string& generated_at) {
    const EvaluationSummary summary = summarize(records);
    std::ostringstream out;

    out << "# RAG Evaluation Report\n\n";
    out << "**Generated**: " << generated_at << "\n\n";
    out << "## Overall Statistics\n\n";
    out << "- **Total questions**: " << summary.total << "\n";
    out << "- **Successful answers**: " << summary.success_count << " ("
        << percent(summary.success_rate) << ")\n";
    out << "- **With citations**: " << summary.citation_count << " ("
        << percent(summary.citation_rate) << ")\n";
    out << "- **Without citations**: " << summary.total - summary.citation_count << "\n\n";

    out << "## Failed Samples\n\n";
    size_t sample = 0;
    for (const auto& record : records) {
        if (record.is_success()) {
            continue;
        }
        ++sample;
        out << "### Failed sample " << sample << "\n\n";
        out << "**Question**: " << record.question << "\n";
        out << "**Category**: " << record.category << "\n";
        out << "**Has citations**: " << (record.has_citations() ? "yes" : "no") << "\n\n";
        if (!record.error.empty()) {
            out << "**Error**: " << record.error << "\n\n";
        } else if (!record.answer.empty()) {
            out << "**Answer**: " << shorten(record.answer, ANSWER_PREVIEW_CHARS) << "\n\n";
        } else {
            out << "**Answer**: (empty)\n\n";
        }
    }
    if (sample == 0) {
        out << "No failed samples.\n\n";
    }

    out << "## Detailed Results\n\n";
    out << "| # | Question | Category | Status | Citations | Success |\n";
    out << "|---|----------|----------|--------|-----------|---------|\n";
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        out << "| " << i + 1 << " | " << table_cell(shorten(record.question, QUESTION_PREVIEW_CHARS))
            << " | " << table_cell(record.category) << " | "
            << (record.status.empty() ? "error" : record.status) << " | " << record.citation_count
            << " | " << (record.is_success() ? "yes" : "no") << " |\n";
    }
    return out.str();
}

}  // namespace rentwise_cli
