#include "rentwise_cli/cli_handler.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace rentwise_cli {

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CliError("Cannot open file: " + path.string());
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::string current_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::ostringstream out;
    out << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    auto flag_value = [&](int& i) -> std::string {
        if (i + 1 >= argc) {
            throw CliError(std::string("Missing value for ") + argv[i]);
        }
        return argv[++i];
    };

    if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--question" || flag == "-q") {
                options.question = flag_value(i);
            } else if (flag == "--identity" || flag == "-i") {
                options.identity = flag_value(i);
            } else if (flag == "--verbose" || flag == "-v") {
                options.verbose = true;
            } else {
                throw CliError("Unknown option for ask: " + flag);
            }
        }
        if (options.question.empty()) {
            throw CliError("Ask command requires a question. Usage: ask --question <text>");
        }
    } else if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--manifest" || flag == "-m") {
                options.manifest_path = flag_value(i);
            } else {
                throw CliError("Unknown option for ingest: " + flag);
            }
        }
        if (options.manifest_path.empty()) {
            throw CliError("Ingest command requires a manifest. Usage: ingest --manifest <path>");
        }
    } else if (command == "evaluate" || command == "e") {
        options.command = Command::Evaluate;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--questions" || flag == "-q") {
                options.questions_path = flag_value(i);
            } else if (flag == "--report" || flag == "-r") {
                options.report_path = flag_value(i);
            } else {
                throw CliError("Unknown option for evaluate: " + flag);
            }
        }
        if (options.questions_path.empty()) {
            throw CliError("Evaluate command requires a questions file. Usage: evaluate --questions <path>");
        }
    } else if (command == "stats" || command == "st") {
        options.command = Command::Stats;
    } else if (command == "help" || command == "h" || command == "--help") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command + ". Run 'rentwise help' for usage.");
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ask:
            return handle_ask_command(options);
        case Command::Ingest:
            return handle_ingest_command(options);
        case Command::Evaluate:
            return handle_evaluate_command(options);
        case Command::Stats:
            return handle_stats_command(options);
        case Command::Help:
        default:
            print_help();
            return 0;
    }
}

int CliHandler::handle_ask_command(const CliOptions& options) {
    nlohmann::json request;
    request["question"] = options.question;
    if (!options.identity.empty()) {
        request["identity"] = options.identity;
    }

    nlohmann::json response = make_post_request("/ask", request);
    const nlohmann::json data = response.value("data", nlohmann::json::object());
    print_answer(data, options.verbose);
    return data.value("status", std::string("failed")) == "failed" ? 1 : 0;
}

void CliHandler::print_answer(const nlohmann::json& data, bool verbose) {
    std::cout << data.value("answer", std::string("")) << std::endl;

    const nlohmann::json citations = data.value("citations", nlohmann::json::array());
    if (!citations.empty()) {
        std::cout << "\nSources:" << std::endl;
        int index = 1;
        for (const auto& citation : citations) {
            std::cout << "  [" << index++ << "] " << citation.value("title", std::string(""));
            const std::string url = citation.value("url", std::string(""));
            if (!url.empty()) {
                std::cout << " - " << url;
            }
            std::cout << std::endl;
            if (verbose) {
                std::cout << "      " << citation.value("snippet", std::string("")) << std::endl;
            }
        }
    }

    if (verbose) {
        std::cout << "\nStatus: " << data.value("status", std::string("unknown"));
        if (data.contains("error")) {
            std::cout << " (" << data["error"].get<std::string>() << ")";
        }
        std::cout << std::endl;
        if (data.contains("timings_ms")) {
            const auto& timings = data["timings_ms"];
            std::cout << std::fixed << std::setprecision(1)
                      << "Timings: retrieval " << timings.value("retrieval", 0.0) << " ms, rerank "
                      << timings.value("rerank", 0.0) << " ms, generation "
                      << timings.value("generation", 0.0) << " ms" << std::endl;
        }
    }
}

nlohmann::json CliHandler::load_ingest_manifest(const std::string& manifest_path) {
    nlohmann::json manifest;
    try {
        manifest = nlohmann::json::parse(read_file(manifest_path));
    } catch (const nlohmann::json::exception& e) {
        throw CliError("Failed to parse manifest " + manifest_path + ": " + e.what());
    }
    if (!manifest.is_array()) {
        throw CliError("Manifest must be a JSON array of documents");
    }

    const std::filesystem::path base_dir = std::filesystem::path(manifest_path).parent_path();
    nlohmann::json documents = nlohmann::json::array();
    for (const auto& entry : manifest) {
        if (!entry.is_object() || !entry.contains("url") || !entry["url"].is_string()) {
            throw CliError("Every manifest entry needs a string 'url'");
        }
        nlohmann::json document;
        document["url"] = entry["url"];
        document["title"] = entry.value("title", std::string(""));
        document["category"] = entry.value("category", std::string(""));
        if (entry.contains("content") && entry["content"].is_string()) {
            document["content"] = entry["content"];
        } else if (entry.contains("content_file") && entry["content_file"].is_string()) {
            document["content"] = read_file(base_dir / entry["content_file"].get<std::string>());
        } else {
            throw CliError("Manifest entry " + entry["url"].get<std::string>() +
                           " needs 'content' or 'content_file'");
        }
        documents.push_back(std::move(document));
    }
    return documents;
}

int CliHandler::handle_ingest_command(const CliOptions& options) {
    nlohmann::json documents = load_ingest_manifest(options.manifest_path);
    std::cout << "Sending " << documents.size() << " documents for ingestion..." << std::endl;

    nlohmann::json response = make_post_request("/ingest", {{"documents", documents}});
    const nlohmann::json report = response.value("data", nlohmann::json::object());

    std::cout << "Documents accepted: " << report.value("documents_accepted", 0) << std::endl;
    std::cout << "Chunks added: " << report.value("chunks_added", 0) << std::endl;
    std::cout << "Duplicates skipped: " << report.value("duplicates_skipped", 0) << std::endl;
    const nlohmann::json failures = report.value("failures", nlohmann::json::array());
    for (const auto& failure : failures) {
        std::cout << "  Skipped " << failure.value("url", std::string("")) << ": "
                  << failure.value("reason", std::string("")) << std::endl;
    }
    return 0;
}

EvaluationRecord CliHandler::evaluate_question(const EvaluationQuestion& question) {
    EvaluationRecord record;
    record.question = question.question;
    record.category = question.category;
    try {
        nlohmann::json response = make_post_request("/ask", {{"question", question.question}});
        const nlohmann::json data = response.value("data", nlohmann::json::object());
        record.answer = data.value("answer", std::string(""));
        record.status = data.value("status", std::string(""));
        record.citation_count = data.value("citations", nlohmann::json::array()).size();
    } catch (const std::exception& e) {
        record.error = e.what();
    }
    return record;
}

int CliHandler::handle_evaluate_command(const CliOptions& options) {
    std::vector<EvaluationQuestion> questions = load_evaluation_questions(options.questions_path);
    std::cout << "Loaded " << questions.size() << " evaluation questions" << std::endl;

    std::vector<EvaluationRecord> records;
    for (size_t i = 0; i < questions.size(); ++i) {
        std::cout << "[" << i + 1 << "/" << questions.size() << "] " << questions[i].question
                  << std::endl;
        EvaluationRecord record = evaluate_question(questions[i]);
        if (!record.error.empty()) {
            std::cout << "   error: " << record.error << std::endl;
        } else {
            std::cout << "   " << (record.is_success() ? "ok" : "no answer") << ", "
                      << record.citation_count << " citations" << std::endl;
        }
        records.push_back(std::move(record));
    }

    std::ofstream report(options.report_path);
    if (!report.is_open()) {
        throw CliError("Cannot write report to " + options.report_path);
    }
    report << render_markdown_report(records, current_timestamp());

    const EvaluationSummary summary = summarize(records);
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "\nEvaluation finished:" << std::endl;
    std::cout << "  Success rate: " << summary.success_rate << "%" << std::endl;
    std::cout << "  Citation rate: " << summary.citation_rate << "%" << std::endl;
    std::cout << "  Failed: " << summary.failed_count << std::endl;
    std::cout << "  Report saved to " << options.report_path << std::endl;
    return 0;
}

int CliHandler::handle_stats_command(const CliOptions&) {
    nlohmann::json response = make_get_request("/index/stats");
    const nlohmann::json data = response.value("data", nlohmann::json::object());
    std::cout << "Index: " << data.value("index_dir", std::string("")) << "/"
              << data.value("index_name", std::string("")) << std::endl;
    std::cout << "Chunks: " << data.value("vector_count", 0) << std::endl;
    std::cout << "Dimension: " << data.value("dimension", 0) << std::endl;
    std::cout << "Embedding model: " << data.value("embedding_model", std::string("")) << std::endl;
    return 0;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    return perform_request(endpoint, nullptr);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    const std::string request_json = data.dump();
    return perform_request(endpoint, &request_json);
}

nlohmann::json CliHandler::perform_request(const std::string& endpoint, const std::string* body) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    if (body) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(response_buffer);
    } catch (const nlohmann::json::exception&) {
        throw CliError("HTTP request failed with status code " + std::to_string(http_code) +
                       " and a non-JSON body");
    }
    if (http_code != 200) {
        throw CliError("HTTP " + std::to_string(http_code) + ": " +
                       response.value("error", std::string("request failed")));
    }
    return response;
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string url = api_base_url_;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + endpoint;
}

void CliHandler::print_help() {
    std::cout << R"(
Rentwise CLI - Singapore rental regulations assistant

Usage: rentwise <command> [options]

Commands:
  ask, a        Ask a question
    --question, -q <text>   The question
    --identity, -i <text>   Who is asking, e.g. "Student Pass holder" (optional)
    --verbose, -v           Show snippets, status and timings

  ingest, i     Add pages to the knowledge base
    --manifest, -m <path>   JSON array of {url, title, category, content | content_file}

  evaluate, e   Run a batch of questions and write a Markdown report
    --questions, -q <path>  JSON array of {question, category}
    --report, -r <path>     Report path (default: ./evaluation_report.md)

  stats, st     Show vector index statistics

  help, h       Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the Rentwise API (default: http://127.0.0.1:3030)

Examples:
  rentwise ask -q "What is the minimum lease term for an HDB flat?"
  rentwise ingest -m data/pages.json
  rentwise evaluate -q data/eval_questions.json -r report.md
)" << std::endl;
}

}  // namespace rentwise_cli
