#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "rentwise_cli/evaluation_report.hpp"

namespace rentwise_cli
{

  enum class Command
  {
    Ask,
    Ingest,
    Evaluate,
    Stats,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string question;
    std::string identity;
    std::string manifest_path;
    std::string questions_path;
    std::string report_path = "./evaluation_report.md";
    bool verbose = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Returns the process exit code
    int execute_command(const CliOptions &options);

    // Reads an ingest manifest: a JSON array of {url, title, category} with
    // either inline "content" or a "content_file" relative to the manifest
    static nlohmann::json load_ingest_manifest(const std::string &manifest_path);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    int handle_ask_command(const CliOptions &options);
    int handle_ingest_command(const CliOptions &options);
    int handle_evaluate_command(const CliOptions &options);
    int handle_stats_command(const CliOptions &options);

    EvaluationRecord evaluate_question(const EvaluationQuestion &question);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &endpoint, const std::string *body);

    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_answer(const nlohmann::json &data, bool verbose);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
