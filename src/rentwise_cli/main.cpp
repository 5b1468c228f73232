#include "rentwise_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
  {
    std::cerr << "Error: failed to initialize libcurl" << std::endl;
    return 1;
  }

  int exit_code = 0;
  try
  {
    const char *api_base_url = std::getenv("API_BASE_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

    rentwise_cli::CliOptions options = rentwise_cli::CliHandler::parse_arguments(argc, argv);
    rentwise_cli::CliHandler handler(base_url);
    exit_code = handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }
  curl_global_cleanup();

  return exit_code;
}
