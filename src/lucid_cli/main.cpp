#include <cstdlib>
#include <iostream>

#include "lucid_cli/cli_handler.hpp"

int main(int argc, char *argv[])
{
  try
  {
    const char *api_base_url = std::getenv("LUCID_API_URL");
    std::string base_url = api_base_url ? api_base_url : lucid_cli::CliHandler::DEFAULT_API_URL;

    lucid_cli::CliOptions options = lucid_cli::CliHandler::parse_arguments(argc, argv);

    lucid_cli::CliHandler handler(base_url);
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
