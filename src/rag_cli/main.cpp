#include "rag_cli/cli_handler.hpp"
#include "rag_cli/config.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    // Get config path from environment variable
    const char *config_env = std::getenv("RAG_CONFIG");
    std::string config_path = config_env ? config_env : "ragrc.json";

    rag_cli::Config config = rag_cli::Config::from_file(config_path);

    // Create CLI handler
    rag_cli::CliHandler handler(config);

    // Parse command line arguments
    rag_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
