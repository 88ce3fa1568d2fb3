#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "rag_cli/cli_handler.hpp"
#include "rag_cli/config.hpp"

int main(int argc, char *argv[]) {
  try {
    rag_cli::CliOptions options = rag_cli::CliHandler::parse_arguments(argc, argv);

    const char *config_env = std::getenv("RAG_CONFIG");
    std::string config_path = config_env ? config_env : "ragrc.json";

    rag_cli::Config config;
    if (std::filesystem::exists(config_path)) {
      config = rag_cli::Config::from_file(config_path);
    } else {
      if (config_env) {
        throw std::runtime_error("Config file named by RAG_CONFIG does not exist: " + config_path);
      }
      config = rag_cli::Config::from_json(nlohmann::json::object());
    }

    rag_cli::CliHandler handler(config);
    handler.execute_command(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
