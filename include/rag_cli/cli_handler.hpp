#pragma once

#include <memory>
#include <optional>
#include <string>

#include "rag_cli/config.hpp"
#include "rag_core/services/rag_orchestrator.hpp"
#include "rag_core/stores/sqlite_vector_store.hpp"

namespace rag_cli {

enum class Command { Ingest, Add, Query, Ask, Delete, Drop, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string file_path;
  std::string text;
  std::string id;
  // recursive, character, markdown or latex; empty picks one from the file extension
  std::string splitter;
  std::optional<int> top_k;
  bool augmented = true;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(Config config);
  ~CliHandler();

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Execute command
  void execute_command(const CliOptions &options);

  static rag_core::TextSplitterPtr make_splitter(const std::string &name,
                                                 const std::string &file_path,
                                                 size_t chunk_size,
                                                 size_t chunk_overlap);

 private:
  Config config_;
  std::shared_ptr<rag_core::SqliteVectorStore> store_;
  std::shared_ptr<rag_core::RagOrchestrator> orchestrator_;

  // Builds and loads the store, and the chat model when with_model is set
  void setup_pipeline(bool with_model);

  // Command handlers
  void handle_ingest_command(const CliOptions &options);
  void handle_add_command(const CliOptions &options);
  void handle_query_command(const CliOptions &options);
  void handle_ask_command(const CliOptions &options);
  void handle_delete_command(const CliOptions &options);
  void handle_drop_command(const CliOptions &options);

  static void print_results(const std::vector<rag_core::QueryResult> &results);
  static void print_help();
};

}  // namespace rag_cli
