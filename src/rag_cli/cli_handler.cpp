#include "rag_cli/cli_handler.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "rag_core/llm/ollama_chat_model.hpp"
#include "rag_core/llm/ollama_embedding_provider.hpp"
#include "rag_core/splitters/character_text_splitter.hpp"
#include "rag_core/splitters/recursive_character_text_splitter.hpp"

namespace rag_cli {

namespace {

// Chat model stand-in for commands that never generate
class NoopModel : public rag_core::GenerativeModel {
 public:
  void load() override {}
  void unload() override {}
  void interrupt() override {}
  std::string generate(const rag_core::Messages &, const rag_core::TokenSink &) override {
    throw CliError("This command does not load a chat model");
  }
};

std::string read_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw CliError("Failed to open file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

int parse_int(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError(flag + " expects an integer, got \"" + value + "\"");
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError(flag + " expects an integer, got \"" + value + "\"");
  }
}

}  // namespace

CliHandler::CliHandler(Config config) : config_(std::move(config)) {}

CliHandler::~CliHandler() {
  if (orchestrator_) {
    orchestrator_->unload();
  } else if (store_) {
    store_->unload();
  }
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
  } else if (command == "add" || command == "a") {
    options.command = Command::Add;
  } else if (command == "query" || command == "q") {
    options.command = Command::Query;
  } else if (command == "ask") {
    options.command = Command::Ask;
  } else if (command == "delete" || command == "d") {
    options.command = Command::Delete;
  } else if (command == "drop") {
    options.command = Command::Drop;
    return options;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--no-rag") {
      options.augmented = false;
      continue;
    }
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[++i];

    if (flag == "--file" || flag == "-f") {
      options.file_path = value;
    } else if (flag == "--text" || flag == "-t") {
      options.text = value;
    } else if (flag == "--id") {
      options.id = value;
    } else if (flag == "--splitter" || flag == "-s") {
      options.splitter = value;
    } else if (flag == "--k" || flag == "-k") {
      options.top_k = parse_int(flag, value);
      if (*options.top_k <= 0) {
        throw CliError("--k must be greater than 0");
      }
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  switch (options.command) {
    case Command::Ingest:
      if (options.file_path.empty()) {
        throw CliError("Ingest command requires a file path. Usage: ingest --file <path>");
      }
      break;
    case Command::Add:
      if (options.text.empty()) {
        throw CliError("Add command requires text. Usage: add --text <text> [--id <id>]");
      }
      break;
    case Command::Query:
      if (options.text.empty()) {
        throw CliError("Query command requires text. Usage: query --text <text> [--k N]");
      }
      break;
    case Command::Ask:
      if (options.text.empty()) {
        throw CliError("Ask command requires a question. Usage: ask --text <question>");
      }
      break;
    case Command::Delete:
      if (options.id.empty()) {
        throw CliError("Delete command requires an id. Usage: delete --id <id>");
      }
      break;
    default:
      break;
  }
  return options;
}

rag_core::TextSplitterPtr CliHandler::make_splitter(const std::string &name,
                                                    const std::string &file_path,
                                                    size_t chunk_size,
                                                    size_t chunk_overlap) {
  std::string kind = name;
  if (kind.empty()) {
    const std::string extension = std::filesystem::path(file_path).extension().string();
    if (extension == ".md" || extension == ".markdown") {
      kind = "markdown";
    } else if (extension == ".tex") {
      kind = "latex";
    } else {
      kind = "recursive";
    }
  }

  if (kind == "recursive")
    return std::make_shared<rag_core::RecursiveCharacterTextSplitter>(chunk_size, chunk_overlap);
  if (kind == "character")
    return std::make_shared<rag_core::CharacterTextSplitter>(chunk_size, chunk_overlap);
  if (kind == "markdown")
    return std::make_shared<rag_core::MarkdownTextSplitter>(chunk_size, chunk_overlap);
  if (kind == "latex")
    return std::make_shared<rag_core::LatexTextSplitter>(chunk_size, chunk_overlap);
  throw CliError("Unknown splitter: " + kind);
}

void CliHandler::setup_pipeline(bool with_model) {
  auto embeddings = std::make_shared<rag_core::OllamaEmbeddingProvider>(config_.ollama_url,
                                                                       config_.embedding_model);
  store_ = std::make_shared<rag_core::SqliteVectorStore>(embeddings, config_.to_store_options());

  std::shared_ptr<rag_core::GenerativeModel> model;
  if (with_model) {
    model = std::make_shared<rag_core::OllamaChatModel>(config_.ollama_url, config_.chat_model);
  } else {
    model = std::make_shared<NoopModel>();
  }
  orchestrator_ = std::make_shared<rag_core::RagOrchestrator>(store_, model);
  orchestrator_->load();
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Ingest:
      handle_ingest_command(options);
      break;
    case Command::Add:
      handle_add_command(options);
      break;
    case Command::Query:
      handle_query_command(options);
      break;
    case Command::Ask:
      handle_ask_command(options);
      break;
    case Command::Delete:
      handle_delete_command(options);
      break;
    case Command::Drop:
      handle_drop_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::handle_ingest_command(const CliOptions &options) {
  std::cout << "Ingesting file: " << options.file_path << std::endl;
  const std::string document = read_file(options.file_path);
  auto splitter = make_splitter(options.splitter, options.file_path, config_.chunk_size,
                                config_.chunk_overlap);

  setup_pipeline(false);
  const std::string source = options.file_path;
  auto ids = orchestrator_->split_add_document(
      document,
      [&source](const std::vector<std::string> &chunks) {
        std::vector<rag_core::Metadata> metadatas;
        metadatas.reserve(chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
          metadatas.push_back(rag_core::Metadata{{"source", source}, {"chunk", i}});
        }
        return metadatas;
      },
      splitter);

  std::cout << "Stored " << ids.size() << " chunks" << std::endl;
  for (const auto &id : ids) {
    std::cout << "  " << id << std::endl;
  }
}

void CliHandler::handle_add_command(const CliOptions &options) {
  setup_pipeline(false);
  rag_core::AddRequest request;
  if (!options.id.empty()) {
    request.ids = {options.id};
  }
  request.documents = {options.text};
  auto ids = orchestrator_->add_document(request);
  std::cout << "Added " << ids.front() << std::endl;
}

void CliHandler::handle_query_command(const CliOptions &options) {
  setup_pipeline(false);
  rag_core::QueryRequest request;
  request.query_texts = std::vector<std::string>{options.text};
  request.n_results = static_cast<size_t>(options.top_k.value_or(config_.n_results));
  auto results = store_->query(request);
  print_results(results.front());
}

void CliHandler::handle_ask_command(const CliOptions &options) {
  setup_pipeline(true);
  rag_core::GenerateRequest request;
  request.input = options.text;
  request.augmented_generation = options.augmented;
  request.n_results = static_cast<size_t>(options.top_k.value_or(config_.n_results));

  auto handle = orchestrator_->generate_stream(request);
  while (auto token = handle.tokens->next()) {
    std::cout << *token << std::flush;
  }
  std::cout << std::endl;
  // Rethrows a generation failure
  handle.result.get();
}

void CliHandler::handle_delete_command(const CliOptions &options) {
  setup_pipeline(false);
  rag_core::DeleteRequest request;
  request.ids = std::vector<std::string>{options.id};
  orchestrator_->delete_document(request);
  std::cout << "Deleted " << options.id << std::endl;
}

void CliHandler::handle_drop_command(const CliOptions & /*options*/) {
  setup_pipeline(false);
  store_->delete_vector_store();
  orchestrator_.reset();
  store_.reset();
  std::cout << "Dropped vector store at " << config_.database_path << std::endl;
}

void CliHandler::print_results(const std::vector<rag_core::QueryResult> &results) {
  if (results.empty()) {
    std::cout << "No results." << std::endl;
    return;
  }
  for (size_t i = 0; i < results.size(); ++i) {
    const auto &result = results[i];
    std::cout << std::setw(2) << (i + 1) << ". [" << std::fixed << std::setprecision(4)
              << result.similarity << "] " << result.id << std::endl;
    if (result.document) {
      std::cout << "    " << *result.document << std::endl;
    }
    if (!result.metadata.is_null()) {
      std::cout << "    metadata: " << result.metadata.dump() << std::endl;
    }
  }
}

void CliHandler::print_help() {
  std::cout << "Usage: rag_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  ingest --file <path> [--splitter recursive|character|markdown|latex]\n"
            << "                         Split a file and store its chunks\n"
            << "  add --text <text> [--id <id>]\n"
            << "                         Store a single document\n"
            << "  query --text <text> [--k N]\n"
            << "                         Show the N most similar documents\n"
            << "  ask --text <question> [--k N] [--no-rag]\n"
            << "                         Answer with retrieved context (or without, --no-rag)\n"
            << "  delete --id <id>       Remove a document\n"
            << "  drop                   Drop the whole vector store\n"
            << "  help                   Show this message\n\n"
            << "Configuration is read from ragrc.json, or the file named by RAG_CONFIG."
            << std::endl;
}

}  // namespace rag_cli
