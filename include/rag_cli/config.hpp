#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/stores/sqlite_vector_store.hpp"

namespace rag_cli {

class Config {
 public:
  // Storage
  std::string database_path;
  std::string database_key;
  int pool_size = 2;

  // Ollama
  std::string ollama_url;
  std::string embedding_model;
  std::string chat_model;

  // Similarity index
  std::string index_kind;
  int max_neighbors = 32;
  int ef_construction = 100;
  int ef_search = 64;
  std::string compression;

  // Ingestion and retrieval
  int chunk_size = 500;
  int chunk_overlap = 100;
  int n_results = 3;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }
    Config config;

    try {
      config.database_path = json_config.value("database_path", std::string("./data/vectors.db"));
      config.database_key = json_config.value("database_key", std::string(""));
      config.pool_size = json_config.value("pool_size", 2);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.chat_model = json_config.value("chat_model", std::string("llama3.2"));

      config.index_kind = json_config.value("index_kind", std::string("hnsw"));
      config.max_neighbors = json_config.value("max_neighbors", 32);
      config.ef_construction = json_config.value("ef_construction", 100);
      config.ef_search = json_config.value("ef_search", 64);
      config.compression = json_config.value("compression", std::string("none"));

      config.chunk_size = json_config.value("chunk_size", 500);
      config.chunk_overlap = json_config.value("chunk_overlap", 100);
      config.n_results = json_config.value("n_results", 3);
    } catch (const nlohmann::json::type_error &e) {
      throw std::runtime_error(std::string("Config value has the wrong type: ") + e.what());
    }

    config.validate();
    return config;
  }

  rag_core::SqliteVectorStoreOptions to_store_options() const {
    rag_core::SqliteVectorStoreOptions options;
    options.db_path = database_path;
    options.db_key = database_key;
    options.pool_size = pool_size;
    options.index.kind = rag_core::index_kind_from_string(index_kind);
    options.index.max_neighbors = max_neighbors;
    options.index.ef_construction = ef_construction;
    options.index.ef_search = ef_search;
    options.index.compression = rag_core::index_compression_from_string(compression);
    return options;
  }

 private:
  void validate() const {
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (pool_size <= 0) {
      throw std::runtime_error("pool_size must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (chat_model.empty()) {
      throw std::runtime_error("chat_model cannot be empty");
    }
    if (index_kind != "flat" && index_kind != "hnsw") {
      throw std::runtime_error("index_kind must be \"flat\" or \"hnsw\", got \"" + index_kind + "\"");
    }
    if (compression != "none" && compression != "float16" && compression != "int8") {
      throw std::runtime_error("compression must be \"none\", \"float16\" or \"int8\", got \"" +
                               compression + "\"");
    }
    if (max_neighbors <= 0 || ef_construction <= 0 || ef_search <= 0) {
      throw std::runtime_error("max_neighbors, ef_construction and ef_search must be positive");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (n_results <= 0) {
      throw std::runtime_error("n_results must be greater than 0");
    }
  }
};

}  // namespace rag_cli
