#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

#include <cstdio>

#include "rag_cli/config.hpp"

using rag_cli::Config;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/rag_toolkit_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"database_path", "./data/notes.db"},
      {"database_key", "secret"},
      {"pool_size", 4},
      {"ollama_url", "http://ollama:11434"},
      {"embedding_model", "nomic-embed-text"},
      {"chat_model", "mistral"},
      {"index_kind", "flat"},
      {"compression", "int8"},
      {"chunk_size", 800},
      {"chunk_overlap", 50},
      {"n_results", 5}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.database_path, "./data/notes.db");
  EXPECT_EQ(cfg.database_key, "secret");
  EXPECT_EQ(cfg.pool_size, 4);
  EXPECT_EQ(cfg.ollama_url, "http://ollama:11434");
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.chat_model, "mistral");
  EXPECT_EQ(cfg.index_kind, "flat");
  EXPECT_EQ(cfg.compression, "int8");
  EXPECT_EQ(cfg.chunk_size, 800);
  EXPECT_EQ(cfg.chunk_overlap, 50);
  EXPECT_EQ(cfg.n_results, 5);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  nlohmann::json j = nlohmann::json::object();

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.database_path, "./data/vectors.db");
  EXPECT_EQ(cfg.database_key, "");
  EXPECT_EQ(cfg.pool_size, 2);
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.chat_model, "llama3.2");
  EXPECT_EQ(cfg.index_kind, "hnsw");
  EXPECT_EQ(cfg.max_neighbors, 32);
  EXPECT_EQ(cfg.ef_construction, 100);
  EXPECT_EQ(cfg.ef_search, 64);
  EXPECT_EQ(cfg.compression, "none");
  EXPECT_EQ(cfg.chunk_size, 500);
  EXPECT_EQ(cfg.chunk_overlap, 100);
  EXPECT_EQ(cfg.n_results, 3);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "database_path": "./db/vectors.db",
    "chat_model": "llama3.1",
    "index_kind": "hnsw",
    "max_neighbors": 16,
    "ef_search": 128
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.database_path, "./db/vectors.db");
  EXPECT_EQ(cfg.chat_model, "llama3.1");
  EXPECT_EQ(cfg.max_neighbors, 16);
  EXPECT_EQ(cfg.ef_search, 128);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, std::runtime_error);
}

TEST(ConfigTest, MalformedFileThrows) {
  std::string path = write_temp_file("{ not json");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, NonObjectThrows) {
  EXPECT_THROW({ (void)Config::from_json(nlohmann::json::array({1, 2})); }, std::runtime_error);
}

TEST(ConfigTest, WrongValueTypeThrows) {
  nlohmann::json j = {{"pool_size", "two"}};
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"database_path", ""}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"chat_model", ""}}); }, std::runtime_error);
}

TEST(ConfigTest, UnknownIndexSettingsThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"index_kind", "ivf"}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"compression", "pq"}}); }, std::runtime_error);
}

TEST(ConfigTest, ChunkSettingsAreValidated) {
  EXPECT_THROW({ (void)Config::from_json({{"chunk_size", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"chunk_size", 100}, {"chunk_overlap", 100}}); },
               std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"n_results", 0}}); }, std::runtime_error);
}

TEST(ConfigTest, ConvertsToStoreOptions) {
  nlohmann::json j = {
      {"database_path", "./data/notes.db"},
      {"database_key", "secret"},
      {"index_kind", "flat"},
      {"compression", "float16"},
      {"ef_construction", 200}
  };

  rag_core::SqliteVectorStoreOptions options = Config::from_json(j).to_store_options();

  EXPECT_EQ(options.db_path, std::filesystem::path("./data/notes.db"));
  EXPECT_EQ(options.db_key, "secret");
  EXPECT_EQ(options.pool_size, 2);
  EXPECT_EQ(options.index.kind, rag_core::IndexKind::Flat);
  EXPECT_EQ(options.index.compression, rag_core::IndexCompression::Float16);
  EXPECT_EQ(options.index.ef_construction, 200);
}
