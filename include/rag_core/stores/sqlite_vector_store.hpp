#pragma once
#include <faiss/Index.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/stores/vector_store.hpp"

namespace rag_core {

enum class IndexKind { Flat, HNSW };
enum class IndexCompression { None, Float16, Int8 };

std::string to_string(IndexKind kind);
IndexKind index_kind_from_string(const std::string &str);
std::string to_string(IndexCompression compression);
IndexCompression index_compression_from_string(const std::string &str);

struct IndexParams {
  IndexKind kind = IndexKind::HNSW;
  // HNSW M
  int max_neighbors = 32;
  int ef_construction = 100;
  int ef_search = 64;
  IndexCompression compression = IndexCompression::None;
};

struct SqliteVectorStoreOptions {
  std::filesystem::path db_path;
  // Empty means the database is not encrypted
  std::string db_key;
  int pool_size = 2;
  IndexParams index;
};

/**
 * @class SqliteVectorStore
 * @brief Persisted store: rows live in the `vectors` table, ranking goes through Faiss.
 *
 * The Faiss index holds L2-normalised copies of the stored embeddings keyed by rowid and is
 * searched with inner product. It is rebuilt from the table on load() and again on the first
 * query after any write. Reported similarities are exact cosines against the stored
 * full-precision embeddings, so compression only affects which candidates are found.
 */
class SqliteVectorStore : public VectorStore {
 public:
  SqliteVectorStore(std::shared_ptr<EmbeddingProvider> embeddings,
                    SqliteVectorStoreOptions options,
                    std::shared_ptr<UuidGenerator> uuid_generator = nullptr);
  ~SqliteVectorStore() override;

  // Non-movable to keep DB references stable
  SqliteVectorStore(SqliteVectorStore &&) = delete;
  SqliteVectorStore &operator=(SqliteVectorStore &&) = delete;

  void load() override;
  void unload() override;

  std::vector<std::string> add(const AddRequest &request) override;
  void update(const UpdateRequest &request) override;
  void remove(const DeleteRequest &request) override;
  std::vector<std::vector<QueryResult>> query(const QueryRequest &request) override;

  size_t size() override;

  std::optional<Record> get(const std::string &id);

  // Drops the `vectors` table. The store has to be loaded again before further use.
  void delete_vector_store();

  bool is_loaded() const {
    return loaded_;
  }

  const SqliteVectorStoreOptions &options() const {
    return options_;
  }

 private:
  struct StoredRow {
    int64_t rowid = 0;
    Record record;
  };

  void ensure_loaded() const;

  void rebuild_index(sqlite::database &db);
  std::unique_ptr<faiss::IndexIDMap> create_index(size_t dimension, bool exact) const;
  std::unique_ptr<faiss::IndexIDMap> build_index(const std::vector<StoredRow> &rows,
                                                 bool exact) const;

  bool row_exists(sqlite::database &db, const std::string &id) const;
  std::optional<StoredRow> fetch_row(sqlite::database &db, const std::string &id) const;
  std::vector<StoredRow> fetch_rows_by_rowid(sqlite::database &db,
                                             const std::vector<int64_t> &rowids) const;
  std::vector<StoredRow> fetch_all_rows(sqlite::database &db) const;

  std::vector<QueryResult> rank(faiss::IndexIDMap &index,
                                const Embedding &query,
                                const QueryRequest &request,
                                sqlite::database &db) const;

  static StoredRow to_row(int64_t rowid,
                          std::string id,
                          std::optional<std::string> document,
                          const std::vector<char> &embedding_blob,
                          std::optional<std::string> metadata);
  static std::vector<char> embedding_to_blob(const Embedding &embedding);
  static Embedding blob_to_embedding(const std::vector<char> &blob);
  static std::optional<std::string> metadata_to_text(const Metadata &metadata);

  SqliteVectorStoreOptions options_;
  DatabaseManager db_manager_;
  std::unique_ptr<faiss::IndexIDMap> index_;
  bool index_dirty_ = true;
  std::atomic<bool> loaded_{false};
};

}  // namespace rag_core
