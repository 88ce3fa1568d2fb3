#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "rag_core/stores/vector_store.hpp"

namespace rag_core {

/**
 * Exact brute-force store kept entirely in memory.
 *
 * Records are kept in insertion order and ranking uses a stable sort, so equal similarities
 * come back in the order the records were added.
 */
class MemoryVectorStore : public VectorStore {
 public:
  explicit MemoryVectorStore(std::shared_ptr<EmbeddingProvider> embeddings,
                             std::shared_ptr<UuidGenerator> uuid_generator = nullptr);

  void load() override;
  void unload() override;

  std::vector<std::string> add(const AddRequest &request) override;
  void update(const UpdateRequest &request) override;
  void remove(const DeleteRequest &request) override;
  std::vector<std::vector<QueryResult>> query(const QueryRequest &request) override;

  size_t size() override;

  // Copy of the stored record, if any.
  std::optional<Record> get(const std::string &id);

 private:
  bool contains(const std::string &id) const;
  void reindex();

  std::vector<Record> records_;
  std::unordered_map<std::string, size_t> positions_;
};

}  // namespace rag_core
