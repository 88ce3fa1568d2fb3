#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/errors.hpp"
#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/types/record.hpp"
#include "rag_core/uuid_generator.hpp"

namespace rag_core {

/**
 * @class VectorStore
 * @brief Id-keyed collection of (document, embedding, metadata) with cosine ranking.
 *
 * Every batch call validates the whole batch before anything is written, so a rejected
 * call leaves the store as it was. All records share one embedding dimension, fixed by the
 * first successful write (or by the load probe of a persisted store).
 *
 * Implementations serialize their public operations on mutex_.
 */
class VectorStore {
 public:
  explicit VectorStore(std::shared_ptr<EmbeddingProvider> embeddings,
                       std::shared_ptr<UuidGenerator> uuid_generator = nullptr);
  virtual ~VectorStore() = default;

  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;

  virtual void load() = 0;
  virtual void unload() = 0;

  // Returns the assigned ids, aligned with the request entries.
  virtual std::vector<std::string> add(const AddRequest &request) = 0;
  virtual void update(const UpdateRequest &request) = 0;
  virtual void remove(const DeleteRequest &request) = 0;

  // One ranked list per query, in query order.
  virtual std::vector<std::vector<QueryResult>> query(const QueryRequest &request) = 0;

  virtual size_t size() = 0;

  std::optional<size_t> dimension() const;

 protected:
  using ExistsFn = std::function<bool(const std::string &id)>;
  using LookupFn = std::function<std::optional<Record>(const std::string &id)>;

  // Assigns ids, rejects duplicates, computes missing embeddings and checks dimensions.
  // Nothing is stored; the caller writes the returned records and then calls
  // establish_dimension().
  std::vector<Record> prepare_add(const AddRequest &request, const ExistsFn &exists);

  // Returns the full replacement record for each id. Throws NotFoundError if any id is
  // missing.
  std::vector<Record> prepare_update(const UpdateRequest &request, const LookupFn &lookup);

  static void validate_delete(const DeleteRequest &request);

  static void validate_query_arguments(const QueryRequest &request);

  // Embeds query_texts when needed and checks every query vector.
  std::vector<Embedding> prepare_queries(const QueryRequest &request);

  void check_ids_exist(const std::vector<std::string> &ids, const ExistsFn &exists) const;

  // Throws unless the vector is non-empty, non-zero and matches expected (or dimension_).
  void check_embedding(const Embedding &embedding,
                       const std::string &context,
                       std::optional<size_t> expected) const;

  void establish_dimension(size_t dimension);

  std::shared_ptr<EmbeddingProvider> embeddings_;
  std::shared_ptr<UuidGenerator> uuid_generator_;
  std::optional<size_t> dimension_;
  mutable std::mutex mutex_;

 private:
  static size_t batch_size(const AddRequest &request);
  static void check_batch_length(size_t actual, size_t expected, const std::string &name);
};

using VectorStorePtr = std::shared_ptr<VectorStore>;

}  // namespace rag_core
