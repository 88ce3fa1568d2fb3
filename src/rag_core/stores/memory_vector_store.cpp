#include "rag_core/stores/memory_vector_store.hpp"

#include <algorithm>
#include <unordered_set>

#include "rag_core/vector_math.hpp"

namespace rag_core {

MemoryVectorStore::MemoryVectorStore(std::shared_ptr<EmbeddingProvider> embeddings,
                                     std::shared_ptr<UuidGenerator> uuid_generator)
    : VectorStore(std::move(embeddings), std::move(uuid_generator)) {}

void MemoryVectorStore::load() {
  embeddings_->load();
}

void MemoryVectorStore::unload() {
  embeddings_->unload();
}

bool MemoryVectorStore::contains(const std::string &id) const {
  return positions_.find(id) != positions_.end();
}

void MemoryVectorStore::reindex() {
  positions_.clear();
  for (size_t i = 0; i < records_.size(); ++i) {
    positions_[records_[i].id] = i;
  }
}

size_t MemoryVectorStore::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::optional<Record> MemoryVectorStore::get(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return records_[it->second];
}

std::vector<std::string> MemoryVectorStore::add(const AddRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Record> prepared =
      prepare_add(request, [this](const std::string &id) { return contains(id); });

  std::vector<std::string> ids;
  ids.reserve(prepared.size());
  for (auto &record : prepared) {
    ids.push_back(record.id);
    positions_[record.id] = records_.size();
    records_.push_back(std::move(record));
  }
  if (!records_.empty()) {
    establish_dimension(records_.front().embedding.size());
  }
  return ids;
}

void MemoryVectorStore::update(const UpdateRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Record> updated =
      prepare_update(request, [this](const std::string &id) -> std::optional<Record> {
        auto it = positions_.find(id);
        if (it == positions_.end()) {
          return std::nullopt;
        }
        return records_[it->second];
      });

  for (auto &record : updated) {
    const size_t pos = positions_.at(record.id);
    records_[pos] = std::move(record);
    establish_dimension(records_[pos].embedding.size());
  }
}

void MemoryVectorStore::remove(const DeleteRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  validate_delete(request);

  std::unordered_set<std::string> targets;
  if (request.ids) {
    check_ids_exist(*request.ids, [this](const std::string &id) { return contains(id); });
    for (const auto &id : *request.ids) {
      if (!request.predicate || request.predicate(records_[positions_.at(id)])) {
        targets.insert(id);
      }
    }
  } else {
    for (const auto &record : records_) {
      if (request.predicate(record)) {
        targets.insert(record.id);
      }
    }
  }

  if (targets.empty()) {
    return;
  }
  records_.erase(std::remove_if(records_.begin(), records_.end(),
                                [&](const Record &r) { return targets.count(r.id) > 0; }),
                 records_.end());
  reindex();
}

std::vector<std::vector<QueryResult>> MemoryVectorStore::query(const QueryRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  validate_query_arguments(request);
  check_ids_exist(request.ids, [this](const std::string &id) { return contains(id); });

  std::vector<Embedding> queries = prepare_queries(request);

  std::vector<const Record *> pool;
  if (!request.ids.empty()) {
    std::unordered_set<std::string> seen;
    for (const auto &id : request.ids) {
      if (seen.insert(id).second) {
        pool.push_back(&records_[positions_.at(id)]);
      }
    }
  } else {
    for (const auto &record : records_) {
      pool.push_back(&record);
    }
  }

  std::vector<std::vector<QueryResult>> results;
  results.reserve(queries.size());
  for (const auto &q : queries) {
    std::vector<QueryResult> scored;
    // Nothing stored yet means there is nothing to compare against
    if (dimension_) {
      scored.reserve(pool.size());
      for (const Record *record : pool) {
        QueryResult result;
        static_cast<Record &>(result) = *record;
        result.similarity = cosine(q, record->embedding);
        if (!request.predicate || request.predicate(result)) {
          scored.push_back(std::move(result));
        }
      }
      std::stable_sort(scored.begin(), scored.end(),
                       [](const QueryResult &a, const QueryResult &b) {
                         return a.similarity > b.similarity;
                       });
      if (request.n_results && scored.size() > *request.n_results) {
        scored.resize(*request.n_results);
      }
    }
    results.push_back(std::move(scored));
  }
  return results;
}

}  // namespace rag_core
