#include "rag_core/stores/vector_store.hpp"

#include <unordered_set>

#include "rag_core/vector_math.hpp"

namespace rag_core {

VectorStore::VectorStore(std::shared_ptr<EmbeddingProvider> embeddings,
                         std::shared_ptr<UuidGenerator> uuid_generator)
    : embeddings_(std::move(embeddings)), uuid_generator_(std::move(uuid_generator)) {
  if (!embeddings_) {
    throw InvalidArgumentError("VectorStore requires an embedding provider");
  }
  if (!uuid_generator_) {
    uuid_generator_ = std::make_shared<UuidGenerator>();
  }
}

std::optional<size_t> VectorStore::dimension() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dimension_;
}

size_t VectorStore::batch_size(const AddRequest &request) {
  if (!request.ids.empty())
    return request.ids.size();
  if (!request.documents.empty())
    return request.documents.size();
  if (!request.embeddings.empty())
    return request.embeddings.size();
  return request.metadatas.size();
}

void VectorStore::check_batch_length(size_t actual, size_t expected, const std::string &name) {
  if (actual != 0 && actual != expected) {
    throw InvalidArgumentError(name + " length " + std::to_string(actual) +
                               " does not match batch size " + std::to_string(expected));
  }
}

void VectorStore::check_embedding(const Embedding &embedding,
                                  const std::string &context,
                                  std::optional<size_t> expected) const {
  if (embedding.empty()) {
    throw InvalidArgumentError("embedding must be a non-empty vector (" + context + ")");
  }
  if (expected && embedding.size() != *expected) {
    throw DimensionMismatchError("embedding dimension " + std::to_string(embedding.size()) +
                                 " does not match collection dimension " +
                                 std::to_string(*expected) + " (" + context + ")");
  }
  if (is_zero_vector(embedding)) {
    throw InvalidArgumentError("embedding must have non-zero magnitude (" + context + ")");
  }
}

void VectorStore::establish_dimension(size_t dimension) {
  if (!dimension_) {
    dimension_ = dimension;
  }
}

void VectorStore::check_ids_exist(const std::vector<std::string> &ids,
                                  const ExistsFn &exists) const {
  for (const auto &id : ids) {
    if (!exists(id)) {
      throw NotFoundError("id not found: " + id);
    }
  }
}

std::vector<Record> VectorStore::prepare_add(const AddRequest &request, const ExistsFn &exists) {
  const size_t n = batch_size(request);
  check_batch_length(request.ids.size(), n, "ids");
  check_batch_length(request.documents.size(), n, "documents");
  check_batch_length(request.embeddings.size(), n, "embeddings");
  check_batch_length(request.metadatas.size(), n, "metadatas");

  std::vector<Record> records(n);
  for (size_t i = 0; i < n; ++i) {
    Record &record = records[i];
    if (!request.documents.empty())
      record.document = request.documents[i];
    if (!request.embeddings.empty())
      record.embedding = request.embeddings[i];
    if (!request.metadatas.empty())
      record.metadata = request.metadatas[i];

    if (!record.document && record.embedding.empty()) {
      throw InvalidArgumentError("entry " + std::to_string(i) +
                                 " has neither a document nor an embedding");
    }

    if (!request.ids.empty() && !request.ids[i].empty()) {
      record.id = request.ids[i];
    } else {
      record.id = uuid_generator_->generate();
    }
  }

  std::unordered_set<std::string> seen;
  for (const auto &record : records) {
    if (!seen.insert(record.id).second || exists(record.id)) {
      throw DuplicateIdError("id already exists: " + record.id);
    }
  }

  // The first vector of the batch fixes the dimension when the store has none yet
  std::optional<size_t> expected = dimension_;
  for (auto &record : records) {
    if (record.embedding.empty()) {
      record.embedding = embeddings_->embed(*record.document);
    }
    check_embedding(record.embedding, "id: " + record.id, expected);
    if (!expected) {
      expected = record.embedding.size();
    }
  }
  return records;
}

std::vector<Record> VectorStore::prepare_update(const UpdateRequest &request,
                                                const LookupFn &lookup) {
  const size_t n = request.ids.size();
  check_batch_length(request.embeddings.size(), n, "embeddings");
  check_batch_length(request.documents.size(), n, "documents");
  check_batch_length(request.metadatas.size(), n, "metadatas");

  std::vector<Record> records;
  records.reserve(n);
  for (const auto &id : request.ids) {
    std::optional<Record> existing = lookup(id);
    if (!existing) {
      throw NotFoundError("id not found: " + id);
    }
    records.push_back(std::move(*existing));
  }

  std::optional<size_t> expected = dimension_;
  for (size_t i = 0; i < n; ++i) {
    Record &record = records[i];
    const bool has_embedding = !request.embeddings.empty() && !request.embeddings[i].empty();
    const bool has_document = !request.documents.empty() && request.documents[i].has_value();

    if (has_document) {
      record.document = request.documents[i];
    }
    if (has_embedding) {
      record.embedding = request.embeddings[i];
    } else if (has_document) {
      record.embedding = embeddings_->embed(*record.document);
    }
    if (!request.metadatas.empty() && !request.metadatas[i].is_null()) {
      record.metadata = request.metadatas[i];
    }

    if (has_embedding || has_document) {
      check_embedding(record.embedding, "id: " + record.id, expected);
      if (!expected) {
        expected = record.embedding.size();
      }
    }
  }
  return records;
}

void VectorStore::validate_delete(const DeleteRequest &request) {
  if (!request.ids && !request.predicate) {
    throw InvalidArgumentError("remove requires ids, a predicate, or both");
  }
}

void VectorStore::validate_query_arguments(const QueryRequest &request) {
  if (request.query_texts.has_value() == request.query_embeddings.has_value()) {
    throw InvalidArgumentError("Exactly one of query_texts or query_embeddings must be provided");
  }
}

std::vector<Embedding> VectorStore::prepare_queries(const QueryRequest &request) {
  std::vector<Embedding> queries;
  if (request.query_embeddings) {
    queries = *request.query_embeddings;
  } else {
    queries.reserve(request.query_texts->size());
    for (const auto &text : *request.query_texts) {
      queries.push_back(embeddings_->embed(text));
    }
  }

  for (size_t i = 0; i < queries.size(); ++i) {
    check_embedding(queries[i], "query " + std::to_string(i), dimension_);
  }
  return queries;
}

}  // namespace rag_core
