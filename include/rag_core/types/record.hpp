#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rag_core {

using Embedding = std::vector<float>;

// Opaque to the store. A null value means "no metadata".
using Metadata = nlohmann::json;

struct Record {
  std::string id;
  std::optional<std::string> document;
  Embedding embedding;
  Metadata metadata;
};

struct QueryResult : public Record {
  float similarity = 0.0f;
};

using RecordPredicate = std::function<bool(const Record &)>;
using ResultPredicate = std::function<bool(const QueryResult &)>;

/*
Batch arrays follow one convention: an empty array means the caller did not supply it.
Inside a supplied array an empty id or empty embedding, a std::nullopt document, or a null
metadata means "not supplied for this entry".
*/
struct AddRequest {
  std::vector<std::string> ids;
  std::vector<std::optional<std::string>> documents;
  std::vector<Embedding> embeddings;
  std::vector<Metadata> metadatas;
};

struct UpdateRequest {
  std::vector<std::string> ids;
  std::vector<Embedding> embeddings;
  std::vector<std::optional<std::string>> documents;
  std::vector<Metadata> metadatas;
};

struct DeleteRequest {
  std::optional<std::vector<std::string>> ids;
  RecordPredicate predicate;
};

struct QueryRequest {
  std::optional<std::vector<std::string>> query_texts;
  std::optional<std::vector<Embedding>> query_embeddings;
  // Absent means every match is returned.
  std::optional<size_t> n_results;
  // Empty means the whole collection is searched.
  std::vector<std::string> ids;
  ResultPredicate predicate;
};

}  // namespace rag_core
