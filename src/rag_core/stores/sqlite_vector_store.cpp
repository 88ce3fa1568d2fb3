#include "rag_core/stores/sqlite_vector_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/IndexScalarQuantizer.h>
#include <faiss/impl/FaissException.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/transaction.hpp"
#include "rag_core/vector_math.hpp"

namespace rag_core {

namespace {

// Text the dimension probe embeds on load
const char *const DIMENSION_PROBE_TEXT = "dummy";

std::string rowids_to_comma_string(const std::vector<int64_t> &rowids) {
  std::stringstream ss;
  for (size_t i = 0; i < rowids.size(); ++i) {
    ss << rowids[i];
    if (i < rowids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

faiss::ScalarQuantizer::QuantizerType quantizer_type(IndexCompression compression) {
  return compression == IndexCompression::Float16 ? faiss::ScalarQuantizer::QT_fp16
                                                  : faiss::ScalarQuantizer::QT_8bit;
}

}  // namespace

std::string to_string(IndexKind kind) {
  switch (kind) {
    case IndexKind::Flat:
      return "flat";
    case IndexKind::HNSW:
      return "hnsw";
    default:
      return "unknown";
  }
}

IndexKind index_kind_from_string(const std::string &str) {
  if (str == "flat")
    return IndexKind::Flat;
  if (str == "hnsw")
    return IndexKind::HNSW;
  throw std::invalid_argument("Unknown IndexKind: " + str);
}

std::string to_string(IndexCompression compression) {
  switch (compression) {
    case IndexCompression::None:
      return "none";
    case IndexCompression::Float16:
      return "float16";
    case IndexCompression::Int8:
      return "int8";
    default:
      return "unknown";
  }
}

IndexCompression index_compression_from_string(const std::string &str) {
  if (str == "none")
    return IndexCompression::None;
  if (str == "float16")
    return IndexCompression::Float16;
  if (str == "int8")
    return IndexCompression::Int8;
  throw std::invalid_argument("Unknown IndexCompression: " + str);
}

SqliteVectorStore::SqliteVectorStore(std::shared_ptr<EmbeddingProvider> embeddings,
                                     SqliteVectorStoreOptions options,
                                     std::shared_ptr<UuidGenerator> uuid_generator)
    : VectorStore(std::move(embeddings), std::move(uuid_generator)), options_(std::move(options)) {
  if (options_.db_path.empty()) {
    throw InvalidArgumentError("SqliteVectorStore requires a database path");
  }
  if (options_.index.max_neighbors <= 0 || options_.index.ef_construction <= 0 ||
      options_.index.ef_search <= 0) {
    throw InvalidArgumentError("Index parameters must be positive");
  }
}

SqliteVectorStore::~SqliteVectorStore() {
  db_manager_.shutdown();
}

void SqliteVectorStore::ensure_loaded() const {
  if (!loaded_) {
    throw VectorStoreError("Vector store at " + options_.db_path.string() + " is not loaded");
  }
}

void SqliteVectorStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    db_manager_.initialize(options_.db_path, options_.db_key, options_.pool_size);

    embeddings_->load();
    const size_t probed = embeddings_->embed(DIMENSION_PROBE_TEXT).size();
    if (probed == 0) {
      throw InvalidArgumentError("Embedding provider returned an empty vector for the probe");
    }

    std::vector<int64_t> stored_sizes;
    {
      PooledConnection conn(db_manager_);
      *conn << "SELECT DISTINCT length(embedding) FROM vectors" >>
          [&](int64_t bytes) { stored_sizes.push_back(bytes); };
    }
    for (int64_t bytes : stored_sizes) {
      const size_t stored_dim = static_cast<size_t>(bytes) / sizeof(float);
      if (stored_dim != probed) {
        throw DimensionMismatchError("embedding dimension " + std::to_string(probed) +
                                     " of the provider does not match stored dimension " +
                                     std::to_string(stored_dim) + " in " +
                                     options_.db_path.string());
      }
    }

    dimension_ = probed;
    {
      PooledConnection conn(db_manager_);
      rebuild_index(*conn);
    }
    loaded_ = true;
    std::cout << "Loaded vector store " << options_.db_path.string() << " (dimension " << probed
              << ", " << index_->ntotal << " vectors, " << to_string(options_.index.kind)
              << " index)" << std::endl;
  } catch (const sqlite::sqlite_exception &e) {
    loaded_ = false;
    throw to_vector_store_error("load", e);
  } catch (const faiss::FaissException &e) {
    loaded_ = false;
    throw VectorStoreError(std::string("load failed building the index: ") + e.what());
  }
}

void SqliteVectorStore::unload() {
  std::lock_guard<std::mutex> lock(mutex_);
  embeddings_->unload();
  index_.reset();
  index_dirty_ = true;
  db_manager_.shutdown();
  loaded_ = false;
}

void SqliteVectorStore::delete_vector_store() {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded();
  try {
    PooledConnection conn(db_manager_);
    *conn << "DROP TABLE IF EXISTS vectors";
  } catch (const sqlite::sqlite_exception &e) {
    throw to_vector_store_error("delete_vector_store", e);
  }
  index_.reset();
  index_dirty_ = true;
  dimension_.reset();
  db_manager_.shutdown();
  loaded_ = false;
}

size_t SqliteVectorStore::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded();
  try {
    PooledConnection conn(db_manager_);
    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM vectors" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw to_vector_store_error("size", e);
  }
}

std::optional<Record> SqliteVectorStore::get(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded();
  try {
    PooledConnection conn(db_manager_);
    auto row = fetch_row(*conn, id);
    if (!row) {
      return std::nullopt;
    }
    return std::move(row->record);
  } catch (const sqlite::sqlite_exception &e) {
    throw to_vector_store_error("get", e);
  }
}

std::vector<std::string> SqliteVectorStore::add(const AddRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded();
  try {
    PooledConnection conn(db_manager_);
    std::vector<Record> prepared = prepare_add(
        request, [this, &conn](const std::string &id) { return row_exists(*conn, id); });

    std::vector<std::string> ids;
    ids.reserve(prepared.size());

    WriteTransaction tx(*conn, "add");
    for (const auto &record : prepared) {
      *conn << "INSERT INTO vectors (id, document, embedding, metadata) VALUES (?, ?, ?, ?)"
            << record.id << record.document << embedding_to_blob(record.embedding)
            << metadata_to_text(record.metadata);
      ids.push_back(record.id);
    }
    tx.commit();

    if (!prepared.empty()) {
      index_dirty_ = true;
    }
    return ids;
  } catch (const sqlite::sqlite_exception &e) {
    throw to_vector_store_error("add", e);
  }
}

void SqliteVectorStore::update(const UpdateRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded();
  try {
    PooledConnection conn(db_manager_);
    std::vector<Record> updated =
        prepare_update(request, [this, &conn](const std::string &id) -> std::optional<Record> {
          auto row = fetch_row(*conn, id);
          if (!row) {
            return std::nullopt;
          }
          return std::move(row->record);
        });

    WriteTransaction tx(*conn, "update");
    for (const auto &record : updated) {
      *conn << "UPDATE vectors SET document = ?, embedding = ?, metadata = ? WHERE id = ?"
            << record.document << embedding_to_blob(record.embedding)
            << metadata_to_text(record.metadata) << record.id;
    }
    tx.commit();

    if (!updated.empty()) {
      index_dirty_ = true;
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw to_vector_store_error("update", e);
  }
}

void SqliteVectorStore::remove(const DeleteRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded();
  validate_delete(request);
  try {
    PooledConnection conn(db_manager_);

    std::vector<std::string> targets;
    if (request.ids) {
      check_ids_exist(*request.ids,
                      [this, &conn](const std::string &id) { return row_exists(*conn, id); });
      std::unordered_set<std::string> seen;
      for (const auto &id : *request.ids) {
        if (!seen.insert(id).second) {
          continue;
        }
        if (request.predicate) {
          auto row = fetch_row(*conn, id);
          if (!row || !request.predicate(row->record)) {
            continue;
          }
        }
        targets.push_back(id);
      }
    } else {
      for (const auto &row : fetch_all_rows(*conn)) {
        if (request.predicate(row.record)) {
          targets.push_back(row.record.id);
        }
      }
    }

    if (targets.empty()) {
      return;
    }

    WriteTransaction tx(*conn, "remove");
    for (const auto &id : targets) {
      *conn << "DELETE FROM vectors WHERE id = ?" << id;
    }
    tx.commit();
    index_dirty_ = true;
  } catch (const sqlite::sqlite_exception &e) {
    throw to_vector_store_error("remove", e);
  }
}

std::vector<std::vector<QueryResult>> SqliteVectorStore::query(const QueryRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded();
  validate_query_arguments(request);
  try {
    PooledConnection conn(db_manager_);
    check_ids_exist(request.ids,
                    [this, &conn](const std::string &id) { return row_exists(*conn, id); });

    std::vector<Embedding> queries = prepare_queries(request);

    // Restricted searches use an exact temporary index over just those rows
    std::unique_ptr<faiss::IndexIDMap> restricted;
    if (!request.ids.empty()) {
      std::vector<StoredRow> rows;
      std::unordered_set<std::string> seen;
      for (const auto &id : request.ids) {
        if (seen.insert(id).second) {
          auto row = fetch_row(*conn, id);
          if (row) {
            rows.push_back(std::move(*row));
          }
        }
      }
      restricted = build_index(rows, /*exact*/ true);
    } else if (index_dirty_ || !index_) {
      rebuild_index(*conn);
    }

    faiss::IndexIDMap &index = restricted ? *restricted : *index_;

    std::vector<std::vector<QueryResult>> results;
    results.reserve(queries.size());
    for (const auto &q : queries) {
      results.push_back(rank(index, q, request, *conn));
    }
    return results;
  } catch (const sqlite::sqlite_exception &e) {
    throw to_vector_store_error("query", e);
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError(std::string("query failed in the similarity index: ") + e.what());
  }
}

std::vector<QueryResult> SqliteVectorStore::rank(faiss::IndexIDMap &index,
                                                 const Embedding &query,
                                                 const QueryRequest &request,
                                                 sqlite::database &db) const {
  const faiss::idx_t total = index.ntotal;
  if (total == 0) {
    return {};
  }

  // A predicate may reject any candidate, so it needs the full ranking
  faiss::idx_t k = total;
  if (request.n_results && !request.predicate) {
    k = std::min<faiss::idx_t>(total, static_cast<faiss::idx_t>(*request.n_results));
  }
  if (k == 0) {
    return {};
  }

  Embedding normalized = query;
  faiss::fvec_renorm_L2(normalized.size(), 1, normalized.data());

  std::vector<float> distances(k);
  std::vector<faiss::idx_t> labels(k);
  index.search(1, normalized.data(), k, distances.data(), labels.data());

  std::vector<int64_t> rowids;
  rowids.reserve(k);
  for (faiss::idx_t label : labels) {
    if (label != -1) {
      rowids.push_back(static_cast<int64_t>(label));
    }
  }

  std::unordered_map<int64_t, StoredRow> by_rowid;
  for (auto &row : fetch_rows_by_rowid(db, rowids)) {
    by_rowid.emplace(row.rowid, std::move(row));
  }

  std::vector<QueryResult> scored;
  scored.reserve(rowids.size());
  for (int64_t rowid : rowids) {
    auto it = by_rowid.find(rowid);
    if (it == by_rowid.end()) {
      std::cerr << "Warning: Faiss returned rowid " << rowid
                << " but no corresponding row found in DB." << std::endl;
      continue;
    }
    QueryResult result;
    static_cast<Record &>(result) = it->second.record;
    result.similarity = cosine(query, result.embedding);
    if (!request.predicate || request.predicate(result)) {
      scored.push_back(std::move(result));
    }
  }

  std::stable_sort(scored.begin(), scored.end(), [](const QueryResult &a, const QueryResult &b) {
    return a.similarity > b.similarity;
  });
  if (request.n_results && scored.size() > *request.n_results) {
    scored.resize(*request.n_results);
  }
  return scored;
}

void SqliteVectorStore::rebuild_index(sqlite::database &db) {
  std::vector<StoredRow> rows = fetch_all_rows(db);
  index_ = build_index(rows, /*exact*/ false);
  index_dirty_ = false;
}

std::unique_ptr<faiss::IndexIDMap> SqliteVectorStore::create_index(size_t dimension,
                                                                   bool exact) const {
  const int d = static_cast<int>(dimension);
  const IndexParams &params = options_.index;
  faiss::Index *base = nullptr;

  if (exact) {
    base = new faiss::IndexFlatIP(d);
  } else if (params.kind == IndexKind::Flat) {
    if (params.compression == IndexCompression::None) {
      base = new faiss::IndexFlatIP(d);
    } else {
      base = new faiss::IndexScalarQuantizer(d, quantizer_type(params.compression),
                                             faiss::METRIC_INNER_PRODUCT);
    }
  } else {
    faiss::IndexHNSW *hnsw = nullptr;
    if (params.compression == IndexCompression::None) {
      hnsw = new faiss::IndexHNSWFlat(d, params.max_neighbors, faiss::METRIC_INNER_PRODUCT);
    } else {
      hnsw = new faiss::IndexHNSWSQ(d, quantizer_type(params.compression), params.max_neighbors,
                                    faiss::METRIC_INNER_PRODUCT);
    }
    hnsw->hnsw.efConstruction = params.ef_construction;
    hnsw->hnsw.efSearch = params.ef_search;
    base = hnsw;
  }

  // Wrap with IDMap to enable add_with_ids; the map owns the base index
  auto index = std::make_unique<faiss::IndexIDMap>(base);
  index->own_fields = true;
  return index;
}

std::unique_ptr<faiss::IndexIDMap> SqliteVectorStore::build_index(
    const std::vector<StoredRow> &rows, bool exact) const {
  const size_t dimension = *dimension_;
  auto index = create_index(dimension, exact);

  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;
  faiss_ids.reserve(rows.size());
  all_vectors_flat.reserve(rows.size() * dimension);

  for (const auto &row : rows) {
    if (row.record.embedding.size() != dimension) {
      std::cerr << "Warning: Skipping id " << row.record.id
                << " during index rebuild due to mismatched vector dimension. Expected "
                << dimension << ", got " << row.record.embedding.size() << "." << std::endl;
      continue;
    }
    faiss_ids.push_back(static_cast<faiss::idx_t>(row.rowid));
    all_vectors_flat.insert(all_vectors_flat.end(), row.record.embedding.begin(),
                            row.record.embedding.end());
  }

  const faiss::idx_t n = static_cast<faiss::idx_t>(faiss_ids.size());
  if (n == 0) {
    return index;
  }

  faiss::fvec_renorm_L2(dimension, n, all_vectors_flat.data());
  if (!index->is_trained) {
    index->train(n, all_vectors_flat.data());
  }
  index->add_with_ids(n, all_vectors_flat.data(), faiss_ids.data());
  return index;
}

bool SqliteVectorStore::row_exists(sqlite::database &db, const std::string &id) const {
  bool exists = false;
  db << "SELECT 1 FROM vectors WHERE id = ? LIMIT 1" << id >> [&](int /*dummy*/) {
    exists = true;
  };
  return exists;
}

std::optional<SqliteVectorStore::StoredRow> SqliteVectorStore::fetch_row(
    sqlite::database &db, const std::string &id) const {
  std::optional<StoredRow> result;
  db << "SELECT rowid, id, document, embedding, metadata FROM vectors WHERE id = ?" << id >>
      [&](int64_t rowid, std::string row_id, std::optional<std::string> document,
          std::vector<char> embedding_blob, std::optional<std::string> metadata) {
        result = to_row(rowid, std::move(row_id), std::move(document), embedding_blob,
                        std::move(metadata));
      };
  return result;
}

std::vector<SqliteVectorStore::StoredRow> SqliteVectorStore::fetch_rows_by_rowid(
    sqlite::database &db, const std::vector<int64_t> &rowids) const {
  std::vector<StoredRow> rows;
  if (rowids.empty()) {
    return rows;
  }
  db << "SELECT rowid, id, document, embedding, metadata FROM vectors WHERE rowid IN (" +
            rowids_to_comma_string(rowids) + ")" >>
      [&](int64_t rowid, std::string id, std::optional<std::string> document,
          std::vector<char> embedding_blob, std::optional<std::string> metadata) {
        rows.push_back(to_row(rowid, std::move(id), std::move(document), embedding_blob,
                              std::move(metadata)));
      };
  return rows;
}

std::vector<SqliteVectorStore::StoredRow> SqliteVectorStore::fetch_all_rows(
    sqlite::database &db) const {
  std::vector<StoredRow> rows;
  db << "SELECT rowid, id, document, embedding, metadata FROM vectors ORDER BY rowid" >>
      [&](int64_t rowid, std::string id, std::optional<std::string> document,
          std::vector<char> embedding_blob, std::optional<std::string> metadata) {
        rows.push_back(to_row(rowid, std::move(id), std::move(document), embedding_blob,
                              std::move(metadata)));
      };
  return rows;
}

SqliteVectorStore::StoredRow SqliteVectorStore::to_row(int64_t rowid,
                                                       std::string id,
                                                       std::optional<std::string> document,
                                                       const std::vector<char> &embedding_blob,
                                                       std::optional<std::string> metadata) {
  StoredRow row;
  row.rowid = rowid;
  row.record.id = std::move(id);
  row.record.document = std::move(document);
  row.record.embedding = blob_to_embedding(embedding_blob);
  if (metadata) {
    try {
      row.record.metadata = nlohmann::json::parse(*metadata);
    } catch (const nlohmann::json::parse_error &e) {
      throw VectorStoreError("Stored metadata for id " + row.record.id +
                             " is not valid JSON: " + e.what());
    }
  }
  return row;
}

std::vector<char> SqliteVectorStore::embedding_to_blob(const Embedding &embedding) {
  std::vector<char> blob(embedding.size() * sizeof(float));
  std::memcpy(blob.data(), embedding.data(), blob.size());
  return blob;
}

Embedding SqliteVectorStore::blob_to_embedding(const std::vector<char> &blob) {
  Embedding embedding(blob.size() / sizeof(float));
  std::memcpy(embedding.data(), blob.data(), embedding.size() * sizeof(float));
  return embedding;
}

std::optional<std::string> SqliteVectorStore::metadata_to_text(const Metadata &metadata) {
  if (metadata.is_null()) {
    return std::nullopt;
  }
  return metadata.dump();
}

}  // namespace rag_core
