#include "rag_core/llm/ollama_embedding_provider.hpp"

#include "ollama.hpp"

namespace rag_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string &ollama_url,
                                                 const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {}

void OllamaEmbeddingProvider::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

void OllamaEmbeddingProvider::load() {
  if (loaded_) {
    return;
  }
  setup_server_connection();
  loaded_ = true;
}

// Ollama keeps the model resident on its side; there is nothing to release here
void OllamaEmbeddingProvider::unload() {
  loaded_ = false;
}

Embedding OllamaEmbeddingProvider::embed(const std::string &text) {
  if (!loaded_) {
    throw OllamaError("Embedding model " + embedding_model_ + " is not loaded");
  }
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embeddings field");
    }

    // /api/embed answers with a list of vectors, one per input
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      return embeddings[0].get<Embedding>();
    }
    return embeddings.get<Embedding>();

  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

bool OllamaEmbeddingProvider::is_server_available() {
  return ollama::is_running();
}

}  // namespace rag_core
