#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "rag_core/llm/embedding_provider.hpp"

namespace rag_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaEmbeddingProvider() override = default;

  // Disable copy constructor and assignment
  OllamaEmbeddingProvider(const OllamaEmbeddingProvider &) = delete;
  OllamaEmbeddingProvider &operator=(const OllamaEmbeddingProvider &) = delete;

  void load() override;
  void unload() override;
  Embedding embed(const std::string &text) override;

  bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::atomic<bool> loaded_{false};

  void setup_server_connection();
};

}  // namespace rag_core
