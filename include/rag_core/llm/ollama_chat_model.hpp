#pragma once

#include <atomic>
#include <string>

#include "rag_core/llm/generative_model.hpp"
#include "rag_core/llm/ollama_embedding_provider.hpp"

namespace rag_core {

/**
 * Chat completion against a local Ollama server.
 *
 * interrupt() only raises a flag. The streaming callback checks it on every token and
 * returns false, which makes ollama-hpp close the stream. The flag is consumed when a
 * generate() call ends, so a stop raised just before generate() still applies to it.
 */
class OllamaChatModel : public GenerativeModel {
 public:
  OllamaChatModel(const std::string &ollama_url, const std::string &chat_model);
  ~OllamaChatModel() override = default;

  OllamaChatModel(const OllamaChatModel &) = delete;
  OllamaChatModel &operator=(const OllamaChatModel &) = delete;

  void load() override;
  void unload() override;
  void interrupt() override;
  std::string generate(const Messages &messages, const TokenSink &on_token) override;

 private:
  std::string ollama_url_;
  std::string chat_model_;
  std::atomic<bool> loaded_{false};
  std::atomic<bool> interrupt_requested_{false};
};

}  // namespace rag_core
