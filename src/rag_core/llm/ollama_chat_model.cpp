#include "rag_core/llm/ollama_chat_model.hpp"

#include <iostream>

#include "ollama.hpp"

namespace rag_core {

OllamaChatModel::OllamaChatModel(const std::string &ollama_url, const std::string &chat_model)
    : ollama_url_(ollama_url), chat_model_(chat_model) {}

void OllamaChatModel::load() {
  if (loaded_) {
    return;
  }
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
  try {
    if (!ollama::load_model(chat_model_)) {
      throw OllamaError("Ollama failed to load model " + chat_model_);
    }
  } catch (const ollama::exception &e) {
    throw OllamaError("Loading model " + chat_model_ + " failed: " + std::string(e.what()));
  }
  loaded_ = true;
}

void OllamaChatModel::unload() {
  loaded_ = false;
}

void OllamaChatModel::interrupt() {
  interrupt_requested_ = true;
}

std::string OllamaChatModel::generate(const Messages &messages, const TokenSink &on_token) {
  if (!loaded_) {
    throw OllamaError("Chat model " + chat_model_ + " is not loaded");
  }
  // A stop requested before the first token ends the call without contacting the server
  if (interrupt_requested_.exchange(false)) {
    std::cout << "Generation interrupted before the first token" << std::endl;
    return "";
  }

  ollama::messages ollama_messages;
  for (const auto &message : messages) {
    ollama_messages.push_back(ollama::message(to_string(message.role), message.content));
  }

  std::string aggregated;
  auto on_receive = [&](const ollama::response &response) -> bool {
    std::string token = response.as_simple_string();
    aggregated += token;
    bool keep_going = on_token ? on_token(token) : true;
    return keep_going && !interrupt_requested_;
  };

  try {
    ollama::chat(chat_model_, ollama_messages, on_receive);
  } catch (const ollama::exception &e) {
    interrupt_requested_ = false;
    throw OllamaError("Chat generation failed: " + std::string(e.what()));
  }

  if (interrupt_requested_.exchange(false)) {
    std::cout << "Generation interrupted after " << aggregated.size() << " characters" << std::endl;
  }
  return aggregated;
}

}  // namespace rag_core
