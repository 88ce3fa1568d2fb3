#pragma once

#include <functional>
#include <string>

#include "rag_core/types/message.hpp"

namespace rag_core {

// Receives each token in production order. Returning false asks the model to stop early.
using TokenSink = std::function<bool(const std::string &)>;

class GenerativeModel {
 public:
  virtual ~GenerativeModel() = default;

  virtual void load() = 0;
  virtual void unload() = 0;

  // Best effort. The generate() call in flight may still emit a few tokens.
  virtual void interrupt() = 0;

  // Streams tokens into on_token and returns the aggregated completion.
  virtual std::string generate(const Messages &messages, const TokenSink &on_token) = 0;
};

}  // namespace rag_core
