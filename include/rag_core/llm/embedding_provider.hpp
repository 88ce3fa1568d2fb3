#pragma once

#include <string>

#include "rag_core/types/record.hpp"

namespace rag_core {

/**
 * Turns text into a fixed-length vector. load() must be called before embed().
 * Implementations surface their own exception types; the stores never wrap them.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual void load() = 0;
  virtual void unload() = 0;
  virtual Embedding embed(const std::string &text) = 0;
};

}  // namespace rag_core
