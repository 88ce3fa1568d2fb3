#pragma once

#include "rag_core/splitters/text_splitter.hpp"

namespace rag_core {

// Splits on a single separator, then merges the pieces back up to chunk_size.
class CharacterTextSplitter : public ChunkingTextSplitter {
 public:
  CharacterTextSplitter(size_t chunk_size, size_t chunk_overlap, std::string separator = "\n\n");

  std::vector<std::string> split_text(const std::string &text) const override;

 private:
  std::string separator_;
};

}  // namespace rag_core
