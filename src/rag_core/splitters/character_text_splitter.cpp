#include "rag_core/splitters/character_text_splitter.hpp"

#include <utf8.h>

#include "rag_core/errors.hpp"

namespace rag_core {

CharacterTextSplitter::CharacterTextSplitter(size_t chunk_size,
                                             size_t chunk_overlap,
                                             std::string separator)
    : ChunkingTextSplitter(chunk_size, chunk_overlap), separator_(std::move(separator)) {}

std::vector<std::string> CharacterTextSplitter::split_text(const std::string &text) const {
  if (!utf8::is_valid(text.begin(), text.end())) {
    throw InvalidArgumentError("Text to split is not valid UTF-8");
  }
  std::vector<std::string> splits = split_on_separator(text, separator_, false);
  return merge_splits(splits, separator_);
}

}  // namespace rag_core
