#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace rag_core {

class TextSplitter {
 public:
  virtual ~TextSplitter() = default;

  // Ordered chunks. Boundary handling is up to the implementation.
  virtual std::vector<std::string> split_text(const std::string &text) const = 0;
};

using TextSplitterPtr = std::shared_ptr<TextSplitter>;

/**
 * @brief Shared size/overlap machinery for the character based splitters.
 *
 * Lengths are counted in Unicode code points, so a chunk never ends in the middle of a
 * multi-byte UTF-8 sequence. Input that is not valid UTF-8 is rejected with
 * InvalidArgumentError.
 */
class ChunkingTextSplitter : public TextSplitter {
 public:
  ChunkingTextSplitter(size_t chunk_size, size_t chunk_overlap);

  size_t chunk_size() const {
    return chunk_size_;
  }
  size_t chunk_overlap() const {
    return chunk_overlap_;
  }

 protected:
  // Greedily packs splits into chunks of at most chunk_size, carrying chunk_overlap
  // worth of trailing splits into the next chunk.
  std::vector<std::string> merge_splits(const std::vector<std::string> &splits,
                                        const std::string &separator) const;

  static size_t text_length(const std::string &text);

  // With keep_separator the separator stays at the start of the piece that follows it.
  // An empty separator splits into single code points. Empty pieces are dropped.
  static std::vector<std::string> split_on_separator(const std::string &text,
                                                     const std::string &separator,
                                                     bool keep_separator);

  static std::string trim(const std::string &text);

  size_t chunk_size_;
  size_t chunk_overlap_;
};

}  // namespace rag_core
