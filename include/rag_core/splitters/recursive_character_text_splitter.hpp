#pragma once

#include "rag_core/splitters/text_splitter.hpp"

namespace rag_core {

/**
 * @brief Boundary-aware splitter.
 *
 * Tries each separator in order and uses the first one present in the text. Pieces that are
 * still longer than chunk_size are split again with the remaining separators. The last
 * separator is "" which falls back to code point granularity.
 */
class RecursiveCharacterTextSplitter : public ChunkingTextSplitter {
 public:
  static constexpr size_t DEFAULT_CHUNK_SIZE = 500;
  static constexpr size_t DEFAULT_CHUNK_OVERLAP = 100;

  RecursiveCharacterTextSplitter(size_t chunk_size = DEFAULT_CHUNK_SIZE,
                                 size_t chunk_overlap = DEFAULT_CHUNK_OVERLAP,
                                 std::vector<std::string> separators = default_separators());

  std::vector<std::string> split_text(const std::string &text) const override;

  const std::vector<std::string> &separators() const {
    return separators_;
  }

  static std::vector<std::string> default_separators();

 private:
  std::vector<std::string> split_recursive(const std::string &text,
                                           const std::vector<std::string> &separators) const;

  std::vector<std::string> separators_;
};

// Prefers heading, code fence and horizontal rule boundaries.
class MarkdownTextSplitter : public RecursiveCharacterTextSplitter {
 public:
  MarkdownTextSplitter(size_t chunk_size = DEFAULT_CHUNK_SIZE,
                       size_t chunk_overlap = DEFAULT_CHUNK_OVERLAP);

  static std::vector<std::string> markdown_separators();
};

// Prefers sectioning commands, then list/quote/verbatim environments, then math.
class LatexTextSplitter : public RecursiveCharacterTextSplitter {
 public:
  LatexTextSplitter(size_t chunk_size = DEFAULT_CHUNK_SIZE,
                    size_t chunk_overlap = DEFAULT_CHUNK_OVERLAP);

  static std::vector<std::string> latex_separators();
};

}  // namespace rag_core
