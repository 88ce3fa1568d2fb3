#include "rag_core/splitters/recursive_character_text_splitter.hpp"

#include <utf8.h>

#include "rag_core/errors.hpp"

namespace rag_core {

RecursiveCharacterTextSplitter::RecursiveCharacterTextSplitter(size_t chunk_size,
                                                               size_t chunk_overlap,
                                                               std::vector<std::string> separators)
    : ChunkingTextSplitter(chunk_size, chunk_overlap), separators_(std::move(separators)) {
  if (separators_.empty()) {
    throw InvalidArgumentError("RecursiveCharacterTextSplitter needs at least one separator");
  }
}

std::vector<std::string> RecursiveCharacterTextSplitter::default_separators() {
  return {"\n\n", "\n", " ", ""};
}

std::vector<std::string> RecursiveCharacterTextSplitter::split_text(const std::string &text) const {
  if (!utf8::is_valid(text.begin(), text.end())) {
    throw InvalidArgumentError("Text to split is not valid UTF-8");
  }
  return split_recursive(text, separators_);
}

std::vector<std::string> RecursiveCharacterTextSplitter::split_recursive(
    const std::string &text, const std::vector<std::string> &separators) const {
  std::vector<std::string> final_chunks;

  // Pick the first separator that occurs in the text; "" always matches
  std::string separator = separators.back();
  std::vector<std::string> remaining_separators;
  for (size_t i = 0; i < separators.size(); ++i) {
    const std::string &candidate = separators[i];
    if (candidate.empty()) {
      separator = candidate;
      break;
    }
    if (text.find(candidate) != std::string::npos) {
      separator = candidate;
      remaining_separators.assign(separators.begin() + i + 1, separators.end());
      break;
    }
  }

  // Separators are kept at the start of the following piece, so pieces merge with ""
  std::vector<std::string> splits = split_on_separator(text, separator, true);

  std::vector<std::string> good_splits;
  for (const auto &split : splits) {
    if (text_length(split) < chunk_size_) {
      good_splits.push_back(split);
      continue;
    }
    if (!good_splits.empty()) {
      auto merged = merge_splits(good_splits, "");
      final_chunks.insert(final_chunks.end(), merged.begin(), merged.end());
      good_splits.clear();
    }
    if (remaining_separators.empty()) {
      final_chunks.push_back(split);
    } else {
      auto nested = split_recursive(split, remaining_separators);
      final_chunks.insert(final_chunks.end(), nested.begin(), nested.end());
    }
  }
  if (!good_splits.empty()) {
    auto merged = merge_splits(good_splits, "");
    final_chunks.insert(final_chunks.end(), merged.begin(), merged.end());
  }
  return final_chunks;
}

MarkdownTextSplitter::MarkdownTextSplitter(size_t chunk_size, size_t chunk_overlap)
    : RecursiveCharacterTextSplitter(chunk_size, chunk_overlap, markdown_separators()) {}

std::vector<std::string> MarkdownTextSplitter::markdown_separators() {
  return {
      // Headings, level 2 and below
      "\n## ", "\n### ", "\n#### ", "\n##### ", "\n###### ",
      // End of a fenced code block
      "```\n\n",
      // Horizontal rules
      "\n\n***\n\n", "\n\n---\n\n", "\n\n___\n\n",
      "\n\n", "\n", " ", ""};
}

LatexTextSplitter::LatexTextSplitter(size_t chunk_size, size_t chunk_overlap)
    : RecursiveCharacterTextSplitter(chunk_size, chunk_overlap, latex_separators()) {}

std::vector<std::string> LatexTextSplitter::latex_separators() {
  return {"\n\\chapter{", "\n\\section{", "\n\\subsection{", "\n\\subsubsection{",
          "\n\\begin{enumerate}", "\n\\begin{itemize}", "\n\\begin{description}",
          "\n\\begin{list}", "\n\\begin{quote}", "\n\\begin{quotation}", "\n\\begin{verse}",
          "\n\\begin{verbatim}",
          "\n\\begin{align}", "$$", "$",
          "\n\n", "\n", " ", ""};
}

}  // namespace rag_core
