#include "rag_core/splitters/text_splitter.hpp"

#include <utf8.h>

#include <deque>
#include <iostream>

#include "rag_core/errors.hpp"

namespace rag_core {

ChunkingTextSplitter::ChunkingTextSplitter(size_t chunk_size, size_t chunk_overlap)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap) {
  if (chunk_size_ == 0) {
    throw InvalidArgumentError("chunk_size must be greater than 0");
  }
  if (chunk_overlap_ >= chunk_size_) {
    throw InvalidArgumentError("chunk_overlap (" + std::to_string(chunk_overlap_) +
                               ") must be smaller than chunk_size (" +
                               std::to_string(chunk_size_) + ")");
  }
}

size_t ChunkingTextSplitter::text_length(const std::string &text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string ChunkingTextSplitter::trim(const std::string &text) {
  const char *whitespace = " \t\n\r\f\v";
  const size_t start = text.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  const size_t end = text.find_last_not_of(whitespace);
  return text.substr(start, end - start + 1);
}

std::vector<std::string> ChunkingTextSplitter::split_on_separator(const std::string &text,
                                                                  const std::string &separator,
                                                                  bool keep_separator) {
  std::vector<std::string> splits;

  if (separator.empty()) {
    auto it = text.begin();
    while (it != text.end()) {
      auto start = it;
      utf8::next(it, text.end());
      splits.emplace_back(start, it);
    }
    return splits;
  }

  size_t piece_start = 0;
  if (keep_separator) {
    // Every occurrence opens a new piece that begins with the separator itself
    size_t pos = text.find(separator, 1);
    while (pos != std::string::npos) {
      splits.push_back(text.substr(piece_start, pos - piece_start));
      piece_start = pos;
      pos = text.find(separator, pos + 1);
    }
  } else {
    size_t pos = text.find(separator);
    while (pos != std::string::npos) {
      splits.push_back(text.substr(piece_start, pos - piece_start));
      piece_start = pos + separator.size();
      pos = text.find(separator, piece_start);
    }
  }
  splits.push_back(text.substr(piece_start));

  std::vector<std::string> non_empty;
  non_empty.reserve(splits.size());
  for (auto &split : splits) {
    if (!split.empty()) {
      non_empty.push_back(std::move(split));
    }
  }
  return non_empty;
}

std::vector<std::string> ChunkingTextSplitter::merge_splits(const std::vector<std::string> &splits,
                                                            const std::string &separator) const {
  const size_t separator_len = text_length(separator);
  std::vector<std::string> chunks;
  std::deque<std::string> current;
  size_t total = 0;

  auto join_current = [&]() {
    std::string joined;
    for (size_t i = 0; i < current.size(); ++i) {
      if (i > 0)
        joined += separator;
      joined += current[i];
    }
    joined = trim(joined);
    if (!joined.empty()) {
      chunks.push_back(std::move(joined));
    }
  };

  for (const auto &split : splits) {
    const size_t len = text_length(split);
    const size_t joining_len = current.empty() ? 0 : separator_len;

    if (total + len + joining_len > chunk_size_) {
      if (total > chunk_size_) {
        std::cerr << "Warning: created a chunk of size " << total
                  << ", which is longer than the specified " << chunk_size_ << std::endl;
      }
      if (!current.empty()) {
        join_current();
        // Drop leading pieces until what is left fits as overlap for the next chunk
        while (total > chunk_overlap_ ||
               (total > 0 && total + len + (current.empty() ? 0 : separator_len) > chunk_size_)) {
          total -= text_length(current.front()) + (current.size() > 1 ? separator_len : 0);
          current.pop_front();
        }
      }
    }
    current.push_back(split);
    total += len + (current.size() > 1 ? separator_len : 0);
  }
  join_current();
  return chunks;
}

}  // namespace rag_core
