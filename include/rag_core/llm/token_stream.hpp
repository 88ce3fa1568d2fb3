#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace rag_core {

/**
 * @class TokenStream
 * @brief Single-producer, single-consumer ordered channel for generated tokens.
 *
 * The producer (the generation thread) calls push() for every token and close() once the
 * model is done. The consumer pulls with next() until it returns std::nullopt.
 *
 * A non-zero capacity bounds the queue: push() blocks while the consumer is behind.
 * cancel() is the consumer's way to stop the producer: every later push() returns false,
 * which the orchestrator turns into a stop request for the model.
 */
class TokenStream {
 public:
  // capacity == 0 means unbounded
  explicit TokenStream(size_t capacity = 0);

  TokenStream(const TokenStream &) = delete;
  TokenStream &operator=(const TokenStream &) = delete;

  bool push(std::string token);
  void close();

  // Blocks until a token is available. std::nullopt once closed and drained, or cancelled.
  std::optional<std::string> next();

  void cancel();

  bool is_cancelled() const;
  bool is_closed() const;

 private:
  size_t capacity_;
  std::deque<std::string> queue_;
  bool closed_ = false;
  bool cancelled_ = false;
  mutable std::mutex mtx_;
  std::condition_variable not_empty_cv_;
  std::condition_variable not_full_cv_;
};

}  // namespace rag_core
