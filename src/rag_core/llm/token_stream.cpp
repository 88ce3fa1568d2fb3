#include "rag_core/llm/token_stream.hpp"

namespace rag_core {

TokenStream::TokenStream(size_t capacity) : capacity_(capacity) {}

bool TokenStream::push(std::string token) {
  std::unique_lock<std::mutex> lock(mtx_);
  not_full_cv_.wait(lock, [this] {
    return cancelled_ || closed_ || capacity_ == 0 || queue_.size() < capacity_;
  });
  if (cancelled_ || closed_) {
    return false;
  }
  queue_.push_back(std::move(token));
  not_empty_cv_.notify_one();
  return true;
}

void TokenStream::close() {
  std::lock_guard<std::mutex> lock(mtx_);
  closed_ = true;
  not_empty_cv_.notify_all();
  not_full_cv_.notify_all();
}

std::optional<std::string> TokenStream::next() {
  std::unique_lock<std::mutex> lock(mtx_);
  not_empty_cv_.wait(lock, [this] { return cancelled_ || closed_ || !queue_.empty(); });
  if (cancelled_ || queue_.empty()) {
    return std::nullopt;
  }
  std::string token = std::move(queue_.front());
  queue_.pop_front();
  not_full_cv_.notify_one();
  return token;
}

void TokenStream::cancel() {
  std::lock_guard<std::mutex> lock(mtx_);
  cancelled_ = true;
  queue_.clear();
  not_empty_cv_.notify_all();
  not_full_cv_.notify_all();
}

bool TokenStream::is_cancelled() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return cancelled_;
}

bool TokenStream::is_closed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return closed_;
}

}  // namespace rag_core
