#pragma once

#include <exception>
#include <string>

namespace rag_core {

enum class RagErrorKind {
  DimensionMismatch,
  DuplicateId,
  NotFound,
  InvalidArgument,
  ShapeMismatch,
  EmptyInput,
  MissingContent,
  Busy
};

inline std::string to_string(RagErrorKind kind) {
  switch (kind) {
    case RagErrorKind::DimensionMismatch:
      return "DimensionMismatch";
    case RagErrorKind::DuplicateId:
      return "DuplicateId";
    case RagErrorKind::NotFound:
      return "NotFound";
    case RagErrorKind::InvalidArgument:
      return "InvalidArgument";
    case RagErrorKind::ShapeMismatch:
      return "ShapeMismatch";
    case RagErrorKind::EmptyInput:
      return "EmptyInput";
    case RagErrorKind::MissingContent:
      return "MissingContent";
    case RagErrorKind::Busy:
      return "Busy";
    default:
      return "Unknown";
  }
}

/**
 * Base class for every validation error raised by the store and the orchestrator.
 * Callers that only care about the category can catch this and inspect kind().
 */
class RagError : public std::exception {
 public:
  RagError(RagErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  RagErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  RagErrorKind kind_;
  std::string message_;
};

class DimensionMismatchError : public RagError {
 public:
  explicit DimensionMismatchError(const std::string &message)
      : RagError(RagErrorKind::DimensionMismatch, message) {}
};

class DuplicateIdError : public RagError {
 public:
  explicit DuplicateIdError(const std::string &message)
      : RagError(RagErrorKind::DuplicateId, message) {}
};

class NotFoundError : public RagError {
 public:
  explicit NotFoundError(const std::string &message) : RagError(RagErrorKind::NotFound, message) {}
};

class InvalidArgumentError : public RagError {
 public:
  explicit InvalidArgumentError(const std::string &message)
      : RagError(RagErrorKind::InvalidArgument, message) {}
};

class ShapeMismatchError : public RagError {
 public:
  explicit ShapeMismatchError(const std::string &message)
      : RagError(RagErrorKind::ShapeMismatch, message) {}
};

class EmptyInputError : public RagError {
 public:
  explicit EmptyInputError(const std::string &message)
      : RagError(RagErrorKind::EmptyInput, message) {}
};

class MissingContentError : public RagError {
 public:
  explicit MissingContentError(const std::string &message)
      : RagError(RagErrorKind::MissingContent, message) {}
};

// A storing or generating call arrived while another one of the same kind was running
class BusyError : public RagError {
 public:
  explicit BusyError(const std::string &message) : RagError(RagErrorKind::Busy, message) {}
};

// Raised when the persisted backend itself fails (I/O, locking, schema, wrong key).
// retryable() is set when the same call may succeed once another writer is done.
class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string &message, bool retryable = false)
      : message_(message), retryable_(retryable) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  bool retryable() const noexcept {
    return retryable_;
  }

 private:
  std::string message_;
  bool retryable_;
};

}  // namespace rag_core
