#pragma once

#include <exception>
#include <string>

namespace rag_core {

class RagError : public std::exception {
 public:
  explicit RagError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Invalid chunk_size / overlap / top_k or other caller-supplied settings.
class ConfigurationError : public RagError {
 public:
  explicit ConfigurationError(const std::string &message) : RagError(message) {}
};

// Vector shapes disagree between index entries, or between index and query.
class DimensionMismatch : public RagError {
 public:
  explicit DimensionMismatch(const std::string &message) : RagError(message) {}
};

// Search before build, or build with zero entries.
class EmptyIndex : public RagError {
 public:
  explicit EmptyIndex(const std::string &message) : RagError(message) {}
};

// The embedding or generation backend failed or returned unusable output.
class UpstreamFailure : public RagError {
 public:
  explicit UpstreamFailure(const std::string &message) : RagError(message) {}
};

}  // namespace rag_core
