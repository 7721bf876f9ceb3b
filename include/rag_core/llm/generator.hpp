#pragma once

#include <string>

namespace rag_core {

class Generator {
 public:
  virtual ~Generator() = default;

  // Blocking completion of a single prompt.
  virtual std::string generate(const std::string &prompt) = 0;
};

}  // namespace rag_core
