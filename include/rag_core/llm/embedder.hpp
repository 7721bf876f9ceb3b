#pragma once

#include <string>
#include <vector>

namespace rag_core {

// Maps text into a fixed-dimension vector space.
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<float> encode(const std::string &text) = 0;

  // One vector per input, same order.
  virtual std::vector<std::vector<float>> encode_many(const std::vector<std::string> &texts) = 0;
};

}  // namespace rag_core
