#pragma once

#include "rag_core/types/chunk.hpp"

namespace rag_core {

struct SearchResult {
  Chunk chunk;
  // Squared L2 distance between unit vectors, in [0, 4].
  float distance;
  // 1 / (1 + distance), shown to users as relevance.
  float similarity;
  int rank;
};

}  // namespace rag_core
