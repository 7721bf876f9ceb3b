#pragma once

#include <string>
#include <vector>

namespace rag_core {

struct Chunk {
  std::string text;
  int page_number;
  int chunk_index;
};

// A chunk paired with the embedding of its text.
struct IndexEntry {
  Chunk chunk;
  std::vector<float> vector_embedding;
};

}  // namespace rag_core
