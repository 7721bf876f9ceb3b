#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/index/vector_index.hpp"
#include "rag_core/llm/embedder.hpp"
#include "rag_core/types/search_result.hpp"

namespace rag_core {

class Retriever {
 public:
  Retriever(std::shared_ptr<const VectorIndex> vector_index, std::shared_ptr<Embedder> embedder);

  // Natural-language semantic search. Returns top-k nearest chunks, closest first.
  std::vector<SearchResult> search(const std::string &query_text, int top_k = 3) const;

 private:
  std::vector<float> embed_query(const std::string &query_text) const;

  std::shared_ptr<const VectorIndex> vector_index_;
  std::shared_ptr<Embedder> embedder_;
};

}  // namespace rag_core
