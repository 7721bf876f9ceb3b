#include "rag_core/services/retriever.hpp"

#include <string>
#include <utility>

#include "rag_core/errors.hpp"

namespace rag_core {

Retriever::Retriever(std::shared_ptr<const VectorIndex> vector_index,
                     std::shared_ptr<Embedder> embedder)
    : vector_index_(std::move(vector_index)), embedder_(std::move(embedder)) {
  if (!embedder_) {
    throw ConfigurationError("Retriever requires an embedder");
  }
}

std::vector<SearchResult> Retriever::search(const std::string &query_text, int top_k) const {
  if (!vector_index_ || vector_index_->size() == 0) {
    throw EmptyIndex("Search attempted before the knowledge base index was built");
  }
  if (top_k <= 0) {
    throw ConfigurationError("top_k must be greater than 0, got " + std::to_string(top_k));
  }

  std::vector<float> query_embedding = embed_query(query_text);
  VectorIndex::normalize(query_embedding);
  return vector_index_->search(query_embedding, top_k);
}

std::vector<float> Retriever::embed_query(const std::string &query_text) const {
  std::vector<float> embedding;
  try {
    embedding = embedder_->encode(query_text);
  } catch (const RagError &) {
    throw;
  } catch (const std::exception &e) {
    throw UpstreamFailure("Query embedding failed: " + std::string(e.what()));
  }
  if (embedding.empty()) {
    throw UpstreamFailure("Embedder returned an empty vector for the query");
  }
  return embedding;
}

}  // namespace rag_core
