#include "rag_core/index/vector_index.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "rag_core/errors.hpp"

namespace rag_core {

VectorIndex::VectorIndex(size_t dimension, std::vector<Chunk> chunks)
    : dimension_(dimension),
      chunks_(std::move(chunks)),
      faiss_index_(std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension))) {}

VectorIndex::~VectorIndex() = default;

VectorIndex::VectorIndex(VectorIndex &&other) noexcept
    : dimension_(other.dimension_),
      chunks_(std::move(other.chunks_)),
      faiss_index_(std::move(other.faiss_index_)) {}

VectorIndex &VectorIndex::operator=(VectorIndex &&other) noexcept {
  if (this != &other) {
    dimension_ = other.dimension_;
    chunks_ = std::move(other.chunks_);
    faiss_index_ = std::move(other.faiss_index_);
  }
  return *this;
}

void VectorIndex::normalize(std::vector<float> &vector) {
  const float norm_sqr = faiss::fvec_norm_L2sqr(vector.data(), vector.size());
  if (!std::isfinite(norm_sqr) || norm_sqr <= 0.0f) {
    throw UpstreamFailure("Cannot normalize embedding vector of dimension " +
                          std::to_string(vector.size()) + " with squared norm " +
                          std::to_string(norm_sqr));
  }
  faiss::fvec_renorm_L2(vector.size(), 1, vector.data());
}

VectorIndex VectorIndex::build(const std::vector<IndexEntry> &entries) {
  if (entries.empty()) {
    throw EmptyIndex("Cannot build vector index from zero entries");
  }

  const size_t dimension = entries.front().vector_embedding.size();
  if (dimension == 0) {
    throw DimensionMismatch("Embedding for chunk_index " +
                            std::to_string(entries.front().chunk.chunk_index) + " is empty");
  }

  std::vector<Chunk> chunks;
  chunks.reserve(entries.size());
  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(entries.size() * dimension);

  for (size_t i = 0; i < entries.size(); ++i) {
    const auto &entry = entries[i];
    if (entry.vector_embedding.size() != dimension) {
      throw DimensionMismatch("Embedding dimension mismatch at entry " + std::to_string(i) +
                              " (chunk_index " + std::to_string(entry.chunk.chunk_index) +
                              "). Expected " + std::to_string(dimension) + ", got " +
                              std::to_string(entry.vector_embedding.size()));
    }
    std::vector<float> vector = entry.vector_embedding;
    normalize(vector);
    all_vectors_flat.insert(all_vectors_flat.end(), vector.begin(), vector.end());
    chunks.push_back(entry.chunk);
  }

  VectorIndex index(dimension, std::move(chunks));
  index.faiss_index_->add(static_cast<faiss::idx_t>(entries.size()), all_vectors_flat.data());
  return index;
}

std::vector<SearchResult> VectorIndex::search(const std::vector<float> &query_vector,
                                              int top_k) const {
  if (top_k <= 0) {
    throw ConfigurationError("top_k must be greater than 0, got " + std::to_string(top_k));
  }
  if (!faiss_index_ || faiss_index_->ntotal == 0) {
    throw EmptyIndex("Vector index is empty. Cannot perform search.");
  }
  if (query_vector.size() != dimension_) {
    throw DimensionMismatch("Query vector dimension mismatch. Expected " +
                            std::to_string(dimension_) + ", got " +
                            std::to_string(query_vector.size()));
  }

  std::vector<float> query = query_vector;
  normalize(query);

  // Score every entry, then rank here so ties follow chunk_index.
  const faiss::idx_t total = faiss_index_->ntotal;
  std::vector<float> distances(total);
  std::vector<faiss::idx_t> labels(total);
  faiss_index_->search(1, query.data(), total, distances.data(), labels.data());

  std::vector<std::pair<float, size_t>> scored;
  scored.reserve(total);
  for (faiss::idx_t i = 0; i < total; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    // Rounding can leave a self-match a hair below zero.
    scored.emplace_back(std::max(0.0f, distances[i]), static_cast<size_t>(labels[i]));
  }

  std::sort(scored.begin(), scored.end(), [this](const auto &a, const auto &b) {
    if (a.first != b.first) {
      return a.first < b.first;
    }
    return chunks_[a.second].chunk_index < chunks_[b.second].chunk_index;
  });

  const size_t count = std::min(static_cast<size_t>(top_k), scored.size());
  std::vector<SearchResult> results;
  results.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const float distance = scored[i].first;
    results.push_back({.chunk = chunks_[scored[i].second],
                       .distance = distance,
                       .similarity = 1.0f / (1.0f + distance),
                       .rank = static_cast<int>(i) + 1});
  }
  return results;
}

}  // namespace rag_core
