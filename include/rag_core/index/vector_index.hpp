#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <vector>

#include "rag_core/types/chunk.hpp"
#include "rag_core/types/search_result.hpp"

namespace rag_core {

/**
 * @class VectorIndex
 * @brief Exact nearest-neighbour index over unit-length embedding vectors.
 *
 * Vectors are L2-normalized on the way in, so the squared Euclidean distance
 * used for ranking is 2 - 2 * cosine similarity. Search is a full scan
 * (faiss::IndexFlatL2). Entries are fixed once build() returns; concurrent
 * search() calls on a built index are safe.
 */
class VectorIndex {
 public:
  /**
   * @brief Builds an index from chunk/embedding pairs, in order.
   * @throw EmptyIndex if entries is empty.
   * @throw DimensionMismatch if any vector is empty or differs in length from the first.
   * @throw UpstreamFailure if a vector has zero or non-finite norm.
   */
  static VectorIndex build(const std::vector<IndexEntry> &entries);

  ~VectorIndex();

  // Disable copy constructor and assignment
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Allow move constructor and assignment
  VectorIndex(VectorIndex &&) noexcept;
  VectorIndex &operator=(VectorIndex &&) noexcept;

  /**
   * @brief Returns the top_k closest entries, closest first.
   *
   * Ties on distance are broken by ascending chunk_index. When top_k exceeds
   * the entry count, every entry is returned.
   *
   * @throw ConfigurationError if top_k <= 0.
   * @throw EmptyIndex if the index holds no entries.
   * @throw DimensionMismatch if query_vector has the wrong length.
   */
  std::vector<SearchResult> search(const std::vector<float> &query_vector, int top_k) const;

  size_t size() const {
    return chunks_.size();
  }
  size_t dimension() const {
    return dimension_;
  }
  const std::vector<Chunk> &chunks() const {
    return chunks_;
  }

  // Scales vector to unit length in place.
  // @throw UpstreamFailure if the vector is all zeros or contains NaN/inf.
  static void normalize(std::vector<float> &vector);

 private:
  VectorIndex(size_t dimension, std::vector<Chunk> chunks);

  size_t dimension_;
  std::vector<Chunk> chunks_;
  std::unique_ptr<faiss::IndexFlatL2> faiss_index_;
};

}  // namespace rag_core
