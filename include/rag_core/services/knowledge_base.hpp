#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/chunking/chunker.hpp"
#include "rag_core/index/vector_index.hpp"
#include "rag_core/llm/embedder.hpp"
#include "rag_core/sources/page_source.hpp"
#include "rag_core/types.hpp"

namespace rag_core {

struct KnowledgeBaseStats {
  size_t total_pages;
  size_t total_chunks;
  std::string source;
  size_t dimension;
};

/**
 * @class KnowledgeBase
 * @brief Startup phase of the pipeline: pages -> chunks -> embeddings -> index.
 *
 * Building runs once and exclusively. Afterwards the index is handed out as a
 * shared read-only handle and this object is no longer modified.
 */
class KnowledgeBase {
 public:
  KnowledgeBase(std::shared_ptr<Embedder> embedder, Chunker chunker = Chunker());

  // Disable copy constructor and assignment
  KnowledgeBase(const KnowledgeBase &) = delete;
  KnowledgeBase &operator=(const KnowledgeBase &) = delete;

  const std::vector<DocumentPage> &load_pages(const PageSource &source);

  const std::vector<Chunk> &create_chunks();

  /**
   * @brief Embeds every chunk and builds the vector index.
   * @throw EmptyIndex if there are no chunks to index.
   * @throw UpstreamFailure if the embedder fails or returns the wrong number of vectors.
   * @throw DimensionMismatch if the embedder returns vectors of differing length.
   */
  std::shared_ptr<const VectorIndex> build_index();

  // load_pages + create_chunks + build_index.
  std::shared_ptr<const VectorIndex> load(const PageSource &source);

  // Null until build_index() succeeds.
  std::shared_ptr<const VectorIndex> index() const {
    return index_;
  }

  const std::vector<Chunk> &chunks() const {
    return chunks_;
  }

  KnowledgeBaseStats get_stats() const;

 private:
  std::shared_ptr<Embedder> embedder_;
  Chunker chunker_;
  std::string source_;
  std::vector<DocumentPage> pages_;
  std::vector<Chunk> chunks_;
  std::shared_ptr<const VectorIndex> index_;
};

}  // namespace rag_core
