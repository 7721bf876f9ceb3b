#include "rag_core/services/knowledge_base.hpp"

#include <iostream>
#include <utility>

#include "rag_core/errors.hpp"

namespace rag_core {

KnowledgeBase::KnowledgeBase(std::shared_ptr<Embedder> embedder, Chunker chunker)
    : embedder_(std::move(embedder)), chunker_(chunker) {
  if (!embedder_) {
    throw ConfigurationError("KnowledgeBase requires an embedder");
  }
}

const std::vector<DocumentPage> &KnowledgeBase::load_pages(const PageSource &source) {
  source_ = source.describe();
  std::cout << "Loading pages from: " << source_ << std::endl;
  pages_ = source.load_pages();
  std::cout << "Loaded " << pages_.size() << " pages" << std::endl;
  return pages_;
}

const std::vector<Chunk> &KnowledgeBase::create_chunks() {
  chunks_ = chunker_.create_chunks(pages_);
  std::cout << "Created " << chunks_.size() << " chunks (chunk_size=" << chunker_.chunk_size()
            << " chars, overlap=" << chunker_.overlap() << " sentences)" << std::endl;
  return chunks_;
}

std::shared_ptr<const VectorIndex> KnowledgeBase::build_index() {
  if (chunks_.empty()) {
    throw EmptyIndex("Knowledge base has no chunks to index (source: " +
                     (source_.empty() ? std::string("none") : source_) + ")");
  }

  std::vector<std::string> texts;
  texts.reserve(chunks_.size());
  for (const auto &chunk : chunks_) {
    texts.push_back(chunk.text);
  }

  std::cout << "Encoding " << texts.size() << " chunks to embeddings..." << std::endl;
  std::vector<std::vector<float>> embeddings;
  try {
    embeddings = embedder_->encode_many(texts);
  } catch (const RagError &) {
    throw;
  } catch (const std::exception &e) {
    throw UpstreamFailure("Chunk embedding failed: " + std::string(e.what()));
  }

  if (embeddings.size() != chunks_.size()) {
    throw UpstreamFailure("Embedder returned " + std::to_string(embeddings.size()) +
                          " vectors for " + std::to_string(chunks_.size()) + " chunks");
  }

  std::vector<IndexEntry> entries;
  entries.reserve(chunks_.size());
  for (size_t i = 0; i < chunks_.size(); ++i) {
    entries.push_back({chunks_[i], std::move(embeddings[i])});
  }

  index_ = std::make_shared<const VectorIndex>(VectorIndex::build(entries));
  std::cout << "Index built with " << index_->size() << " vectors (dim=" << index_->dimension()
            << ")" << std::endl;
  return index_;
}

std::shared_ptr<const VectorIndex> KnowledgeBase::load(const PageSource &source) {
  load_pages(source);
  create_chunks();
  return build_index();
}

KnowledgeBaseStats KnowledgeBase::get_stats() const {
  return {pages_.size(), chunks_.size(), source_, index_ ? index_->dimension() : 0};
}

}  // namespace rag_core
