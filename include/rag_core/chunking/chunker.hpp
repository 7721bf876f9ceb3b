#pragma once

#include <string>
#include <vector>

#include "rag_core/types/chunk.hpp"
#include "rag_core/types/page.hpp"

namespace rag_core {

/**
 * @class Chunker
 * @brief Splits page text into overlapping, sentence-aligned chunks.
 *
 * Sentences are accumulated greedily until the next one would push the chunk
 * past chunk_size characters (UTF-8 code points). Each new chunk on the same
 * page starts with the last `overlap` sentences of the previous one. A
 * sentence is never cut; one that is longer than chunk_size becomes a chunk of
 * its own. Chunks never cross a page boundary.
 */
class Chunker {
 public:
  static constexpr int DEFAULT_CHUNK_SIZE = 1000;
  static constexpr int DEFAULT_OVERLAP = 2;

  /**
   * @param chunk_size Upper bound on chunk length in characters.
   * @param overlap Number of trailing sentences repeated at the start of the next chunk.
   * @throw ConfigurationError if chunk_size <= 0, overlap < 0 or overlap >= chunk_size.
   */
  Chunker(int chunk_size = DEFAULT_CHUNK_SIZE, int overlap = DEFAULT_OVERLAP);

  // Chunks every page in order; chunk_index runs across the whole sequence.
  std::vector<Chunk> create_chunks(const std::vector<DocumentPage> &pages) const;

  int chunk_size() const {
    return chunk_size_;
  }
  int overlap() const {
    return overlap_;
  }

  // Sentence boundary: terminal punctuation (plus closing quotes/brackets)
  // followed by whitespace, or a blank line.
  static std::vector<std::string> split_into_sentences(const std::string &text);

  // Length in UTF-8 code points.
  static size_t char_count(const std::string &text);

 private:
  void chunk_page(const DocumentPage &page, int &next_chunk_index,
                  std::vector<Chunk> &out) const;

  int chunk_size_;
  int overlap_;
};

// Convenience wrapper around Chunker for one-shot use.
std::vector<Chunk> create_chunks(const std::vector<DocumentPage> &pages, int chunk_size,
                                 int overlap);

}  // namespace rag_core
