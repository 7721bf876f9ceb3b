#pragma once

#include <string>
#include <vector>

#include "rag_core/types/search_result.hpp"

namespace rag_core {

/**
 * @class ContextAssembler
 * @brief Formats retrieved chunks and the user's question into one grounded prompt.
 *
 * Every result is included, in rank order, with its page number and scores.
 * Output depends only on the arguments.
 */
class ContextAssembler {
 public:
  static constexpr const char *INSTRUCTIONS =
      "Answer the question using only the context above. If the context does not "
      "contain the answer, say that the document does not cover it.";
  static constexpr const char *NO_CONTEXT_MESSAGE =
      "No relevant information was found in the document for this question.";

  std::string create_context(const std::string &query_text,
                             const std::vector<SearchResult> &results) const;

 private:
  static std::string format_result(const SearchResult &result);
};

}  // namespace rag_core
