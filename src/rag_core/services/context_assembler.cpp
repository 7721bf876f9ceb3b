#include "rag_core/services/context_assembler.hpp"

#include <iomanip>
#include <sstream>

namespace rag_core {

std::string ContextAssembler::format_result(const SearchResult &result) {
  std::ostringstream ss;
  ss << "[" << result.rank << "] [Page " << result.chunk.page_number << "]\n"
     << "Relevance: " << std::fixed << std::setprecision(2) << result.similarity * 100.0f
     << "% (distance " << std::setprecision(4) << result.distance << ")\n"
     << result.chunk.text << "\n";
  return ss.str();
}

std::string ContextAssembler::create_context(const std::string &query_text,
                                             const std::vector<SearchResult> &results) const {
  std::ostringstream prompt;
  prompt << "RELEVANT CONTEXT FROM PDF:\n";

  if (results.empty()) {
    prompt << NO_CONTEXT_MESSAGE << "\n";
  } else {
    for (size_t i = 0; i < results.size(); ++i) {
      if (i > 0) {
        prompt << "\n---\n";
      }
      prompt << format_result(results[i]);
    }
  }

  prompt << "\nQUESTION: " << query_text << "\n\n"
         << "INSTRUCTIONS: " << INSTRUCTIONS;
  return prompt.str();
}

}  // namespace rag_core
