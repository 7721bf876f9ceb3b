#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/services/context_assembler.hpp"
#include "rag_core/services/generation_service.hpp"
#include "rag_core/services/retriever.hpp"
#include "rag_core/types/search_result.hpp"

namespace rag_core {

struct Answer {
  std::string query;
  std::vector<SearchResult> results;
  std::string prompt;
  std::string answer;
};

// One question at a time: retrieve -> assemble -> generate.
class RagPipeline {
 public:
  RagPipeline(std::shared_ptr<Retriever> retriever,
              std::shared_ptr<GenerationService> generation_service,
              ContextAssembler context_assembler = ContextAssembler());

  Answer ask(const std::string &query_text, int top_k = 3);

 private:
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<GenerationService> generation_service_;
  ContextAssembler context_assembler_;
};

}  // namespace rag_core
