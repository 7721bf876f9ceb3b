#include "rag_core/services/rag_pipeline.hpp"

#include <iostream>
#include <utility>

#include "rag_core/errors.hpp"

namespace rag_core {

RagPipeline::RagPipeline(std::shared_ptr<Retriever> retriever,
                         std::shared_ptr<GenerationService> generation_service,
                         ContextAssembler context_assembler)
    : retriever_(std::move(retriever)),
      generation_service_(std::move(generation_service)),
      context_assembler_(context_assembler) {
  if (!retriever_ || !generation_service_) {
    throw ConfigurationError("RagPipeline requires a retriever and a generation service");
  }
}

Answer RagPipeline::ask(const std::string &query_text, int top_k) {
  Answer answer;
  answer.query = query_text;

  std::cout << "Searching for top " << top_k << " relevant chunks..." << std::endl;
  answer.results = retriever_->search(query_text, top_k);
  std::cout << "Retrieved " << answer.results.size() << " chunks" << std::endl;

  answer.prompt = context_assembler_.create_context(query_text, answer.results);
  answer.answer = generation_service_->generate(answer.prompt, answer.results);
  return answer;
}

}  // namespace rag_core
