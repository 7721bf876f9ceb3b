#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/llm/generator.hpp"
#include "rag_core/types/search_result.hpp"

namespace rag_core {

/**
 * @class GenerationService
 * @brief Turns an assembled prompt into the final answer text.
 *
 * With the LLM enabled the generator's answer is followed by a SOURCES
 * listing of the retrieved passages. With it disabled, no model is called and
 * the answer lists the retrieved passages themselves.
 */
class GenerationService {
 public:
  static constexpr size_t SOURCE_PREVIEW_CHARS = 150;
  static constexpr size_t TEMPLATE_PREVIEW_CHARS = 300;

  // @throw ConfigurationError if use_llm is set without a generator.
  GenerationService(std::shared_ptr<Generator> generator, bool use_llm = true);

  // @throw UpstreamFailure if the generator fails.
  std::string generate(const std::string &prompt, const std::vector<SearchResult> &results);

  bool uses_llm() const {
    return use_llm_;
  }

  // First max_chars characters of text, with "..." appended when cut.
  static std::string preview(const std::string &text, size_t max_chars);

 private:
  std::string generate_with_llm(const std::string &prompt,
                                const std::vector<SearchResult> &results);
  std::string generate_template(const std::string &prompt,
                                const std::vector<SearchResult> &results) const;

  std::shared_ptr<Generator> generator_;
  bool use_llm_;
};

}  // namespace rag_core
