#include "rag_core/services/generation_service.hpp"

#include <utf8.h>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "rag_core/chunking/chunker.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

const std::string DIVIDER(70, '=');

std::string format_similarity(float similarity) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << similarity * 100.0f << "%";
  return ss.str();
}

std::string find_question_line(const std::string &prompt) {
  std::istringstream lines(prompt);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.rfind("QUESTION:", 0) == 0) {
      return line;
    }
  }
  return "Question not found";
}

}  // namespace

GenerationService::GenerationService(std::shared_ptr<Generator> generator, bool use_llm)
    : generator_(std::move(generator)), use_llm_(use_llm) {
  if (use_llm_ && !generator_) {
    throw ConfigurationError("LLM generation is enabled but no generator was provided");
  }
}

std::string GenerationService::preview(const std::string &text, size_t max_chars) {
  if (Chunker::char_count(text) <= max_chars) {
    return text;
  }
  auto cut = text.begin();
  utf8::advance(cut, max_chars, text.end());
  return std::string(text.begin(), cut) + "...";
}

std::string GenerationService::generate(const std::string &prompt,
                                        const std::vector<SearchResult> &results) {
  if (use_llm_) {
    return generate_with_llm(prompt, results);
  }
  return generate_template(prompt, results);
}

std::string GenerationService::generate_with_llm(const std::string &prompt,
                                                 const std::vector<SearchResult> &results) {
  std::cout << "Generating answer with LLM..." << std::endl;

  std::string answer;
  try {
    answer = generator_->generate(prompt);
  } catch (const RagError &) {
    throw;
  } catch (const std::exception &e) {
    throw UpstreamFailure("Answer generation failed: " + std::string(e.what()));
  }

  std::ostringstream out;
  out << answer << "\n\n" << DIVIDER << "\nSOURCES:\n" << DIVIDER << "\n";
  for (size_t i = 0; i < results.size(); ++i) {
    const auto &result = results[i];
    out << "\n[" << (i + 1) << "] Page " << result.chunk.page_number
        << " (Similarity: " << format_similarity(result.similarity) << ")\n"
        << "    Preview: " << preview(result.chunk.text, SOURCE_PREVIEW_CHARS) << "\n";
  }
  return out.str();
}

std::string GenerationService::generate_template(const std::string &prompt,
                                                 const std::vector<SearchResult> &results) const {
  std::ostringstream out;
  out << DIVIDER << "\nLLM Mode Disabled - Showing Retrieved Context\n" << DIVIDER << "\n\n"
      << find_question_line(prompt) << "\n\n"
      << "Found " << results.size() << " relevant passages:\n\n";

  for (size_t i = 0; i < results.size(); ++i) {
    const auto &result = results[i];
    out << "[" << (i + 1) << "] Page " << result.chunk.page_number
        << " (Similarity: " << format_similarity(result.similarity) << ")\n"
        << preview(result.chunk.text, TEMPLATE_PREVIEW_CHARS) << "\n\n";
  }
  out << DIVIDER;
  return out.str();
}

}  // namespace rag_core
