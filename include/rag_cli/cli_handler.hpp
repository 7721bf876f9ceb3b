#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_cli/config.hpp"
#include "rag_core/llm/embedder.hpp"
#include "rag_core/llm/generator.hpp"
#include "rag_core/services/knowledge_base.hpp"
#include "rag_core/services/rag_pipeline.hpp"
#include "rag_core/services/retriever.hpp"

namespace rag_cli
{

  enum class Command
  {
    Ask,
    Search,
    Stats,
    Help
  };

  struct CliOptions
  {
    Command command;
    std::string query;
    int top_k;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    // Without an embedder/generator an OllamaClient is created from config on first use.
    explicit CliHandler(Config config,
                        std::shared_ptr<rag_core::Embedder> embedder = nullptr,
                        std::shared_ptr<rag_core::Generator> generator = nullptr);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]) const;

    // Execute command
    void execute_command(const CliOptions &options);

  private:
    Config config_;
    std::shared_ptr<rag_core::Embedder> embedder_;
    std::shared_ptr<rag_core::Generator> generator_;
    std::unique_ptr<rag_core::KnowledgeBase> knowledge_base_;
    std::shared_ptr<rag_core::Retriever> retriever_;
    std::unique_ptr<rag_core::RagPipeline> pipeline_;

    // Command handlers
    void handle_ask_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_stats_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // Helper methods
    void ensure_knowledge_base();
    std::string parse_query_options(int argc, char *argv[], int &top_k,
                                    const std::string &usage) const;
    void print_search_results(const std::vector<rag_core::SearchResult> &results);
    void print_help();
  };

}
