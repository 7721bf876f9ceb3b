#include "rag_cli/cli_handler.hpp"

#include <iomanip>
#include <iostream>
#include <utility>

#include "rag_core/chunking/chunker.hpp"
#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/services/generation_service.hpp"
#include "rag_core/sources/page_source.hpp"

namespace rag_cli {

CliHandler::CliHandler(Config config,
                       std::shared_ptr<rag_core::Embedder> embedder,
                       std::shared_ptr<rag_core::Generator> generator)
    : config_(std::move(config)), embedder_(std::move(embedder)), generator_(std::move(generator)) {}

std::string CliHandler::parse_query_options(int argc, char* argv[], int& top_k,
                                            const std::string& usage) const {
    std::string query;
    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[i + 1];

        if (flag == "--query" || flag == "-q") {
            query = value;
        } else if (flag == "--top-k" || flag == "-k") {
            try {
                top_k = std::stoi(value);
            } catch (const std::exception&) {
                throw CliError("Invalid value for --top-k: " + value);
            }
            if (top_k <= 0) {
                throw CliError("--top-k must be greater than 0");
            }
        } else {
            throw CliError("Unknown option: " + flag + ". Usage: " + usage);
        }
    }
    if (query.empty()) {
        throw CliError("Command requires a query. Usage: " + usage);
    }
    return query;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) const {
    CliOptions options;
    options.command = Command::Help;
    options.top_k = config_.top_k;

    if (argc < 2) {
        return options;
    }

    std::string command = argv[1];

    if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        options.query = parse_query_options(argc, argv, options.top_k,
                                            "ask --query <question> [--top-k <k>]");
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        options.query = parse_query_options(argc, argv, options.top_k,
                                            "search --query <text> [--top-k <k>]");
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Stats:
            handle_stats_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

void CliHandler::ensure_knowledge_base() {
    if (pipeline_) {
        return;
    }

    if (!embedder_ || (config_.use_llm && !generator_)) {
        rag_core::GenerationOptions generation_options;
        generation_options.temperature = config_.temperature;
        generation_options.num_predict = config_.num_predict;
        generation_options.top_k = config_.llm_top_k;
        generation_options.top_p = config_.top_p;

        auto ollama_client = std::make_shared<rag_core::OllamaClient>(
            config_.ollama_url, config_.embedding_model, config_.generation_model,
            generation_options);
        if (!embedder_) {
            embedder_ = ollama_client;
        }
        if (config_.use_llm && !generator_) {
            generator_ = ollama_client;
        }
    }

    knowledge_base_ = std::make_unique<rag_core::KnowledgeBase>(
        embedder_, rag_core::Chunker(config_.chunk_size, config_.chunk_overlap));
    rag_core::TextPageSource page_source(config_.page_text_path);
    auto index = knowledge_base_->load(page_source);

    retriever_ = std::make_shared<rag_core::Retriever>(index, embedder_);
    auto generation_service =
        std::make_shared<rag_core::GenerationService>(generator_, config_.use_llm);
    pipeline_ = std::make_unique<rag_core::RagPipeline>(retriever_, generation_service);
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    ensure_knowledge_base();

    rag_core::Answer answer = pipeline_->ask(options.query, options.top_k);

    std::cout << "\nQuestion: " << answer.query << "\n" << std::endl;
    std::cout << answer.answer << std::endl;
}

void CliHandler::handle_search_command(const CliOptions& options) {
    ensure_knowledge_base();

    auto results = retriever_->search(options.query, options.top_k);
    print_search_results(results);
}

void CliHandler::handle_stats_command(const CliOptions& /*options*/) {
    ensure_knowledge_base();

    rag_core::KnowledgeBaseStats stats = knowledge_base_->get_stats();
    std::cout << "Source:       " << stats.source << std::endl;
    std::cout << "Total pages:  " << stats.total_pages << std::endl;
    std::cout << "Total chunks: " << stats.total_chunks << std::endl;
    std::cout << "Dimension:    " << stats.dimension << std::endl;
}

void CliHandler::handle_help_command(const CliOptions& /*options*/) {
    print_help();
}

void CliHandler::print_search_results(const std::vector<rag_core::SearchResult>& results) {
    if (results.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    std::cout << "Found " << results.size() << " result(s):\n" << std::endl;
    for (const auto& result : results) {
        std::cout << "[" << result.rank << "] Page " << result.chunk.page_number
                  << " | chunk " << result.chunk.chunk_index
                  << " | distance " << std::fixed << std::setprecision(4) << result.distance
                  << " | similarity " << std::setprecision(1) << result.similarity * 100.0f << "%"
                  << std::endl;
        std::cout << "    "
                  << rag_core::GenerationService::preview(
                         result.chunk.text, rag_core::GenerationService::SOURCE_PREVIEW_CHARS)
                  << "\n" << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << "rag - ask questions about a PDF knowledge base\n\n"
              << "Usage:\n"
              << "  rag ask --query <question> [--top-k <k>]   Answer a question from the document\n"
              << "  rag search --query <text> [--top-k <k>]    Show the closest chunks only\n"
              << "  rag stats                                  Show knowledge base statistics\n"
              << "  rag help                                   Show this message\n\n"
              << "Configuration is read from ragrc.json, or the file named by RAG_CONFIG."
              << std::endl;
}

}  // namespace rag_cli
