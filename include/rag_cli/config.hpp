#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace rag_cli {

class Config {
 public:
  std::string page_text_path;
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;

  // Retrieval configuration
  int chunk_size;
  int chunk_overlap;
  int top_k;

  // Generation configuration
  bool use_llm;
  float temperature;
  int num_predict;
  int llm_top_k;
  float top_p;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      // Apply defaults when keys are missing
      config.page_text_path = json_config.value("page_text_path", std::string("./data/knowledge_base.txt"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.2:3b"));

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 2);
      config.top_k = json_config.value("top_k", 3);

      config.use_llm = json_config.value("use_llm", true);
      config.temperature = json_config.value("temperature", 0.7f);
      config.num_predict = json_config.value("num_predict", 500);
      config.llm_top_k = json_config.value("llm_top_k", 40);
      config.top_p = json_config.value("top_p", 0.9f);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value type in config: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (page_text_path.empty()) {
      throw std::runtime_error("page_text_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (use_llm && generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty when use_llm is true");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0) {
      throw std::runtime_error("chunk_overlap cannot be negative");
    }
    if (chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be smaller than chunk_size");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (temperature < 0.0f) {
      throw std::runtime_error("temperature cannot be negative");
    }
    if (num_predict <= 0) {
      throw std::runtime_error("num_predict must be greater than 0");
    }
    if (llm_top_k <= 0) {
      throw std::runtime_error("llm_top_k must be greater than 0");
    }
    if (top_p <= 0.0f || top_p > 1.0f) {
      throw std::runtime_error("top_p must be in (0, 1]");
    }
  }
};

}  // namespace rag_cli
