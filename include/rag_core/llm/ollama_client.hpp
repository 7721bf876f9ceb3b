#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rag_core/llm/embedder.hpp"
#include "rag_core/llm/generator.hpp"

namespace rag_core {

struct GenerationOptions {
  float temperature = 0.7f;
  int num_predict = 500;
  int top_k = 40;
  float top_p = 0.9f;
};

class OllamaClient : public Embedder, public Generator {
 public:
  // @throw UpstreamFailure if no Ollama server answers at ollama_url.
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model,
               GenerationOptions options = {});
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> encode(const std::string &text) override;
  std::vector<std::vector<float>> encode_many(const std::vector<std::string> &texts) override;

  std::string generate(const std::string &prompt) override;

  bool is_server_available();

  // Extract the first vector from an /api/embed reply.
  // @throw UpstreamFailure if the reply has no usable "embeddings" array.
  static std::vector<float> parse_embedding_response(const nlohmann::json &json_response);

  // @throw UpstreamFailure if the reply has no string "response" field.
  static std::string parse_generation_response(const nlohmann::json &json_response);

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
  GenerationOptions options_;

  void setup_server_connection();
};

}  // namespace rag_core
