#include "rag_core/llm/ollama_client.hpp"

#include <ollama.hpp>

#include <iostream>

#include "rag_core/errors.hpp"

namespace rag_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model,
                           GenerationOptions options)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model),
      options_(options) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  // Set the server URL for ollama-hpp
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw UpstreamFailure("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::encode(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    return parse_embedding_response(response.as_json());
  } catch (const ollama::exception &e) {
    throw UpstreamFailure("Embedding generation with " + embedding_model_ +
                          " failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw UpstreamFailure("Malformed embedding response: " + std::string(e.what()));
  }
}

std::vector<float> OllamaClient::parse_embedding_response(const nlohmann::json &json_response) {
  if (!json_response.contains("embeddings")) {
    throw UpstreamFailure("Ollama response does not contain an embeddings field");
  }

  try {
    // /api/embed answers with an array of vectors, one per input
    const auto &embeddings = json_response.at("embeddings");
    if (!embeddings.is_array() || embeddings.empty()) {
      throw UpstreamFailure("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw UpstreamFailure("Malformed embedding response: " + std::string(e.what()));
  }
}

// The embed endpoint takes one input per request through ollama-hpp, so
// batches are sent sequentially.
std::vector<std::vector<float>> OllamaClient::encode_many(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    embeddings.push_back(encode(texts[i]));
    if ((i + 1) % 50 == 0) {
      std::cout << "   Encoded " << (i + 1) << "/" << texts.size() << " chunks" << std::endl;
    }
  }
  return embeddings;
}

std::string OllamaClient::generate(const std::string &prompt) {
  ollama::options request_options;
  request_options["temperature"] = options_.temperature;
  request_options["num_predict"] = options_.num_predict;
  request_options["top_k"] = options_.top_k;
  request_options["top_p"] = options_.top_p;

  try {
    ollama::response response = ollama::generate(generation_model_, prompt, request_options);
    return parse_generation_response(response.as_json());
  } catch (const ollama::exception &e) {
    throw UpstreamFailure("Answer generation with " + generation_model_ +
                          " failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw UpstreamFailure("Malformed generation response from " + generation_model_ + ": " +
                          std::string(e.what()));
  }
}

std::string OllamaClient::parse_generation_response(const nlohmann::json &json_response) {
  if (!json_response.contains("response")) {
    throw UpstreamFailure("Ollama response does not contain a response field");
  }
  try {
    return json_response.at("response").get<std::string>();
  } catch (const nlohmann::json::exception &e) {
    throw UpstreamFailure("Malformed generation response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace rag_core
