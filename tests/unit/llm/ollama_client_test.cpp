#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "rag_core/errors.hpp"
#include "rag_core/llm/ollama_client.hpp"

namespace rag_core {

// Nothing listens on port 1, so the reachability probe fails without a real server.
TEST(OllamaClientTest, Constructor_UnreachableServerIsUpstreamFailure) {
  EXPECT_THROW(OllamaClient("http://127.0.0.1:1", "all-minilm", "llama3.2:3b"), UpstreamFailure);
}

TEST(OllamaClientTest, GenerationOptions_Defaults) {
  GenerationOptions options;

  EXPECT_FLOAT_EQ(options.temperature, 0.7f);
  EXPECT_EQ(options.num_predict, 500);
  EXPECT_EQ(options.top_k, 40);
  EXPECT_FLOAT_EQ(options.top_p, 0.9f);
}

TEST(OllamaClientTest, ParseEmbeddingResponse_FirstVectorOfBatch) {
  auto reply = nlohmann::json::parse(R"({"model": "all-minilm", "embeddings": [[0.25, -0.5, 1.0]]})");

  auto vector = OllamaClient::parse_embedding_response(reply);

  ASSERT_EQ(vector.size(), 3);
  EXPECT_FLOAT_EQ(vector[0], 0.25f);
  EXPECT_FLOAT_EQ(vector[1], -0.5f);
  EXPECT_FLOAT_EQ(vector[2], 1.0f);
}

TEST(OllamaClientTest, ParseEmbeddingResponse_MalformedIsUpstreamFailure) {
  EXPECT_THROW(OllamaClient::parse_embedding_response(nlohmann::json::parse(R"({"error": "no model"})")),
               UpstreamFailure);
  EXPECT_THROW(OllamaClient::parse_embedding_response(nlohmann::json::parse(R"({"embeddings": []})")),
               UpstreamFailure);
  EXPECT_THROW(OllamaClient::parse_embedding_response(nlohmann::json::parse(R"({"embeddings": "x"})")),
               UpstreamFailure);
  EXPECT_THROW(
      OllamaClient::parse_embedding_response(nlohmann::json::parse(R"({"embeddings": [["a", "b"]]})")),
      UpstreamFailure);
}

TEST(OllamaClientTest, ParseGenerationResponse_ReturnsText) {
  auto reply = nlohmann::json::parse(R"({"model": "llama3.2:3b", "response": "Water is wet.", "done": true})");

  EXPECT_EQ(OllamaClient::parse_generation_response(reply), "Water is wet.");
}

TEST(OllamaClientTest, ParseGenerationResponse_MalformedIsUpstreamFailure) {
  EXPECT_THROW(OllamaClient::parse_generation_response(nlohmann::json::parse(R"({"done": true})")),
               UpstreamFailure);
  // A non-string response field is a json type error inside the client.
  EXPECT_THROW(OllamaClient::parse_generation_response(nlohmann::json::parse(R"({"response": 42})")),
               UpstreamFailure);
}

}  // namespace rag_core
