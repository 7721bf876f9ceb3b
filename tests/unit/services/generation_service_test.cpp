#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/context_assembler.hpp"
#include "rag_core/services/generation_service.hpp"

namespace rag_core {

using rag_tests::MockUtilities::create_test_result;
using testing::_;
using testing::HasSubstr;
using testing::Return;
using testing::Throw;

class GenerationServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_generator_ = std::make_shared<rag_tests::MockGenerator>();
    results_ = {create_test_result("Water is wet.", 2, 1, 0.0f),
                create_test_result("Fire is hot.", 3, 2, 1.0f)};
    prompt_ = ContextAssembler().create_context("Is water wet?", results_);
  }

  std::shared_ptr<rag_tests::MockGenerator> mock_generator_;
  std::vector<SearchResult> results_;
  std::string prompt_;
};

TEST_F(GenerationServiceTest, Generate_LlmAnswerIsFollowedBySources) {
  GenerationService service(mock_generator_, true);
  EXPECT_CALL(*mock_generator_, generate(prompt_)).WillOnce(Return("Yes, water is wet."));

  std::string answer = service.generate(prompt_, results_);

  EXPECT_EQ(answer.rfind("Yes, water is wet.", 0), 0);
  EXPECT_THAT(answer, HasSubstr("SOURCES:"));
  EXPECT_THAT(answer, HasSubstr("[1] Page 2 (Similarity: 100.0%)"));
  EXPECT_THAT(answer, HasSubstr("[2] Page 3 (Similarity: 50.0%)"));
  EXPECT_THAT(answer, HasSubstr("Preview: Water is wet."));
}

TEST_F(GenerationServiceTest, Generate_GeneratorFailureIsUpstreamFailure) {
  GenerationService service(mock_generator_, true);
  EXPECT_CALL(*mock_generator_, generate(_)).WillOnce(Throw(std::runtime_error("model not found")));

  try {
    service.generate(prompt_, results_);
    FAIL() << "Expected UpstreamFailure";
  } catch (const UpstreamFailure& e) {
    EXPECT_THAT(std::string(e.what()), HasSubstr("model not found"));
  }
}

TEST_F(GenerationServiceTest, Generate_TemplateModeDoesNotCallGenerator) {
  GenerationService service(mock_generator_, false);
  EXPECT_CALL(*mock_generator_, generate(_)).Times(0);

  std::string answer = service.generate(prompt_, results_);

  EXPECT_THAT(answer, HasSubstr("LLM Mode Disabled"));
  EXPECT_THAT(answer, HasSubstr("QUESTION: Is water wet?"));
  EXPECT_THAT(answer, HasSubstr("Found 2 relevant passages"));
  EXPECT_THAT(answer, HasSubstr("Fire is hot."));
}

TEST_F(GenerationServiceTest, Generate_TemplateModeWorksWithoutGenerator) {
  GenerationService service(nullptr, false);

  std::string answer = service.generate(prompt_, {});

  EXPECT_THAT(answer, HasSubstr("Found 0 relevant passages"));
  EXPECT_FALSE(service.uses_llm());
}

TEST_F(GenerationServiceTest, Constructor_LlmModeRequiresGenerator) {
  EXPECT_THROW(GenerationService(nullptr, true), ConfigurationError);
}

TEST_F(GenerationServiceTest, Preview_ShortTextIsUnchanged) {
  EXPECT_EQ(GenerationService::preview("short", 150), "short");
}

TEST_F(GenerationServiceTest, Preview_LongTextIsCutOnCharacterBoundary) {
  // 200 two-byte characters ("é").
  std::string text;
  for (int i = 0; i < 200; ++i) {
    text += "\xc3\xa9";
  }

  std::string preview = GenerationService::preview(text, 150);

  EXPECT_EQ(preview.size(), 150 * 2 + 3);
  EXPECT_EQ(preview.substr(preview.size() - 3), "...");
}

}  // namespace rag_core
