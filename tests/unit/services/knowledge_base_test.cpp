#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/knowledge_base.hpp"

namespace rag_core {

using testing::_;
using testing::Invoke;
using testing::Return;
using testing::Throw;

class KnowledgeBaseTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_embedder_ = std::make_shared<testing::NiceMock<rag_tests::MockEmbedder>>();
    ON_CALL(mock_page_source_, describe()).WillByDefault(Return("elements.pdf"));
    ON_CALL(mock_page_source_, load_pages())
        .WillByDefault(Return(std::vector<DocumentPage>{
            {.text = "The sky is blue. Water is wet. Fire is hot.", .page_number = 1},
            {.text = "Earth is solid.", .page_number = 2}}));
  }

  void useKeywordEmbeddings() {
    ON_CALL(*mock_embedder_, encode_many(_))
        .WillByDefault(Invoke(&rag_tests::MockUtilities::keyword_embeddings));
  }

  std::shared_ptr<testing::NiceMock<rag_tests::MockEmbedder>> mock_embedder_;
  testing::NiceMock<rag_tests::MockPageSource> mock_page_source_;
};

TEST_F(KnowledgeBaseTest, Load_BuildsIndexOverAllChunks) {
  useKeywordEmbeddings();
  KnowledgeBase knowledge_base(mock_embedder_, Chunker(30, 1));

  auto index = knowledge_base.load(mock_page_source_);

  ASSERT_NE(index, nullptr);
  // Page 1 splits into two overlapping chunks, page 2 fits in one.
  ASSERT_EQ(knowledge_base.chunks().size(), 3);
  EXPECT_EQ(index->size(), 3);
  EXPECT_EQ(index->dimension(), 4);
  EXPECT_EQ(knowledge_base.chunks()[1].text, "Water is wet. Fire is hot.");
  EXPECT_EQ(knowledge_base.chunks()[2].page_number, 2);
  EXPECT_EQ(knowledge_base.index(), index);
}

TEST_F(KnowledgeBaseTest, Load_EmbedsChunkTextsInOrder) {
  KnowledgeBase knowledge_base(mock_embedder_, Chunker(30, 1));
  std::vector<std::string> expected_texts = {"The sky is blue. Water is wet.",
                                             "Water is wet. Fire is hot.", "Earth is solid."};
  EXPECT_CALL(*mock_embedder_, encode_many(expected_texts))
      .WillOnce(Invoke(&rag_tests::MockUtilities::keyword_embeddings));

  knowledge_base.load(mock_page_source_);
}

TEST_F(KnowledgeBaseTest, GetStats_ReportsPagesChunksAndSource) {
  useKeywordEmbeddings();
  KnowledgeBase knowledge_base(mock_embedder_, Chunker(30, 1));
  knowledge_base.load(mock_page_source_);

  KnowledgeBaseStats stats = knowledge_base.get_stats();

  EXPECT_EQ(stats.total_pages, 2);
  EXPECT_EQ(stats.total_chunks, 3);
  EXPECT_EQ(stats.source, "elements.pdf");
  EXPECT_EQ(stats.dimension, 4);
}

TEST_F(KnowledgeBaseTest, Index_IsNullBeforeBuild) {
  KnowledgeBase knowledge_base(mock_embedder_);

  EXPECT_EQ(knowledge_base.index(), nullptr);
  EXPECT_EQ(knowledge_base.get_stats().dimension, 0);
}

TEST_F(KnowledgeBaseTest, BuildIndex_WithoutChunksThrowsEmptyIndex) {
  ON_CALL(mock_page_source_, load_pages())
      .WillByDefault(Return(std::vector<DocumentPage>{{.text = "   ", .page_number = 1}}));
  EXPECT_CALL(*mock_embedder_, encode_many(_)).Times(0);
  KnowledgeBase knowledge_base(mock_embedder_);

  EXPECT_THROW(knowledge_base.load(mock_page_source_), EmptyIndex);
}

TEST_F(KnowledgeBaseTest, BuildIndex_WrongVectorCountIsUpstreamFailure) {
  EXPECT_CALL(*mock_embedder_, encode_many(_))
      .WillOnce(Return(std::vector<std::vector<float>>{{1.0f, 0.0f}}));
  KnowledgeBase knowledge_base(mock_embedder_, Chunker(30, 1));

  EXPECT_THROW(knowledge_base.load(mock_page_source_), UpstreamFailure);
  EXPECT_EQ(knowledge_base.index(), nullptr);
}

TEST_F(KnowledgeBaseTest, BuildIndex_EmbedderExceptionIsUpstreamFailure) {
  EXPECT_CALL(*mock_embedder_, encode_many(_)).WillOnce(Throw(std::runtime_error("timeout")));
  KnowledgeBase knowledge_base(mock_embedder_, Chunker(30, 1));

  EXPECT_THROW(knowledge_base.load(mock_page_source_), UpstreamFailure);
}

TEST_F(KnowledgeBaseTest, BuildIndex_InconsistentDimensionsIsDimensionMismatch) {
  EXPECT_CALL(*mock_embedder_, encode_many(_))
      .WillOnce(Return(std::vector<std::vector<float>>{
          {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.0f, 1.0f}}));
  KnowledgeBase knowledge_base(mock_embedder_, Chunker(30, 1));

  EXPECT_THROW(knowledge_base.load(mock_page_source_), DimensionMismatch);
}

TEST_F(KnowledgeBaseTest, LoadPages_SourceFailurePropagates) {
  EXPECT_CALL(mock_page_source_, load_pages())
      .WillOnce(Throw(UpstreamFailure("Could not open page text file: missing.txt")));
  KnowledgeBase knowledge_base(mock_embedder_);

  EXPECT_THROW(knowledge_base.load(mock_page_source_), UpstreamFailure);
}

TEST_F(KnowledgeBaseTest, Constructor_RequiresEmbedder) {
  EXPECT_THROW(KnowledgeBase(nullptr), ConfigurationError);
}

}  // namespace rag_core
