#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "lucid_core/db/memory_chunk_store.hpp"
#include "lucid_core/errors.hpp"
#include "lucid_core/services/rag_service.hpp"

namespace lucid_core {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SizeIs;
using ::testing::Throw;
using lucid_tests::TestUtilities;

class RagServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    embedder_ = std::make_shared<NiceMock<lucid_tests::MockEmbeddingProvider>>();
    chat_ = std::make_shared<NiceMock<lucid_tests::MockChatProvider>>();
    store_ = std::make_shared<NiceMock<lucid_tests::MockChunkStore>>();

    ON_CALL(*embedder_, create_embedding(_, _, _))
        .WillByDefault(Invoke([](const std::string& text, const std::string&, const RequestContext&) {
          return TestUtilities::create_test_vector(text);
        }));
    ON_CALL(*chat_, create_chat_completion(_, _, _, _)).WillByDefault(Return("an answer"));
  }

  RagDependencies full_deps(std::shared_ptr<ChunkStore> store = nullptr) {
    RagDependencies deps;
    deps.embedder = embedder_;
    deps.chat = chat_;
    deps.chunker = std::make_shared<Chunker>(512, 50);
    deps.store = store ? store : store_;
    return deps;
  }

  static std::vector<Chunk> found_chunks(int count) {
    return TestUtilities::create_test_chunks("doc", count);
  }

  std::shared_ptr<NiceMock<lucid_tests::MockEmbeddingProvider>> embedder_;
  std::shared_ptr<NiceMock<lucid_tests::MockChatProvider>> chat_;
  std::shared_ptr<NiceMock<lucid_tests::MockChunkStore>> store_;
};

// --- capabilities ---

TEST_F(RagServiceTest, CapabilitiesFollowDependencies) {
  RagService full({}, full_deps());
  EXPECT_TRUE(full.capabilities().can_query);
  EXPECT_TRUE(full.capabilities().can_index);
  EXPECT_TRUE(full.capabilities().can_delete);

  RagDependencies store_only;
  store_only.store = store_;
  RagService degraded({}, store_only);
  EXPECT_FALSE(degraded.capabilities().can_query);
  EXPECT_FALSE(degraded.capabilities().can_index);
  EXPECT_TRUE(degraded.capabilities().can_delete);

  RagDependencies no_chat = full_deps();
  no_chat.chat.reset();
  RagService index_only({}, no_chat);
  EXPECT_FALSE(index_only.capabilities().can_query);
  EXPECT_TRUE(index_only.capabilities().can_index);
}

TEST_F(RagServiceTest, EmptyConfigValuesFallBackToDefaults) {
  RagServiceConfig config;
  config.embedding_model = "";
  config.chat_model = "";
  config.default_top_k = 0;
  config.default_threshold = -1.0f;
  config.index_workers = 0;

  RagService service(config, {});
  EXPECT_EQ(service.config().embedding_model, "text-embedding-ada-002");
  EXPECT_EQ(service.config().chat_model, "gpt-3.5-turbo");
  EXPECT_EQ(service.config().default_top_k, 5);
  EXPECT_FLOAT_EQ(service.config().default_threshold, 0.7f);
  EXPECT_EQ(service.config().index_workers, 1);
}

// --- query ---

TEST_F(RagServiceTest, EmptyQueryIsInvalid) {
  RagService service({}, full_deps());
  EXPECT_THROW(service.query(Query{}), InvalidQueryError);

  RagService unconfigured({}, {});
  EXPECT_THROW(unconfigured.query(Query{}), InvalidQueryError);
}

TEST_F(RagServiceTest, UnconfiguredServiceAnswersWithoutError) {
  RagService service({}, {});
  Response response = service.query(Query{"what is the refund policy?"});

  EXPECT_THAT(response.answer, HasSubstr("not configured"));
  EXPECT_TRUE(response.relevant_chunks.empty());
  EXPECT_FLOAT_EQ(response.confidence_score, 0.0f);
  EXPECT_GE(response.processing_time_ms, 0);
}

TEST_F(RagServiceTest, AppliesDefaultTopKAndThreshold) {
  EXPECT_CALL(*store_, search(_, 5, ::testing::DoubleNear(0.7, 1e-6))).WillOnce(Return(found_chunks(1)));

  RagService service({}, full_deps());
  service.query(Query{"question", 0, 0.0f});
}

TEST_F(RagServiceTest, PassesExplicitTopKAndThreshold) {
  EXPECT_CALL(*store_, search(_, 3, ::testing::DoubleNear(0.25, 1e-6)))
      .WillOnce(Return(found_chunks(3)));

  RagService service({}, full_deps());
  service.query(Query{"question", 3, 0.25f});
}

TEST_F(RagServiceTest, NoRelevantChunksSkipsTheChatModel) {
  EXPECT_CALL(*store_, search(_, _, _)).WillOnce(Return(std::vector<Chunk>{}));
  EXPECT_CALL(*chat_, create_chat_completion(_, _, _, _)).Times(0);

  RagService service({}, full_deps());
  Response response = service.query(Query{"question"});

  EXPECT_THAT(response.answer, HasSubstr("couldn't find any relevant information"));
  EXPECT_TRUE(response.relevant_chunks.empty());
  EXPECT_FLOAT_EQ(response.confidence_score, 0.0f);
}

TEST_F(RagServiceTest, BuildsPromptFromRetrievedChunks) {
  std::vector<Chunk> chunks = {
      TestUtilities::create_test_chunk("doc", 0, "Refunds within 30 days.", {1.0f}),
      TestUtilities::create_test_chunk("doc", 1, "Store credit otherwise.", {1.0f}),
  };
  EXPECT_CALL(*store_, search(_, _, _)).WillOnce(Return(chunks));

  std::vector<ChatMessage> sent;
  EXPECT_CALL(*chat_, create_chat_completion(_, "gpt-3.5-turbo", _, _))
      .WillOnce(Invoke([&](const std::vector<ChatMessage>& messages, const std::string&,
                           const std::optional<CompletionOptions>& options,
                           const RequestContext&) {
        sent = messages;
        EXPECT_FALSE(options.has_value());
        return std::string("Within 30 days.");
      }));

  RagService service({}, full_deps());
  Response response = service.query(Query{"How long for refunds?", 2, 0.5f});

  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0].role, "system");
  EXPECT_EQ(sent[0].content, RagService::SYSTEM_PROMPT);
  EXPECT_EQ(sent[1].role, "user");
  EXPECT_EQ(sent[1].content,
            "Context:\n[Source 1]\nRefunds within 30 days.\n\n[Source 2]\nStore credit "
            "otherwise.\n\n\nQuestion: How long for refunds?");

  EXPECT_EQ(response.answer, "Within 30 days.");
  EXPECT_EQ(response.relevant_chunks.size(), 2u);
  EXPECT_FLOAT_EQ(response.confidence_score, 0.85f);
}

TEST_F(RagServiceTest, ConfidenceDropsWhenFewChunksFound) {
  EXPECT_CALL(*store_, search(_, 10, _)).WillOnce(Return(found_chunks(4)));

  RagService service({}, full_deps());
  Response response = service.query(Query{"question", 10, 0.5f});
  EXPECT_FLOAT_EQ(response.confidence_score, 0.60f);
}

TEST_F(RagServiceTest, ConfidenceHeuristicUsesIntegerHalf) {
  EXPECT_FLOAT_EQ(RagService::confidence_for(2, 5), 0.85f);  // 2 < 5/2 is false
  EXPECT_FLOAT_EQ(RagService::confidence_for(1, 5), 0.60f);
  EXPECT_FLOAT_EQ(RagService::confidence_for(1, 1), 0.85f);
  EXPECT_FLOAT_EQ(RagService::confidence_for(4, 10), 0.60f);
  EXPECT_FLOAT_EQ(RagService::confidence_for(5, 10), 0.85f);
}

TEST_F(RagServiceTest, QueryEmbeddingFailureIsProviderError) {
  EXPECT_CALL(*embedder_, create_embedding(_, _, _))
      .WillOnce(Throw(ProviderError("OpenAI API error: status 500")));
  EXPECT_CALL(*store_, search(_, _, _)).Times(0);

  RagService service({}, full_deps());
  try {
    service.query(Query{"question"});
    FAIL() << "expected ProviderError";
  } catch (const ProviderError& e) {
    EXPECT_THAT(e.what(), HasSubstr("generate query embedding"));
    EXPECT_THAT(e.what(), HasSubstr("status 500"));
  }
}

TEST_F(RagServiceTest, SearchFailureIsChunkStoreError) {
  EXPECT_CALL(*store_, search(_, _, _)).WillOnce(Throw(ChunkStoreError("search failed: io")));
  RagService service({}, full_deps());
  EXPECT_THROW(service.query(Query{"question"}), ChunkStoreError);
}

TEST_F(RagServiceTest, ChatFailureIsProviderError) {
  EXPECT_CALL(*store_, search(_, _, _)).WillOnce(Return(found_chunks(2)));
  EXPECT_CALL(*chat_, create_chat_completion(_, _, _, _))
      .WillOnce(Throw(ProviderError("no completion returned")));

  RagService service({}, full_deps());
  EXPECT_THROW(service.query(Query{"question"}), ProviderError);
}

TEST_F(RagServiceTest, CancelledContextStopsBeforeProviderCalls) {
  EXPECT_CALL(*embedder_, create_embedding(_, _, _)).Times(0);

  RequestContext context;
  context.cancel();
  RagService service({}, full_deps());
  EXPECT_THROW(service.query(Query{"question"}, context), DeadlineExceededError);
}

TEST_F(RagServiceTest, DeadlinePassingDuringEmbeddingStopsBeforeSearch) {
  auto context = RequestContext::with_timeout(std::chrono::milliseconds(20));
  EXPECT_CALL(*embedder_, create_embedding(_, _, _))
      .WillOnce(Invoke([](const std::string&, const std::string&, const RequestContext&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(40));
        return std::vector<float>{1.0f};
      }));
  EXPECT_CALL(*store_, search(_, _, _)).Times(0);

  RagService service({}, full_deps());
  EXPECT_THROW(service.query(Query{"question"}, context), DeadlineExceededError);
}

// --- index_document ---

TEST_F(RagServiceTest, IndexingIsANoOpWithoutCapabilityOrContent) {
  EXPECT_CALL(*store_, create_batch(_)).Times(0);

  RagService service({}, full_deps());
  EXPECT_EQ(service.index_document("doc", ""), 0u);
  EXPECT_EQ(service.index_document("doc", "   \n "), 0u);

  RagDependencies no_embedder = full_deps();
  no_embedder.embedder.reset();
  RagService unconfigured({}, no_embedder);
  EXPECT_EQ(unconfigured.index_document("doc", "some content"), 0u);
}

TEST_F(RagServiceTest, IndexesThousandWordDocumentAsThreeChunks) {
  std::vector<Chunk> batch;
  EXPECT_CALL(*store_, create_batch(SizeIs(3))).WillOnce(Invoke([&](const std::vector<Chunk>& c) {
    batch = c;
    return c;
  }));

  RagService service({}, full_deps());
  EXPECT_EQ(service.index_document("doc-42", TestUtilities::make_words(1000)), 3u);

  ASSERT_EQ(batch.size(), 3u);
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(batch[i].document_id, "doc-42");
    EXPECT_EQ(batch[i].chunk_index, i);
    EXPECT_FALSE(batch[i].embedding.empty());
  }
  EXPECT_EQ(batch[1].content.substr(0, 5), "w462 ");
}

TEST_F(RagServiceTest, FailedChunkEmbeddingsAreSkippedAndSurvivorsRenumbered) {
  auto chunker = std::make_shared<NiceMock<lucid_tests::MockChunker>>();
  ON_CALL(*chunker, chunk(_)).WillByDefault(Return(std::vector<std::string>{"a", "b", "c", "d"}));

  EXPECT_CALL(*embedder_, create_embedding(_, _, _)).WillRepeatedly(Return(std::vector<float>{1.0f}));
  EXPECT_CALL(*embedder_, create_embedding("b", _, _)).WillOnce(Throw(ProviderError("boom")));
  EXPECT_CALL(*embedder_, create_embedding("d", _, _)).WillOnce(Return(std::vector<float>{}));

  std::vector<Chunk> batch;
  EXPECT_CALL(*store_, create_batch(_)).WillOnce(Invoke([&](const std::vector<Chunk>& c) {
    batch = c;
    return c;
  }));

  RagDependencies deps = full_deps();
  deps.chunker = chunker;
  RagService service({}, deps);
  EXPECT_EQ(service.index_document("doc", "ignored"), 2u);

  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch[0].content, "a");
  EXPECT_EQ(batch[0].chunk_index, 0);
  EXPECT_EQ(batch[1].content, "c");
  EXPECT_EQ(batch[1].chunk_index, 1);
}

TEST_F(RagServiceTest, AllEmbeddingsFailingStoresNothing) {
  EXPECT_CALL(*embedder_, create_embedding(_, _, _))
      .WillRepeatedly(Throw(ProviderError("provider down")));
  EXPECT_CALL(*store_, create_batch(_)).Times(0);

  RagService service({}, full_deps());
  size_t stored = 0;
  EXPECT_NO_THROW(stored = service.index_document("doc", TestUtilities::make_words(1200)));
  EXPECT_EQ(stored, 0u);
}

TEST_F(RagServiceTest, BatchFailureIsFatal) {
  EXPECT_CALL(*store_, create_batch(_)).WillOnce(Throw(ChunkStoreError("constraint")));
  RagService service({}, full_deps());
  EXPECT_THROW(service.index_document("doc", "some words here"), ChunkStoreError);
}

TEST_F(RagServiceTest, ParallelIndexingKeepsOriginalOrder) {
  auto chunker = std::make_shared<Chunker>(10, 0);
  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};

  EXPECT_CALL(*embedder_, create_embedding(_, _, _))
      .WillRepeatedly(Invoke([&](const std::string& text, const std::string&, const RequestContext&) {
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
        }
        // Later chunks finish first
        std::this_thread::sleep_for(std::chrono::milliseconds(text.size() % 7));
        --in_flight;
        return TestUtilities::create_test_vector(text);
      }));

  auto store = std::make_shared<InMemoryChunkStore>();
  RagServiceConfig config;
  config.index_workers = 4;
  RagDependencies deps = full_deps(store);
  deps.chunker = chunker;
  RagService service(config, deps);

  const std::string text = TestUtilities::make_words(95);
  EXPECT_EQ(service.index_document("doc", text), 10u);
  EXPECT_LE(max_in_flight.load(), 4);

  auto expected = chunker->chunk(text);
  auto stored = store->get_by_document_id("doc");
  ASSERT_EQ(stored.size(), expected.size());
  for (size_t i = 0; i < stored.size(); ++i) {
    EXPECT_EQ(stored[i].chunk_index, static_cast<int>(i));
    EXPECT_EQ(stored[i].content, expected[i]);
    EXPECT_EQ(stored[i].embedding, TestUtilities::create_test_vector(expected[i]));
  }
}

TEST_F(RagServiceTest, CancelledContextAbortsIndexing) {
  EXPECT_CALL(*store_, create_batch(_)).Times(0);
  RequestContext context;
  context.cancel();

  RagService service({}, full_deps());
  EXPECT_THROW(service.index_document("doc", "some words", context), DeadlineExceededError);
}

// --- delete ---

TEST_F(RagServiceTest, DeleteDelegatesToStore) {
  EXPECT_CALL(*store_, delete_by_document_id("doc")).Times(1);
  RagService service({}, full_deps());
  service.delete_document_chunks("doc");
}

TEST_F(RagServiceTest, DeleteWithoutStoreIsANoOp) {
  RagService service({}, {});
  EXPECT_NO_THROW(service.delete_document_chunks("doc"));
}

TEST_F(RagServiceTest, DeleteFailureIsFatal) {
  EXPECT_CALL(*store_, delete_by_document_id(_)).WillOnce(Throw(ChunkStoreError("locked")));
  RagService service({}, full_deps());
  EXPECT_THROW(service.delete_document_chunks("doc"), ChunkStoreError);
}

// --- end to end over the in-memory store ---

TEST_F(RagServiceTest, IndexedDocumentIsRetrievableUntilDeleted) {
  auto store = std::make_shared<InMemoryChunkStore>();
  RagService service({}, full_deps(store));

  const std::string content = "Refunds are accepted within thirty days of purchase.";
  ASSERT_EQ(service.index_document("policy", content), 1u);

  // The embedder is deterministic, so the query with the same text matches exactly
  Response found = service.query(Query{content, 5, 0.99f});
  ASSERT_EQ(found.relevant_chunks.size(), 1u);
  EXPECT_EQ(found.relevant_chunks[0].document_id, "policy");

  service.delete_document_chunks("policy");
  EXPECT_TRUE(store->get_by_document_id("policy").empty());
  Response after = service.query(Query{content, 5, 0.99f});
  EXPECT_TRUE(after.relevant_chunks.empty());
}

TEST(RagServiceStaticTest, BuildContextNumbersSourcesFromOne) {
  std::vector<Chunk> chunks(2);
  chunks[0].content = "alpha";
  chunks[1].content = "beta";
  EXPECT_EQ(RagService::build_context(chunks), "[Source 1]\nalpha\n\n[Source 2]\nbeta\n\n");
  EXPECT_EQ(RagService::build_context({}), "");
}

}  // namespace lucid_core
