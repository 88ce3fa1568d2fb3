#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/mocks_test.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/rag_orchestrator.hpp"
#include "rag_core/splitters/recursive_character_text_splitter.hpp"
#include "rag_core/stores/memory_vector_store.hpp"

namespace rag_tests {

using namespace rag_core;
using ::testing::_;
using ::testing::DoAll;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

class RagOrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<NiceMock<MockVectorStore>>();
    model_ = std::make_shared<NiceMock<MockGenerativeModel>>();
    orchestrator_ = std::make_unique<RagOrchestrator>(store_, model_);
  }

  std::shared_ptr<NiceMock<MockVectorStore>> store_;
  std::shared_ptr<NiceMock<MockGenerativeModel>> model_;
  std::unique_ptr<RagOrchestrator> orchestrator_;
};

TEST_F(RagOrchestratorTest, RequiresStoreAndModel) {
  EXPECT_THROW(RagOrchestrator(nullptr, model_), InvalidArgumentError);
  EXPECT_THROW(RagOrchestrator(store_, nullptr), InvalidArgumentError);
}

TEST_F(RagOrchestratorTest, LoadsStoreBeforeModel) {
  {
    InSequence seq;
    EXPECT_CALL(*store_, load());
    EXPECT_CALL(*model_, load());
    EXPECT_CALL(*store_, unload());
    EXPECT_CALL(*model_, unload());
  }
  orchestrator_->load();
  orchestrator_->unload();
}

// --- Generation ---

TEST_F(RagOrchestratorTest, PlainGenerationSkipsRetrieval) {
  Messages seen;
  EXPECT_CALL(*store_, query(_)).Times(0);
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce(DoAll(SaveArg<0>(&seen), MockUtilities::stream_tokens({"Hel", "lo"})));

  GenerateRequest request;
  request.input = std::string("hi");
  request.augmented_generation = false;
  std::string text = orchestrator_->generate(request);

  EXPECT_EQ(text, "Hello");
  EXPECT_EQ(orchestrator_->current_response(), "Hello");
  EXPECT_EQ(seen, (Messages{{Role::User, "hi"}}));
  EXPECT_FALSE(orchestrator_->is_generating());
}

TEST_F(RagOrchestratorTest, AugmentedGenerationQueriesOnceAndBuildsPrompt) {
  QueryRequest seen_query;
  Messages seen_messages;
  std::vector<std::vector<QueryResult>> retrieved = {
      {MockUtilities::make_result("a", "first fact", 0.9f),
       MockUtilities::make_result("b", "second fact", 0.5f)}};

  EXPECT_CALL(*store_, query(_)).WillOnce(DoAll(SaveArg<0>(&seen_query), Return(retrieved)));
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce(DoAll(SaveArg<0>(&seen_messages), MockUtilities::stream_tokens({"ok"})));

  GenerateRequest request;
  request.input = Messages{{Role::System, "be brief"}, {Role::User, "what is up?"}};
  request.n_results = 5;
  request.predicate = [](const QueryResult &) { return true; };
  orchestrator_->generate(request);

  ASSERT_TRUE(seen_query.query_texts.has_value());
  EXPECT_EQ(*seen_query.query_texts, (std::vector<std::string>{"what is up?"}));
  EXPECT_FALSE(seen_query.query_embeddings.has_value());
  EXPECT_EQ(seen_query.n_results, 5u);
  EXPECT_TRUE(static_cast<bool>(seen_query.predicate));

  ASSERT_EQ(seen_messages.size(), 3u);
  EXPECT_EQ(seen_messages[0].content, "be brief");
  EXPECT_EQ(seen_messages[2].role, Role::User);
  EXPECT_EQ(seen_messages[2].content,
            "Message: what is up?\nContext: first fact\nsecond fact");
}

TEST_F(RagOrchestratorTest, CustomQuestionAndPromptGenerators) {
  QueryRequest seen_query;
  Messages seen_messages;
  EXPECT_CALL(*store_, query(_))
      .WillOnce(DoAll(SaveArg<0>(&seen_query),
                      Return(std::vector<std::vector<QueryResult>>{
                          {MockUtilities::make_result("a", "fact", 0.9f)}})));
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce(DoAll(SaveArg<0>(&seen_messages), MockUtilities::stream_tokens({"ok"})));

  GenerateRequest request;
  request.input = std::string("plain question");
  request.question_generator = [](const Messages &messages) {
    return "rewritten " + messages.back().content;
  };
  request.prompt_generator = [](const Messages &, const std::vector<QueryResult> &docs) {
    return "docs=" + std::to_string(docs.size());
  };
  orchestrator_->generate(request);

  EXPECT_EQ(*seen_query.query_texts, (std::vector<std::string>{"rewritten plain question"}));
  EXPECT_EQ(seen_messages.back().content, "docs=1");
}

TEST_F(RagOrchestratorTest, CallbackSeesTokenBeforeItIsAppended) {
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce(MockUtilities::stream_tokens({"a", "b", "c"}));

  std::vector<std::string> tokens;
  std::vector<std::string> responses_at_callback;
  GenerateRequest request;
  request.input = std::string("hi");
  request.augmented_generation = false;
  request.callback = [&](const std::string &token) {
    tokens.push_back(token);
    responses_at_callback.push_back(orchestrator_->current_response());
  };
  orchestrator_->generate(request);

  EXPECT_EQ(tokens, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(responses_at_callback, (std::vector<std::string>{"", "a", "ab"}));
  EXPECT_EQ(orchestrator_->current_response(), "abc");
}

TEST_F(RagOrchestratorTest, NewGenerationClearsPreviousResponse) {
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce(MockUtilities::stream_tokens({"first"}))
      .WillOnce(MockUtilities::stream_tokens({"second"}));

  GenerateRequest request;
  request.input = std::string("hi");
  request.augmented_generation = false;
  orchestrator_->generate(request);
  orchestrator_->generate(request);

  EXPECT_EQ(orchestrator_->current_response(), "second");
}

TEST_F(RagOrchestratorTest, EmptyMessagesAreRejected) {
  EXPECT_CALL(*model_, generate(_, _)).Times(0);

  GenerateRequest request;
  request.input = Messages{};
  EXPECT_THROW(orchestrator_->generate(request), EmptyInputError);
  EXPECT_EQ(orchestrator_->last_error(), "No messages provided");

  request.augmented_generation = false;
  EXPECT_THROW(orchestrator_->generate(request), EmptyInputError);
}

TEST_F(RagOrchestratorTest, AugmentedGenerationNeedsLastMessageContent) {
  EXPECT_CALL(*store_, query(_)).Times(0);

  GenerateRequest request;
  request.input = Messages{{Role::User, "earlier"}, {Role::User, ""}};
  EXPECT_THROW(orchestrator_->generate(request), MissingContentError);
  EXPECT_EQ(orchestrator_->last_error(), "Last message has no content");
}

TEST_F(RagOrchestratorTest, ModelFailureIsRecordedAndRethrown) {
  EXPECT_CALL(*model_, generate(_, _)).WillOnce(Throw(std::runtime_error("model offline")));

  GenerateRequest request;
  request.input = std::string("hi");
  request.augmented_generation = false;
  EXPECT_THROW(orchestrator_->generate(request), std::runtime_error);
  EXPECT_EQ(orchestrator_->last_error(), "model offline");
  EXPECT_FALSE(orchestrator_->is_generating());
}

TEST_F(RagOrchestratorTest, InterruptWhileIdleIsIgnored) {
  EXPECT_CALL(*model_, interrupt()).Times(0);
  orchestrator_->interrupt();
}

TEST_F(RagOrchestratorTest, InterruptDuringRetrievalReachesModel) {
  {
    InSequence seq;
    EXPECT_CALL(*store_, query(_)).WillOnce([&](const QueryRequest &) {
      orchestrator_->interrupt();
      return std::vector<std::vector<QueryResult>>{{}};
    });
    EXPECT_CALL(*model_, interrupt());
    EXPECT_CALL(*model_, generate(_, _)).WillOnce(Return(std::string()));
  }

  GenerateRequest request;
  request.input = std::string("question");
  EXPECT_EQ(orchestrator_->generate(request), "");
}

TEST_F(RagOrchestratorTest, DefaultPromptWithoutContext) {
  EXPECT_EQ(RagOrchestrator::default_prompt({{Role::User, "q"}}, {}), "Message: q\nContext: ");
  EXPECT_EQ(RagOrchestrator::default_question({{Role::User, "a"}, {Role::User, "b"}}), "b");
}

// --- Streaming ---

TEST_F(RagOrchestratorTest, StreamDeliversTokensInOrder) {
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce(MockUtilities::stream_tokens({"one ", "two ", "three"}));

  GenerateRequest request;
  request.input = std::string("count");
  request.augmented_generation = false;
  GenerationHandle handle = orchestrator_->generate_stream(request);

  std::vector<std::string> received;
  while (auto token = handle.tokens->next()) {
    received.push_back(*token);
  }

  EXPECT_EQ(received, (std::vector<std::string>{"one ", "two ", "three"}));
  EXPECT_EQ(handle.result.get(), "one two three");
  EXPECT_EQ(orchestrator_->current_response(), "one two three");
}

TEST_F(RagOrchestratorTest, CancellingStreamInterruptsModel) {
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce(MockUtilities::stream_tokens({"a", "b", "c", "d"}));
  EXPECT_CALL(*model_, interrupt()).Times(1);

  GenerateRequest request;
  request.input = std::string("hi");
  request.augmented_generation = false;
  GenerationHandle handle = orchestrator_->generate_stream(request, 1);

  auto first = handle.tokens->next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, "a");
  handle.tokens->cancel();

  EXPECT_NO_THROW(handle.result.get());
  EXPECT_FALSE(handle.tokens->next().has_value());
}

TEST_F(RagOrchestratorTest, StreamFailureClosesStreamAndSurfacesError) {
  EXPECT_CALL(*model_, generate(_, _)).WillOnce(Throw(std::runtime_error("boom")));

  GenerateRequest request;
  request.input = std::string("hi");
  request.augmented_generation = false;
  GenerationHandle handle = orchestrator_->generate_stream(request);

  EXPECT_FALSE(handle.tokens->next().has_value());
  EXPECT_THROW(handle.result.get(), std::runtime_error);
  EXPECT_EQ(orchestrator_->last_error(), "boom");
}

TEST_F(RagOrchestratorTest, DroppingUndrainedBoundedStreamStopsGeneration) {
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce(MockUtilities::stream_tokens({"a", "b", "c"}));
  EXPECT_CALL(*model_, interrupt()).Times(1);

  GenerateRequest request;
  request.input = std::string("hi");
  request.augmented_generation = false;

  auto dropped = std::async(std::launch::async, [&]() {
    GenerationHandle handle = orchestrator_->generate_stream(request, 1);
  });
  ASSERT_EQ(dropped.wait_for(std::chrono::seconds(10)), std::future_status::ready);
  EXPECT_FALSE(orchestrator_->is_generating());
}

TEST_F(RagOrchestratorTest, OverlappingGenerationIsRejected) {
  std::promise<void> entered;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce([&](const Messages &, const TokenSink &sink) {
        entered.set_value();
        released.wait();
        sink("done");
        return std::string("done");
      });

  GenerateRequest request;
  request.input = std::string("hi");
  request.augmented_generation = false;
  GenerationHandle first = orchestrator_->generate_stream(request);
  entered.get_future().wait();

  EXPECT_THROW(orchestrator_->generate(request), BusyError);
  EXPECT_TRUE(orchestrator_->is_generating());
  EXPECT_FALSE(orchestrator_->last_error().has_value());

  release.set_value();
  EXPECT_EQ(first.result.get(), "done");
  EXPECT_FALSE(orchestrator_->is_generating());
  EXPECT_EQ(orchestrator_->current_response(), "done");
}

// --- Storing ---

TEST_F(RagOrchestratorTest, StoringCallsForwardAndFlagActivity) {
  bool storing_during_add = false;
  EXPECT_CALL(*store_, add(_)).WillOnce([&](const AddRequest &) {
    storing_during_add = orchestrator_->is_storing();
    return std::vector<std::string>{"id"};
  });
  EXPECT_CALL(*store_, update(_));
  EXPECT_CALL(*store_, remove(_));

  AddRequest add;
  add.documents = {std::string("doc")};
  EXPECT_EQ(orchestrator_->add_document(add), (std::vector<std::string>{"id"}));
  EXPECT_TRUE(storing_during_add);
  EXPECT_FALSE(orchestrator_->is_storing());

  orchestrator_->update_document(UpdateRequest{});
  DeleteRequest remove;
  remove.ids = std::vector<std::string>{"id"};
  orchestrator_->delete_document(remove);
}

TEST_F(RagOrchestratorTest, OverlappingStoringIsRejected) {
  std::promise<void> entered;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  EXPECT_CALL(*store_, add(_)).WillOnce([&](const AddRequest &) {
    entered.set_value();
    released.wait();
    return std::vector<std::string>{"id"};
  });
  EXPECT_CALL(*store_, remove(_)).Times(0);

  AddRequest add;
  add.documents = {std::string("doc")};
  auto first = std::async(std::launch::async, [&]() { return orchestrator_->add_document(add); });
  entered.get_future().wait();

  DeleteRequest remove;
  remove.ids = std::vector<std::string>{"id"};
  EXPECT_THROW(orchestrator_->delete_document(remove), BusyError);
  EXPECT_TRUE(orchestrator_->is_storing());
  EXPECT_FALSE(orchestrator_->last_error().has_value());

  release.set_value();
  EXPECT_EQ(first.get(), (std::vector<std::string>{"id"}));
  EXPECT_FALSE(orchestrator_->is_storing());
}

TEST_F(RagOrchestratorTest, StoringFailureIsRecordedAndClearedByNextCall) {
  EXPECT_CALL(*store_, remove(_))
      .WillOnce(Throw(NotFoundError("id not found: ghost")))
      .WillOnce(Return());

  DeleteRequest request;
  request.ids = std::vector<std::string>{"ghost"};
  EXPECT_THROW(orchestrator_->delete_document(request), NotFoundError);
  EXPECT_EQ(orchestrator_->last_error(), "id not found: ghost");
  EXPECT_FALSE(orchestrator_->is_storing());

  orchestrator_->delete_document(request);
  EXPECT_FALSE(orchestrator_->last_error().has_value());
}

TEST_F(RagOrchestratorTest, SplitAddUsesSplitterAndAssignsIds) {
  auto splitter = std::make_shared<MockTextSplitter>();
  EXPECT_CALL(*splitter, split_text("whole document"))
      .WillOnce(Return(std::vector<std::string>{"chunk one", "chunk two"}));

  AddRequest seen;
  EXPECT_CALL(*store_, add(_)).WillOnce(DoAll(SaveArg<0>(&seen), [](const AddRequest &request) {
    return request.ids;
  }));

  auto ids = orchestrator_->split_add_document("whole document", nullptr, splitter);

  ASSERT_EQ(ids.size(), 2u);
  EXPECT_NE(ids[0], ids[1]);
  EXPECT_TRUE(UuidGenerator::is_valid(ids[0]));
  EXPECT_EQ(seen.ids, ids);
  ASSERT_EQ(seen.documents.size(), 2u);
  EXPECT_EQ(seen.documents[0], "chunk one");
  EXPECT_EQ(seen.documents[1], "chunk two");
  EXPECT_TRUE(seen.metadatas.empty());
}

TEST_F(RagOrchestratorTest, SplitAddWithNoChunksStoresNothing) {
  auto splitter = std::make_shared<MockTextSplitter>();
  EXPECT_CALL(*splitter, split_text(_)).WillOnce(Return(std::vector<std::string>{}));
  EXPECT_CALL(*store_, add(_)).Times(0);

  EXPECT_TRUE(orchestrator_->split_add_document("", nullptr, splitter).empty());
}

TEST_F(RagOrchestratorTest, SplitAddRejectsShortMetadataBeforeStoring) {
  auto splitter = std::make_shared<MockTextSplitter>();
  EXPECT_CALL(*splitter, split_text(_))
      .WillOnce(Return(std::vector<std::string>{"one", "two", "three"}));
  EXPECT_CALL(*store_, add(_)).Times(0);

  auto metadata = [](const std::vector<std::string> &) {
    return std::vector<Metadata>{Metadata{{"only", 1}}};
  };
  EXPECT_THROW(orchestrator_->split_add_document("doc", metadata, splitter), ShapeMismatchError);
  EXPECT_EQ(orchestrator_->last_error(),
            "metadata_generator must return metadata for all chunks: expected 3, got 1");
}

// --- End to end with an in-memory store ---

class RagOrchestratorMemoryStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    embeddings_ = std::make_shared<FakeEmbeddingProvider>(4);
    store_ = std::make_shared<MemoryVectorStore>(embeddings_);
    model_ = std::make_shared<NiceMock<MockGenerativeModel>>();
    orchestrator_ = std::make_unique<RagOrchestrator>(store_, model_);
    orchestrator_->load();
  }

  std::shared_ptr<FakeEmbeddingProvider> embeddings_;
  std::shared_ptr<MemoryVectorStore> store_;
  std::shared_ptr<NiceMock<MockGenerativeModel>> model_;
  std::unique_ptr<RagOrchestrator> orchestrator_;
};

TEST_F(RagOrchestratorMemoryStoreTest, SplitAddedChunksAreRetrievable) {
  auto splitter = std::make_shared<RecursiveCharacterTextSplitter>(10, 0);
  auto metadata = [](const std::vector<std::string> &chunks) {
    std::vector<Metadata> result;
    for (size_t i = 0; i < chunks.size(); ++i) {
      result.push_back(Metadata{{"chunk", i}});
    }
    return result;
  };

  auto ids = orchestrator_->split_add_document("aaaa bbbb cccc dddd", metadata, splitter);

  ASSERT_EQ(ids.size(), 2u);
  EXPECT_EQ(store_->size(), 2u);
  EXPECT_EQ(store_->get(ids[0])->document, "aaaa bbbb");
  EXPECT_EQ(store_->get(ids[1])->document, "cccc dddd");
  EXPECT_EQ(store_->get(ids[1])->metadata["chunk"], 1);
}

TEST_F(RagOrchestratorMemoryStoreTest, EachChunkIsFoundByItsOwnText) {
  auto splitter = std::make_shared<MockTextSplitter>();
  EXPECT_CALL(*splitter, split_text(_))
      .WillOnce(Return(std::vector<std::string>{"aaaa", "zz"}));

  auto ids = orchestrator_->split_add_document("aaaa zz", nullptr, splitter);
  ASSERT_EQ(ids.size(), 2u);

  const std::vector<std::string> chunks = {"aaaa", "zz"};
  for (size_t i = 0; i < chunks.size(); ++i) {
    QueryRequest query;
    query.query_texts = std::vector<std::string>{chunks[i]};
    query.n_results = 1;
    auto results = store_->query(query);
    ASSERT_EQ(results[0].size(), 1u);
    EXPECT_EQ(results[0][0].id, ids[i]);
    EXPECT_NEAR(results[0][0].similarity, 1.0f, 1e-5);
  }
}

TEST_F(RagOrchestratorMemoryStoreTest, DefaultSplitterKeepsShortDocumentWhole) {
  auto ids = orchestrator_->split_add_document("A short note.");

  ASSERT_EQ(ids.size(), 1u);
  EXPECT_EQ(store_->get(ids[0])->document, "A short note.");
}

TEST_F(RagOrchestratorMemoryStoreTest, RetrievedChunkReachesPrompt) {
  AddRequest add;
  add.ids = {"note"};
  add.documents = {std::string("the sky is blue")};
  orchestrator_->add_document(add);

  Messages seen;
  EXPECT_CALL(*model_, generate(_, _))
      .WillOnce(DoAll(SaveArg<0>(&seen), MockUtilities::stream_tokens({"blue"})));

  GenerateRequest request;
  request.input = std::string("the sky is blue");
  request.n_results = 1;
  EXPECT_EQ(orchestrator_->generate(request), "blue");

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen.back().content, "Message: the sky is blue\nContext: the sky is blue");
}

}  // namespace rag_tests
