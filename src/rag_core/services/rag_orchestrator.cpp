#include "rag_core/services/rag_orchestrator.hpp"

#include <iostream>

#include "rag_core/errors.hpp"
#include "rag_core/splitters/recursive_character_text_splitter.hpp"

namespace rag_core {

namespace {

// Claims an activity flag for one call and resets it when the call returns or throws.
// A call that finds the flag already set is rejected without touching it.
class FlagGuard {
 public:
  FlagGuard(std::atomic<bool> &flag, const char *busy_message) : flag_(flag) {
    bool expected = false;
    if (!flag_.compare_exchange_strong(expected, true)) {
      throw BusyError(busy_message);
    }
  }
  ~FlagGuard() {
    flag_ = false;
  }

  FlagGuard(const FlagGuard &) = delete;
  FlagGuard &operator=(const FlagGuard &) = delete;

 private:
  std::atomic<bool> &flag_;
};

}  // namespace

GenerationHandle &GenerationHandle::operator=(GenerationHandle &&other) {
  if (this != &other) {
    cancel_pending();
    tokens = std::move(other.tokens);
    result = std::move(other.result);
  }
  return *this;
}

GenerationHandle::~GenerationHandle() {
  cancel_pending();
}

void GenerationHandle::cancel_pending() {
  if (tokens && result.valid()) {
    tokens->cancel();
    result.wait();
  }
}

RagOrchestrator::RagOrchestrator(VectorStorePtr vector_store,
                                 std::shared_ptr<GenerativeModel> model,
                                 std::shared_ptr<UuidGenerator> uuid_generator)
    : vector_store_(std::move(vector_store)),
      model_(std::move(model)),
      uuid_generator_(std::move(uuid_generator)) {
  if (!vector_store_ || !model_) {
    throw InvalidArgumentError("RagOrchestrator requires a vector store and a generative model");
  }
  if (!uuid_generator_) {
    uuid_generator_ = std::make_shared<UuidGenerator>();
  }
}

void RagOrchestrator::load() {
  vector_store_->load();
  model_->load();
}

void RagOrchestrator::unload() {
  vector_store_->unload();
  model_->unload();
}

void RagOrchestrator::set_error(const std::string &message) {
  std::lock_guard<std::mutex> lock(state_mtx_);
  last_error_ = message;
}

void RagOrchestrator::clear_error() {
  std::lock_guard<std::mutex> lock(state_mtx_);
  last_error_.reset();
}

std::optional<std::string> RagOrchestrator::last_error() const {
  std::lock_guard<std::mutex> lock(state_mtx_);
  return last_error_;
}

std::string RagOrchestrator::current_response() const {
  std::lock_guard<std::mutex> lock(state_mtx_);
  return current_response_;
}

template <typename Fn>
auto RagOrchestrator::run_storing(Fn &&fn) -> decltype(fn()) {
  FlagGuard guard(is_storing_, "RAG busy storing");
  clear_error();
  try {
    return fn();
  } catch (const std::exception &e) {
    set_error(e.what());
    throw;
  }
}

std::vector<std::string> RagOrchestrator::split_add_document(
    const std::string &document,
    const MetadataGenerator &metadata_generator,
    TextSplitterPtr text_splitter) {
  return run_storing([&]() {
    if (!text_splitter) {
      text_splitter = std::make_shared<RecursiveCharacterTextSplitter>(
          RecursiveCharacterTextSplitter::DEFAULT_CHUNK_SIZE,
          RecursiveCharacterTextSplitter::DEFAULT_CHUNK_OVERLAP);
    }

    AddRequest request;
    std::vector<std::string> chunks = text_splitter->split_text(document);
    if (metadata_generator) {
      request.metadatas = metadata_generator(chunks);
      if (request.metadatas.size() != chunks.size()) {
        throw ShapeMismatchError("metadata_generator must return metadata for all chunks: expected " +
                                 std::to_string(chunks.size()) + ", got " +
                                 std::to_string(request.metadatas.size()));
      }
    }

    request.ids.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
      request.ids.push_back(uuid_generator_->generate());
    }
    request.documents.assign(chunks.begin(), chunks.end());

    if (chunks.empty()) {
      return std::vector<std::string>{};
    }
    return vector_store_->add(request);
  });
}

std::vector<std::string> RagOrchestrator::add_document(const AddRequest &request) {
  return run_storing([&]() { return vector_store_->add(request); });
}

void RagOrchestrator::update_document(const UpdateRequest &request) {
  run_storing([&]() { vector_store_->update(request); });
}

void RagOrchestrator::delete_document(const DeleteRequest &request) {
  run_storing([&]() { vector_store_->remove(request); });
}

std::string RagOrchestrator::default_question(const Messages &messages) {
  return messages.empty() ? "" : messages.back().content;
}

std::string RagOrchestrator::default_prompt(const Messages &messages,
                                            const std::vector<QueryResult> &retrieved) {
  std::string prompt = "Message: " + (messages.empty() ? "" : messages.back().content);
  prompt += "\nContext: ";
  for (size_t i = 0; i < retrieved.size(); ++i) {
    if (i > 0)
      prompt += "\n";
    prompt += retrieved[i].document.value_or("");
  }
  return prompt;
}

std::string RagOrchestrator::generate(const GenerateRequest &request) {
  return run_generation(request, [](const std::string &) { return true; });
}

std::string RagOrchestrator::run_generation(const GenerateRequest &request,
                                            const TokenSink &sink) {
  FlagGuard guard(is_generating_, "RAG busy generating");
  {
    std::lock_guard<std::mutex> lock(state_mtx_);
    current_response_.clear();
    last_error_.reset();
  }

  try {
    Messages messages;
    if (const auto *text = std::get_if<std::string>(&request.input)) {
      messages.push_back(Message{Role::User, *text});
    } else {
      messages = std::get<Messages>(request.input);
    }
    if (messages.empty()) {
      throw EmptyInputError("No messages provided");
    }

    auto on_token = [&](const std::string &token) -> bool {
      if (request.callback) {
        request.callback(token);
      }
      {
        std::lock_guard<std::mutex> lock(state_mtx_);
        current_response_ += token;
      }
      return sink(token);
    };

    if (!request.augmented_generation) {
      return model_->generate(messages, on_token);
    }

    if (messages.back().content.empty()) {
      throw MissingContentError("Last message has no content");
    }

    const std::string question = request.question_generator
                                     ? request.question_generator(messages)
                                     : default_question(messages);

    QueryRequest query;
    query.query_texts = std::vector<std::string>{question};
    query.n_results = request.n_results;
    query.predicate = request.predicate;
    std::vector<std::vector<QueryResult>> retrieved = vector_store_->query(query);
    const std::vector<QueryResult> &docs =
        retrieved.empty() ? std::vector<QueryResult>{} : retrieved.front();

    const std::string prompt = request.prompt_generator ? request.prompt_generator(messages, docs)
                                                        : default_prompt(messages, docs);
    messages.push_back(Message{Role::User, prompt});
    return model_->generate(messages, on_token);
  } catch (const std::exception &e) {
    set_error(e.what());
    throw;
  }
}

GenerationHandle RagOrchestrator::generate_stream(GenerateRequest request,
                                                  size_t stream_capacity) {
  auto stream = std::make_shared<TokenStream>(stream_capacity);

  GenerationHandle handle;
  handle.tokens = stream;
  handle.result = std::async(std::launch::async, [this, request = std::move(request), stream]() {
    try {
      std::string text = run_generation(request, [this, &stream](const std::string &token) {
        if (stream->push(token)) {
          return true;
        }
        model_->interrupt();
        return false;
      });
      stream->close();
      return text;
    } catch (const std::exception &e) {
      std::cerr << "Streaming generation failed: " << e.what() << std::endl;
      stream->close();
      throw;
    }
  });
  return handle;
}

void RagOrchestrator::interrupt() {
  if (is_generating_) {
    model_->interrupt();
  }
}

}  // namespace rag_core
