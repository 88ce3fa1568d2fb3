#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "rag_core/llm/generative_model.hpp"
#include "rag_core/llm/token_stream.hpp"
#include "rag_core/splitters/text_splitter.hpp"
#include "rag_core/stores/vector_store.hpp"
#include "rag_core/types.hpp"
#include "rag_core/uuid_generator.hpp"

namespace rag_core {

using MetadataGenerator = std::function<std::vector<Metadata>(const std::vector<std::string> &)>;
using QuestionGenerator = std::function<std::string(const Messages &)>;
using PromptGenerator =
    std::function<std::string(const Messages &, const std::vector<QueryResult> &)>;
using TokenCallback = std::function<void(const std::string &)>;

struct GenerateRequest {
  // A bare string becomes a single user message
  std::variant<std::string, Messages> input;
  bool augmented_generation = true;
  size_t n_results = 3;
  ResultPredicate predicate;
  // Defaults to the content of the last message
  QuestionGenerator question_generator;
  // Defaults to default_prompt()
  PromptGenerator prompt_generator;
  TokenCallback callback;
};

// Dropping a handle whose result was never taken cancels the stream, then waits for the worker.
struct GenerationHandle {
  std::shared_ptr<TokenStream> tokens;
  // Final text, or the exception generation failed with
  std::future<std::string> result;

  GenerationHandle() = default;
  GenerationHandle(GenerationHandle &&) = default;
  GenerationHandle &operator=(GenerationHandle &&other);
  ~GenerationHandle();

  GenerationHandle(const GenerationHandle &) = delete;
  GenerationHandle &operator=(const GenerationHandle &) = delete;

 private:
  void cancel_pending();
};

/**
 * @class RagOrchestrator
 * @brief Ingests documents into a VectorStore and answers with a GenerativeModel.
 *
 * Tokens reach the caller's callback first and are appended to current_response() right
 * after. current_response() is cleared when a generation starts. The last failure of any
 * storing or generating call is kept in last_error() and cleared by the next call.
 */
class RagOrchestrator {
 public:
  RagOrchestrator(VectorStorePtr vector_store,
                  std::shared_ptr<GenerativeModel> model,
                  std::shared_ptr<UuidGenerator> uuid_generator = nullptr);

  RagOrchestrator(const RagOrchestrator &) = delete;
  RagOrchestrator &operator=(const RagOrchestrator &) = delete;

  // Store first, then model.
  void load();
  void unload();

  /**
   * Splits the document, assigns one id per chunk and stores all chunks in one add.
   * Uses a RecursiveCharacterTextSplitter(500, 100) when no splitter is given.
   * Throws ShapeMismatchError, before anything is stored, when metadata_generator returns
   * a different number of entries than there are chunks.
   */
  // Storing calls throw BusyError while another storing call is running.
  std::vector<std::string> split_add_document(const std::string &document,
                                              const MetadataGenerator &metadata_generator = nullptr,
                                              TextSplitterPtr text_splitter = nullptr);

  std::vector<std::string> add_document(const AddRequest &request);
  void update_document(const UpdateRequest &request);
  void delete_document(const DeleteRequest &request);

  // Throws BusyError while another generation is running.
  std::string generate(const GenerateRequest &request);

  // Runs generate() on a worker thread and streams tokens through the returned channel.
  // Cancelling the stream stops the model. The orchestrator must outlive the handle.
  GenerationHandle generate_stream(GenerateRequest request, size_t stream_capacity = 0);

  // Asks the model to stop. Ignored while no generation is running.
  void interrupt();

  std::string current_response() const;
  bool is_generating() const {
    return is_generating_;
  }
  bool is_storing() const {
    return is_storing_;
  }
  std::optional<std::string> last_error() const;

  static std::string default_question(const Messages &messages);
  static std::string default_prompt(const Messages &messages,
                                    const std::vector<QueryResult> &retrieved);

 private:
  std::string run_generation(const GenerateRequest &request, const TokenSink &sink);

  template <typename Fn>
  auto run_storing(Fn &&fn) -> decltype(fn());

  void set_error(const std::string &message);
  void clear_error();

  VectorStorePtr vector_store_;
  std::shared_ptr<GenerativeModel> model_;
  std::shared_ptr<UuidGenerator> uuid_generator_;

  std::atomic<bool> is_generating_{false};
  std::atomic<bool> is_storing_{false};
  mutable std::mutex state_mtx_;
  std::string current_response_;
  std::optional<std::string> last_error_;
};

}  // namespace rag_core
