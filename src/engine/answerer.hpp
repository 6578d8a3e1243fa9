#pragma once

#include "verity/error.hpp"
#include "verity/types.hpp"
#include "token_channel.hpp"
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace verity::engine {

    class Generator;
    class VectorIndex;
    class QueryReformulator;
    class Retriever;

    struct StreamEvent {
        enum class Type { Metadata, Chunk, End };

        Type type = Type::End;
        std::string content;              // Chunk
        std::string original_query;       // Metadata
        std::string reformulated_query;   // Metadata
        size_t num_documents = 0;         // Metadata
    };

    /**
     * @brief One streamed answer: a Metadata event, Chunk events, then End.
     *
     * The producer runs on its own thread and feeds a TokenChannel. cancel()
     * stops it; after cancel next() returns false without further events.
     * Destruction cancels and joins.
     */
    class AnswerStream {
    public:
        using Producer = std::function<void(TokenChannel&)>;

        AnswerStream(StreamEvent metadata, Producer producer);
        ~AnswerStream();

        AnswerStream(const AnswerStream&) = delete;
        AnswerStream& operator=(const AnswerStream&) = delete;

        /**
         * @brief Blocks for the next event. False once End was delivered or after cancel.
         */
        bool next(StreamEvent& event);

        void cancel();

    private:
        enum class State { Metadata, Chunks, Done };

        StreamEvent m_metadata;
        State m_state = State::Metadata;
        TokenChannel m_channel;
        std::thread m_producer;
    };

    struct AnswerSettings {
        int max_tokens = 1000;
        float temperature = 0.7f;
    };

    /**
     * @brief Question answering over the index: reformulate, retrieve, prompt, generate.
     * Collaborators are borrowed and must outlive the orchestrator and its streams.
     */
    class AnswerOrchestrator {
    public:
        AnswerOrchestrator(QueryReformulator& reformulator, Retriever& retriever, Generator& generator,
                           VectorIndex& index, AnswerSettings settings = {});

        Result<RetrievalContext> get_context(const std::string& query, size_t top_k) const;

        /**
         * @brief Blocking answer. Failures become the apology answer.
         */
        Answer ask(const std::string& query, size_t top_k) const;

        /**
         * @brief Retrieves up front, then streams generation from a worker thread.
         */
        std::unique_ptr<AnswerStream> ask_streaming(const std::string& query, size_t top_k) const;

        HealthStatus health_check() const;

    private:
        QueryReformulator& m_reformulator;
        Retriever& m_retriever;
        Generator& m_generator;
        VectorIndex& m_index;
        AnswerSettings m_settings;
    };

    /**
     * @throws verity::Error (Validation) for a blank query or top_k outside 1..20.
     */
    void validate_query(const std::string& query, long long top_k);

}
