#include "answerer.hpp"
#include "context.hpp"
#include "generator.hpp"
#include "prompts.hpp"
#include "reformulator.hpp"
#include "retriever.hpp"
#include "vector_index.hpp"
#include "chunker.hpp"
#include "log.hpp"

namespace verity::engine {

    AnswerStream::AnswerStream(StreamEvent metadata, Producer producer)
        : m_metadata(std::move(metadata)) {
        m_metadata.type = StreamEvent::Type::Metadata;
        m_producer = std::thread([this, producer = std::move(producer)]() {
            producer(m_channel);
            m_channel.close();
        });
    }

    AnswerStream::~AnswerStream() {
        cancel();
        if (m_producer.joinable()) m_producer.join();
    }

    void AnswerStream::cancel() {
        m_channel.cancel();
    }

    bool AnswerStream::next(StreamEvent& event) {
        if (m_channel.cancelled()) {
            m_state = State::Done;
            return false;
        }
        switch (m_state) {
            case State::Metadata:
                event = m_metadata;
                m_state = State::Chunks;
                return true;
            case State::Chunks: {
                std::string token;
                if (m_channel.pop(token)) {
                    event = StreamEvent{};
                    event.type = StreamEvent::Type::Chunk;
                    event.content = std::move(token);
                    return true;
                }
                m_state = State::Done;
                if (m_channel.cancelled()) return false;
                event = StreamEvent{};
                event.type = StreamEvent::Type::End;
                return true;
            }
            case State::Done:
                break;
        }
        return false;
    }

    AnswerOrchestrator::AnswerOrchestrator(QueryReformulator& reformulator, Retriever& retriever,
                                           Generator& generator, VectorIndex& index, AnswerSettings settings)
        : m_reformulator(reformulator),
          m_retriever(retriever),
          m_generator(generator),
          m_index(index),
          m_settings(settings) {}

    Result<RetrievalContext> AnswerOrchestrator::get_context(const std::string& query, size_t top_k) const {
        try {
            RetrievalContext ctx;
            ctx.original_query = query;
            ctx.reformulated_query = m_reformulator.reformulate(query);
            ctx.documents = m_retriever.retrieve(ctx.reformulated_query, top_k);
            ctx.context = format_context(ctx.documents);
            ctx.num_documents = ctx.documents.size();
            return ctx;
        } catch (const Error& e) {
            return e;
        } catch (const std::exception& e) {
            return Error(ErrorKind::Index, e.what());
        }
    }

    Answer AnswerOrchestrator::ask(const std::string& query, size_t top_k) const {
        Answer answer;
        answer.query = query;
        answer.reformulated_query = query;

        auto ctx = get_context(query, top_k);
        if (!ctx) {
            log::error("Answerer", "RAG pipeline failed for query '" + query + "': " + ctx.error().what());
            answer.answer = prompts::kApology;
            return answer;
        }
        answer.reformulated_query = ctx.value().reformulated_query;
        answer.num_documents = ctx.value().num_documents;

        GenerationRequest request;
        request.system_prompt = prompts::kSystem;
        request.user_prompt = prompts::rag(ctx.value().context, query);
        request.max_tokens = m_settings.max_tokens;
        request.temperature = m_settings.temperature;

        try {
            answer.answer = m_generator.complete(request);
        } catch (const std::exception& e) {
            log::error("Answerer", "Generation failed for query '" + query + "': " + e.what());
            answer.answer = prompts::kApology;
        }
        return answer;
    }

    std::unique_ptr<AnswerStream> AnswerOrchestrator::ask_streaming(const std::string& query, size_t top_k) const {
        StreamEvent metadata;
        metadata.original_query = query;
        metadata.reformulated_query = query;

        auto ctx = get_context(query, top_k);
        if (!ctx) {
            log::error("Answerer", "RAG pipeline failed for query '" + query + "': " + ctx.error().what());
            return std::make_unique<AnswerStream>(metadata, [](TokenChannel& channel) {
                channel.push(prompts::kApology);
            });
        }
        metadata.reformulated_query = ctx.value().reformulated_query;
        metadata.num_documents = ctx.value().num_documents;

        GenerationRequest request;
        request.system_prompt = prompts::kSystem;
        request.user_prompt = prompts::rag(ctx.value().context, query);
        request.max_tokens = m_settings.max_tokens;
        request.temperature = m_settings.temperature;

        Generator& generator = m_generator;
        return std::make_unique<AnswerStream>(metadata, [&generator, request, query](TokenChannel& channel) {
            try {
                generator.complete_streaming(request,
                    [&channel](const std::string& token) {
                        if (!token.empty()) channel.push(token);
                    },
                    channel.cancel_flag());
            } catch (const std::exception& e) {
                if (channel.cancelled()) return;
                log::error("Answerer", "Streaming failed for query '" + query + "': " + e.what());
                channel.push(prompts::kApology);
            }
        });
    }

    HealthStatus AnswerOrchestrator::health_check() const {
        HealthStatus status;
        std::string errors;

        try {
            m_generator.probe();
            status.generation = ComponentHealth::Healthy;
        } catch (const std::exception& e) {
            status.generation = ComponentHealth::Unhealthy;
            errors = std::string("generation: ") + e.what();
            log::error("Health", errors);
        }

        try {
            m_index.probe();
            status.index = ComponentHealth::Healthy;
        } catch (const std::exception& e) {
            status.index = ComponentHealth::Unhealthy;
            std::string msg = std::string("index: ") + e.what();
            log::error("Health", msg);
            errors += (errors.empty() ? "" : "; ") + msg;
        }

        bool gen_ok = status.generation == ComponentHealth::Healthy;
        bool idx_ok = status.index == ComponentHealth::Healthy;
        if (gen_ok && idx_ok) status.overall = OverallHealth::Healthy;
        else if (gen_ok || idx_ok) status.overall = OverallHealth::Degraded;
        else status.overall = OverallHealth::Unhealthy;

        status.error = errors;
        return status;
    }

    void validate_query(const std::string& query, long long top_k) {
        if (trim(query).empty()) {
            throw Error(ErrorKind::Validation, "query must not be empty");
        }
        if (top_k < 1 || top_k > 20) {
            throw Error(ErrorKind::Validation, "top_k must be between 1 and 20");
        }
    }

}
