#pragma once

#include "platform.hpp"
#include <functional>
#include <string>

namespace verity {

    namespace engine {
        class AnswerOrchestrator;
        class IngestionOrchestrator;
        class VectorIndex;
        struct Config;
    }

    /**
     * @brief Dispatches one JSON request ({"method": ..., "params": {...}})
     * to the orchestrators and writes JSON frames back.
     *
     * Methods: ping, status, health, ask, ask_stream, ingest, shutdown.
     */
    class Router {
    public:
        Router(engine::AnswerOrchestrator& answerer, engine::IngestionOrchestrator& ingestor,
               engine::VectorIndex& index, const engine::Config& config, std::function<void()> on_shutdown);

        void handle(const std::string& request, platform::Responder& out);

    private:
        engine::AnswerOrchestrator& m_answerer;
        engine::IngestionOrchestrator& m_ingestor;
        engine::VectorIndex& m_index;
        const engine::Config& m_config;
        std::function<void()> m_on_shutdown;
    };

}
