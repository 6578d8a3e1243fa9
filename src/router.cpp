#include "router.hpp"
#include "engine/answerer.hpp"
#include "engine/config.hpp"
#include "engine/ingestor.hpp"
#include "engine/serialize.hpp"
#include "engine/vector_index.hpp"
#include "engine/log.hpp"
#include "verity/error.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace verity {

    namespace {
        std::string error_frame(const std::string& message, ErrorKind kind) {
            return json({{"error", message}, {"kind", kind_name(kind)}}).dump(-1, ' ', false, json::error_handler_t::replace);
        }

        std::string result_frame(const json& result) {
            return json({{"result", result}}).dump(-1, ' ', false, json::error_handler_t::replace);
        }
    }

    Router::Router(engine::AnswerOrchestrator& answerer, engine::IngestionOrchestrator& ingestor,
                   engine::VectorIndex& index, const engine::Config& config, std::function<void()> on_shutdown)
        : m_answerer(answerer),
          m_ingestor(ingestor),
          m_index(index),
          m_config(config),
          m_on_shutdown(std::move(on_shutdown)) {}

    void Router::handle(const std::string& request, platform::Responder& out) {
        json j;
        try {
            j = json::parse(request);
        } catch (const json::exception&) {
            out.send(error_frame("invalid json", ErrorKind::Validation));
            return;
        }

        try {
            std::string method = j.value("method", "");
            json params = j.value("params", json::object());

            if (method == "ping") {
                out.send(result_frame("pong"));
                return;
            }
            if (method == "status") {
                out.send(result_frame({
                    {"points", m_index.count()},
                    {"collection", m_config.index.collection},
                    {"embedding_backend", m_config.embedding.backend},
                    {"generation_backend", m_config.generation.backend},
                    {"streaming", m_config.generation.streaming}
                }));
                return;
            }
            if (method == "health") {
                out.send(result_frame(m_answerer.health_check()));
                return;
            }
            if (method == "ask" || method == "ask_stream") {
                std::string query = params.value("query", "");
                long long top_k = params.value("top_k", static_cast<long long>(m_config.default_top_k));
                engine::validate_query(query, top_k);

                if (method == "ask") {
                    out.send(result_frame(m_answerer.ask(query, static_cast<size_t>(top_k))));
                    return;
                }

                auto stream = m_answerer.ask_streaming(query, static_cast<size_t>(top_k));
                engine::StreamEvent event;
                while (stream->next(event)) {
                    json frame;
                    switch (event.type) {
                        case engine::StreamEvent::Type::Metadata:
                            frame = {
                                {"type", "metadata"},
                                {"original_query", event.original_query},
                                {"reformulated_query", event.reformulated_query},
                                {"num_documents", event.num_documents}
                            };
                            break;
                        case engine::StreamEvent::Type::Chunk:
                            frame = {{"type", "chunk"}, {"content", event.content}};
                            break;
                        case engine::StreamEvent::Type::End:
                            frame = {{"type", "end"}};
                            break;
                    }
                    if (!out.send(frame.dump(-1, ' ', false, json::error_handler_t::replace))) {
                        log::info("Router", "Client disconnected, cancelling stream");
                        stream->cancel();
                        break;
                    }
                }
                return;
            }
            if (method == "ingest") {
                if (params.contains("keys")) {
                    auto keys = params["keys"].get<std::vector<std::string>>();
                    out.send(result_frame(m_ingestor.ingest_keys(keys)));
                    return;
                }
                auto summary = m_ingestor.ingest_all(params.value("prefix", ""));
                if (!summary) {
                    out.send(error_frame(summary.error().what(), summary.error().kind()));
                    return;
                }
                out.send(result_frame(summary.value()));
                return;
            }
            if (method == "shutdown") {
                out.send(result_frame("shutting down"));
                if (m_on_shutdown) m_on_shutdown();
                return;
            }
            out.send(error_frame("unknown method '" + method + "'", ErrorKind::Validation));
        } catch (const Error& e) {
            out.send(error_frame(e.what(), e.kind()));
        } catch (const json::exception& e) {
            out.send(error_frame(std::string("bad params: ") + e.what(), ErrorKind::Validation));
        } catch (const std::exception& e) {
            log::error("Router", std::string("Request failed: ") + e.what());
            out.send(error_frame(std::string("internal error: ") + e.what(), ErrorKind::Connectivity));
        }
    }

}
