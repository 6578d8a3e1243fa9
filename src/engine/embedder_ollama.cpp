#include "embedder.hpp"
#include "http.hpp"
#include "log.hpp"
#include "verity/error.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace verity::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint, size_t batch_size,
                       long timeout_ms, size_t dimension)
            : m_model(model),
              m_url((endpoint.empty() ? std::string("http://localhost:11434") : endpoint) + "/api/embed"),
              m_batch_size(batch_size),
              m_dimension(dimension) {
            m_options.timeout_ms = timeout_ms;
            if (m_dimension == 0) {
                // Ask the model once; every later vector must match.
                m_dimension = request({"test"}).at(0).size();
            }
            log::info("OllamaEmbedder", "Model '" + m_model + "' ready, dimension " + std::to_string(m_dimension));
        }

        std::vector<float> embed_one(const std::string& text) override {
            return embed_many({text}).at(0);
        }

        std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override {
            if (texts.empty()) return {};
            return embed_in_batches(texts, m_batch_size, m_dimension,
                                    [this](const std::vector<std::string>& slice) { return request(slice); });
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_model;
        std::string m_url;
        size_t m_batch_size;
        size_t m_dimension;
        HttpOptions m_options;

        std::vector<std::vector<float>> request(const std::vector<std::string>& texts) {
            std::string body;
            try {
                body = json{{"model", m_model}, {"input", texts}}
                           .dump(-1, ' ', false, json::error_handler_t::replace);
            } catch (const json::exception& e) {
                throw Error(ErrorKind::Embedding, std::string("JSON serialization error: ") + e.what());
            }

            HttpResponse resp;
            try {
                resp = http_post_json(m_url, body, m_options);
            } catch (const Error& e) {
                throw e.wrap(ErrorKind::Embedding, "ollama embed");
            }
            if (!is_success(resp)) {
                throw Error(ErrorKind::Embedding, "ollama embed failed: " + describe(resp));
            }

            try {
                auto j = json::parse(resp.body);
                if (!j.contains("embeddings")) {
                    throw Error(ErrorKind::Embedding, "ollama response has no embeddings");
                }
                return j["embeddings"].get<std::vector<std::vector<float>>>();
            } catch (const json::exception& e) {
                throw Error(ErrorKind::Embedding, std::string("JSON parse error: ") + e.what());
            }
        }
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint,
                                                     size_t batch_size, long timeout_ms, size_t dimension) {
        return std::make_unique<OllamaEmbedder>(model, endpoint, batch_size, timeout_ms, dimension);
    }

}
