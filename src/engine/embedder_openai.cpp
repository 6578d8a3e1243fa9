#include "embedder.hpp"
#include "http.hpp"
#include "log.hpp"
#include "verity/error.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace verity::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model, const std::string& endpoint,
                       size_t batch_size, long timeout_ms, size_t dimension)
            : m_model(model),
              m_url((endpoint.empty() ? std::string("https://api.openai.com") : endpoint) + "/v1/embeddings"),
              m_batch_size(batch_size),
              m_dimension(dimension) {
            if (api_key.empty()) {
                throw Error(ErrorKind::Configuration, "OpenAI embedder requires an API key");
            }
            m_options.headers.push_back("Authorization: Bearer " + api_key);
            m_options.timeout_ms = timeout_ms;
            if (m_dimension == 0) {
                m_dimension = request({"test"}).at(0).size();
            }
            log::info("OpenAIEmbedder", "Model '" + m_model + "' ready, dimension " + std::to_string(m_dimension));
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
            json body = {
                {"model", m_model},
                {"input", texts}
            };

            HttpResponse resp;
            try {
                resp = http_post_json(m_url, body.dump(-1, ' ', false, json::error_handler_t::replace), m_options);
            } catch (const Error& e) {
                throw e.wrap(ErrorKind::Embedding, "openai embeddings");
            }

            try {
                auto j = json::parse(resp.body);
                if (j.contains("error")) {
                    throw Error(ErrorKind::Embedding, "API error: " + j["error"].dump());
                }
                if (!is_success(resp)) {
                    throw Error(ErrorKind::Embedding, "openai embeddings failed: " + describe(resp));
                }
                // Items carry their input position; do not trust array order.
                std::vector<std::vector<float>> out(texts.size());
                for (const auto& item : j.at("data")) {
                    size_t idx = item.at("index").get<size_t>();
                    if (idx >= out.size()) {
                        throw Error(ErrorKind::Embedding, "embedding index out of range");
                    }
                    out[idx] = item.at("embedding").get<std::vector<float>>();
                }
                return out;
            } catch (const json::exception& e) {
                throw Error(ErrorKind::Embedding, std::string("JSON parse error: ") + e.what());
            }
        }
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model,
                                                     const std::string& endpoint, size_t batch_size,
                                                     long timeout_ms, size_t dimension) {
        return std::make_unique<OpenAIEmbedder>(api_key, model, endpoint, batch_size, timeout_ms, dimension);
    }

}
