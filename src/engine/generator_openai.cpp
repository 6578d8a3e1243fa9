#include "generator.hpp"
#include "chunker.hpp"
#include "http.hpp"
#include "log.hpp"
#include "verity/error.hpp"
#include <nlohmann/json.hpp>
#include <optional>

using json = nlohmann::json;

namespace verity::engine {

    /**
     * @brief OpenAI-compatible /v1/chat/completions. Streams as server-sent events.
     */
    class OpenAIGenerator : public Generator {
    public:
        OpenAIGenerator(const std::string& api_key, const std::string& model, const std::string& endpoint,
                        long timeout_ms)
            : m_model(model),
              m_url((endpoint.empty() ? std::string("https://api.openai.com") : endpoint) + "/v1/chat/completions") {
            if (api_key.empty()) {
                throw Error(ErrorKind::Configuration, "OpenAI generator requires an API key");
            }
            m_options.headers.push_back("Authorization: Bearer " + api_key);
            m_options.timeout_ms = timeout_ms;
        }

        std::string complete(const GenerationRequest& request) override {
            HttpResponse resp;
            try {
                resp = http_post_json(m_url, body(request, false), m_options);
            } catch (const Error& e) {
                throw e.wrap(ErrorKind::Generation, "openai chat");
            }
            try {
                auto j = json::parse(resp.body);
                if (j.contains("error")) {
                    throw Error(ErrorKind::Generation, "API error: " + j["error"].dump());
                }
                if (!is_success(resp)) {
                    throw Error(ErrorKind::Generation, "openai chat failed: " + describe(resp));
                }
                const auto& content = j.at("choices").at(0).at("message").at("content");
                return content.is_string() ? trim(content.get<std::string>()) : std::string();
            } catch (const json::exception& e) {
                throw Error(ErrorKind::Generation, std::string("JSON parse error: ") + e.what());
            }
        }

        void complete_streaming(const GenerationRequest& request, const TokenCallback& on_token,
                                const std::atomic<bool>& cancel) override {
            LineBuffer lines;
            bool done = false;

            auto handle_line = [&](const std::string& line) {
                // SSE: only "data:" fields matter; blank lines separate events.
                if (done || line.rfind("data:", 0) != 0) return;
                std::string data = trim(line.substr(5));
                if (data == "[DONE]") {
                    done = true;
                    return;
                }
                std::string token;
                try {
                    auto j = json::parse(data);
                    if (j.contains("error")) {
                        throw Error(ErrorKind::Generation, "API error: " + j["error"].dump());
                    }
                    if (j.contains("choices") && !j["choices"].empty()) {
                        const auto& delta = j["choices"][0].value("delta", json::object());
                        if (delta.contains("content") && delta["content"].is_string()) {
                            token = delta["content"].get<std::string>();
                        }
                    }
                } catch (const json::exception& e) {
                    throw Error(ErrorKind::Generation, std::string("bad stream event: ") + e.what());
                }
                if (!token.empty() && !cancel) on_token(token);
            };

            std::optional<Error> failure;
            HttpOptions options = m_options;
            options.cancel = &cancel;
            HttpResponse resp;
            try {
                resp = http_post_stream(m_url, body(request, true), options,
                    [&](const char* data, size_t size) {
                        if (cancel) return false;
                        try {
                            for (const auto& line : lines.feed(data, size)) handle_line(line);
                        } catch (const Error& e) {
                            failure = e;
                            return false;
                        } catch (const std::exception& e) {
                            failure = Error(ErrorKind::Generation, e.what());
                            return false;
                        }
                        return !cancel.load();
                    });
            } catch (const Error& e) {
                throw e.wrap(ErrorKind::Generation, "openai stream");
            }
            if (failure) throw *failure;
            if (resp.aborted) {
                log::debug("OpenAIGenerator", "Stream cancelled");
                return;
            }
            if (!is_success(resp)) {
                throw Error(ErrorKind::Generation, "openai stream failed: " + describe(resp));
            }
            handle_line(lines.flush());
        }

        void probe() override {
            GenerationRequest request;
            request.user_prompt = "Hello";
            request.max_tokens = 1;
            request.temperature = 0.1f;
            complete(request);
        }

    private:
        std::string m_model;
        std::string m_url;
        HttpOptions m_options;

        std::string body(const GenerationRequest& request, bool stream) const {
            json j = {
                {"model", m_model},
                {"messages", json::array({
                    {{"role", "system"}, {"content", request.system_prompt}},
                    {{"role", "user"}, {"content", request.user_prompt}}
                })},
                {"max_tokens", request.max_tokens},
                {"temperature", request.temperature},
                {"stream", stream}
            };
            return j.dump(-1, ' ', false, json::error_handler_t::replace);
        }
    };

    std::unique_ptr<Generator> create_openai_generator(const std::string& api_key, const std::string& model,
                                                       const std::string& endpoint, long timeout_ms) {
        return std::make_unique<OpenAIGenerator>(api_key, model, endpoint, timeout_ms);
    }

}
