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
     * @brief Ollama /api/chat. Streaming responses are one JSON object per line.
     */
    class OllamaGenerator : public Generator {
    public:
        OllamaGenerator(const std::string& model, const std::string& endpoint, long timeout_ms)
            : m_model(model),
              m_url((endpoint.empty() ? std::string("http://localhost:11434") : endpoint) + "/api/chat") {
            m_options.timeout_ms = timeout_ms;
        }

        std::string complete(const GenerationRequest& request) override {
            HttpResponse resp;
            try {
                resp = http_post_json(m_url, body(request, false), m_options);
            } catch (const Error& e) {
                throw e.wrap(ErrorKind::Generation, "ollama chat");
            }
            if (!is_success(resp)) {
                throw Error(ErrorKind::Generation, "ollama chat failed: " + describe(resp));
            }
            try {
                auto j = json::parse(resp.body);
                if (j.contains("error")) {
                    throw Error(ErrorKind::Generation, "ollama: " + j["error"].get<std::string>());
                }
                return trim(j.at("message").at("content").get<std::string>());
            } catch (const json::exception& e) {
                throw Error(ErrorKind::Generation, std::string("JSON parse error: ") + e.what());
            }
        }

        void complete_streaming(const GenerationRequest& request, const TokenCallback& on_token,
                                const std::atomic<bool>& cancel) override {
            LineBuffer lines;
            bool done = false;

            auto handle_line = [&](const std::string& line) {
                if (line.empty() || done) return;
                std::string token;
                try {
                    auto j = json::parse(line);
                    if (j.contains("error")) {
                        throw Error(ErrorKind::Generation, "ollama: " + j["error"].dump());
                    }
                    if (j.contains("message") && j["message"].contains("content")) {
                        token = j["message"]["content"].get<std::string>();
                    }
                    done = j.value("done", false);
                } catch (const json::exception& e) {
                    throw Error(ErrorKind::Generation, std::string("bad stream line: ") + e.what());
                }
                if (!token.empty() && !cancel) on_token(token);
            };

            // Exceptions must not unwind through libcurl; park them until it returns.
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
                throw e.wrap(ErrorKind::Generation, "ollama stream");
            }
            if (failure) throw *failure;
            if (resp.aborted) {
                log::debug("OllamaGenerator", "Stream cancelled");
                return;
            }
            if (!is_success(resp)) {
                throw Error(ErrorKind::Generation, "ollama stream failed: " + describe(resp));
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
                {"stream", stream},
                {"options", {
                    {"num_predict", request.max_tokens},
                    {"temperature", request.temperature}
                }}
            };
            return j.dump(-1, ' ', false, json::error_handler_t::replace);
        }
    };

    std::unique_ptr<Generator> create_ollama_generator(const std::string& model, const std::string& endpoint,
                                                       long timeout_ms) {
        return std::make_unique<OllamaGenerator>(model, endpoint, timeout_ms);
    }

}
