#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace verity::engine {

    struct Config;

    struct GenerationRequest {
        std::string system_prompt;
        std::string user_prompt;
        int max_tokens = 1000;
        float temperature = 0.7f;
    };

    using TokenCallback = std::function<void(const std::string& token)>;

    /**
     * @brief Chat-completion capability of a language model backend.
     */
    class Generator {
    public:
        virtual ~Generator() = default;

        /**
         * @brief Blocking completion; the result is trimmed.
         * @throws verity::Error (Generation)
         */
        virtual std::string complete(const GenerationRequest& request) = 0;

        /**
         * @brief Streams text increments to on_token until the model finishes
         * or cancel becomes true, whichever comes first. Empty increments are
         * not delivered. Returns normally when cancelled.
         * @throws verity::Error (Generation)
         */
        virtual void complete_streaming(const GenerationRequest& request, const TokenCallback& on_token,
                                        const std::atomic<bool>& cancel) = 0;

        /**
         * @brief One-token completion against the backend.
         * @throws verity::Error (Generation or Connectivity) when unreachable.
         */
        virtual void probe() = 0;
    };

    /**
     * @brief Reassembles newline-terminated lines from arbitrary byte slices.
     */
    class LineBuffer {
    public:
        /**
         * @brief Appends data and returns every line completed by it, without
         * the terminator ("\r\n" or "\n").
         */
        std::vector<std::string> feed(const char* data, size_t size);

        /**
         * @brief Returns and clears an unterminated trailing line.
         */
        std::string flush();

    private:
        std::string m_pending;
    };

    std::unique_ptr<Generator> create_ollama_generator(const std::string& model, const std::string& endpoint = "",
                                                       long timeout_ms = 30000);
    std::unique_ptr<Generator> create_openai_generator(const std::string& api_key, const std::string& model,
                                                       const std::string& endpoint = "", long timeout_ms = 30000);

    /**
     * @brief Builds the generator named by config.generation.backend.
     * @throws verity::Error (Configuration)
     */
    std::unique_ptr<Generator> create_generator(const Config& config);

}
