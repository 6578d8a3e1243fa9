#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace verity::engine {

    struct Config;

    /**
     * @brief Embedding capability: text in, fixed-length vectors out.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @throws verity::Error (Embedding)
         */
        virtual std::vector<float> embed_one(const std::string& text) = 0;

        /**
         * @brief Embeds many texts; result[i] belongs to texts[i].
         * @throws verity::Error (Embedding)
         */
        virtual std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) = 0;

        /**
         * @brief Dimension of every vector this embedder returns. Fixed once constructed.
         */
        virtual size_t dimension() const = 0;
    };

    using BatchFn = std::function<std::vector<std::vector<float>>(const std::vector<std::string>&)>;

    /**
     * @brief Runs fn over consecutive slices of at most batch_size texts and
     * checks that every slice comes back complete and of the given dimension
     * (0 skips the dimension check).
     */
    std::vector<std::vector<float>> embed_in_batches(const std::vector<std::string>& texts, size_t batch_size,
                                                     size_t dimension, const BatchFn& fn);

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model,
                                                     const std::string& endpoint = "",
                                                     size_t batch_size = 32, long timeout_ms = 120000,
                                                     size_t dimension = 0);
    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path,
                                                   size_t batch_size = 32);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key,
                                                     const std::string& model = "text-embedding-3-small",
                                                     const std::string& endpoint = "",
                                                     size_t batch_size = 32, long timeout_ms = 120000,
                                                     size_t dimension = 0);

    /**
     * @brief Builds the embedder named by config.embedding.backend.
     * @throws verity::Error (Configuration, Connectivity or Embedding)
     */
    std::unique_ptr<Embedder> create_embedder(const Config& config);

}
