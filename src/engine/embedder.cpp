#include "embedder.hpp"
#include "config.hpp"
#include "verity/error.hpp"
#include <algorithm>

namespace verity::engine {

    std::vector<std::vector<float>> embed_in_batches(const std::vector<std::string>& texts, size_t batch_size,
                                                     size_t dimension, const BatchFn& fn) {
        std::vector<std::vector<float>> out;
        out.reserve(texts.size());
        if (batch_size == 0) batch_size = texts.size();

        for (size_t start = 0; start < texts.size(); start += batch_size) {
            size_t end = std::min(start + batch_size, texts.size());
            std::vector<std::string> slice(texts.begin() + start, texts.begin() + end);
            auto vectors = fn(slice);
            if (vectors.size() != slice.size()) {
                throw Error(ErrorKind::Embedding, "backend returned " + std::to_string(vectors.size()) +
                            " vectors for " + std::to_string(slice.size()) + " texts");
            }
            for (auto& v : vectors) {
                if (dimension != 0 && v.size() != dimension) {
                    throw Error(ErrorKind::Embedding, "dimension mismatch: expected " + std::to_string(dimension) +
                                ", got " + std::to_string(v.size()));
                }
                out.push_back(std::move(v));
            }
        }
        return out;
    }

    std::unique_ptr<Embedder> create_embedder(const Config& config) {
        const auto& e = config.embedding;
        if (e.backend == "openai") {
            return create_openai_embedder(e.api_key, e.model, e.endpoint, e.batch_size, e.timeout_ms,
                                          config.index.dimension);
        }
        if (e.backend == "onnx") {
            return create_onnx_embedder(e.onnx_model, e.onnx_vocab, e.batch_size);
        }
        if (e.backend == "ollama") {
            return create_ollama_embedder(e.model, e.endpoint, e.batch_size, e.timeout_ms, config.index.dimension);
        }
        throw Error(ErrorKind::Configuration, "unknown embedding backend '" + e.backend + "'");
    }

}
