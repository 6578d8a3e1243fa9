#include "retriever.hpp"
#include "embedder.hpp"
#include "vector_index.hpp"
#include "log.hpp"
#include <algorithm>

namespace verity::engine {

    Retriever::Retriever(Embedder& embedder, VectorIndex& index) : m_embedder(embedder), m_index(index) {}

    std::vector<ScoredChunk> Retriever::retrieve(const std::string& query, size_t top_k) const {
        auto vector = m_embedder.embed_one(query);
        auto results = m_index.search(vector, top_k);

        std::stable_sort(results.begin(), results.end(),
                         [](const ScoredChunk& a, const ScoredChunk& b) { return a.score > b.score; });
        if (results.size() > top_k) results.resize(top_k);

        log::info("Retriever", "Found " + std::to_string(results.size()) + " similar chunks");
        return results;
    }

}
