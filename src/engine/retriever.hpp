#pragma once

#include "verity/types.hpp"
#include <string>
#include <vector>

namespace verity::engine {

    class Embedder;
    class VectorIndex;

    class Retriever {
    public:
        Retriever(Embedder& embedder, VectorIndex& index);

        /**
         * @brief At most top_k chunks, most similar first.
         * @throws verity::Error (Embedding or Index)
         */
        std::vector<ScoredChunk> retrieve(const std::string& query, size_t top_k) const;

    private:
        Embedder& m_embedder;
        VectorIndex& m_index;
    };

}
