#pragma once

#include "verity/error.hpp"
#include "verity/types.hpp"
#include "identity.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace verity::engine {

    class DocumentStorage;
    class TextExtractor;
    class Chunker;
    class Embedder;
    class VectorIndex;

    /**
     * @brief Moves documents from storage into the index.
     *
     * Re-ingesting a document first removes its previous points, so running
     * the same ingestion twice leaves one copy. Runs are serialized.
     */
    class IngestionOrchestrator {
    public:
        IngestionOrchestrator(DocumentStorage& storage, TextExtractor& extractor, const Chunker& chunker,
                              Embedder& embedder, VectorIndex& index, DocumentIdentity identity);

        /**
         * @brief delete old points, fetch, extract, chunk, embed, upsert.
         * @return Number of chunks stored, or an Ingestion error naming the key.
         */
        Result<size_t> ingest_one(const std::string& key);

        /**
         * @brief Ingests every listed document; one failure does not stop the rest.
         * @return Error only when the listing itself fails.
         */
        Result<IngestionSummary> ingest_all(const std::string& prefix = "");

        /**
         * @brief Same isolation as ingest_all over an explicit key list.
         */
        IngestionSummary ingest_keys(const std::vector<std::string>& keys);

        /**
         * @brief Stops launching further documents for good; the current one finishes.
         */
        void stop() { m_stop = true; }
        bool stopping() const { return m_stop; }

    private:
        DocumentStorage& m_storage;
        TextExtractor& m_extractor;
        const Chunker& m_chunker;
        Embedder& m_embedder;
        VectorIndex& m_index;
        DocumentIdentity m_identity;
        std::atomic<bool> m_stop{false};
        std::mutex m_run_mutex;

        size_t ingest_document(const std::string& key);
        IngestionSummary run(const std::vector<std::string>& keys);
    };

}
