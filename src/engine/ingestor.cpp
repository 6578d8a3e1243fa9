#include "ingestor.hpp"
#include "chunker.hpp"
#include "embedder.hpp"
#include "extractor.hpp"
#include "storage.hpp"
#include "vector_index.hpp"
#include "log.hpp"

namespace verity::engine {

    IngestionOrchestrator::IngestionOrchestrator(DocumentStorage& storage, TextExtractor& extractor,
                                                 const Chunker& chunker, Embedder& embedder,
                                                 VectorIndex& index, DocumentIdentity identity)
        : m_storage(storage),
          m_extractor(extractor),
          m_chunker(chunker),
          m_embedder(embedder),
          m_index(index),
          m_identity(std::move(identity)) {}

    size_t IngestionOrchestrator::ingest_document(const std::string& key) {
        const std::string document_id = m_identity.document_id(key);

        try {
            size_t deleted = m_index.delete_where("document_id", document_id);
            if (deleted > 0) {
                log::info("Ingestor", "Deleted " + std::to_string(deleted) + " existing chunks for document " + document_id);
            }
        } catch (const Error& e) {
            log::warn("Ingestor", "Failed to delete existing chunks for " + document_id + ": " + e.what());
        }

        std::string bytes = m_storage.fetch(key);
        std::string text = m_extractor.extract(bytes, key);

        ChunkMetadata metadata;
        auto slash = key.find_last_of('/');
        metadata.filename = slash == std::string::npos ? key : key.substr(slash + 1);
        metadata.document_id = document_id;
        metadata.file_size = bytes.size();
        metadata.processed_date = utc_now_iso8601();

        auto chunks = m_chunker.chunk(text, metadata);
        if (chunks.empty()) {
            log::warn("Ingestor", "No chunks created for " + key);
            return 0;
        }

        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (const auto& c : chunks) texts.push_back(c.text);

        auto vectors = m_embedder.embed_many(texts);
        if (vectors.size() != chunks.size()) {
            throw Error(ErrorKind::Embedding, "got " + std::to_string(vectors.size()) + " embeddings for " +
                        std::to_string(chunks.size()) + " chunks");
        }

        std::vector<IndexedPoint> points;
        points.reserve(chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& c = chunks[i];
            IndexedPoint p;
            p.id = DocumentIdentity::chunk_id(document_id, c.index);
            p.vector = std::move(vectors[i]);
            p.payload.filename = c.metadata.filename;
            p.payload.document_id = c.metadata.document_id;
            p.payload.file_size = c.metadata.file_size;
            p.payload.processed_date = c.metadata.processed_date;
            p.payload.text = c.text;
            p.payload.chunk_index = c.index;
            points.push_back(std::move(p));
        }
        m_index.upsert(points);

        log::info("Ingestor", "Processed " + key + ": " + std::to_string(points.size()) + " chunks stored");
        return points.size();
    }

    Result<size_t> IngestionOrchestrator::ingest_one(const std::string& key) {
        log::info("Ingestor", "Processing " + key);
        try {
            return ingest_document(key);
        } catch (const Error& e) {
            return Error(ErrorKind::Ingestion,
                         "Failed to process " + key + ": " + kind_name(e.kind()) + " error: " + e.what());
        } catch (const std::exception& e) {
            return Error(ErrorKind::Ingestion, "Failed to process " + key + ": " + e.what());
        }
    }

    IngestionSummary IngestionOrchestrator::run(const std::vector<std::string>& keys) {
        IngestionSummary summary;
        for (const auto& key : keys) {
            if (m_stop) {
                log::info("Ingestor", "Stop requested, leaving remaining documents");
                break;
            }
            FileOutcome outcome;
            outcome.file = key;
            auto result = ingest_one(key);
            if (result) {
                outcome.success = true;
                outcome.chunks = result.value();
                ++summary.processed;
            } else {
                outcome.error = result.error().what();
                ++summary.failed;
                log::error("Ingestor", outcome.error);
            }
            summary.files.push_back(std::move(outcome));
        }
        log::info("Ingestor", "Ingestion complete: " + std::to_string(summary.processed) + " succeeded, " +
                  std::to_string(summary.failed) + " failed");
        return summary;
    }

    Result<IngestionSummary> IngestionOrchestrator::ingest_all(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(m_run_mutex);
        std::vector<std::string> keys;
        try {
            keys = m_storage.list(prefix);
        } catch (const Error& e) {
            return e.wrap(ErrorKind::Ingestion, "Failed to list documents");
        } catch (const std::exception& e) {
            return Error(ErrorKind::Ingestion, std::string("Failed to list documents: ") + e.what());
        }
        if (keys.empty()) {
            log::info("Ingestor", "No documents found");
            return IngestionSummary{};
        }
        log::info("Ingestor", "Found " + std::to_string(keys.size()) + " documents to process");
        return run(keys);
    }

    IngestionSummary IngestionOrchestrator::ingest_keys(const std::vector<std::string>& keys) {
        std::lock_guard<std::mutex> lock(m_run_mutex);
        return run(keys);
    }

}
