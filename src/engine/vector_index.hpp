#pragma once

#include "verity/types.hpp"
#include <string>
#include <vector>
#include <memory>
#include <filesystem>

namespace verity::engine {

    /**
     * @brief Stores points and answers nearest-neighbour queries within one collection.
     * Implementations must be safe to call from several threads.
     */
    class VectorIndex {
    public:
        virtual ~VectorIndex() = default;

        /**
         * @brief Creates the collection on first use, otherwise checks it matches.
         * @throws verity::Error (Configuration) when dimension or metric differ.
         */
        virtual void ensure_collection(size_t dimension, const std::string& metric) = 0;

        /**
         * @brief Inserts or replaces points by id, all or nothing.
         * Payloads without created_at are stamped with the current UTC time.
         * @throws verity::Error (Index)
         */
        virtual void upsert(const std::vector<IndexedPoint>& points) = 0;

        /**
         * @brief At most top_k points by descending cosine similarity.
         * @throws verity::Error (Index)
         */
        virtual std::vector<ScoredChunk> search(const std::vector<float>& vector, size_t top_k) = 0;

        /**
         * @brief Removes every point whose payload field equals value.
         * @return Number of points removed.
         * @throws verity::Error (Index)
         */
        virtual size_t delete_where(const std::string& field, const std::string& value) = 0;

        virtual size_t count() = 0;

        /**
         * @throws verity::Error (Connectivity) when the backing store is unusable.
         */
        virtual void probe() = 0;
    };

    /**
     * @brief Opens (creating if needed) the SQLite file at path and rebuilds
     * the in-memory graph for the named collection.
     * @throws verity::Error (Connectivity)
     */
    std::unique_ptr<VectorIndex> create_sqlite_index(const std::filesystem::path& path,
                                                     const std::string& collection);

}
