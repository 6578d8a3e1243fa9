#pragma once

#include <vector>
#include <memory>
#include <utility>
#include <cstdint>

namespace verity::engine {

    /**
     * @brief In-memory HNSW graph over L2-normalized vectors (cosine via inner product).
     * Not thread-safe; the owning index serializes access.
     */
    class Librarian {
    public:
        explicit Librarian(size_t dim, size_t initial_capacity = 1024);
        ~Librarian();

        /**
         * @brief Adds or replaces the vector under label, growing the graph when full.
         * @throws verity::Error (Index) on dimension mismatch.
         */
        void add_item(int64_t label, const std::vector<float>& vector);

        /**
         * @brief Hides label from searches; the next new label reuses its slot.
         * Unknown labels are ignored.
         */
        void remove_item(int64_t label);

        /**
         * @brief Nearest neighbours as (label, cosine similarity), best first.
         */
        std::vector<std::pair<int64_t, float>> search(const std::vector<float>& query, size_t k) const;

        /**
         * @brief Returns the number of live (not deleted) elements.
         */
        size_t count() const;

        /**
         * @brief Graph elements including deleted ones awaiting reuse.
         */
        size_t slots() const;

        size_t dimension() const { return m_dim; }

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
        size_t m_dim;
    };

}
