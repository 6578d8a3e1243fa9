#pragma once

#include <string>
#include <vector>
#include "verity/types.hpp"

namespace verity::engine {

    /**
     * @brief Splits extracted text into overlapping, size-bounded chunks.
     *
     * Sizes are counted in UTF-8 code points. The splitter tries the
     * coarsest separator first and only falls back to finer ones for pieces
     * that are still too large. Stateless apart from its parameters.
     */
    class Chunker {
    public:
        /**
         * @throws verity::Error (Configuration) if chunk_size is zero or
         *         chunk_overlap is not smaller than chunk_size.
         */
        Chunker(size_t chunk_size = 1000, size_t chunk_overlap = 200,
                std::vector<std::string> separators = default_separators());

        /**
         * @brief Splits text and attaches metadata; indices are 0..n-1.
         */
        std::vector<Chunk> chunk(const std::string& text, const ChunkMetadata& metadata) const;

        /**
         * @brief Splits text into trimmed, non-empty segments.
         */
        std::vector<std::string> split_text(const std::string& text) const;

        /**
         * @brief Paragraph, line, sentence, word, then hard cut.
         */
        static std::vector<std::string> default_separators();

        size_t chunk_size() const { return m_chunk_size; }
        size_t chunk_overlap() const { return m_chunk_overlap; }

    private:
        size_t m_chunk_size;
        size_t m_chunk_overlap;
        std::vector<std::string> m_separators;

        std::vector<std::string> split_recursive(const std::string& text, size_t first_separator) const;
        void merge(const std::vector<std::string>& pieces, std::vector<std::string>& out) const;
    };

    /**
     * @brief Number of UTF-8 code points in s.
     */
    size_t utf8_length(const std::string& s);

    /**
     * @brief Copy of s without leading and trailing ASCII whitespace.
     */
    std::string trim(const std::string& s);

}
