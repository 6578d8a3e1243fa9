#include "chunker.hpp"
#include "verity/error.hpp"
#include <deque>

namespace verity::engine {

    namespace {

        bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

        // Pieces keep their terminating separator; an empty separator cuts
        // between code points.
        std::vector<std::string> split_keep(const std::string& text, const std::string& sep) {
            std::vector<std::string> pieces;
            if (sep.empty()) {
                size_t start = 0;
                for (size_t i = 1; i <= text.size(); ++i) {
                    if (i == text.size() || !is_continuation(static_cast<unsigned char>(text[i]))) {
                        pieces.push_back(text.substr(start, i - start));
                        start = i;
                    }
                }
                return pieces;
            }

            size_t pos = 0;
            while (pos < text.size()) {
                size_t next = text.find(sep, pos);
                size_t end = (next == std::string::npos) ? text.size() : next + sep.size();
                if (end > pos) pieces.push_back(text.substr(pos, end - pos));
                pos = end;
            }
            return pieces;
        }

    }

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n\f\v";
        size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    size_t utf8_length(const std::string& s) {
        size_t n = 0;
        for (unsigned char c : s) {
            if (!is_continuation(c)) ++n;
        }
        return n;
    }

    Chunker::Chunker(size_t chunk_size, size_t chunk_overlap, std::vector<std::string> separators)
        : m_chunk_size(chunk_size), m_chunk_overlap(chunk_overlap), m_separators(std::move(separators)) {
        if (m_chunk_size == 0) {
            throw Error(ErrorKind::Configuration, "chunk_size must be positive");
        }
        if (m_chunk_overlap >= m_chunk_size) {
            throw Error(ErrorKind::Configuration, "chunk_overlap (" + std::to_string(m_chunk_overlap) +
                        ") must be smaller than chunk_size (" + std::to_string(m_chunk_size) + ")");
        }
    }

    std::vector<std::string> Chunker::default_separators() {
        return {"\n\n", "\n", ". ", " ", ""};
    }

    std::vector<Chunk> Chunker::chunk(const std::string& text, const ChunkMetadata& metadata) const {
        std::vector<Chunk> chunks;
        for (auto& segment : split_text(text)) {
            Chunk c;
            c.index = chunks.size();
            c.text = std::move(segment);
            c.metadata = metadata;
            chunks.push_back(std::move(c));
        }
        return chunks;
    }

    std::vector<std::string> Chunker::split_text(const std::string& text) const {
        if (text.empty()) return {};
        return split_recursive(text, 0);
    }

    std::vector<std::string> Chunker::split_recursive(const std::string& text, size_t first_separator) const {
        // Coarsest separator that actually occurs; "" always matches.
        size_t chosen = m_separators.size();
        for (size_t i = first_separator; i < m_separators.size(); ++i) {
            if (m_separators[i].empty() || text.find(m_separators[i]) != std::string::npos) {
                chosen = i;
                break;
            }
        }

        std::vector<std::string> pieces = (chosen < m_separators.size())
            ? split_keep(text, m_separators[chosen])
            : std::vector<std::string>{text};
        size_t next = chosen + 1;

        std::vector<std::string> out;
        std::vector<std::string> small;
        for (const auto& piece : pieces) {
            if (utf8_length(piece) < m_chunk_size) {
                small.push_back(piece);
                continue;
            }
            if (!small.empty()) {
                merge(small, out);
                small.clear();
            }
            if (next >= m_separators.size()) {
                // Nothing finer to split with: keep the oversized token whole.
                std::string t = trim(piece);
                if (!t.empty()) out.push_back(std::move(t));
            } else {
                auto sub = split_recursive(piece, next);
                out.insert(out.end(), sub.begin(), sub.end());
            }
        }
        if (!small.empty()) merge(small, out);
        return out;
    }

    void Chunker::merge(const std::vector<std::string>& pieces, std::vector<std::string>& out) const {
        std::deque<std::pair<std::string, size_t>> current;
        size_t total = 0;

        auto emit = [&]() {
            std::string joined;
            for (const auto& p : current) joined += p.first;
            std::string t = trim(joined);
            if (!t.empty()) out.push_back(std::move(t));
        };

        for (const auto& piece : pieces) {
            size_t len = utf8_length(piece);
            if (total + len > m_chunk_size && !current.empty()) {
                emit();
                // Keep a tail no longer than the overlap that still leaves room for this piece.
                while (total > m_chunk_overlap || (total > 0 && total + len > m_chunk_size)) {
                    total -= current.front().second;
                    current.pop_front();
                }
            }
            current.emplace_back(piece, len);
            total += len;
        }
        if (!current.empty()) emit();
    }

}
