#include "librarian.hpp"
#include "verity/error.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <unordered_set>

namespace verity::engine {

    namespace {
        std::vector<float> normalized(const std::vector<float>& v) {
            float norm = 0.0f;
            for (float x : v) norm += x * x;
            norm = std::sqrt(norm);
            std::vector<float> out(v);
            if (norm > 0.0f) {
                for (float& x : out) x /= norm;
            }
            return out;
        }
    }

    struct Librarian::Impl {
        hnswlib::InnerProductSpace space;
        std::unique_ptr<hnswlib::HierarchicalNSW<float>> alg_hnsw;
        std::unordered_set<int64_t> live;

        Impl(size_t dim, size_t capacity) : space(dim) {
            alg_hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(&space, capacity, 16, 200, 100,
                                                                         /*allow_replace_deleted=*/true);
        }
    };

    Librarian::Librarian(size_t dim, size_t initial_capacity) : m_dim(dim) {
        m_impl = std::make_unique<Impl>(dim, std::max<size_t>(initial_capacity, 16));
    }

    Librarian::~Librarian() = default;

    void Librarian::add_item(int64_t label, const std::vector<float>& vector) {
        if (vector.size() != m_dim) {
            throw Error(ErrorKind::Index, "vector dimension mismatch: expected " + std::to_string(m_dim) +
                        ", got " + std::to_string(vector.size()));
        }
        auto& hnsw = *m_impl->alg_hnsw;
        const auto key = static_cast<hnswlib::labeltype>(label);
        bool known;
        {
            std::unique_lock<std::mutex> lock(hnsw.label_lookup_lock);
            known = hnsw.label_lookup_.count(key) > 0;
        }
        // A new label takes over a deleted slot when one is free.
        bool reuse = !known && hnsw.getDeletedCount() > 0;
        if (!known && !reuse && hnsw.getCurrentElementCount() >= hnsw.getMaxElements()) {
            hnsw.resizeIndex(hnsw.getMaxElements() * 2);
        }
        auto unit = normalized(vector);
        try {
            // A known label is un-deleted and its vector replaced in place.
            hnsw.addPoint(unit.data(), key, reuse);
        } catch (const std::exception& e) {
            throw Error(ErrorKind::Index, std::string("HNSW insert failed: ") + e.what());
        }
        m_impl->live.insert(label);
    }

    void Librarian::remove_item(int64_t label) {
        if (m_impl->live.erase(label) == 0) return;
        m_impl->alg_hnsw->markDelete(static_cast<hnswlib::labeltype>(label));
    }

    std::vector<std::pair<int64_t, float>> Librarian::search(const std::vector<float>& query, size_t k) const {
        std::vector<std::pair<int64_t, float>> results;
        if (query.size() != m_dim) {
            throw Error(ErrorKind::Index, "query dimension mismatch: expected " + std::to_string(m_dim) +
                        ", got " + std::to_string(query.size()));
        }
        if (k == 0 || m_impl->live.empty()) return results;

        auto unit = normalized(query);
        auto& hnsw = *m_impl->alg_hnsw;
        hnsw.setEf(std::max<size_t>(k, 64));

        // searchKnn returns a max-heap on distance, furthest first.
        auto pq = hnsw.searchKnn(unit.data(), std::min(k, m_impl->live.size()));
        while (!pq.empty()) {
            results.emplace_back(static_cast<int64_t>(pq.top().second), 1.0f - pq.top().first);
            pq.pop();
        }
        std::reverse(results.begin(), results.end());
        return results;
    }

    size_t Librarian::count() const {
        return m_impl->live.size();
    }

    size_t Librarian::slots() const {
        return m_impl->alg_hnsw->getCurrentElementCount();
    }

}
