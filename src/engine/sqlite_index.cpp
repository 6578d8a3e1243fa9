#include "vector_index.hpp"
#include "database.hpp"
#include "librarian.hpp"
#include "serialize.hpp"
#include "log.hpp"
#include "verity/error.hpp"
#include <mutex>

using json = nlohmann::json;

namespace verity::engine {

    /**
     * @brief Points live in SQLite; the HNSW graph is rebuilt from them on open
     * and kept in step on every write.
     */
    class SqliteVectorIndex : public VectorIndex {
    public:
        SqliteVectorIndex(const std::filesystem::path& path, std::string collection)
            : m_collection(std::move(collection)) {
            m_db.open(path);
            if (auto info = m_db.get_collection(m_collection)) {
                load_graph(info->dimension);
            }
        }

        void ensure_collection(size_t dimension, const std::string& metric) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (metric != "cosine") {
                throw Error(ErrorKind::Configuration, "unsupported metric '" + metric + "'");
            }
            if (dimension == 0) {
                throw Error(ErrorKind::Configuration, "collection dimension must be positive");
            }
            auto existing = m_db.get_collection(m_collection);
            if (existing) {
                if (existing->dimension != dimension || existing->metric != metric) {
                    throw Error(ErrorKind::Configuration,
                                "collection '" + m_collection + "' has dimension " +
                                std::to_string(existing->dimension) + "/" + existing->metric +
                                ", embedder produces " + std::to_string(dimension) + "/" + metric);
                }
                if (!m_graph) load_graph(dimension);
                return;
            }
            m_db.create_collection(m_collection, {dimension, metric});
            m_graph = std::make_unique<Librarian>(dimension);
            log::info("Index", "Created collection '" + m_collection + "' (dimension " + std::to_string(dimension) + ")");
        }

        void upsert(const std::vector<IndexedPoint>& points) override {
            if (points.empty()) return;
            std::lock_guard<std::mutex> lock(m_mutex);
            require_graph();
            for (const auto& p : points) {
                if (p.vector.size() != m_graph->dimension()) {
                    throw Error(ErrorKind::Index, "point " + p.id + " has dimension " +
                                std::to_string(p.vector.size()) + ", collection expects " +
                                std::to_string(m_graph->dimension()));
                }
            }

            const std::string now = utc_now_iso8601();
            std::vector<std::pair<int64_t, const std::vector<float>*>> added;
            m_db.begin();
            try {
                for (const auto& p : points) {
                    Payload payload = p.payload;
                    if (payload.created_at.empty()) payload.created_at = now;
                    json j = payload;
                    int64_t label = m_db.upsert_point(m_collection, p.id, p.vector,
                                                      j.dump(-1, ' ', false, json::error_handler_t::replace));
                    added.emplace_back(label, &p.vector);
                }
                m_db.commit();
            } catch (...) {
                m_db.rollback();
                throw;
            }

            for (const auto& [label, vector] : added) {
                m_graph->add_item(label, *vector);
            }
        }

        std::vector<ScoredChunk> search(const std::vector<float>& vector, size_t top_k) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<ScoredChunk> results;
            if (!m_graph) return results;

            for (const auto& [label, score] : m_graph->search(vector, top_k)) {
                auto point = m_db.get_point(m_collection, label);
                if (!point) {
                    log::warn("Index", "Graph label " + std::to_string(label) + " has no stored point");
                    continue;
                }
                ScoredChunk chunk;
                chunk.id = point->id;
                chunk.score = score;
                try {
                    chunk.payload = json::parse(point->payload_json).get<Payload>();
                } catch (const json::exception& e) {
                    throw Error(ErrorKind::Index, "corrupt payload for " + point->id + ": " + e.what());
                }
                results.push_back(std::move(chunk));
            }
            return results;
        }

        size_t delete_where(const std::string& field, const std::string& value) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<int64_t> labels;
            m_db.begin();
            try {
                labels = m_db.delete_where(m_collection, field, value);
                m_db.commit();
            } catch (...) {
                m_db.rollback();
                throw;
            }
            if (m_graph) {
                for (auto label : labels) m_graph->remove_item(label);
            }
            if (!labels.empty()) {
                log::debug("Index", "Deleted " + std::to_string(labels.size()) + " points where " + field + " = " + value);
            }
            return labels.size();
        }

        size_t count() override {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_db.count(m_collection);
        }

        void probe() override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_db.ping();
        }

    private:
        std::string m_collection;
        Database m_db;
        std::unique_ptr<Librarian> m_graph;
        std::mutex m_mutex;

        void require_graph() const {
            if (!m_graph) {
                throw Error(ErrorKind::Index, "collection '" + m_collection + "' is not initialized");
            }
        }

        void load_graph(size_t dimension) {
            size_t stored = m_db.count(m_collection);
            m_graph = std::make_unique<Librarian>(dimension, stored + 1024);
            m_db.for_each_vector(m_collection, [this](int64_t label, const std::vector<float>& v) {
                m_graph->add_item(label, v);
            });
            log::info("Index", "Loaded " + std::to_string(m_graph->count()) + " points from '" + m_collection + "'");
        }
    };

    std::unique_ptr<VectorIndex> create_sqlite_index(const std::filesystem::path& path,
                                                     const std::string& collection) {
        return std::make_unique<SqliteVectorIndex>(path, collection);
    }

}
