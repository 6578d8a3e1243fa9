#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace verity::engine {

    struct SourceDocument {
        std::string key;
        std::string bytes;
    };

    struct ChunkMetadata {
        std::string filename;
        std::string document_id;
        std::uintmax_t file_size = 0;
        std::string processed_date;
    };

    struct Chunk {
        size_t index = 0;
        std::string text;
        ChunkMetadata metadata;
    };

    /**
     * @brief Everything stored next to a vector. Mirrors Chunk plus the
     * storage timestamp the index stamps on upsert.
     */
    struct Payload {
        std::string filename;
        std::string document_id;
        std::uintmax_t file_size = 0;
        std::string processed_date;
        std::string text;
        size_t chunk_index = 0;
        std::string created_at;
    };

    struct IndexedPoint {
        std::string id;
        std::vector<float> vector;
        Payload payload;
    };

    struct ScoredChunk {
        std::string id;
        Payload payload;
        float score = 0.0f;
    };

    struct FileOutcome {
        std::string file;
        bool success = false;
        size_t chunks = 0;
        std::string error;
    };

    struct IngestionSummary {
        size_t processed = 0;
        size_t failed = 0;
        std::vector<FileOutcome> files;
    };

    struct RetrievalContext {
        std::string original_query;
        std::string reformulated_query;
        std::vector<ScoredChunk> documents;
        std::string context;
        size_t num_documents = 0;
    };

    struct Answer {
        std::string answer;
        std::string query;
        std::string reformulated_query;
        size_t num_documents = 0;
    };

    enum class ComponentHealth { Healthy, Unhealthy, Unknown };
    enum class OverallHealth { Healthy, Degraded, Unhealthy };

    struct HealthStatus {
        ComponentHealth generation = ComponentHealth::Unknown;
        ComponentHealth index = ComponentHealth::Unknown;
        OverallHealth overall = OverallHealth::Unhealthy;
        std::string error;
    };

    /**
     * @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
     */
    inline std::string utc_now_iso8601() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        gmtime_r(&now, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }

    inline const char* to_string(ComponentHealth h) {
        switch (h) {
            case ComponentHealth::Healthy: return "healthy";
            case ComponentHealth::Unhealthy: return "unhealthy";
            default: return "unknown";
        }
    }

    inline const char* to_string(OverallHealth h) {
        switch (h) {
            case OverallHealth::Healthy: return "healthy";
            case OverallHealth::Degraded: return "degraded";
            default: return "unhealthy";
        }
    }

}
