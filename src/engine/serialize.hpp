#pragma once

#include "verity/types.hpp"
#include <nlohmann/json.hpp>

namespace verity::engine {

    inline void to_json(nlohmann::json& j, const Payload& p) {
        j = nlohmann::json{
            {"filename", p.filename},
            {"document_id", p.document_id},
            {"file_size", p.file_size},
            {"processed_date", p.processed_date},
            {"text", p.text},
            {"chunk_index", p.chunk_index},
            {"created_at", p.created_at}
        };
    }

    inline void from_json(const nlohmann::json& j, Payload& p) {
        p.filename = j.value("filename", "");
        p.document_id = j.value("document_id", "");
        p.file_size = j.value("file_size", std::uintmax_t{0});
        p.processed_date = j.value("processed_date", "");
        p.text = j.value("text", "");
        p.chunk_index = j.value("chunk_index", size_t{0});
        p.created_at = j.value("created_at", "");
    }

    inline void to_json(nlohmann::json& j, const ScoredChunk& c) {
        j = nlohmann::json{{"id", c.id}, {"score", c.score}, {"payload", c.payload}};
    }

    inline void to_json(nlohmann::json& j, const FileOutcome& f) {
        j = nlohmann::json{{"file", f.file}, {"success", f.success}};
        if (f.success) j["chunks"] = f.chunks;
        else j["error"] = f.error;
    }

    inline void to_json(nlohmann::json& j, const IngestionSummary& s) {
        j = nlohmann::json{{"processed", s.processed}, {"failed", s.failed}, {"files", s.files}};
    }

    inline void to_json(nlohmann::json& j, const HealthStatus& h) {
        j = nlohmann::json{
            {"status", to_string(h.overall)},
            {"generation", to_string(h.generation)},
            {"index", to_string(h.index)}
        };
        if (!h.error.empty()) j["error"] = h.error;
    }

    inline void to_json(nlohmann::json& j, const Answer& a) {
        j = nlohmann::json{
            {"answer", a.answer},
            {"query", a.query},
            {"reformulated_query", a.reformulated_query},
            {"num_documents", a.num_documents}
        };
    }

}
