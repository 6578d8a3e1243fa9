#include "config.hpp"
#include "verity/error.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdlib>

using json = nlohmann::json;

namespace verity::engine {

    namespace {
        void env_override(const char* name, std::string& field) {
            if (const char* v = std::getenv(name)) field = v;
        }

        // Sizes must be non-negative JSON integers.
        void read_size(const json& section, const char* key, size_t& field) {
            if (!section.contains(key)) return;
            const auto& v = section[key];
            if (!v.is_number_unsigned()) {
                throw Error(ErrorKind::Configuration,
                            std::string("'") + key + "' must be a non-negative integer, got " + v.dump());
            }
            field = v.get<size_t>();
        }
    }

    Config Config::load(const std::filesystem::path& path) {
        Config cfg;
        if (!std::filesystem::exists(path)) return cfg;

        try {
            std::ifstream f(path);
            json j = json::parse(f);

            if (j.contains("storage")) {
                const auto& s = j["storage"];
                if (s.contains("root")) cfg.storage.root = s["root"];
                if (s.contains("prefix")) cfg.storage.prefix = s["prefix"];
                if (s.contains("suffix")) cfg.storage.suffix = s["suffix"];
                if (s.contains("extract_command")) cfg.storage.extract_command = s["extract_command"];
            }
            if (j.contains("index")) {
                const auto& s = j["index"];
                if (s.contains("path")) cfg.index.path = s["path"];
                if (s.contains("collection")) cfg.index.collection = s["collection"];
                read_size(s, "dimension", cfg.index.dimension);
                if (s.contains("metric")) cfg.index.metric = s["metric"];
            }
            if (j.contains("embedding")) {
                const auto& s = j["embedding"];
                if (s.contains("backend")) cfg.embedding.backend = s["backend"];
                if (s.contains("model")) cfg.embedding.model = s["model"];
                if (s.contains("endpoint")) cfg.embedding.endpoint = s["endpoint"];
                if (s.contains("api_key")) cfg.embedding.api_key = s["api_key"];
                read_size(s, "batch_size", cfg.embedding.batch_size);
                if (s.contains("timeout_ms")) cfg.embedding.timeout_ms = s["timeout_ms"];
                if (s.contains("onnx_model")) cfg.embedding.onnx_model = s["onnx_model"];
                if (s.contains("onnx_vocab")) cfg.embedding.onnx_vocab = s["onnx_vocab"];
            }
            if (j.contains("generation")) {
                const auto& s = j["generation"];
                if (s.contains("backend")) cfg.generation.backend = s["backend"];
                if (s.contains("model")) cfg.generation.model = s["model"];
                if (s.contains("endpoint")) cfg.generation.endpoint = s["endpoint"];
                if (s.contains("api_key")) cfg.generation.api_key = s["api_key"];
                if (s.contains("max_tokens")) cfg.generation.max_tokens = s["max_tokens"];
                if (s.contains("temperature")) cfg.generation.temperature = s["temperature"];
                if (s.contains("timeout_ms")) cfg.generation.timeout_ms = s["timeout_ms"];
                if (s.contains("streaming")) cfg.generation.streaming = s["streaming"];
            }
            read_size(j, "chunk_size", cfg.chunk_size);
            read_size(j, "chunk_overlap", cfg.chunk_overlap);
            if (j.contains("default_top_k")) cfg.default_top_k = j["default_top_k"];
            if (j.contains("log_level")) cfg.log_level = j["log_level"];
            if (j.contains("socket")) cfg.socket = j["socket"];
        } catch (const json::exception& e) {
            throw Error(ErrorKind::Configuration, "invalid config file " + path.string() + ": " + e.what());
        }
        return cfg;
    }

    void Config::apply_env() {
        env_override("VERITY_STORAGE_ROOT", storage.root);
        env_override("VERITY_STORAGE_PREFIX", storage.prefix);
        env_override("VERITY_INDEX_PATH", index.path);
        env_override("VERITY_EMBEDDING_BACKEND", embedding.backend);
        env_override("VERITY_EMBEDDING_MODEL", embedding.model);
        env_override("VERITY_EMBEDDING_ENDPOINT", embedding.endpoint);
        env_override("VERITY_GENERATION_BACKEND", generation.backend);
        env_override("VERITY_GENERATION_MODEL", generation.model);
        env_override("VERITY_GENERATION_ENDPOINT", generation.endpoint);
        env_override("VERITY_LOG_LEVEL", log_level);

        if (const char* key = std::getenv("OPENAI_API_KEY")) {
            if (embedding.api_key.empty()) embedding.api_key = key;
            if (generation.api_key.empty()) generation.api_key = key;
        }
    }

    void Config::validate() const {
        auto fail = [](const std::string& msg) { throw Error(ErrorKind::Configuration, msg); };

        if (chunk_size == 0) fail("chunk_size must be positive");
        if (chunk_overlap >= chunk_size) fail("chunk_overlap must be smaller than chunk_size");
        if (default_top_k < 1 || default_top_k > 20) fail("default_top_k must be within 1..20");
        if (index.metric != "cosine") fail("unsupported index metric '" + index.metric + "'");
        if (index.collection.empty()) fail("index collection name is empty");
        if (embedding.batch_size == 0) fail("embedding batch_size must be positive");

        const auto& eb = embedding.backend;
        if (eb != "ollama" && eb != "openai" && eb != "onnx") fail("unknown embedding backend '" + eb + "'");
        if (eb == "openai" && embedding.api_key.empty()) fail("openai embedding backend requires an api key");

        const auto& gb = generation.backend;
        if (gb != "ollama" && gb != "openai") fail("unknown generation backend '" + gb + "'");
        if (gb == "openai" && generation.api_key.empty()) fail("openai generation backend requires an api key");
        if (generation.max_tokens <= 0) fail("generation max_tokens must be positive");
        if (generation.temperature < 0.0f || generation.temperature > 2.0f) fail("generation temperature must be within 0..2");
    }

    void Config::save(const std::filesystem::path& path) const {
        json j;
        j["storage"] = {
            {"root", storage.root},
            {"prefix", storage.prefix},
            {"suffix", storage.suffix},
            {"extract_command", storage.extract_command}
        };
        j["index"] = {
            {"path", index.path},
            {"collection", index.collection},
            {"dimension", index.dimension},
            {"metric", index.metric}
        };
        j["embedding"] = {
            {"backend", embedding.backend},
            {"model", embedding.model},
            {"endpoint", embedding.endpoint},
            {"batch_size", embedding.batch_size},
            {"timeout_ms", embedding.timeout_ms},
            {"onnx_model", embedding.onnx_model},
            {"onnx_vocab", embedding.onnx_vocab}
        };
        j["generation"] = {
            {"backend", generation.backend},
            {"model", generation.model},
            {"endpoint", generation.endpoint},
            {"max_tokens", generation.max_tokens},
            {"temperature", generation.temperature},
            {"timeout_ms", generation.timeout_ms},
            {"streaming", generation.streaming}
        };
        j["chunk_size"] = chunk_size;
        j["chunk_overlap"] = chunk_overlap;
        j["default_top_k"] = default_top_k;
        j["log_level"] = log_level;
        j["socket"] = socket;
        // API keys stay in the environment, never on disk.

        std::ofstream f(path);
        if (!f) {
            throw Error(ErrorKind::Configuration, "cannot write config file " + path.string());
        }
        f << j.dump(4);
        f.close();
        if (!f) {
            throw Error(ErrorKind::Configuration, "failed writing config file " + path.string());
        }
    }

}
