#pragma once

#include <string>
#include <filesystem>

namespace verity::engine {

    struct Config {
        struct Storage {
            std::string root = "./documents";
            std::string prefix = "";          // stripped before hashing document ids
            std::string suffix = ".pdf";
            std::string extract_command = "pdftotext -layout {input} -"; // empty: plain text
        };

        struct Index {
            std::string path = "verity.db";
            std::string collection = "documents";
            size_t dimension = 0;             // 0: take it from the embedder
            std::string metric = "cosine";
        };

        struct Embedding {
            std::string backend = "ollama";   // ollama, openai, onnx
            std::string model = "all-minilm";
            std::string endpoint = "";        // empty: the backend default
            std::string api_key = "";
            size_t batch_size = 32;
            long timeout_ms = 120000;
            std::string onnx_model = "model.onnx";
            std::string onnx_vocab = "vocab.txt";
        };

        struct Generation {
            std::string backend = "ollama";   // ollama, openai
            std::string model = "mistral";
            std::string endpoint = "";        // empty: the backend default
            std::string api_key = "";
            int max_tokens = 1000;
            float temperature = 0.7f;
            long timeout_ms = 30000;
            bool streaming = true;
        };

        Storage storage;
        Index index;
        Embedding embedding;
        Generation generation;

        size_t chunk_size = 1000;
        size_t chunk_overlap = 200;
        int default_top_k = 5;
        std::string log_level = "info";
        std::string socket = "verity.sock";

        /**
         * @brief Loads the JSON file at path; a missing file yields defaults.
         * @throws verity::Error (Configuration) on malformed JSON, bad types or negative sizes.
         */
        static Config load(const std::filesystem::path& path);

        /**
         * @brief Overrides fields from VERITY_* environment variables and OPENAI_API_KEY.
         */
        void apply_env();

        /**
         * @brief Rejects values the pipelines cannot run with.
         * @throws verity::Error (Configuration)
         */
        void validate() const;

        /**
         * @brief Writes the settings as JSON, without API keys.
         * @throws verity::Error (Configuration) when the file cannot be written.
         */
        void save(const std::filesystem::path& path) const;
    };

}
