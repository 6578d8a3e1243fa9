#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <vector>

#include "platform.hpp"
#include "router.hpp"
#include "engine/answerer.hpp"
#include "engine/chunker.hpp"
#include "engine/config.hpp"
#include "engine/embedder.hpp"
#include "engine/extractor.hpp"
#include "engine/generator.hpp"
#include "engine/identity.hpp"
#include "engine/ingestor.hpp"
#include "engine/log.hpp"
#include "engine/reformulator.hpp"
#include "engine/retriever.hpp"
#include "engine/storage.hpp"
#include "engine/vector_index.hpp"
#include "verity/error.hpp"

namespace engine = verity::engine;

// Global stop signal
std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

namespace {

    void usage() {
        std::cerr << "Usage: verityd [--config <path>] <command> [keys...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  serve     - Answer questions over the local socket\n";
        std::cerr << "  ingest    - Ingest all documents (or the given keys) and exit\n";
    }

    int run(const std::string& command, const std::filesystem::path& config_path,
            const std::vector<std::string>& keys) {
        auto config = engine::Config::load(config_path);
        if (!std::filesystem::exists(config_path)) {
            try {
                config.save(config_path);
            } catch (const verity::Error& e) {
                verity::log::warn("Verity", std::string(e.what()) + "; continuing with defaults");
            }
        }
        config.apply_env();
        config.validate();
        verity::log::set_level(verity::log::parse_level(config.log_level));
        verity::log::info("Verity", "Config path: " + config_path.string());

        std::filesystem::path index_path = config.index.path;
        if (index_path.is_relative()) {
            auto data_dir = verity::platform::system::get_data_dir();
            if (data_dir.empty()) data_dir = std::filesystem::current_path(); // Fallback
            index_path = data_dir / index_path;
        }

        auto storage = engine::create_filesystem_storage(config.storage.root, config.storage.prefix,
                                                         config.storage.suffix);
        auto extractor = engine::create_extractor(config.storage.extract_command);
        auto index = engine::create_sqlite_index(index_path, config.index.collection);

        if (!storage->probe()) {
            throw verity::Error(verity::ErrorKind::Connectivity,
                                "document storage unreachable: " + config.storage.root);
        }
        index->probe();

        verity::log::info("Verity", "Embedding backend: " + config.embedding.backend + " (" + config.embedding.model + ")");
        auto embedder = engine::create_embedder(config);
        index->ensure_collection(embedder->dimension(), config.index.metric);

        engine::Chunker chunker(config.chunk_size, config.chunk_overlap);
        engine::IngestionOrchestrator ingestor(*storage, *extractor, chunker, *embedder, *index,
                                               engine::DocumentIdentity(config.storage.prefix));

        if (command == "ingest") {
            engine::IngestionSummary summary;
            if (keys.empty()) {
                auto result = ingestor.ingest_all();
                if (!result) {
                    verity::log::error("Verity", result.error().what());
                    return 1;
                }
                summary = result.value();
            } else {
                summary = ingestor.ingest_keys(keys);
            }
            for (const auto& f : summary.files) {
                std::cout << (f.success ? "  ok     " : "  FAILED ") << f.file;
                if (f.success) std::cout << " (" << f.chunks << " chunks)";
                else std::cout << ": " << f.error;
                std::cout << "\n";
            }
            std::cout << "Processed: " << summary.processed << ", Failed: " << summary.failed << "\n";
            return summary.failed == 0 ? 0 : 1;
        }

        verity::log::info("Verity", "Generation backend: " + config.generation.backend + " (" + config.generation.model + ")");
        auto generator = engine::create_generator(config);
        try {
            generator->probe();
        } catch (const verity::Error& e) {
            verity::log::warn("Verity", std::string("Generation backend not reachable yet: ") + e.what());
        }

        engine::QueryReformulator reformulator(*generator);
        engine::Retriever retriever(*embedder, *index);
        engine::AnswerOrchestrator answerer(reformulator, retriever, *generator, *index,
                                            {config.generation.max_tokens, config.generation.temperature});

        verity::Router router(answerer, ingestor, *index, config, [] { g_running = false; });

        auto bridge = verity::platform::Bridge::create();
        bridge->set_handler([&router](const std::string& request, verity::platform::Responder& out) {
            router.handle(request, out);
        });
        bridge->listen(config.socket);
        verity::log::info("Verity", "Ready. " + std::to_string(index->count()) + " points in '" + config.index.collection + "'");

        std::thread bridge_thread([&bridge]() { bridge->run(); });

        while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Shutdown
        verity::log::info("Verity", "Shutting down...");
        ingestor.stop();
        bridge->stop();
        if (bridge_thread.joinable()) bridge_thread.join();
        return 0;
    }

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::filesystem::path config_path;
    std::string command;
    std::vector<std::string> keys;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (command.empty()) {
            command = arg;
        } else {
            keys.push_back(arg);
        }
    }
    if (command != "serve" && command != "ingest") {
        usage();
        return 1;
    }

    if (config_path.empty()) {
        auto config_dir = verity::platform::system::get_config_dir();
        if (!config_dir.empty()) {
            std::filesystem::create_directories(config_dir);
        }
        config_path = config_dir / "config.json";
    }

    try {
        return run(command, config_path, keys);
    } catch (const verity::Error& e) {
        verity::log::error("Verity", std::string(verity::kind_name(e.kind())) + " error: " + e.what());
        return 1;
    } catch (const std::exception& e) {
        verity::log::error("Verity", e.what());
        return 1;
    }
}
