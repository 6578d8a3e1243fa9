#include "engine/config.hpp"
#include "verity/error.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using verity::engine::Config;

namespace {

    class ConfigTest : public ::testing::Test {
    protected:
        std::filesystem::path dir;

        void SetUp() override {
            dir = std::filesystem::temp_directory_path() /
                  ("verity_config_" + std::to_string(::getpid()) + "_" +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name());
            std::filesystem::create_directories(dir);
            for (const char* name : {"VERITY_STORAGE_ROOT", "VERITY_GENERATION_MODEL", "VERITY_LOG_LEVEL",
                                     "OPENAI_API_KEY"}) {
                ::unsetenv(name);
            }
        }

        void TearDown() override {
            std::filesystem::remove_all(dir);
        }

        std::filesystem::path write(const std::string& body) {
            auto path = dir / "config.json";
            std::ofstream(path) << body;
            return path;
        }
    };

}

TEST_F(ConfigTest, MissingFileGivesValidDefaults) {
    Config cfg = Config::load(dir / "absent.json");
    EXPECT_EQ(cfg.chunk_size, 1000u);
    EXPECT_EQ(cfg.chunk_overlap, 200u);
    EXPECT_EQ(cfg.default_top_k, 5);
    EXPECT_EQ(cfg.index.metric, "cosine");
    EXPECT_EQ(cfg.generation.max_tokens, 1000);
    EXPECT_FLOAT_EQ(cfg.generation.temperature, 0.7f);
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, PartialFileOverridesOnlyGivenFields) {
    Config cfg = Config::load(write(R"({
        "storage": {"root": "/srv/docs", "prefix": "pdfs/"},
        "generation": {"model": "llama3", "temperature": 0.1},
        "chunk_size": 500
    })"));
    EXPECT_EQ(cfg.storage.root, "/srv/docs");
    EXPECT_EQ(cfg.storage.prefix, "pdfs/");
    EXPECT_EQ(cfg.storage.suffix, ".pdf");
    EXPECT_EQ(cfg.generation.model, "llama3");
    EXPECT_FLOAT_EQ(cfg.generation.temperature, 0.1f);
    EXPECT_EQ(cfg.generation.backend, "ollama");
    EXPECT_EQ(cfg.chunk_size, 500u);
}

TEST_F(ConfigTest, MalformedFileIsConfigurationError) {
    auto path = write("{ \"chunk_size\": ");
    try {
        Config::load(path);
        FAIL() << "expected a configuration error";
    } catch (const verity::Error& e) {
        EXPECT_EQ(e.kind(), verity::ErrorKind::Configuration);
    }
}

TEST_F(ConfigTest, WrongTypeIsConfigurationError) {
    auto path = write(R"({"chunk_size": "large"})");
    EXPECT_THROW(Config::load(path), verity::Error);
}

TEST_F(ConfigTest, NegativeSizesAreRejected) {
    for (const char* body : {R"({"chunk_size": -1})", R"({"chunk_overlap": -5})",
                             R"({"embedding": {"batch_size": -32}})", R"({"index": {"dimension": 1.5}})"}) {
        auto path = write(body);
        try {
            Config::load(path);
            ADD_FAILURE() << "accepted " << body;
        } catch (const verity::Error& e) {
            EXPECT_EQ(e.kind(), verity::ErrorKind::Configuration) << body;
        }
    }
}

TEST_F(ConfigTest, ValidateRejectsUnusableValues) {
    Config overlap;
    overlap.chunk_overlap = overlap.chunk_size;
    EXPECT_THROW(overlap.validate(), verity::Error);

    Config top_k;
    top_k.default_top_k = 21;
    EXPECT_THROW(top_k.validate(), verity::Error);

    Config metric;
    metric.index.metric = "euclid";
    EXPECT_THROW(metric.validate(), verity::Error);

    Config backend;
    backend.generation.backend = "mystery";
    EXPECT_THROW(backend.validate(), verity::Error);

    Config keyless;
    keyless.embedding.backend = "openai";
    EXPECT_THROW(keyless.validate(), verity::Error);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    Config cfg;
    ::setenv("VERITY_STORAGE_ROOT", "/mnt/bucket", 1);
    ::setenv("VERITY_GENERATION_MODEL", "phi3", 1);
    ::setenv("OPENAI_API_KEY", "sk-test", 1);
    cfg.generation.api_key = "sk-explicit";
    cfg.apply_env();

    EXPECT_EQ(cfg.storage.root, "/mnt/bucket");
    EXPECT_EQ(cfg.generation.model, "phi3");
    EXPECT_EQ(cfg.embedding.api_key, "sk-test");
    EXPECT_EQ(cfg.generation.api_key, "sk-explicit");

    ::unsetenv("VERITY_STORAGE_ROOT");
    ::unsetenv("VERITY_GENERATION_MODEL");
    ::unsetenv("OPENAI_API_KEY");
}

TEST_F(ConfigTest, SaveToUnwritablePathFails) {
    Config cfg;
    try {
        cfg.save(dir / "missing" / "nested" / "config.json");
        FAIL() << "expected a configuration error";
    } catch (const verity::Error& e) {
        EXPECT_EQ(e.kind(), verity::ErrorKind::Configuration);
    }
}

TEST_F(ConfigTest, SavedFileLoadsBackWithoutKeys) {
    Config cfg;
    cfg.storage.prefix = "pdfs/";
    cfg.generation.model = "llama3";
    cfg.generation.api_key = "sk-secret";
    cfg.chunk_size = 640;
    auto path = dir / "saved.json";
    cfg.save(path);

    std::ifstream in(path);
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(body.find("sk-secret"), std::string::npos);

    Config loaded = Config::load(path);
    EXPECT_EQ(loaded.storage.prefix, "pdfs/");
    EXPECT_EQ(loaded.generation.model, "llama3");
    EXPECT_EQ(loaded.chunk_size, 640u);
    EXPECT_TRUE(loaded.generation.api_key.empty());
}
