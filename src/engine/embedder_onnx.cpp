#include "embedder.hpp"
#include "tokenizer.hpp"
#include "log.hpp"
#include "verity/error.hpp"
#include <vector>
#include <cmath>
#include <filesystem>
#include <algorithm>

#ifdef VERITY_WITH_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace verity::engine {

    class OnnxEmbedder : public Embedder {
    public:
        OnnxEmbedder(const std::string& model_path, const std::string& vocab_path, size_t batch_size)
            : m_batch_size(batch_size) {
#ifdef VERITY_WITH_ONNX
            if (!std::filesystem::exists(model_path)) {
                throw Error(ErrorKind::Configuration, "ONNX model not found: " + model_path);
            }
            m_tokenizer = std::make_unique<WordPieceTokenizer>(vocab_path);

            try {
                m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "verity");
                Ort::SessionOptions session_options;
                session_options.SetIntraOpNumThreads(1);
                session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
                m_session = std::make_unique<Ort::Session>(*m_env, model_path.c_str(), session_options);
            } catch (const Ort::Exception& e) {
                throw Error(ErrorKind::Configuration, std::string("ONNX session: ") + e.what());
            }

            m_dimension = run({"test"}).at(0).size();
            log::info("OnnxEmbedder", "Loaded " + model_path + ", dimension " + std::to_string(m_dimension));
#else
            (void)model_path;
            (void)vocab_path;
            throw Error(ErrorKind::Configuration, "built without ONNX Runtime support");
#endif
        }

        std::vector<float> embed_one(const std::string& text) override {
            return embed_many({text}).at(0);
        }

        std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override {
            if (texts.empty()) return {};
            return embed_in_batches(texts, m_batch_size, m_dimension,
                                    [this](const std::vector<std::string>& slice) { return run(slice); });
        }

        size_t dimension() const override { return m_dimension; }

    private:
        size_t m_batch_size;
        size_t m_dimension = 0;
#ifdef VERITY_WITH_ONNX
        std::unique_ptr<Ort::Env> m_env;
        std::unique_ptr<Ort::Session> m_session;
        std::unique_ptr<WordPieceTokenizer> m_tokenizer;
#endif

        std::vector<std::vector<float>> run(const std::vector<std::string>& texts) {
            std::vector<std::vector<float>> out;
#ifdef VERITY_WITH_ONNX
            // Pad every row to the longest sequence in the batch.
            std::vector<std::vector<int64_t>> encoded;
            size_t seq_length = 0;
            for (const auto& t : texts) {
                encoded.push_back(m_tokenizer->encode(t));
                seq_length = std::max(seq_length, encoded.back().size());
            }
            const size_t rows = texts.size();

            std::vector<int64_t> input_ids(rows * seq_length, m_tokenizer->pad_id());
            std::vector<int64_t> attention_mask(rows * seq_length, 0);
            std::vector<int64_t> token_type_ids(rows * seq_length, 0);
            for (size_t r = 0; r < rows; ++r) {
                for (size_t i = 0; i < encoded[r].size(); ++i) {
                    input_ids[r * seq_length + i] = encoded[r][i];
                    attention_mask[r * seq_length + i] = 1;
                }
            }

            std::vector<int64_t> shape = {(int64_t)rows, (int64_t)seq_length};
            auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

            std::vector<Ort::Value> inputs;
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, input_ids.data(), input_ids.size(), shape.data(), shape.size()));
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, attention_mask.data(), attention_mask.size(), shape.data(), shape.size()));
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, token_type_ids.data(), token_type_ids.size(), shape.data(), shape.size()));

            const char* input_names[] = {"input_ids", "attention_mask", "token_type_ids"};
            const char* output_names[] = {"last_hidden_state"};

            try {
                auto outputs = m_session->Run(Ort::RunOptions{nullptr}, input_names, inputs.data(), 3, output_names, 1);
                const float* data = outputs[0].GetTensorData<float>();
                auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
                size_t hidden = static_cast<size_t>(out_shape.at(2));

                // Masked mean pooling, then L2 normalization.
                for (size_t r = 0; r < rows; ++r) {
                    std::vector<float> v(hidden, 0.0f);
                    size_t tokens = encoded[r].size();
                    for (size_t i = 0; i < tokens; ++i) {
                        const float* row = data + (r * seq_length + i) * hidden;
                        for (size_t j = 0; j < hidden; ++j) v[j] += row[j];
                    }
                    float norm = 0.0f;
                    for (float& x : v) {
                        x /= static_cast<float>(tokens);
                        norm += x * x;
                    }
                    norm = std::sqrt(norm);
                    for (float& x : v) x /= (norm + 1e-9f);
                    out.push_back(std::move(v));
                }
            } catch (const Ort::Exception& e) {
                throw Error(ErrorKind::Embedding, std::string("ONNX inference: ") + e.what());
            }
#else
            (void)texts;
#endif
            return out;
        }
    };

    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path,
                                                   size_t batch_size) {
        return std::make_unique<OnnxEmbedder>(model_path, vocab_path, batch_size);
    }

}
