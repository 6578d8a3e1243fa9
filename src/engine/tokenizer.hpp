#pragma once

#include "verity/error.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <fstream>
#include <cctype>
#include <cstdint>

namespace verity::engine {

    /**
     * @brief Uncased BERT WordPiece tokenizer over a vocab.txt (one token per line, id = line number).
     * Punctuation becomes its own word; bytes >= 0x80 are kept inside words.
     */
    class WordPieceTokenizer {
    public:
        explicit WordPieceTokenizer(const std::string& vocab_path) {
            std::ifstream file(vocab_path);
            if (!file.is_open()) {
                throw Error(ErrorKind::Configuration, "cannot open vocabulary '" + vocab_path + "'");
            }
            std::string line;
            int64_t id = 0;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_vocab.emplace(line, id++);
            }
            m_cls = lookup("[CLS]", 101);
            m_sep = lookup("[SEP]", 102);
            m_unk = lookup("[UNK]", 100);
            m_pad = lookup("[PAD]", 0);
        }

        /**
         * @brief [CLS] pieces... [SEP], at most max_length ids.
         */
        std::vector<int64_t> encode(const std::string& text, size_t max_length = 256) const {
            std::vector<int64_t> ids{m_cls};
            for (const auto& word : split_words(text)) {
                append_word(word, ids);
                if (ids.size() >= max_length - 1) break;
            }
            if (ids.size() > max_length - 1) ids.resize(max_length - 1);
            ids.push_back(m_sep);
            return ids;
        }

        int64_t pad_id() const { return m_pad; }

    private:
        std::unordered_map<std::string, int64_t> m_vocab;
        int64_t m_cls = 101;
        int64_t m_sep = 102;
        int64_t m_unk = 100;
        int64_t m_pad = 0;

        int64_t lookup(const std::string& token, int64_t fallback) const {
            auto it = m_vocab.find(token);
            return it == m_vocab.end() ? fallback : it->second;
        }

        static std::vector<std::string> split_words(const std::string& text) {
            std::vector<std::string> words;
            std::string current;
            auto flush = [&] {
                if (!current.empty()) words.push_back(std::move(current));
                current.clear();
            };
            for (unsigned char c : text) {
                if (c < 0x80 && std::isspace(c)) {
                    flush();
                } else if (c < 0x80 && std::ispunct(c)) {
                    flush();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    current.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
                }
            }
            flush();
            return words;
        }

        void append_word(const std::string& word, std::vector<int64_t>& ids) const {
            if (word.size() > 100) {
                ids.push_back(m_unk);
                return;
            }
            std::vector<int64_t> pieces;
            size_t start = 0;
            while (start < word.size()) {
                size_t end = word.size();
                int64_t found = -1;
                while (start < end) {
                    std::string sub = word.substr(start, end - start);
                    if (start > 0) sub = "##" + sub;
                    auto it = m_vocab.find(sub);
                    if (it != m_vocab.end()) {
                        found = it->second;
                        break;
                    }
                    --end;
                }
                if (found < 0) {
                    ids.push_back(m_unk);
                    return;
                }
                pieces.push_back(found);
                start = end;
            }
            ids.insert(ids.end(), pieces.begin(), pieces.end());
        }
    };

}
