#pragma once

#include <string>
#include <memory>

namespace verity::engine {

    /**
     * @brief Turns raw document bytes into plain text.
     */
    class TextExtractor {
    public:
        virtual ~TextExtractor() = default;

        /**
         * @param bytes Raw document content.
         * @param label Logical key, used for messages and the temp file suffix.
         * @throws verity::Error (Extraction) on corrupt or unsupported input.
         */
        virtual std::string extract(const std::string& bytes, const std::string& label) = 0;
    };

    /**
     * @brief Accepts UTF-8 text as-is; rejects binary content.
     */
    class PlainTextExtractor : public TextExtractor {
    public:
        std::string extract(const std::string& bytes, const std::string& label) override;
    };

    /**
     * @brief Runs an external converter (pdftotext and friends) on a temp copy.
     *
     * "{input}" in the command template is replaced by the quoted temp file
     * path; the converter's stdout is the extracted text.
     */
    class CommandExtractor : public TextExtractor {
    public:
        explicit CommandExtractor(std::string command_template);

        std::string extract(const std::string& bytes, const std::string& label) override;

    private:
        std::string m_template;
    };

    bool is_valid_utf8(const std::string& s);

    /**
     * @brief Command extractor for a non-empty template, plain text otherwise.
     */
    std::unique_ptr<TextExtractor> create_extractor(const std::string& command_template);

}
