#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include "ignore.hpp"

namespace verity::engine {

    /**
     * @brief Source of raw documents, addressed by logical key.
     */
    class DocumentStorage {
    public:
        virtual ~DocumentStorage() = default;

        /**
         * @brief Lists keys of eligible documents below the given prefix.
         * @throws verity::Error (Storage)
         */
        virtual std::vector<std::string> list(const std::string& prefix = "") = 0;

        /**
         * @brief Returns the raw bytes of a document.
         * @throws verity::Error (Storage)
         */
        virtual std::string fetch(const std::string& key) = 0;

        /**
         * @brief True if the backing store is reachable.
         */
        virtual bool probe() = 0;
    };

    /**
     * @brief Documents in a local directory tree. Keys are '/'-separated
     * paths relative to the root, e.g. "reports/2024/policy.pdf".
     */
    class FileSystemStorage : public DocumentStorage {
    public:
        /**
         * @param root Directory holding the documents.
         * @param key_prefix Prefix every listed key must start with.
         * @param suffix Case-insensitive file suffix of eligible documents.
         */
        FileSystemStorage(std::filesystem::path root, std::string key_prefix = "", std::string suffix = ".pdf");

        std::vector<std::string> list(const std::string& prefix = "") override;
        std::string fetch(const std::string& key) override;
        bool probe() override;

        Ignore& ignore() { return m_ignore; }

    private:
        std::filesystem::path m_root;
        std::string m_key_prefix;
        std::string m_suffix;
        Ignore m_ignore;

        std::filesystem::path resolve(const std::string& key) const;
    };

    std::unique_ptr<DocumentStorage> create_filesystem_storage(const std::filesystem::path& root,
                                                               const std::string& key_prefix,
                                                               const std::string& suffix);

}
