#pragma once

#include <string>

namespace verity::engine {

    /**
     * @brief Deterministic identifiers for documents and their chunks.
     *
     * The storage prefix is removed from the logical key before hashing, so
     * moving the whole collection under another prefix keeps the ids while
     * renaming a file changes them.
     */
    class DocumentIdentity {
    public:
        explicit DocumentIdentity(std::string storage_prefix = "");

        /**
         * @brief First 16 hex digits of SHA-256 over the prefix-stripped key.
         */
        std::string document_id(const std::string& logical_key) const;

        /**
         * @brief UUIDv5 (DNS namespace) of "<document_id>_chunk_<index>".
         */
        static std::string chunk_id(const std::string& document_id, size_t index);

        std::string strip_prefix(const std::string& logical_key) const;

    private:
        std::string m_prefix;
    };

    std::string sha256_hex(const std::string& data);

    /**
     * @brief RFC 4122 name-based (SHA-1) UUID in canonical lowercase form.
     * @param namespace_uuid Canonical text form of the namespace UUID.
     */
    std::string uuid_v5(const std::string& namespace_uuid, const std::string& name);

    extern const char* const kNamespaceDns;

}
