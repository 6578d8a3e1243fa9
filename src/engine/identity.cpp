#include "identity.hpp"
#include "verity/error.hpp"
#include <openssl/evp.h>
#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace verity::engine {

    const char* const kNamespaceDns = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

    namespace {

        std::string digest(const EVP_MD* md, const std::string& data) {
            unsigned char out[EVP_MAX_MD_SIZE];
            unsigned int len = 0;
            if (EVP_Digest(data.data(), data.size(), out, &len, md, nullptr) != 1) {
                throw Error(ErrorKind::Configuration, "EVP_Digest failed");
            }
            return std::string(reinterpret_cast<const char*>(out), len);
        }

        std::string to_hex(const std::string& bytes) {
            std::ostringstream oss;
            for (unsigned char c : bytes) {
                oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
            }
            return oss.str();
        }

        int hex_value(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        std::array<unsigned char, 16> parse_uuid(const std::string& text) {
            std::array<unsigned char, 16> bytes{};
            size_t n = 0;
            for (size_t i = 0; i < text.size(); ++i) {
                if (text[i] == '-') continue;
                if (n >= 32 || i + 1 >= text.size()) break;
                int hi = hex_value(text[i]);
                int lo = hex_value(text[i + 1]);
                if (hi < 0 || lo < 0) break;
                bytes[n / 2] = static_cast<unsigned char>((hi << 4) | lo);
                n += 2;
                ++i;
            }
            if (n != 32) {
                throw Error(ErrorKind::Configuration, "malformed namespace uuid: " + text);
            }
            return bytes;
        }

    }

    std::string sha256_hex(const std::string& data) {
        return to_hex(digest(EVP_sha256(), data));
    }

    std::string uuid_v5(const std::string& namespace_uuid, const std::string& name) {
        auto ns = parse_uuid(namespace_uuid);
        std::string input(reinterpret_cast<const char*>(ns.data()), ns.size());
        input += name;

        std::string hash = digest(EVP_sha1(), input);
        hash.resize(16);
        hash[6] = static_cast<char>((static_cast<unsigned char>(hash[6]) & 0x0F) | 0x50);
        hash[8] = static_cast<char>((static_cast<unsigned char>(hash[8]) & 0x3F) | 0x80);

        std::string hex = to_hex(hash);
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
               hex.substr(16, 4) + "-" + hex.substr(20, 12);
    }

    DocumentIdentity::DocumentIdentity(std::string storage_prefix)
        : m_prefix(std::move(storage_prefix)) {}

    std::string DocumentIdentity::strip_prefix(const std::string& logical_key) const {
        if (!m_prefix.empty() && logical_key.compare(0, m_prefix.size(), m_prefix) == 0) {
            return logical_key.substr(m_prefix.size());
        }
        return logical_key;
    }

    std::string DocumentIdentity::document_id(const std::string& logical_key) const {
        return sha256_hex(strip_prefix(logical_key)).substr(0, 16);
    }

    std::string DocumentIdentity::chunk_id(const std::string& document_id, size_t index) {
        return uuid_v5(kNamespaceDns, document_id + "_chunk_" + std::to_string(index));
    }

}
