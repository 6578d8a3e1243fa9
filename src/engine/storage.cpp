#include "storage.hpp"
#include "log.hpp"
#include "verity/error.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace verity::engine {

    namespace {
        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool ends_with(const std::string& s, const std::string& suffix) {
            return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }
    }

    FileSystemStorage::FileSystemStorage(std::filesystem::path root, std::string key_prefix, std::string suffix)
        : m_root(std::move(root)), m_key_prefix(std::move(key_prefix)), m_suffix(lower(std::move(suffix))) {
        m_ignore.add_defaults();
        m_ignore.load(m_root / ".verity_ignore");
    }

    std::vector<std::string> FileSystemStorage::list(const std::string& prefix) {
        if (!probe()) {
            throw Error(ErrorKind::Storage, "document root is not a directory: " + m_root.string());
        }

        const std::string wanted = m_key_prefix + prefix;
        std::vector<std::string> keys;
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(
                 m_root, std::filesystem::directory_options::skip_permission_denied, ec);
             it != std::filesystem::recursive_directory_iterator();
             it.increment(ec)) {
            if (ec) {
                throw Error(ErrorKind::Storage, "failed to list " + m_root.string() + ": " + ec.message());
            }
            const auto& path = it->path();
            std::error_code entry_ec;

            if (m_ignore.check(path)) {
                if (it->is_directory(entry_ec)) it.disable_recursion_pending();
                continue;
            }
            bool regular = it->is_regular_file(entry_ec);
            if (entry_ec) {
                log::warn("Storage", "Skipping " + path.string() + ": " + entry_ec.message());
                continue;
            }
            if (!regular) continue;

            std::string key = std::filesystem::relative(path, m_root, entry_ec).generic_string();
            if (entry_ec || key.empty()) {
                log::warn("Storage", "Skipping " + path.string() + ": cannot make it relative to the root");
                continue;
            }
            if (key.compare(0, wanted.size(), wanted) != 0) continue;
            if (!ends_with(lower(key), m_suffix)) continue;
            keys.push_back(std::move(key));
        }
        if (ec) {
            throw Error(ErrorKind::Storage, "failed to list " + m_root.string() + ": " + ec.message());
        }

        std::sort(keys.begin(), keys.end());
        log::info("Storage", "Found " + std::to_string(keys.size()) + " documents under " + m_root.string());
        return keys;
    }

    std::string FileSystemStorage::fetch(const std::string& key) {
        auto path = resolve(key);
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw Error(ErrorKind::Storage, "failed to open document '" + key + "'");
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            throw Error(ErrorKind::Storage, "failed to read document '" + key + "'");
        }
        std::string bytes = buffer.str();
        log::debug("Storage", "Read " + key + " (" + std::to_string(bytes.size()) + " bytes)");
        return bytes;
    }

    bool FileSystemStorage::probe() {
        std::error_code ec;
        return std::filesystem::is_directory(m_root, ec);
    }

    std::filesystem::path FileSystemStorage::resolve(const std::string& key) const {
        std::filesystem::path rel(key);
        if (rel.is_absolute()) {
            throw Error(ErrorKind::Storage, "document key must be relative: " + key);
        }
        for (const auto& part : rel) {
            if (part == "..") {
                throw Error(ErrorKind::Storage, "document key escapes the root: " + key);
            }
        }
        return m_root / rel;
    }

    std::unique_ptr<DocumentStorage> create_filesystem_storage(const std::filesystem::path& root,
                                                               const std::string& key_prefix,
                                                               const std::string& suffix) {
        return std::make_unique<FileSystemStorage>(root, key_prefix, suffix);
    }

}
