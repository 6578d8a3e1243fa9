#include "extractor.hpp"
#include "log.hpp"
#include "verity/error.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

namespace verity::engine {

    bool is_valid_utf8(const std::string& s) {
        size_t i = 0;
        while (i < s.size()) {
            unsigned char c = static_cast<unsigned char>(s[i]);
            size_t extra;
            if (c < 0x80) extra = 0;
            else if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
            else if ((c & 0xF0) == 0xE0) extra = 2;
            else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
            else return false;

            if (i + extra >= s.size()) return false;
            for (size_t k = 1; k <= extra; ++k) {
                if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
            }
            i += extra + 1;
        }
        return true;
    }

    std::string PlainTextExtractor::extract(const std::string& bytes, const std::string& label) {
        if (bytes.find('\0') != std::string::npos) {
            throw Error(ErrorKind::Extraction, "'" + label + "' looks binary (NUL byte)");
        }
        if (!is_valid_utf8(bytes)) {
            throw Error(ErrorKind::Extraction, "'" + label + "' is not valid UTF-8");
        }
        log::info("Extractor", "Extracted " + std::to_string(bytes.size()) + " characters from '" + label + "'");
        return bytes;
    }

    CommandExtractor::CommandExtractor(std::string command_template)
        : m_template(std::move(command_template)) {}

    namespace {

        // Removes the temp file on every exit path.
        struct TempFile {
            std::string path;
            ~TempFile() {
                if (!path.empty()) ::unlink(path.c_str());
            }
        };

        std::string shell_quote(const std::string& s) {
            std::string out = "'";
            for (char c : s) {
                if (c == '\'') out += "'\\''";
                else out += c;
            }
            out += "'";
            return out;
        }

    }

    std::string CommandExtractor::extract(const std::string& bytes, const std::string& label) {
        std::string suffix = std::filesystem::path(label).extension().string();
        std::string pattern = (std::filesystem::temp_directory_path() / ("verity-XXXXXX" + suffix)).string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');

        int fd = ::mkstemps(name.data(), static_cast<int>(suffix.size()));
        if (fd < 0) {
            throw Error(ErrorKind::Extraction, std::string("failed to create temp file: ") + std::strerror(errno));
        }
        TempFile tmp{name.data()};

        size_t written = 0;
        while (written < bytes.size()) {
            ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
            if (n < 0) {
                ::close(fd);
                throw Error(ErrorKind::Extraction, std::string("failed to write temp file: ") + std::strerror(errno));
            }
            written += static_cast<size_t>(n);
        }
        ::close(fd);

        std::string cmd = m_template;
        const std::string placeholder = "{input}";
        size_t at = cmd.find(placeholder);
        if (at == std::string::npos) {
            cmd += " " + shell_quote(tmp.path);
        } else {
            cmd.replace(at, placeholder.size(), shell_quote(tmp.path));
        }
        cmd += " 2>/dev/null";

        log::debug("Extractor", "Running: " + cmd);
        FILE* pipe = ::popen(cmd.c_str(), "r");
        if (!pipe) {
            throw Error(ErrorKind::Extraction, "failed to start extractor for '" + label + "'");
        }
        std::string output;
        char buffer[4096];
        size_t n;
        while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
            output.append(buffer, n);
        }
        int status = ::pclose(pipe);
        if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
            throw Error(ErrorKind::Extraction, "extractor failed on '" + label + "' (exit " + std::to_string(code) + ")");
        }

        log::info("Extractor", "Extracted " + std::to_string(output.size()) + " characters from '" + label + "'");
        return output;
    }

    std::unique_ptr<TextExtractor> create_extractor(const std::string& command_template) {
        if (command_template.empty()) return std::make_unique<PlainTextExtractor>();
        return std::make_unique<CommandExtractor>(command_template);
    }

}
