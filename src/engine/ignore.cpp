#include "ignore.hpp"
#include <fstream>

namespace verity::engine {

    void Ignore::load(const std::filesystem::path& ignore_file) {
        if (!std::filesystem::exists(ignore_file)) return;

        std::ifstream file(ignore_file);
        std::string line;
        while (std::getline(file, line)) {
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;
            add(line);
        }
    }

    void Ignore::add(const std::string& glob) {
        m_patterns.push_back({std::regex(glob_to_regex(glob)), glob});
    }

    void Ignore::add_defaults() {
        for (const char* p : {".git", ".svn", ".hg", ".DS_Store", "Thumbs.db",
                              "~$*", "*.tmp", "*.part", ".verity_ignore"}) {
            add(p);
        }
    }

    bool Ignore::check(const std::filesystem::path& path) const {
        std::string name = path.filename().string();
        for (const auto& p : m_patterns) {
            if (std::regex_match(name, p.regex)) return true;
        }
        return false;
    }

    std::string Ignore::glob_to_regex(const std::string& glob) {
        std::string out = "^";
        for (char c : glob) {
            switch (c) {
                case '*': out += ".*"; break;
                case '?': out += "."; break;
                case '.': case '$': case '^': case '+': case '(': case ')':
                case '[': case ']': case '{': case '}': case '|': case '\\':
                    out += '\\';
                    out += c;
                    break;
                default: out += c;
            }
        }
        out += "$";
        return out;
    }

}
