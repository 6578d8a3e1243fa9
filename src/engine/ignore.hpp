#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace verity::engine {

    /**
     * @brief Glob patterns for entries the document storage never lists.
     */
    class Ignore {
    public:
        /**
         * @brief Loads patterns from a .verity_ignore file, one glob per line.
         * Blank lines and lines starting with '#' are skipped.
         */
        void load(const std::filesystem::path& ignore_file);

        /**
         * @brief Adds a single glob pattern.
         */
        void add(const std::string& glob);

        /**
         * @brief VCS directories, temp files and the engine's own files.
         */
        void add_defaults();

        /**
         * @brief True if the entry's name matches any pattern.
         */
        bool check(const std::filesystem::path& path) const;

        size_t size() const { return m_patterns.size(); }

    private:
        struct Pattern {
            std::regex regex;
            std::string original;
        };
        std::vector<Pattern> m_patterns;

        static std::string glob_to_regex(const std::string& glob);
    };

}
