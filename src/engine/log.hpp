#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace verity::log {

    enum class Level { Debug = 0, Info = 1, Warning = 2, Error = 3 };

    inline Level parse_level(std::string value, Level fallback = Level::Info) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "debug") return Level::Debug;
        if (value == "info") return Level::Info;
        if (value == "warning" || value == "warn") return Level::Warning;
        if (value == "error") return Level::Error;
        return fallback;
    }

    namespace detail {
        inline std::atomic<int>& threshold() {
            static std::atomic<int> level = [] {
                const char* env = std::getenv("VERITY_LOG_LEVEL");
                return static_cast<int>(env ? parse_level(env) : Level::Info);
            }();
            return level;
        }

        inline std::mutex& sink_mutex() {
            static std::mutex m;
            return m;
        }

        inline std::string timestamp() {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm{};
            gmtime_r(&now, &tm);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
            return buf;
        }

        inline void write(Level level, std::string_view tag, std::string_view message) {
            if (static_cast<int>(level) < threshold().load()) return;
            std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
            std::lock_guard<std::mutex> lock(sink_mutex());
            out << timestamp() << " [" << tag << "] ";
            if (level == Level::Warning) out << "Warning: ";
            else if (level == Level::Error) out << "Error: ";
            out << message << "\n";
        }
    }

    inline void set_level(Level level) { detail::threshold() = static_cast<int>(level); }

    inline void debug(std::string_view tag, std::string_view message) { detail::write(Level::Debug, tag, message); }
    inline void info(std::string_view tag, std::string_view message) { detail::write(Level::Info, tag, message); }
    inline void warn(std::string_view tag, std::string_view message) { detail::write(Level::Warning, tag, message); }
    inline void error(std::string_view tag, std::string_view message) { detail::write(Level::Error, tag, message); }

}
