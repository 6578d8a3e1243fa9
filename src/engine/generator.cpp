#include "generator.hpp"
#include "config.hpp"
#include "verity/error.hpp"

namespace verity::engine {

    std::vector<std::string> LineBuffer::feed(const char* data, size_t size) {
        std::vector<std::string> lines;
        m_pending.append(data, size);
        size_t start = 0;
        size_t nl;
        while ((nl = m_pending.find('\n', start)) != std::string::npos) {
            std::string line = m_pending.substr(start, nl - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
            start = nl + 1;
        }
        m_pending.erase(0, start);
        return lines;
    }

    std::string LineBuffer::flush() {
        std::string rest = std::move(m_pending);
        m_pending.clear();
        if (!rest.empty() && rest.back() == '\r') rest.pop_back();
        return rest;
    }

    std::unique_ptr<Generator> create_generator(const Config& config) {
        const auto& g = config.generation;
        if (g.backend == "ollama") {
            return create_ollama_generator(g.model, g.endpoint, g.timeout_ms);
        }
        if (g.backend == "openai") {
            return create_openai_generator(g.api_key, g.model, g.endpoint, g.timeout_ms);
        }
        throw Error(ErrorKind::Configuration, "unknown generation backend '" + g.backend + "'");
    }

}
