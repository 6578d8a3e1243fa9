#include "context.hpp"

namespace verity::engine {

    const char* const kNoDocumentsFound = "No relevant documents found.";

    std::string format_context(const std::vector<ScoredChunk>& chunks) {
        if (chunks.empty()) return kNoDocumentsFound;

        std::string out;
        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& p = chunks[i].payload;
            if (i > 0) out += "\n---\n";
            out += "Document " + std::to_string(i + 1) + " (from " +
                   (p.filename.empty() ? std::string("Unknown") : p.filename) + "):\n" + p.text + "\n";
        }
        return out;
    }

}
