#pragma once

#include "verity/types.hpp"
#include <string>
#include <vector>

namespace verity::engine {

    extern const char* const kNoDocumentsFound;

    /**
     * @brief Renders retrieved chunks as numbered, source-attributed blocks
     * separated by "\n---\n"; no chunks renders kNoDocumentsFound.
     */
    std::string format_context(const std::vector<ScoredChunk>& chunks);

}
