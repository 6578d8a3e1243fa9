#include "reformulator.hpp"
#include "generator.hpp"
#include "chunker.hpp"
#include "prompts.hpp"
#include "log.hpp"

namespace verity::engine {

    QueryReformulator::QueryReformulator(Generator& generator) : m_generator(generator) {}

    std::string QueryReformulator::reformulate(const std::string& user_query) const {
        GenerationRequest request;
        request.system_prompt = "";
        request.user_prompt = prompts::reformulation(user_query);
        request.max_tokens = 100;
        request.temperature = 0.3f;

        std::string reformulated;
        try {
            reformulated = trim(m_generator.complete(request));
        } catch (const std::exception& e) {
            log::warn("Reformulator", std::string("Reformulation failed: ") + e.what() + ". Using original query.");
            return user_query;
        }

        if (reformulated.empty()) {
            log::warn("Reformulator", "Reformulation returned empty result, using original query");
            return user_query;
        }

        log::info("Reformulator", "'" + user_query + "' -> '" + reformulated + "'");
        return reformulated;
    }

}
