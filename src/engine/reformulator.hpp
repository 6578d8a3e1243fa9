#pragma once

#include <string>

namespace verity::engine {

    class Generator;

    /**
     * @brief Rewrites a user question into a retrieval-friendly query.
     * Never fails: any backend problem yields the original question.
     */
    class QueryReformulator {
    public:
        explicit QueryReformulator(Generator& generator);

        std::string reformulate(const std::string& user_query) const;

    private:
        Generator& m_generator;
    };

}
