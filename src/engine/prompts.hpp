#pragma once

#include <initializer_list>
#include <string>
#include <utility>

namespace verity::engine::prompts {

    inline const char* const kSystem = R"(
You are an AI Ethics Assistant, a knowledgeable expert on AI policy, ethics, governance, and regulation.
Your role is to provide accurate, helpful, and well-informed responses about AI ethics topics based on the provided context from authoritative documents.

Inputs:
- User reformulated query: Enhanced version of the user's question optimized for document retrieval
- Context from AI Ethics Documents: Relevant excerpts from retrieved documents with source filenames

Guidelines:
- Provide clear, accurate, and comprehensive answers based on the context
- Your answer should directly address the user's question
- If the context doesn't contain enough information, acknowledge this limitation
- Focus on practical guidance and actionable insights when appropriate
- Use specific examples from the context when relevant
- Maintain a professional but approachable tone
- Do not make up information that isn't supported by the context
- Keep your answer concise and focused on the user's question
- Use bullet points or numbered lists for clarity when appropriate
)";

    inline const char* const kReformulation = R"(
You are an AI assistant helping users find information about AI policy and ethics.

The user has asked: "{user_query}"

Reformulate this query to be more comprehensive and likely to match relevant content in AI ethics documents.
Add related terms, expand acronyms, and make the query more specific to AI policy, ethics, governance, or regulation topics.

Return only the reformulated query, nothing else.)";

    inline const char* const kRag = R"(
Context from AI Ethics Documents:
{context}

User Question: {user_query}

Provide a comprehensive answer based on the context above.
If the context doesn't fully address the question,
mention what information is available and what might be missing.
)";

    inline const char* const kApology =
        "I encountered an error processing your question. Please try rephrasing or ask a different question.";

    /**
     * @brief Single pass over tmpl replacing "{name}" placeholders. Substituted
     * text is never rescanned, so user input cannot inject placeholders.
     */
    inline std::string fill(const std::string& tmpl,
                            std::initializer_list<std::pair<std::string, std::string>> values) {
        std::string out;
        out.reserve(tmpl.size());
        size_t pos = 0;
        while (pos < tmpl.size()) {
            bool replaced = false;
            if (tmpl[pos] == '{') {
                for (const auto& [name, value] : values) {
                    const std::string key = "{" + name + "}";
                    if (tmpl.compare(pos, key.size(), key) == 0) {
                        out += value;
                        pos += key.size();
                        replaced = true;
                        break;
                    }
                }
            }
            if (!replaced) out += tmpl[pos++];
        }
        return out;
    }

    inline std::string reformulation(const std::string& user_query) {
        return fill(kReformulation, {{"user_query", user_query}});
    }

    inline std::string rag(const std::string& context, const std::string& user_query) {
        return fill(kRag, {{"context", context}, {"user_query", user_query}});
    }

}
