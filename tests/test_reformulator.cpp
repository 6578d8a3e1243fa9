#include "fakes.hpp"
#include "engine/prompts.hpp"
#include "engine/reformulator.hpp"
#include <gtest/gtest.h>

using namespace verity::engine;
using namespace verity::testing;

TEST(Reformulator, UsesLowTemperatureShortRequest) {
    FakeGenerator generator;
    generator.response = "  ethical principles for AI transparency \n";
    QueryReformulator reformulator(generator);

    EXPECT_EQ(reformulator.reformulate("what about transparency?"), "ethical principles for AI transparency");

    ASSERT_EQ(generator.requests.size(), 1u);
    const auto& request = generator.requests[0];
    EXPECT_TRUE(request.system_prompt.empty());
    EXPECT_EQ(request.max_tokens, 100);
    EXPECT_FLOAT_EQ(request.temperature, 0.3f);
    EXPECT_EQ(request.user_prompt, prompts::reformulation("what about transparency?"));
    EXPECT_NE(request.user_prompt.find("what about transparency?"), std::string::npos);
}

TEST(Reformulator, FallsBackWhenBackendFails) {
    FakeGenerator generator;
    generator.fail_complete = true;
    QueryReformulator reformulator(generator);
    EXPECT_EQ(reformulator.reformulate("who is accountable?"), "who is accountable?");
}

TEST(Reformulator, FallsBackOnBlankOutput) {
    FakeGenerator generator;
    generator.response = " \n\t ";
    QueryReformulator reformulator(generator);
    EXPECT_EQ(reformulator.reformulate("who is accountable?"), "who is accountable?");
}

TEST(Prompts, PlaceholdersInUserTextAreNotExpanded) {
    std::string out = prompts::fill("Q: {user_query} C: {context}",
                                    {{"context", "ctx"}, {"user_query", "{context}"}});
    EXPECT_EQ(out, "Q: {context} C: ctx");
}
