#include "engine/chunker.hpp"
#include "verity/error.hpp"
#include <gtest/gtest.h>

using namespace verity::engine;

namespace {

    // Each chunk must occur in the source, and together they must cover every
    // non-whitespace character.
    void expect_covers(const std::string& text, const std::vector<std::string>& chunks) {
        std::vector<bool> covered(text.size(), false);
        for (const auto& c : chunks) {
            size_t pos = text.find(c);
            ASSERT_NE(pos, std::string::npos) << "chunk not found in source: " << c;
            for (size_t i = pos; i < pos + c.size(); ++i) covered[i] = true;
        }
        for (size_t i = 0; i < text.size(); ++i) {
            if (!std::isspace(static_cast<unsigned char>(text[i]))) {
                EXPECT_TRUE(covered[i]) << "character at " << i << " not covered";
            }
        }
    }

}

TEST(Chunker, EmptyInputGivesNoChunks) {
    Chunker chunker;
    EXPECT_TRUE(chunker.chunk("", ChunkMetadata{}).empty());
    EXPECT_TRUE(chunker.chunk("   \n\n  \t", ChunkMetadata{}).empty());
}

TEST(Chunker, ShortTextIsOneChunk) {
    Chunker chunker(1000, 200);
    auto chunks = chunker.split_text("First paragraph.\n\nSecond paragraph.");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], "First paragraph.\n\nSecond paragraph.");
}

TEST(Chunker, WordsMergeWithOverlap) {
    Chunker chunker(20, 5);
    auto chunks = chunker.split_text("one two three four five six seven eight nine ten");
    std::vector<std::string> expected = {"one two three four", "four five six seven", "eight nine ten"};
    EXPECT_EQ(chunks, expected);
}

TEST(Chunker, ParagraphsBeforeWords) {
    Chunker chunker(30, 0);
    auto chunks = chunker.split_text("Alpha beta.\n\nGamma delta epsilon zeta eta theta iota.\n\nKappa.");
    std::vector<std::string> expected = {"Alpha beta.", "Gamma delta epsilon zeta eta", "theta iota.", "Kappa."};
    EXPECT_EQ(chunks, expected);
}

TEST(Chunker, HardCutWhenNoSeparatorFits) {
    Chunker chunker(10, 0);
    auto chunks = chunker.split_text("abcdefghijklmnopqrstuvwxyz");
    std::vector<std::string> expected = {"abcdefghij", "klmnopqrst", "uvwxyz"};
    EXPECT_EQ(chunks, expected);
}

TEST(Chunker, OversizedTokenKeptWithoutHardCut) {
    Chunker chunker(10, 0, {"\n\n", "\n", ". ", " "});
    auto chunks = chunker.split_text("short supercalifragilisticexpialidocious end");
    std::vector<std::string> expected = {"short", "supercalifragilisticexpialidocious", "end"};
    EXPECT_EQ(chunks, expected);
}

TEST(Chunker, SizeCountsCodePointsNotBytes) {
    Chunker chunker(5, 1);
    auto chunks = chunker.split_text("héllo wörld ünïcode");
    ASSERT_FALSE(chunks.empty());
    for (const auto& c : chunks) {
        EXPECT_LE(utf8_length(c), 5u) << c;
    }
    EXPECT_EQ(chunks.front(), "héllo");
}

TEST(Chunker, IndicesAreContiguousAndMetadataCopied) {
    Chunker chunker(40, 10);
    ChunkMetadata meta{"policy.pdf", "53346a8acb0ecef8", 1234, "2024-01-01T00:00:00Z"};
    std::string text;
    for (int i = 0; i < 30; ++i) text += "Sentence number " + std::to_string(i) + ". ";
    auto chunks = chunker.chunk(text, meta);
    ASSERT_GT(chunks.size(), 3u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].metadata.document_id, meta.document_id);
        EXPECT_EQ(chunks[i].metadata.filename, meta.filename);
        EXPECT_EQ(chunks[i].metadata.file_size, meta.file_size);
    }
}

TEST(Chunker, ChunksStayWithinSizeAndCoverText) {
    Chunker chunker(120, 30);
    std::string text =
        "Transparency obliges operators to document how automated decisions are made.\n"
        "Accountability requires a named party who answers for outcomes.\n\n"
        "Fairness audits compare error rates across groups. Privacy impact assessments "
        "precede deployment. Human oversight must be meaningful, not ceremonial.\n\n"
        "Redress mechanisms let affected people contest decisions and obtain remedies.";
    auto chunks = chunker.split_text(text);
    ASSERT_GT(chunks.size(), 1u);
    for (const auto& c : chunks) {
        EXPECT_LE(utf8_length(c), 120u);
        EXPECT_EQ(c, trim(c));
        EXPECT_FALSE(c.empty());
    }
    expect_covers(text, chunks);
}

TEST(Chunker, DeterministicForSameInput) {
    Chunker chunker(50, 10);
    std::string text(500, 'x');
    for (size_t i = 7; i < text.size(); i += 11) text[i] = ' ';
    EXPECT_EQ(chunker.split_text(text), chunker.split_text(text));
}

TEST(Chunker, RejectsBadParameters) {
    EXPECT_THROW(Chunker(0, 0), verity::Error);
    EXPECT_THROW(Chunker(100, 100), verity::Error);
    EXPECT_THROW(Chunker(100, 150), verity::Error);
    try {
        Chunker(10, 20);
        FAIL() << "expected a configuration error";
    } catch (const verity::Error& e) {
        EXPECT_EQ(e.kind(), verity::ErrorKind::Configuration);
    }
}

TEST(Utf8Length, CountsCodePoints) {
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("héllo"), 5u);
    EXPECT_EQ(utf8_length("日本語"), 3u);
}
