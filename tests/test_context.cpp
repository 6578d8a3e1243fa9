#include "fakes.hpp"
#include "engine/context.hpp"
#include "engine/retriever.hpp"
#include <gtest/gtest.h>

using namespace verity::engine;
using namespace verity::testing;

namespace {

    ScoredChunk make_chunk(const std::string& filename, const std::string& text, float score = 0.5f) {
        ScoredChunk c;
        c.id = filename + text;
        c.payload.filename = filename;
        c.payload.text = text;
        c.score = score;
        return c;
    }

}

TEST(Context, NoChunksGivesSentinel) {
    EXPECT_EQ(format_context({}), "No relevant documents found.");
}

TEST(Context, NumbersAndAttributesChunks) {
    std::string out = format_context({
        make_chunk("a.pdf", "First passage."),
        make_chunk("b.pdf", "Second passage.")
    });
    EXPECT_EQ(out,
              "Document 1 (from a.pdf):\nFirst passage.\n"
              "\n---\n"
              "Document 2 (from b.pdf):\nSecond passage.\n");
}

TEST(Context, MissingFilenameIsUnknown) {
    EXPECT_EQ(format_context({make_chunk("", "Orphan text.")}), "Document 1 (from Unknown):\nOrphan text.\n");
}

TEST(Retriever, ReturnsMostSimilarFirst) {
    FakeEmbedder embedder;
    InMemoryIndex index;
    std::vector<IndexedPoint> points;
    for (const std::string& text : {"aaaa", "bbbb", "aabb"}) {
        IndexedPoint p;
        p.id = text;
        p.vector = FakeEmbedder::vectorize(text);
        p.payload.text = text;
        points.push_back(p);
    }
    index.upsert(points);

    Retriever retriever(embedder, index);
    auto results = retriever.retrieve("aaa", 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].id, "aaaa");
    EXPECT_EQ(results[1].id, "aabb");
    EXPECT_GE(results[0].score, results[1].score);
}

TEST(Retriever, EmptyIndexGivesNothing) {
    FakeEmbedder embedder;
    InMemoryIndex index;
    Retriever retriever(embedder, index);
    EXPECT_TRUE(retriever.retrieve("anything", 5).empty());
}

TEST(Retriever, EmbeddingFailurePropagates) {
    FakeEmbedder embedder;
    embedder.fail = true;
    InMemoryIndex index;
    Retriever retriever(embedder, index);
    try {
        retriever.retrieve("anything", 5);
        FAIL() << "expected an embedding error";
    } catch (const verity::Error& e) {
        EXPECT_EQ(e.kind(), verity::ErrorKind::Embedding);
    }
}
