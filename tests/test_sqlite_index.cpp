#include "engine/librarian.hpp"
#include "engine/vector_index.hpp"
#include "verity/error.hpp"
#include <gtest/gtest.h>
#include <unistd.h>

using namespace verity::engine;

namespace {

    IndexedPoint point(const std::string& id, std::vector<float> v, const std::string& doc, size_t index = 0) {
        IndexedPoint p;
        p.id = id;
        p.vector = std::move(v);
        p.payload.filename = doc + ".pdf";
        p.payload.document_id = doc;
        p.payload.text = "text of " + id;
        p.payload.chunk_index = index;
        p.payload.file_size = 1234;
        p.payload.processed_date = "2024-05-01T10:00:00Z";
        return p;
    }

    class SqliteIndexTest : public ::testing::Test {
    protected:
        std::filesystem::path dir;
        std::filesystem::path db_path;

        void SetUp() override {
            dir = std::filesystem::temp_directory_path() /
                  ("verity_index_" + std::to_string(::getpid()) + "_" +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name());
            std::filesystem::remove_all(dir);
            std::filesystem::create_directories(dir);
            db_path = dir / "index.db";
        }

        void TearDown() override {
            std::filesystem::remove_all(dir);
        }

        std::unique_ptr<VectorIndex> open() {
            auto index = create_sqlite_index(db_path, "documents");
            index->ensure_collection(4, "cosine");
            return index;
        }

        void seed(VectorIndex& index) {
            index.upsert({
                point("a", {1, 0, 0, 0}, "doc1", 0),
                point("b", {0, 1, 0, 0}, "doc1", 1),
                point("c", {0.9f, 0.1f, 0, 0}, "doc2", 0),
                point("d", {0, 0, 0, 1}, "doc2", 1)
            });
        }
    };

}

TEST_F(SqliteIndexTest, SearchOrdersByCosineSimilarity) {
    auto index = open();
    seed(*index);
    EXPECT_EQ(index->count(), 4u);

    auto results = index->search({2, 0, 0, 0}, 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].id, "a");
    EXPECT_NEAR(results[0].score, 1.0f, 1e-4);
    EXPECT_EQ(results[1].id, "c");
    EXPECT_GT(results[0].score, results[1].score);

    EXPECT_EQ(results[0].payload.filename, "doc1.pdf");
    EXPECT_EQ(results[0].payload.text, "text of a");
    EXPECT_EQ(results[0].payload.file_size, 1234u);
    EXPECT_EQ(results[1].payload.document_id, "doc2");
}

TEST_F(SqliteIndexTest, SearchOnEmptyCollection) {
    auto index = open();
    EXPECT_TRUE(index->search({1, 0, 0, 0}, 5).empty());
    EXPECT_EQ(index->count(), 0u);
}

TEST_F(SqliteIndexTest, TopKLargerThanCollection) {
    auto index = open();
    seed(*index);
    EXPECT_EQ(index->search({0, 0, 1, 0}, 20).size(), 4u);
}

TEST_F(SqliteIndexTest, UpsertReplacesExistingId) {
    auto index = open();
    seed(*index);
    auto replacement = point("a", {0, 0, 0, 1}, "doc1", 0);
    replacement.payload.text = "rewritten";
    index->upsert({replacement});

    EXPECT_EQ(index->count(), 4u);
    auto results = index->search({0, 0, 0, 1}, 4);
    ASSERT_GE(results.size(), 2u);
    bool found = false;
    for (const auto& r : results) {
        if (r.id == "a") {
            found = true;
            EXPECT_EQ(r.payload.text, "rewritten");
            EXPECT_NEAR(r.score, 1.0f, 1e-4);
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(SqliteIndexTest, CreatedAtIsStampedWhenMissing) {
    auto index = open();
    auto stamped = point("x", {1, 1, 0, 0}, "doc3");
    auto kept = point("y", {1, 0, 1, 0}, "doc3");
    kept.payload.created_at = "2020-01-01T00:00:00Z";
    index->upsert({stamped, kept});

    for (const auto& r : index->search({1, 1, 1, 0}, 2)) {
        if (r.id == "x") {
            EXPECT_EQ(r.payload.created_at.size(), 20u);
            EXPECT_EQ(r.payload.created_at.back(), 'Z');
        } else {
            EXPECT_EQ(r.payload.created_at, "2020-01-01T00:00:00Z");
        }
    }
}

TEST_F(SqliteIndexTest, DeleteWhereRemovesMatchingPoints) {
    auto index = open();
    seed(*index);

    EXPECT_EQ(index->delete_where("document_id", "doc1"), 2u);
    EXPECT_EQ(index->count(), 2u);
    for (const auto& r : index->search({1, 0, 0, 0}, 4)) {
        EXPECT_EQ(r.payload.document_id, "doc2");
    }
    EXPECT_EQ(index->delete_where("document_id", "doc1"), 0u);
}

TEST_F(SqliteIndexTest, PointsSurviveReopen) {
    {
        auto index = open();
        seed(*index);
        index->delete_where("document_id", "doc2");
    }
    auto index = open();
    EXPECT_EQ(index->count(), 2u);
    auto results = index->search({0, 1, 0, 0}, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].id, "b");
}

TEST_F(SqliteIndexTest, DimensionMismatchIsConfigurationError) {
    { open(); }
    auto index = create_sqlite_index(db_path, "documents");
    try {
        index->ensure_collection(8, "cosine");
        FAIL() << "expected a configuration error";
    } catch (const verity::Error& e) {
        EXPECT_EQ(e.kind(), verity::ErrorKind::Configuration);
    }
}

TEST_F(SqliteIndexTest, WrongVectorSizeIsRejected) {
    auto index = open();
    EXPECT_THROW(index->upsert({point("bad", {1, 0, 0}, "doc")}), verity::Error);
    EXPECT_EQ(index->count(), 0u);
}

TEST_F(SqliteIndexTest, CollectionsAreIsolated) {
    {
        auto index = open();
        seed(*index);
    }
    auto other = create_sqlite_index(db_path, "other");
    other->ensure_collection(4, "cosine");
    EXPECT_EQ(other->count(), 0u);
    EXPECT_TRUE(other->search({1, 0, 0, 0}, 3).empty());
}

TEST_F(SqliteIndexTest, ProbeSucceedsOnOpenDatabase) {
    auto index = open();
    EXPECT_NO_THROW(index->probe());
}

TEST_F(SqliteIndexTest, RepeatedReingestionKeepsResultsStable) {
    auto index = open();
    for (int round = 0; round < 25; ++round) {
        index->delete_where("document_id", "doc1");
        index->upsert({
            point("a", {1, 0, 0, 0}, "doc1", 0),
            point("b", {0, 1, 0, 0}, "doc1", 1)
        });
    }
    EXPECT_EQ(index->count(), 2u);
    auto results = index->search({1, 0, 0, 0}, 5);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].id, "a");
    EXPECT_EQ(results[1].id, "b");
}

TEST(Librarian, DeletedSlotsAreReused) {
    Librarian graph(4, 16);
    int64_t next = 1;
    std::vector<int64_t> current;
    for (int i = 0; i < 8; ++i) {
        graph.add_item(next, {1.0f, static_cast<float>(i), 0, 0});
        current.push_back(next++);
    }

    for (int round = 0; round < 50; ++round) {
        for (auto label : current) graph.remove_item(label);
        current.clear();
        for (int i = 0; i < 8; ++i) {
            graph.add_item(next, {1.0f, static_cast<float>(i), 0, 0});
            current.push_back(next++);
        }
    }

    EXPECT_EQ(graph.count(), 8u);
    EXPECT_EQ(graph.slots(), 8u);
    auto hits = graph.search({1, 0, 0, 0}, 8);
    ASSERT_EQ(hits.size(), 8u);
    for (const auto& [label, score] : hits) {
        EXPECT_GE(label, current.front());
    }
    EXPECT_EQ(hits[0].first, current.front());
}

TEST(Librarian, ReaddingLiveLabelUpdatesInPlace) {
    Librarian graph(4, 16);
    graph.add_item(7, {1, 0, 0, 0});
    graph.add_item(8, {0, 1, 0, 0});
    graph.add_item(7, {0, 0, 1, 0});

    EXPECT_EQ(graph.count(), 2u);
    EXPECT_EQ(graph.slots(), 2u);
    auto hits = graph.search({0, 0, 1, 0}, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].first, 7);
    EXPECT_NEAR(hits[0].second, 1.0f, 1e-4);
}
