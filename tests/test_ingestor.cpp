#include "fakes.hpp"
#include "engine/chunker.hpp"
#include "engine/identity.hpp"
#include "engine/ingestor.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace verity::engine;
using namespace verity::testing;

namespace {

    const std::string kPolicy =
        "Principle one: systems must be transparent about automated decisions.\n\n"
        "Principle two: operators remain accountable for outcomes.\n\n"
        "Principle three: affected people can contest decisions.";

    struct Pipeline {
        Journal journal;
        FakeStorage storage{&journal};
        FakeExtractor extractor{&journal};
        Chunker chunker{80, 10};
        FakeEmbedder embedder{&journal};
        InMemoryIndex index{&journal};
        IngestionOrchestrator ingestor{storage, extractor, chunker, embedder, index, DocumentIdentity("pdfs/")};
    };

}

TEST(Ingestor, StepsRunInOrder) {
    Pipeline p;
    p.storage.documents["pdfs/policy.pdf"] = kPolicy;

    auto result = p.ingestor.ingest_one("pdfs/policy.pdf");
    ASSERT_TRUE(result.ok());
    size_t n = result.value();
    EXPECT_EQ(n, 3u);

    std::vector<std::string> expected = {
        "delete:53346a8acb0ecef8",
        "fetch:pdfs/policy.pdf",
        "extract:pdfs/policy.pdf",
        "embed:3",
        "upsert:3"
    };
    EXPECT_EQ(p.journal, expected);
    EXPECT_EQ(p.embedder.batch_calls, 1u);
}

TEST(Ingestor, PointsCarryChunkPayload) {
    Pipeline p;
    p.storage.documents["pdfs/policy.pdf"] = kPolicy;
    ASSERT_TRUE(p.ingestor.ingest_one("pdfs/policy.pdf").ok());

    ASSERT_EQ(p.index.points.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        auto id = DocumentIdentity::chunk_id("53346a8acb0ecef8", i);
        ASSERT_TRUE(p.index.points.count(id)) << id;
        const auto& point = p.index.points.at(id);
        EXPECT_EQ(point.payload.filename, "policy.pdf");
        EXPECT_EQ(point.payload.document_id, "53346a8acb0ecef8");
        EXPECT_EQ(point.payload.file_size, kPolicy.size());
        EXPECT_EQ(point.payload.chunk_index, i);
        EXPECT_FALSE(point.payload.processed_date.empty());
        EXPECT_EQ(point.vector, FakeEmbedder::vectorize(point.payload.text));
    }
    EXPECT_EQ(p.index.points.at(DocumentIdentity::chunk_id("53346a8acb0ecef8", 0)).payload.text,
              "Principle one: systems must be transparent about automated decisions.");
}

TEST(Ingestor, ReingestingReplacesInsteadOfDuplicating) {
    Pipeline p;
    p.storage.documents["pdfs/policy.pdf"] = kPolicy;
    auto ids = [&p] {
        std::set<std::string> out;
        for (const auto& [id, _] : p.index.points) out.insert(id);
        return out;
    };

    ASSERT_TRUE(p.ingestor.ingest_one("pdfs/policy.pdf").ok());
    auto first = ids();
    ASSERT_TRUE(p.ingestor.ingest_one("pdfs/policy.pdf").ok());
    EXPECT_EQ(p.index.count(), 3u);
    EXPECT_EQ(ids(), first);
    EXPECT_EQ(first, (std::set<std::string>{DocumentIdentity::chunk_id("53346a8acb0ecef8", 0),
                                            DocumentIdentity::chunk_id("53346a8acb0ecef8", 1),
                                            DocumentIdentity::chunk_id("53346a8acb0ecef8", 2)}));

    // A shorter revision must not leave stale trailing chunks behind.
    p.storage.documents["pdfs/policy.pdf"] = "Principle one only.";
    ASSERT_TRUE(p.ingestor.ingest_one("pdfs/policy.pdf").ok());
    EXPECT_EQ(p.index.count(), 1u);
}

TEST(Ingestor, DeleteFailureDoesNotStopIngestion) {
    Pipeline p;
    p.storage.documents["pdfs/policy.pdf"] = kPolicy;
    p.index.fail_delete = true;

    auto result = p.ingestor.ingest_one("pdfs/policy.pdf");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 3u);
    EXPECT_EQ(p.index.count(), 3u);
}

TEST(Ingestor, BlankDocumentSucceedsWithZeroChunks) {
    Pipeline p;
    p.storage.documents["pdfs/blank.pdf"] = "  \n\n \t ";

    auto result = p.ingestor.ingest_one("pdfs/blank.pdf");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 0u);
    EXPECT_EQ(p.embedder.batch_calls, 0u);
    EXPECT_EQ(p.index.count(), 0u);
}

TEST(Ingestor, FailuresAreWrappedAsIngestionErrors) {
    Pipeline p;
    p.storage.documents["pdfs/bad.pdf"] = "CORRUPT";

    auto result = p.ingestor.ingest_one("pdfs/bad.pdf");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind(), verity::ErrorKind::Ingestion);
    std::string msg = result.error().what();
    EXPECT_NE(msg.find("pdfs/bad.pdf"), std::string::npos);
    EXPECT_NE(msg.find("extraction"), std::string::npos);
    EXPECT_EQ(p.index.count(), 0u);
}

TEST(Ingestor, EmbeddingCountMismatchFails) {
    Pipeline p;
    p.storage.documents["pdfs/policy.pdf"] = kPolicy;
    p.embedder.drop_one = true;

    auto result = p.ingestor.ingest_one("pdfs/policy.pdf");
    ASSERT_FALSE(result.ok());
    EXPECT_NE(std::string(result.error().what()).find("embedding"), std::string::npos);
    EXPECT_EQ(p.index.count(), 0u);
}

TEST(Ingestor, MissingDocumentFails) {
    Pipeline p;
    auto result = p.ingestor.ingest_one("pdfs/absent.pdf");
    ASSERT_FALSE(result.ok());
    EXPECT_NE(std::string(result.error().what()).find("storage"), std::string::npos);
}

TEST(Ingestor, BatchIsolatesFailingDocuments) {
    Pipeline p;
    p.storage.documents["pdfs/a.pdf"] = "Alpha document text.";
    p.storage.documents["pdfs/b.pdf"] = "CORRUPT";
    p.storage.documents["pdfs/c.pdf"] = "Gamma document text.";

    auto result = p.ingestor.ingest_all();
    ASSERT_TRUE(result.ok());
    const auto& summary = result.value();
    EXPECT_EQ(summary.processed, 2u);
    EXPECT_EQ(summary.failed, 1u);
    ASSERT_EQ(summary.files.size(), 3u);
    EXPECT_EQ(summary.files[0].file, "pdfs/a.pdf");
    EXPECT_TRUE(summary.files[0].success);
    EXPECT_EQ(summary.files[0].chunks, 1u);
    EXPECT_EQ(summary.files[1].file, "pdfs/b.pdf");
    EXPECT_FALSE(summary.files[1].success);
    EXPECT_FALSE(summary.files[1].error.empty());
    EXPECT_EQ(summary.files[2].file, "pdfs/c.pdf");
    EXPECT_TRUE(summary.files[2].success);
    EXPECT_EQ(p.index.count(), 2u);
}

TEST(Ingestor, EmptyListingGivesEmptySummary) {
    Pipeline p;
    auto result = p.ingestor.ingest_all();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().processed, 0u);
    EXPECT_EQ(result.value().failed, 0u);
    EXPECT_TRUE(result.value().files.empty());
}

TEST(Ingestor, ListingFailureIsAnError) {
    Pipeline p;
    p.storage.fail_list = true;
    auto result = p.ingestor.ingest_all();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind(), verity::ErrorKind::Ingestion);
}

TEST(Ingestor, UntypedListingFailureIsAnError) {
    Pipeline p;
    p.storage.fail_list_untyped = true;
    auto result = p.ingestor.ingest_all();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind(), verity::ErrorKind::Ingestion);
    EXPECT_NE(std::string(result.error().what()).find("symbolic links"), std::string::npos);
}

TEST(Ingestor, ExplicitKeys) {
    Pipeline p;
    p.storage.documents["pdfs/a.pdf"] = "Alpha document text.";
    p.storage.documents["pdfs/c.pdf"] = "Gamma document text.";

    auto summary = p.ingestor.ingest_keys({"pdfs/c.pdf", "pdfs/missing.pdf"});
    EXPECT_EQ(summary.processed, 1u);
    EXPECT_EQ(summary.failed, 1u);
    ASSERT_EQ(summary.files.size(), 2u);
    EXPECT_EQ(summary.files[0].file, "pdfs/c.pdf");
    EXPECT_EQ(p.index.count(), 1u);
}

TEST(Ingestor, StopPreventsFurtherDocuments) {
    Pipeline p;
    p.storage.documents["pdfs/a.pdf"] = "Alpha document text.";
    p.ingestor.stop();
    EXPECT_TRUE(p.ingestor.stopping());

    auto result = p.ingestor.ingest_all();
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().files.empty());
    EXPECT_EQ(p.index.count(), 0u);
}
