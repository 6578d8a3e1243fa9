#include "engine/storage.hpp"
#include "verity/error.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <unistd.h>

using namespace verity::engine;

namespace {

    class StorageTest : public ::testing::Test {
    protected:
        std::filesystem::path root;

        void SetUp() override {
            root = std::filesystem::temp_directory_path() /
                   ("verity_storage_" + std::to_string(::getpid()) + "_" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
            std::filesystem::remove_all(root);
            put("pdfs/b.pdf", "bee");
            put("pdfs/a.PDF", "ay");
            put("pdfs/notes.txt", "not a pdf");
            put("pdfs/2024/c.pdf", "sea");
            put("other/d.pdf", "dee");
            put("pdfs/draft.tmp", "scratch");
            put(".git/e.pdf", "hidden");
        }

        void TearDown() override {
            std::filesystem::remove_all(root);
        }

        void put(const std::string& key, const std::string& body) {
            auto path = root / key;
            std::filesystem::create_directories(path.parent_path());
            std::ofstream(path, std::ios::binary) << body;
        }
    };

}

TEST_F(StorageTest, ListsEligibleDocumentsSorted) {
    FileSystemStorage storage(root);
    std::vector<std::string> expected = {"other/d.pdf", "pdfs/2024/c.pdf", "pdfs/a.PDF", "pdfs/b.pdf"};
    EXPECT_EQ(storage.list(), expected);
}

TEST_F(StorageTest, KeyPrefixAndListPrefixCombine) {
    FileSystemStorage storage(root, "pdfs/");
    std::vector<std::string> all = {"pdfs/2024/c.pdf", "pdfs/a.PDF", "pdfs/b.pdf"};
    EXPECT_EQ(storage.list(), all);
    std::vector<std::string> nested = {"pdfs/2024/c.pdf"};
    EXPECT_EQ(storage.list("2024/"), nested);
}

TEST_F(StorageTest, SuffixIsConfigurable) {
    FileSystemStorage storage(root, "", ".txt");
    std::vector<std::string> expected = {"pdfs/notes.txt"};
    EXPECT_EQ(storage.list(), expected);
}

TEST_F(StorageTest, IgnoreFileExcludesMatches) {
    put(".verity_ignore", "# drafts\n2024\n");
    FileSystemStorage storage(root, "pdfs/");
    std::vector<std::string> expected = {"pdfs/a.PDF", "pdfs/b.pdf"};
    EXPECT_EQ(storage.list(), expected);
}

TEST_F(StorageTest, SymlinkLoopIsSkipped) {
    put("notes/ok.txt", "fine");
    std::filesystem::create_symlink("loop.txt", root / "notes" / "loop.txt");

    FileSystemStorage storage(root, "notes/", ".txt");
    std::vector<std::string> expected = {"notes/ok.txt"};
    EXPECT_EQ(storage.list(), expected);
}

TEST_F(StorageTest, FetchReturnsBytes) {
    FileSystemStorage storage(root);
    EXPECT_EQ(storage.fetch("pdfs/2024/c.pdf"), "sea");
}

TEST_F(StorageTest, FetchMissingIsStorageError) {
    FileSystemStorage storage(root);
    try {
        storage.fetch("pdfs/absent.pdf");
        FAIL() << "expected a storage error";
    } catch (const verity::Error& e) {
        EXPECT_EQ(e.kind(), verity::ErrorKind::Storage);
    }
}

TEST_F(StorageTest, KeysCannotEscapeRoot) {
    FileSystemStorage storage(root / "pdfs");
    EXPECT_THROW(storage.fetch("../other/d.pdf"), verity::Error);
    EXPECT_THROW(storage.fetch("/etc/hostname"), verity::Error);
}

TEST_F(StorageTest, MissingRootFailsProbeAndList) {
    FileSystemStorage storage(root / "nowhere");
    EXPECT_FALSE(storage.probe());
    EXPECT_THROW(storage.list(), verity::Error);
}
