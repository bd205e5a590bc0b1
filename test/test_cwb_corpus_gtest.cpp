#include <gtest/gtest.h>

#include "cwb_corpus.hpp"
#include "fake_cwb_tools.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

using namespace tmx_cwb;

namespace {

void write_be32(std::ofstream& out, std::int32_t value) {
    const auto v = static_cast<std::uint32_t>(value);
    const char bytes[4] = {
        static_cast<char>((v >> 24) & 0xFF),
        static_cast<char>((v >> 16) & 0xFF),
        static_cast<char>((v >> 8) & 0xFF),
        static_cast<char>(v & 0xFF)
    };
    out.write(bytes, sizeof(bytes));
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

}  // namespace

class CwbCorpusTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / ("tmx_cwb_cwb_" + std::to_string(::getpid()));
        registry_ = root_ / "registry";
        home_ = root_ / "corpora" / "foo_pt";
        std::filesystem::create_directories(registry_);
        std::filesystem::create_directories(home_);

        write_text(registry_ / "foo_pt",
            "# generated by cwb-encode\n"
            "NAME \"\"\n"
            "ID   foo_pt\n"
            "HOME \"" + home_.string() + "\"\n"
            "ALIGNED foo_fr\n"
            "STRUCTURE tu_id\n");

        std::ofstream alx(home_ / "foo_fr.alx", std::ios::binary);
        for (const std::int32_t v : {0, 0, 0, 0, 5, 7, 5, 6}) {
            write_be32(alx, v);
        }
    }

    void TearDown() override {
        std::filesystem::remove_all(root_);
    }

    std::filesystem::path root_;
    std::filesystem::path registry_;
    std::filesystem::path home_;
};

TEST_F(CwbCorpusTest, ReadsRegistryEntry) {
    CwbRegistryEntry entry;
    Error error;
    ASSERT_TRUE(read_registry_entry(registry_ / "foo_pt", entry, error)) << error.message;
    EXPECT_EQ(entry.id, "foo_pt");
    EXPECT_EQ(entry.home.string(), home_.string());
    EXPECT_EQ(entry.aligned, (std::vector<std::string>{"foo_fr"}));
}

TEST_F(CwbCorpusTest, RegistryEntryWithoutHomeIsNotACorpus) {
    write_text(registry_ / "broken", "ID broken\n");
    CwbRegistryEntry entry;
    Error error;
    EXPECT_FALSE(read_registry_entry(registry_ / "broken", entry, error));
    EXPECT_EQ(error.code, ErrorCode::CorpusNotFound);
}

TEST_F(CwbCorpusTest, ReadsAlignmentBlocks) {
    std::vector<AlignmentBlock> blocks;
    Error error;
    ASSERT_TRUE(read_alx_file(home_ / "foo_fr.alx", blocks, error)) << error.message;
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[1].source_start, 5);
    EXPECT_EQ(blocks[1].source_end, 7);
    EXPECT_EQ(blocks[1].target_start, 5);
    EXPECT_EQ(blocks[1].target_end, 6);
}

TEST_F(CwbCorpusTest, TruncatedAlignmentFileFails) {
    {
        std::ofstream alx(home_ / "short.alx", std::ios::binary);
        write_be32(alx, 1);
    }
    std::vector<AlignmentBlock> blocks;
    Error error;
    EXPECT_FALSE(read_alx_file(home_ / "short.alx", blocks, error));
    EXPECT_EQ(error.code, ErrorCode::NoAlignmentData);
}

TEST_F(CwbCorpusTest, OpenerLooksUpLowerCasedName) {
    CwbCorpusOpener opener(registry_);
    std::unique_ptr<Corpus> corpus;
    Error error;
    ASSERT_TRUE(opener.open("FOO_PT", corpus, error)) << error.message;
    EXPECT_EQ(corpus->name(), "foo_pt");

    std::unique_ptr<AlignmentAttribute> alignment;
    ASSERT_TRUE(corpus->alignment("FOO_FR", alignment, error)) << error.message;
    EXPECT_EQ(alignment->block_count(), 2u);
}

TEST_F(CwbCorpusTest, OpenerReportsMissingCorpus) {
    CwbCorpusOpener opener(registry_);
    std::unique_ptr<Corpus> corpus;
    Error error;
    EXPECT_FALSE(opener.open("FOO_XX", corpus, error));
    EXPECT_EQ(error.code, ErrorCode::CorpusNotFound);
    EXPECT_EQ(error.message, "Can't find corpus [FOO_XX]");
}

TEST_F(CwbCorpusTest, UndeclaredAlignmentIsNoAlignmentData) {
    CwbCorpusOpener opener(registry_);
    std::unique_ptr<Corpus> corpus;
    Error error;
    ASSERT_TRUE(opener.open("foo_pt", corpus, error));

    std::unique_ptr<AlignmentAttribute> alignment;
    EXPECT_FALSE(corpus->alignment("foo_es", alignment, error));
    EXPECT_EQ(error.code, ErrorCode::NoAlignmentData);
}

TEST_F(CwbCorpusTest, EmptyRangeNeedsNoDecoding) {
    CwbCorpusOpener opener(registry_);
    std::unique_ptr<Corpus> corpus;
    Error error;
    ASSERT_TRUE(opener.open("foo_pt", corpus, error));

    std::vector<std::string> words{"stale"};
    ASSERT_TRUE(corpus->words(3, 2, words, error));
    EXPECT_TRUE(words.empty());
}

TEST_F(CwbCorpusTest, WordsAreSlicedFromOneDecode) {
    FakeCwbTools tools("decode");
    tools.set_words("o\ngato\npreto\nsem-newline");

    CwbCorpusOpener opener(registry_);
    std::unique_ptr<Corpus> corpus;
    Error error;
    ASSERT_TRUE(opener.open("foo_pt", corpus, error));

    std::vector<std::string> words;
    ASSERT_TRUE(corpus->words(1, 3, words, error)) << error.message;
    EXPECT_EQ(words, (std::vector<std::string>{"gato", "preto", "sem-newline"}));

    ASSERT_TRUE(corpus->words(0, 0, words, error)) << error.message;
    EXPECT_EQ(words, (std::vector<std::string>{"o"}));

    EXPECT_EQ(tools.calls(), (std::vector<std::string>{
        "cwb-decode -C -r " + registry_.string() + " FOO_PT -P word"
    }));
}

TEST_F(CwbCorpusTest, RangePastCorpusEndIsNoAlignmentData) {
    FakeCwbTools tools("decode_short");
    tools.set_words("o\ngato\npreto\nsem-newline");

    CwbCorpusOpener opener(registry_);
    std::unique_ptr<Corpus> corpus;
    Error error;
    ASSERT_TRUE(opener.open("foo_pt", corpus, error));

    std::vector<std::string> words;
    EXPECT_FALSE(corpus->words(2, 4, words, error));
    EXPECT_EQ(error.code, ErrorCode::NoAlignmentData);
    EXPECT_EQ(error.message, "foo_pt: position 4 beyond corpus size 4");
}
