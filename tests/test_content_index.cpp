#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../common/errors.hpp"
#include "../delta/content_index.hpp"

#include <string>

using namespace testutil;

class ContentIndexTest : public ::testing::Test {
protected:
    TempDir tmp;

    ContentIndex index_of(const std::string& path) {
        auto reader = open_reader(path);
        return delta::build_index(*reader, "test");
    }
};

TEST_F(ContentIndexTest, IndexesEveryEntryType) {
    std::string path = tmp.file("a.tar");
    write_archive(path, {
        {"dir", "", 0755, 0, tar::TYPE_DIRECTORY},
        {"dir/file.txt", "hello"},
        {"dir/link", "", 0777, 0, tar::TYPE_SYMLINK, "file.txt"},
        {"dir/hard", "", 0644, 0, tar::TYPE_HARDLINK, "dir/file.txt"},
        {"empty", ""},
    });

    ContentIndex idx = index_of(path);
    EXPECT_EQ(idx.size(), 5u);
    for (const char* p : {"dir", "dir/file.txt", "dir/link", "dir/hard", "empty"}) {
        EXPECT_EQ(idx.count(p), 1u) << p;
    }
}

TEST_F(ContentIndexTest, ContentHashIsSha1OfPayload) {
    std::string path = tmp.file("a.tar");
    write_archive(path, {{"hello.txt", "hello"}, {"empty", ""}});

    ContentIndex idx = index_of(path);
    EXPECT_EQ(hash::to_hex(idx.at("hello.txt").content_hash),
              "aaf4c61ddcc5e8a2dabede0f3b482cd9aea9434d");
    EXPECT_EQ(hash::to_hex(idx.at("empty").content_hash),
              "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EXPECT_EQ(idx.at("hello.txt").content_hash, hash::sha1("hello", 5));
}

TEST_F(ContentIndexTest, StructuralChecksumIsHeaderChecksum) {
    std::string path = tmp.file("a.tar");
    write_archive(path, {{"f", "abc"}});

    auto stored = tar::parse_numeric(read_file(path).data() + tar::CHKSUM_OFFSET,
                                     tar::CHKSUM_LEN);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(index_of(path).at("f").structural_checksum, (u32)*stored);
}

TEST_F(ContentIndexTest, MetadataChangeChangesFingerprint) {
    std::string a = tmp.file("a.tar");
    std::string b = tmp.file("b.tar");
    write_archive(a, {{"f", "same bytes", 0644}});
    write_archive(b, {{"f", "same bytes", 0755}});

    Fingerprint fa = index_of(a).at("f");
    Fingerprint fb = index_of(b).at("f");
    EXPECT_EQ(fa.content_hash, fb.content_hash);
    EXPECT_NE(fa.structural_checksum, fb.structural_checksum);
    EXPECT_NE(fa, fb);
}

TEST_F(ContentIndexTest, IdenticalEntriesHaveEqualFingerprints) {
    std::string a = tmp.file("a.tar");
    std::string b = tmp.file("b.tar");
    write_archive(a, {{"f", "bytes"}, {"g", "other"}});
    write_archive(b, {{"g", "other"}, {"f", "bytes"}});

    EXPECT_EQ(index_of(a), index_of(b));
}

TEST_F(ContentIndexTest, DuplicatePathKeepsLastOccurrence) {
    std::string path = tmp.file("a.tar");
    write_archive(path, {{"dup", "first"}, {"other", "x"}, {"dup", "hello"}});

    ContentIndex idx = index_of(path);
    EXPECT_EQ(idx.size(), 2u);
    EXPECT_EQ(hash::to_hex(idx.at("dup").content_hash),
              "aaf4c61ddcc5e8a2dabede0f3b482cd9aea9434d");
}

TEST_F(ContentIndexTest, EmptyArchiveGivesEmptyIndex) {
    std::string path = tmp.file("a.tar");
    write_archive(path, {});
    EXPECT_TRUE(index_of(path).empty());

    std::string zero = tmp.file("zero.tar");
    write_file(zero, "");
    EXPECT_TRUE(index_of(zero).empty());
}

TEST_F(ContentIndexTest, CorruptHeaderPropagates) {
    std::string path = tmp.file("a.tar");
    write_archive(path, {{"a", "1"}, {"b", "2"}});
    patch_file(path, 2 * tar::BLOCK_SIZE, "X");  // second header's name

    try {
        index_of(path);
        FAIL() << "expected CorruptHeader";
    } catch (const DeltaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CORRUPT_HEADER);
    }
}

TEST_F(ContentIndexTest, TruncatedArchiveIsReadError) {
    std::string path = tmp.file("a.tar");
    write_archive(path, {{"big", std::string(5000, 'b')}});
    write_file(path, read_file(path).substr(0, 3 * tar::BLOCK_SIZE));

    try {
        index_of(path);
        FAIL() << "expected ReadError";
    } catch (const DeltaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::READ_ERROR);
    }
}
