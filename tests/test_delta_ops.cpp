#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../common/errors.hpp"
#include "../delta/delta_ops.hpp"

#include <string>
#include <vector>

using namespace testutil;
using Paths = std::vector<std::string>;

class DeltaOpsTest : public ::testing::Test {
protected:
    TempDir tmp;
    DeltaConfig config;

    std::string old_tar()   { return tmp.file("old.tar"); }
    std::string new_tar()   { return tmp.file("new.tar"); }
    std::string delta_tar() { return tmp.file("delta.tar"); }
    std::string out_tar()   { return tmp.file("rebuilt.tar"); }

    // diff old -> new, then apply the delta back onto old
    DiffResult round_trip() {
        DiffResult d = delta::diff(old_tar(), new_tar(), delta_tar(), config);
        delta::apply(old_tar(), delta_tar(), out_tar(), config);
        return d;
    }
};

TEST_F(DeltaOpsTest, RoundTripReproducesNewArchive) {
    write_archive(old_tar(), {{"a.txt", "one"}, {"b.txt", "two"}});
    write_archive(new_tar(), {{"a.txt", "one"}, {"b.txt", "two v2"}, {"c.txt", "three"}});

    DiffResult d = round_trip();
    EXPECT_EQ(d.manifest.changed, Paths{"b.txt"});
    EXPECT_EQ(d.manifest.added, Paths{"c.txt"});
    EXPECT_TRUE(d.manifest.removed.empty());
    EXPECT_EQ(d.old_entries, 2u);
    EXPECT_EQ(d.new_entries, 3u);

    auto delta_entries = read_archive(delta_tar());
    EXPECT_EQ(paths_of(delta_entries), (Paths{MANIFEST_PATH, "b.txt", "c.txt"}));

    EXPECT_EQ(read_file(out_tar()), read_file(new_tar()));
}

TEST_F(DeltaOpsTest, IdenticalArchivesGiveManifestOnlyDelta) {
    std::vector<Entry> entries = {{"d", "", 0755, 0, tar::TYPE_DIRECTORY}, {"d/f", "data"}};
    write_archive(old_tar(), entries);
    write_archive(new_tar(), entries);

    DiffResult d = round_trip();
    EXPECT_TRUE(d.manifest.empty());
    EXPECT_EQ(d.encode.entries_copied, 0u);
    EXPECT_EQ(read_archive(delta_tar()).size(), 1u);
    EXPECT_EQ(read_file(out_tar()), read_file(old_tar()));
}

TEST_F(DeltaOpsTest, DeletionsAreApplied) {
    write_archive(old_tar(), {{"keep", "k"}, {"drop/me", "bye"}, {"also", "a"}});
    write_archive(new_tar(), {{"keep", "k"}, {"also", "a"}});

    DiffResult d = round_trip();
    EXPECT_EQ(d.manifest.removed, Paths{"drop/me"});
    EXPECT_EQ(paths_of(read_archive(out_tar())), (Paths{"keep", "also"}));
    EXPECT_EQ(read_file(out_tar()), read_file(new_tar()));
}

TEST_F(DeltaOpsTest, MetadataOnlyChangeIsCarried) {
    write_archive(old_tar(), {{"script.sh", "#!/bin/sh\n", 0644}});
    write_archive(new_tar(), {{"script.sh", "#!/bin/sh\n", 0755}});

    DiffResult d = round_trip();
    EXPECT_EQ(d.manifest.changed, Paths{"script.sh"});

    auto rebuilt = read_archive(out_tar());
    ASSERT_EQ(rebuilt.size(), 1u);
    EXPECT_EQ(rebuilt[0].info.mode, 0755u);
}

TEST_F(DeltaOpsTest, ReorderedEntriesRebuildSameContent) {
    write_archive(old_tar(), {{"x", "X"}, {"y", "Y"}, {"z", "Z"}});
    write_archive(new_tar(), {{"z", "Z2"}, {"y", "Y"}, {"w", "W"}});

    round_trip();
    auto rebuilt = read_archive(out_tar());
    EXPECT_EQ(paths_of(rebuilt), (Paths{"y", "z", "w"}));
    EXPECT_EQ(rebuilt[1].data, "Z2");
}

TEST_F(DeltaOpsTest, MixedEntryTypesAndLargePayload) {
    std::string big(600 * 1024 + 7, '\0');
    for (size_t i = 0; i < big.size(); ++i) big[i] = (char)(i * 31 % 251);
    std::string long_name = std::string(120, 'p') + "/" + std::string(90, 'q');

    write_archive(old_tar(), {
        {"dir", "", 0755, 0, tar::TYPE_DIRECTORY},
        {"dir/big.bin", "small"},
        {"dir/link", "", 0777, 0, tar::TYPE_SYMLINK, "big.bin"},
    });
    write_archive(new_tar(), {
        {"dir", "", 0755, 0, tar::TYPE_DIRECTORY},
        {"dir/link", "", 0777, 0, tar::TYPE_SYMLINK, "other.bin"},
        {"dir/big.bin", big},
        {"dir/empty", ""},
        {long_name, "deep"},
    });

    DiffResult d = round_trip();
    EXPECT_EQ(d.manifest.changed, (Paths{"dir/big.bin", "dir/link"}));
    EXPECT_EQ(d.manifest.added, (Paths{"dir/empty", long_name}));

    auto rebuilt = read_archive(out_tar());
    EXPECT_EQ(paths_of(rebuilt), (Paths{"dir", "dir/link", "dir/big.bin", "dir/empty", long_name}));
    EXPECT_EQ(rebuilt[1].info.link_name, "other.bin");
    EXPECT_EQ(rebuilt[2].data, big);
    EXPECT_EQ(rebuilt[4].data, "deep");
    EXPECT_EQ(read_file(out_tar()), read_file(new_tar()));
}

TEST_F(DeltaOpsTest, DeltaCarriesOnlyChangedAndAdded) {
    std::vector<Entry> old_entries, new_entries;
    for (int i = 0; i < 40; ++i) {
        std::string p = "f" + std::to_string(i);
        old_entries.push_back({p, "v1-" + p});
        new_entries.push_back({p, i % 10 == 0 ? "v2-" + p : "v1-" + p});
    }
    new_entries.push_back({"extra", "+"});
    write_archive(old_tar(), old_entries);
    write_archive(new_tar(), new_entries);

    DiffResult d = delta::diff(old_tar(), new_tar(), delta_tar(), config);
    EXPECT_EQ(d.manifest.changed.size(), 4u);
    EXPECT_EQ(d.manifest.added, Paths{"extra"});
    EXPECT_EQ(d.encode.entries_copied, 5u);
    EXPECT_EQ(read_archive(delta_tar()).size(), 6u);
}

TEST_F(DeltaOpsTest, ParallelAndSequentialIndexingAgree) {
    write_archive(old_tar(), {{"a", "1"}, {"b", "2"}, {"c", "3"}});
    write_archive(new_tar(), {{"b", "2!"}, {"c", "3"}, {"d", "4"}});

    config.parallel_index = true;
    DiffResult par = delta::diff(old_tar(), new_tar(), tmp.file("par.tar"), config);
    config.parallel_index = false;
    DiffResult seq = delta::diff(old_tar(), new_tar(), tmp.file("seq.tar"), config);

    EXPECT_EQ(par.manifest, seq.manifest);
    EXPECT_EQ(read_file(tmp.file("par.tar")), read_file(tmp.file("seq.tar")));
}

TEST_F(DeltaOpsTest, DiffIsDeterministic) {
    write_archive(old_tar(), {{"a", "1"}, {"b", "2"}});
    write_archive(new_tar(), {{"c", "3"}, {"b", "2+"}});

    delta::diff(old_tar(), new_tar(), tmp.file("d1.tar"), config);
    delta::diff(old_tar(), new_tar(), tmp.file("d2.tar"), config);
    EXPECT_EQ(read_file(tmp.file("d1.tar")), read_file(tmp.file("d2.tar")));
}

TEST_F(DeltaOpsTest, CompressionFlagIsRejectedBeforeOutput) {
    write_archive(old_tar(), {{"a", "1"}});
    write_archive(new_tar(), {{"a", "2"}});
    config.codec = ArchiveCodec::GZIP;

    try {
        delta::diff(old_tar(), new_tar(), delta_tar(), config);
        FAIL() << "expected UnsupportedCompression";
    } catch (const DeltaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UNSUPPORTED_COMPRESSION);
        EXPECT_EQ(e.stage(), Stage::INDEX_OLD);
    }
    EXPECT_FALSE(fs::exists(delta_tar()));
}

TEST_F(DeltaOpsTest, CorruptNewArchiveFailsIndexing) {
    write_archive(old_tar(), {{"a", "1"}});
    write_archive(new_tar(), {{"a", "2"}});
    patch_file(new_tar(), 0, "Z");

    for (bool parallel : {true, false}) {
        config.parallel_index = parallel;
        try {
            delta::diff(old_tar(), new_tar(), delta_tar(), config);
            FAIL() << "expected CorruptHeader";
        } catch (const DeltaError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::CORRUPT_HEADER);
            EXPECT_EQ(e.stage(), Stage::INDEX_NEW);
        }
        EXPECT_FALSE(fs::exists(delta_tar()));
    }
}

TEST_F(DeltaOpsTest, MissingOldArchiveIsReadError) {
    write_archive(new_tar(), {{"a", "1"}});
    try {
        delta::diff(tmp.file("nope.tar"), new_tar(), delta_tar(), config);
        FAIL() << "expected ReadError";
    } catch (const DeltaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::READ_ERROR);
        EXPECT_EQ(e.stage(), Stage::INDEX_OLD);
    }
}

TEST_F(DeltaOpsTest, ApplyWithCorruptOldArchive) {
    write_archive(old_tar(), {{"a", "1"}, {"b", "2"}});
    write_archive(new_tar(), {{"a", "1"}, {"b", "2"}, {"c", "3"}});
    delta::diff(old_tar(), new_tar(), delta_tar(), config);
    patch_file(old_tar(), 2 * tar::BLOCK_SIZE, "!");

    try {
        delta::apply(old_tar(), delta_tar(), out_tar(), config);
        FAIL() << "expected CorruptHeader";
    } catch (const DeltaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CORRUPT_HEADER);
        EXPECT_EQ(e.stage(), Stage::APPLY_OLD);
    }
    EXPECT_FALSE(fs::exists(out_tar()));
}

TEST_F(DeltaOpsTest, ApplyWithMissingDelta) {
    write_archive(old_tar(), {{"a", "1"}});
    try {
        delta::apply(old_tar(), tmp.file("nope.tar"), out_tar(), config);
        FAIL() << "expected ReadError";
    } catch (const DeltaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::READ_ERROR);
        EXPECT_EQ(e.stage(), Stage::DECODE_MANIFEST);
    }
    EXPECT_FALSE(fs::exists(out_tar()));
}

TEST_F(DeltaOpsTest, ApplyResultReportsManifest) {
    write_archive(old_tar(), {{"a", "1"}, {"gone", "g"}});
    write_archive(new_tar(), {{"a", "1"}});
    delta::diff(old_tar(), new_tar(), delta_tar(), config);

    ApplyResult r = delta::apply(old_tar(), delta_tar(), out_tar(), config);
    EXPECT_EQ(r.manifest.removed, Paths{"gone"});
    EXPECT_EQ(r.apply.kept_from_old, 1u);
    EXPECT_EQ(r.apply.dropped_from_old, 1u);
    EXPECT_EQ(r.apply.taken_from_delta, 0u);
}

TEST_F(DeltaOpsTest, GnuSparseEntriesRoundTrip) {
    std::string tail = tmp.file("tail.tar");
    write_archive(tail, {{"a.txt", "same"}});

    write_file(old_tar(), gnu_sparse_entry(std::string(2 * tar::BLOCK_SIZE, 'o')) +
                          read_file(tail));
    write_file(new_tar(), gnu_sparse_entry(std::string(2 * tar::BLOCK_SIZE, 'n')) +
                          read_file(tail));

    DiffResult d = round_trip();
    EXPECT_EQ(d.manifest.changed, Paths{"sparse.img"});
    EXPECT_TRUE(d.manifest.added.empty());
    EXPECT_TRUE(d.manifest.removed.empty());

    // Rebuilt order is a.txt (kept) then sparse.img (from the delta)
    auto rebuilt = read_archive(out_tar());
    EXPECT_EQ(paths_of(rebuilt), (Paths{"a.txt", "sparse.img"}));
    EXPECT_EQ(rebuilt[1].info.type, tar::TYPE_GNU_SPARSE);
    EXPECT_EQ(rebuilt[1].data, std::string(2 * tar::BLOCK_SIZE, 'n'));
}
