#pragma once

// ============================================================
// test_helpers.hpp -- Temp dirs and archive fixtures for tests
// ============================================================

#include "../archive/archive_source.hpp"
#include "../archive/tar_reader.hpp"
#include "../archive/tar_writer.hpp"
#include <gtest/gtest.h>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace testutil {

// Entry to put into a fixture archive
struct Entry {
    std::string path;
    std::string data;
    u32 mode{0644};
    u64 mtime{1700000000};
    char type{tar::TYPE_REGULAR};
    std::string link;
};

// Entry read back from an archive
struct ReadEntry {
    TarEntryInfo info;
    std::string data;
};

// Per-test scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "tardelta_";
        if (test) name += std::string(test->test_suite_name()) + "_" + test->name() + "_";
        name += std::to_string(rd());
        path_ = fs::temp_directory_path() / name;
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline TarEntryInfo to_info(const Entry& e) {
    TarEntryInfo info;
    info.path      = e.path;
    info.type      = e.type;
    info.mode      = e.mode;
    info.mtime     = e.mtime;
    info.link_name = e.link;
    return info;
}

// Write a finalized archive holding entries in order
inline void write_archive(const std::string& path, const std::vector<Entry>& entries) {
    TarWriter w(path);
    for (const auto& e : entries) {
        w.append_entry(to_info(e), e.data.data(), e.data.size());
    }
    w.finalize();
}

inline std::unique_ptr<TarReader> open_reader(const std::string& path) {
    return std::make_unique<TarReader>(open_archive(path, ArchiveCodec::NONE));
}

// Read every logical entry with its payload
inline std::vector<ReadEntry> read_archive(const std::string& path) {
    auto reader = open_reader(path);
    std::vector<ReadEntry> out;
    while (reader->next()) {
        ReadEntry re;
        re.info = reader->entry();
        re.data.resize((size_t)re.info.size);
        size_t got = 0;
        while (got < re.data.size()) {
            size_t n = reader->read_data(&re.data[got], re.data.size() - got);
            if (n == 0) break;
            got += n;
        }
        out.push_back(std::move(re));
    }
    return out;
}

inline std::vector<std::string> paths_of(const std::vector<ReadEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) out.push_back(e.info.path);
    return out;
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

inline void write_file(const std::string& path, const std::string& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(bytes.data(), (std::streamsize)bytes.size());
}

// Overwrite bytes at offset in an existing file
inline void patch_file(const std::string& path, size_t offset, const std::string& bytes) {
    std::string content = read_file(path);
    content.replace(offset, bytes.size(), bytes);
    write_file(path, content);
}

// Old GNU sparse entry as `tar --sparse --format=gnu` writes it: an 'S'
// header with isextended set, one continuation block, then the stored
// data regions.
inline std::string gnu_sparse_entry(const std::string& stored) {
    tar::RawHeader hdr;
    std::memset(&hdr, 0, sizeof(hdr));
    std::memcpy(hdr.name, "sparse.img", 10);
    tar::format_octal(hdr.mode, sizeof(hdr.mode), 0644);
    tar::format_octal(hdr.uid, sizeof(hdr.uid), 1000);
    tar::format_octal(hdr.gid, sizeof(hdr.gid), 1000);
    tar::format_octal(hdr.size, sizeof(hdr.size), stored.size());
    tar::format_octal(hdr.mtime, sizeof(hdr.mtime), 1700000000);
    hdr.typeflag = tar::TYPE_GNU_SPARSE;
    std::memcpy(hdr.magic, "ustar ", 6);
    std::memcpy(hdr.version, " ", 2);

    char* raw = reinterpret_cast<char*>(&hdr);
    // First region in the header, second in the continuation block
    tar::format_octal(raw + tar::GNU_SPARSE_OFFSET, 12, 0);
    tar::format_octal(raw + tar::GNU_SPARSE_OFFSET + 12, 12, tar::BLOCK_SIZE);
    raw[tar::GNU_ISEXTENDED_OFFSET] = 1;
    tar::format_octal(raw + tar::GNU_REALSIZE_OFFSET, 12, 64 * 1024);
    tar::seal_checksum(hdr);

    std::string ext(tar::BLOCK_SIZE, '\0');
    tar::format_octal(&ext[0], 12, 32 * 1024);
    tar::format_octal(&ext[12], 12, stored.size() - tar::BLOCK_SIZE);

    return std::string(raw, tar::BLOCK_SIZE) + ext + stored;
}

} // namespace testutil
