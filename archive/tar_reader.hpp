#pragma once

// ============================================================
// tar_reader.hpp -- Sequential tar archive reader
//
// Enumerates logical entries: GNU long-name/long-link records and
// PAX headers are folded into the entry they describe, and old GNU
// sparse maps stay with their header. The raw header blocks of every
// logical entry are retained so a writer can copy the entry verbatim.
// ============================================================

#include "../common/platform.hpp"
#include "archive_source.hpp"
#include "tar_format.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

// Metadata of one logical archive entry
struct TarEntryInfo {
    std::string path;        // normalized logical path
    char        type{'0'};   // ustar typeflag
    u32         mode{0644};
    u64         uid{0};
    u64         gid{0};
    u64         size{0};     // payload bytes
    u64         mtime{0};    // seconds since epoch
    std::string link_name;
    u32         checksum{0}; // stored header checksum (structural checksum)
};

class TarReader {
public:
    explicit TarReader(std::unique_ptr<ArchiveSource> source);

    TarReader(const TarReader&) = delete;
    TarReader& operator=(const TarReader&) = delete;

    // Advance to the next logical entry, skipping any unread payload of
    // the current one. Returns false at end of archive.
    // Throws DeltaError: CORRUPT_HEADER for malformed headers,
    // READ_ERROR for I/O failures and truncation.
    bool next();

    // Metadata of the current entry (valid after next() returned true)
    const TarEntryInfo& entry() const { return entry_; }

    // Header blocks of the current entry, extension records included
    const std::vector<u8>& raw_header() const { return raw_header_; }

    // Read payload bytes of the current entry. Returns 0 once the
    // payload is exhausted.
    size_t read_data(void* buf, size_t len);

    // Payload bytes not yet consumed by read_data()
    u64 data_remaining() const { return data_remaining_; }

    // True until the first read_data() call on the current entry
    bool payload_untouched() const { return data_remaining_ == entry_.size; }

    const std::string& name() const { return source_->name(); }
    u64 entries_read() const { return entries_read_; }

private:
    std::unique_ptr<ArchiveSource> source_;
    TarEntryInfo    entry_;
    std::vector<u8> raw_header_;
    u64  data_remaining_{0};
    u64  padding_remaining_{0};
    u64  entries_read_{0};
    u64  offset_{0};
    bool at_end_{false};

    std::map<std::string, std::string> global_pax_;

    // Read exactly one block. Returns false on clean EOF before any byte.
    bool read_block(u8* block);
    void read_exact(void* buf, size_t len, const char* what);
    void skip_rest_of_entry();
    std::string read_extension(const tar::RawHeader& hdr, u64 size);
    // Consume the continuation blocks of an extended GNU sparse header
    void read_sparse_map(const std::string& where);
    [[noreturn]] void corrupt(const std::string& msg) const;
};
