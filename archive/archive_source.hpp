#pragma once

// ============================================================
// archive_source.hpp -- Byte sources that archive readers pull from
//
// open_archive() picks a source implementation from the requested
// codec. Only uncompressed archives are readable today; compressed
// codecs are rejected up front so they can be added later without
// touching the index/diff/encode/apply code.
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include <memory>
#include <string>

enum class ArchiveCodec : u8 {
    NONE = 0,
    GZIP = 1,
    ZSTD = 2,
};

const char* to_string(ArchiveCodec codec);

class ArchiveSource {
public:
    virtual ~ArchiveSource() = default;

    // Read up to len bytes; returns fewer only at end of stream.
    virtual size_t read(void* buf, size_t len) = 0;

    // Name used in error messages (usually the file path)
    virtual const std::string& name() const = 0;
};

// Uncompressed archive file
class PlainFileSource : public ArchiveSource {
public:
    explicit PlainFileSource(const std::string& path) : reader_(path) {}

    size_t read(void* buf, size_t len) override { return reader_.read(buf, len); }
    const std::string& name() const override { return reader_.path(); }

private:
    file_io::FileReader reader_;
};

// Detect a compressed container from its leading bytes.
// Returns ArchiveCodec::NONE if no known magic matches.
ArchiveCodec sniff_codec(const u8* data, size_t len);

// Open an archive file for sequential reading.
// Throws DeltaError(UNSUPPORTED_COMPRESSION) if codec != NONE, or if the
// file is compressed although NONE was requested; READ_ERROR if the
// file cannot be opened. A first block that is a checksum-valid tar
// header is read as plain tar even when it starts with a magic.
std::unique_ptr<ArchiveSource> open_archive(const std::string& path, ArchiveCodec codec);
