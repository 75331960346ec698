#pragma once

// ============================================================
// tar_writer.hpp -- Sequential tar archive writer
//
// Output goes to "<path>.partial" and only appears at <path> once
// finalize() has written the end-of-archive marker. A writer that
// is destroyed unfinalized removes its partial output.
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include "tar_reader.hpp"
#include <string>

class TarWriter {
public:
    explicit TarWriter(const std::string& path);

    TarWriter(const TarWriter&) = delete;
    TarWriter& operator=(const TarWriter&) = delete;

    // Append an entry with a freshly built ustar header. meta.size and
    // meta.checksum are ignored: size is len, the checksum is computed.
    // Paths that do not fit ustar are carried by a GNU long-name record.
    void append_entry(const TarEntryInfo& meta, const void* data, size_t len);

    // Copy the reader's current entry verbatim: header blocks (extension
    // records included), payload and padding. The payload must not have
    // been read yet.
    void copy_entry(TarReader& reader);

    // Write the end-of-archive marker and publish the file.
    // Throws DeltaError(WRITE_ERROR) on failure.
    void finalize();

    bool finalized() const { return finalized_; }
    u64 entries_written() const { return entries_written_; }
    u64 bytes_written() const { return out_.bytes_written(); }
    const std::string& path() const { return out_.path(); }

private:
    file_io::AtomicFileWriter out_;
    u64  entries_written_{0};
    bool finalized_{false};

    void write_header_block(const TarEntryInfo& meta, const std::string& name_field,
                            const std::string& prefix_field, char type, u64 size);
    void write_padding(u64 size);
    void ensure_open() const;
};
