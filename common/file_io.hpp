#pragma once

// ============================================================
// file_io.hpp -- Sequential file I/O for archive streams
// ============================================================

#include "platform.hpp"
#include <cstdio>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- FileReader: buffered sequential reader ----
// Errors are raised as DeltaError(READ_ERROR).
class FileReader {
public:
    explicit FileReader(const std::string& path);
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    // Read up to len bytes. Returns fewer only at end of file.
    size_t read(void* buf, size_t len);

    const std::string& path() const { return path_; }
    u64 offset() const { return offset_; }

    void close();

private:
    std::FILE*  file_{nullptr};
    std::string path_;
    u64         offset_{0};
};

// ---- AtomicFileWriter: write to "<path>.partial", publish on commit ----
// The final path only ever holds a complete file. A writer destroyed
// before commit() deletes its partial file.
// Errors are raised as DeltaError(WRITE_ERROR).
class AtomicFileWriter {
public:
    explicit AtomicFileWriter(const std::string& path);
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    void write(const void* data, size_t len);

    // Flush, sync, close and rename onto the final path.
    void commit();

    // Close and delete the partial file without publishing.
    void discard() noexcept;

    bool is_open() const { return file_ != nullptr; }
    bool committed() const { return committed_; }
    u64 bytes_written() const { return bytes_written_; }
    const std::string& path() const { return path_; }
    const std::string& partial_path() const { return partial_path_; }

private:
    std::FILE*  file_{nullptr};
    std::string path_;
    std::string partial_path_;
    u64         bytes_written_{0};
    bool        committed_{false};
};

// ---- Utility functions ----

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Read up to max_len leading bytes of a file (for format sniffing)
std::vector<u8> read_prefix(const std::string& path, size_t max_len);

} // namespace file_io
