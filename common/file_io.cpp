// ============================================================
// file_io.cpp -- Sequential file I/O implementation
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>

#ifndef _WIN32
#  include <unistd.h>
#endif

using namespace file_io;

// Read buffer handed to stdio; archive streams are read block by block
static constexpr size_t STDIO_BUFFER_SIZE = 256 * 1024;

// ============================================================
// FileReader
// ============================================================

FileReader::FileReader(const std::string& path)
    : path_(path)
{
    file_ = std::fopen(path.c_str(), "rb");
    if (!file_) {
        throw DeltaError(ErrorKind::READ_ERROR,
                         "cannot open " + path + ": " + platform::last_error_str());
    }
    std::setvbuf(file_, nullptr, _IOFBF, STDIO_BUFFER_SIZE);
}

FileReader::~FileReader() {
    close();
}

size_t FileReader::read(void* buf, size_t len) {
    if (!file_) {
        throw DeltaError(ErrorKind::READ_ERROR, "read from closed file: " + path_);
    }
    if (len == 0) return 0;
    size_t n = std::fread(buf, 1, len, file_);
    if (n < len && std::ferror(file_)) {
        throw DeltaError(ErrorKind::READ_ERROR,
                         "read failed at offset " + std::to_string(offset_ + n) +
                         " in " + path_ + ": " + platform::last_error_str());
    }
    offset_ += n;
    return n;
}

void FileReader::close() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

// ============================================================
// AtomicFileWriter
// ============================================================

AtomicFileWriter::AtomicFileWriter(const std::string& path)
    : path_(path), partial_path_(path + ".partial")
{
    try {
        ensure_parent_dirs(path);
    } catch (const fs::filesystem_error& e) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         "cannot create parent directory of " + path + ": " + e.what());
    }
    file_ = std::fopen(partial_path_.c_str(), "wb");
    if (!file_) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         "cannot create " + partial_path_ + ": " + platform::last_error_str());
    }
    std::setvbuf(file_, nullptr, _IOFBF, STDIO_BUFFER_SIZE);
}

AtomicFileWriter::~AtomicFileWriter() {
    if (!committed_) discard();
}

void AtomicFileWriter::write(const void* data, size_t len) {
    if (!file_) {
        throw DeltaError(ErrorKind::WRITE_ERROR, "write to closed file: " + partial_path_);
    }
    if (len == 0) return;
    if (std::fwrite(data, 1, len, file_) != len) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         "write failed on " + partial_path_ + ": " + platform::last_error_str());
    }
    bytes_written_ += len;
}

void AtomicFileWriter::commit() {
    if (committed_) return;
    if (!file_) {
        throw DeltaError(ErrorKind::WRITE_ERROR, "commit of closed file: " + partial_path_);
    }

    if (std::fflush(file_) != 0) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         "flush failed on " + partial_path_ + ": " + platform::last_error_str());
    }
#ifndef _WIN32
    // Data must be durable before the rename makes it visible
    if (::fsync(::fileno(file_)) != 0) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         "fsync failed on " + partial_path_ + ": " + platform::last_error_str());
    }
#endif
    std::FILE* f = file_;
    file_ = nullptr;
    if (std::fclose(f) != 0) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         "close failed on " + partial_path_ + ": " + platform::last_error_str());
    }

    std::error_code ec;
    fs::rename(partial_path_, path_, ec);
    if (ec) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         "cannot rename " + partial_path_ + " to " + path_ + ": " + ec.message());
    }
    committed_ = true;
}

void AtomicFileWriter::discard() noexcept {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    std::error_code ec;
    fs::remove(partial_path_, ec);
}

// ============================================================
// Utility functions
// ============================================================

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

std::vector<u8> file_io::read_prefix(const std::string& path, size_t max_len) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return {};
    std::vector<u8> buf(max_len);
    f.read((char*)buf.data(), (std::streamsize)max_len);
    buf.resize((size_t)f.gcount());
    return buf;
}
