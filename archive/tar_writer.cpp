// ============================================================
// tar_writer.cpp -- Sequential tar archive writer implementation
// ============================================================

#include "tar_writer.hpp"
#include "../common/errors.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

using tar::BLOCK_SIZE;

static constexpr size_t COPY_BUFFER_SIZE = 256 * 1024;
static const char* const GNU_LONGLINK_NAME = "././@LongLink";

TarWriter::TarWriter(const std::string& path)
    : out_(path)
{}

void TarWriter::ensure_open() const {
    if (finalized_) {
        throw std::logic_error("TarWriter: append after finalize on " + out_.path());
    }
}

void TarWriter::write_padding(u64 size) {
    static const u8 zeros[BLOCK_SIZE] = {};
    u64 pad = tar::padded_size(size) - size;
    if (pad > 0) out_.write(zeros, (size_t)pad);
}

void TarWriter::write_header_block(const TarEntryInfo& meta, const std::string& name_field,
                                   const std::string& prefix_field, char type, u64 size) {
    tar::RawHeader hdr;
    std::memset(&hdr, 0, sizeof(hdr));

    std::memcpy(hdr.name, name_field.data(), std::min(name_field.size(), sizeof(hdr.name)));
    std::memcpy(hdr.prefix, prefix_field.data(), std::min(prefix_field.size(), sizeof(hdr.prefix)));

    bool ok = tar::format_octal(hdr.mode, sizeof(hdr.mode), meta.mode & 07777) &&
              tar::format_octal(hdr.mtime, sizeof(hdr.mtime), meta.mtime);
    if (!tar::format_octal(hdr.uid, sizeof(hdr.uid), meta.uid)) {
        tar::format_base256(hdr.uid, sizeof(hdr.uid), meta.uid);
    }
    if (!tar::format_octal(hdr.gid, sizeof(hdr.gid), meta.gid)) {
        tar::format_base256(hdr.gid, sizeof(hdr.gid), meta.gid);
    }
    if (!tar::format_octal(hdr.size, sizeof(hdr.size), size)) {
        tar::format_base256(hdr.size, sizeof(hdr.size), size);
    }
    if (!ok) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         "header field out of range for '" + meta.path + "'");
    }
    tar::format_octal(hdr.devmajor, sizeof(hdr.devmajor), 0);
    tar::format_octal(hdr.devminor, sizeof(hdr.devminor), 0);

    hdr.typeflag = type;
    if (!meta.link_name.empty()) {
        std::memcpy(hdr.linkname, meta.link_name.data(),
                    std::min(meta.link_name.size(), sizeof(hdr.linkname)));
    }
    std::memcpy(hdr.magic, "ustar\0", 6);
    std::memcpy(hdr.version, "00", 2);

    tar::seal_checksum(hdr);
    out_.write(&hdr, sizeof(hdr));
}

void TarWriter::append_entry(const TarEntryInfo& meta, const void* data, size_t len) {
    ensure_open();
    if (meta.path.empty()) {
        throw DeltaError(ErrorKind::WRITE_ERROR, "cannot append entry with empty path");
    }
    if (meta.link_name.size() > sizeof(tar::RawHeader::linkname)) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         "link target too long for '" + meta.path + "'");
    }

    const std::string& path = meta.path;
    std::string name_field = path;
    std::string prefix_field;

    if (path.size() > sizeof(tar::RawHeader::name)) {
        // Try a ustar prefix/name split at a '/' boundary
        bool split = false;
        size_t pos = path.find('/');
        while (pos != std::string::npos) {
            if (pos <= sizeof(tar::RawHeader::prefix) &&
                path.size() - pos - 1 <= sizeof(tar::RawHeader::name) &&
                path.size() - pos - 1 > 0) {
                prefix_field = path.substr(0, pos);
                name_field   = path.substr(pos + 1);
                split = true;
                break;
            }
            pos = path.find('/', pos + 1);
        }
        if (!split) {
            // GNU long-name record carries the full path, NUL terminated
            TarEntryInfo ln;
            ln.path  = GNU_LONGLINK_NAME;
            ln.mode  = 0;
            u64 ln_size = path.size() + 1;
            write_header_block(ln, GNU_LONGLINK_NAME, "", tar::TYPE_GNU_LONGNAME, ln_size);
            out_.write(path.c_str(), (size_t)ln_size);
            write_padding(ln_size);
            name_field = path.substr(0, sizeof(tar::RawHeader::name));
            prefix_field.clear();
        }
    }

    write_header_block(meta, name_field, prefix_field, meta.type, (u64)len);
    if (len > 0) out_.write(data, len);
    write_padding(len);
    ++entries_written_;
}

void TarWriter::copy_entry(TarReader& reader) {
    ensure_open();
    if (!reader.payload_untouched()) {
        throw std::logic_error("TarWriter::copy_entry: payload of '" + reader.entry().path +
                               "' already consumed");
    }

    const auto& raw = reader.raw_header();
    out_.write(raw.data(), raw.size());

    u64 size = reader.entry().size;
    std::vector<u8> buf((size_t)std::min<u64>(COPY_BUFFER_SIZE, std::max<u64>(size, 1)));
    // read_data() throws READ_ERROR if the payload is truncated
    for (;;) {
        size_t n = reader.read_data(buf.data(), buf.size());
        if (n == 0) break;
        out_.write(buf.data(), n);
    }
    write_padding(size);
    ++entries_written_;
}

void TarWriter::finalize() {
    if (finalized_) return;
    static const u8 zeros[BLOCK_SIZE * 2] = {};
    out_.write(zeros, sizeof(zeros));
    out_.commit();
    finalized_ = true;
}
