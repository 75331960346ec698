// ============================================================
// tar_reader.cpp -- Sequential tar archive reader implementation
// ============================================================

#include "tar_reader.hpp"
#include "../common/errors.hpp"
#include <algorithm>
#include <cstring>
#include <optional>
#include <stdexcept>

using tar::BLOCK_SIZE;

static constexpr size_t SKIP_BUFFER_SIZE = 64 * 1024;

TarReader::TarReader(std::unique_ptr<ArchiveSource> source)
    : source_(std::move(source))
{
    if (!source_) throw std::invalid_argument("TarReader: null archive source");
}

bool TarReader::read_block(u8* block) {
    size_t n = source_->read(block, BLOCK_SIZE);
    if (n == 0) return false;
    offset_ += n;
    if (n < BLOCK_SIZE) {
        throw DeltaError(ErrorKind::READ_ERROR,
                         "truncated header block at offset " +
                         std::to_string(offset_ - n) + " in " + name());
    }
    return true;
}

void TarReader::read_exact(void* buf, size_t len, const char* what) {
    size_t n = source_->read(buf, len);
    offset_ += n;
    if (n < len) {
        throw DeltaError(ErrorKind::READ_ERROR,
                         std::string("unexpected end of archive in ") + what +
                         (entry_.path.empty() ? std::string() : " of '" + entry_.path + "'") +
                         " in " + name());
    }
}

void TarReader::corrupt(const std::string& msg) const {
    throw DeltaError(ErrorKind::CORRUPT_HEADER, msg + " in " + name());
}

void TarReader::skip_rest_of_entry() {
    if (data_remaining_ == 0 && padding_remaining_ == 0) return;
    std::vector<u8> buf((size_t)std::min<u64>(SKIP_BUFFER_SIZE,
                                              data_remaining_ + padding_remaining_));
    while (data_remaining_ > 0) {
        size_t chunk = (size_t)std::min<u64>(buf.size(), data_remaining_);
        read_exact(buf.data(), chunk, "payload");
        data_remaining_ -= chunk;
    }
    if (padding_remaining_ > 0) {
        read_exact(buf.data(), (size_t)padding_remaining_, "padding");
        padding_remaining_ = 0;
    }
}

size_t TarReader::read_data(void* buf, size_t len) {
    if (data_remaining_ == 0) return 0;
    size_t n = (size_t)std::min<u64>(len, data_remaining_);
    read_exact(buf, n, "payload");
    data_remaining_ -= n;
    if (data_remaining_ == 0 && padding_remaining_ > 0) {
        u8 pad[BLOCK_SIZE];
        read_exact(pad, (size_t)padding_remaining_, "padding");
        padding_remaining_ = 0;
    }
    return n;
}

std::string TarReader::read_extension(const tar::RawHeader& hdr, u64 size) {
    if (size > tar::MAX_EXTENSION_SIZE) {
        corrupt("extension header '" + std::string(1, hdr.typeflag) +
                "' too large (" + std::to_string(size) + " bytes)");
    }
    u64 padded = tar::padded_size(size);
    size_t old_len = raw_header_.size();
    raw_header_.resize(old_len + (size_t)padded);
    read_exact(raw_header_.data() + old_len, (size_t)padded, "extension header");
    return std::string(reinterpret_cast<const char*>(raw_header_.data() + old_len), (size_t)size);
}

void TarReader::read_sparse_map(const std::string& where) {
    u8 ext[BLOCK_SIZE];
    size_t blocks = 0;
    do {
        if (++blocks > tar::MAX_EXTENSION_SIZE / BLOCK_SIZE) {
            corrupt("GNU sparse map too long" + where);
        }
        read_exact(ext, BLOCK_SIZE, "GNU sparse map");
        raw_header_.insert(raw_header_.end(), ext, ext + BLOCK_SIZE);
    } while (ext[tar::GNU_EXT_ISEXTENDED_OFFSET] != 0);
}

static std::string strip_trailing_nuls(std::string s) {
    while (!s.empty() && s.back() == '\0') s.pop_back();
    return s;
}

bool TarReader::next() {
    if (at_end_) return false;
    skip_rest_of_entry();

    raw_header_.clear();
    entry_ = TarEntryInfo{};
    data_remaining_ = 0;
    padding_remaining_ = 0;

    std::map<std::string, std::string> pax = global_pax_;
    std::optional<std::string> long_name;
    std::optional<std::string> long_link;
    bool pending_extension = false;

    u8 block[BLOCK_SIZE];
    for (;;) {
        u64 header_offset = offset_;
        std::string where = " at offset " + std::to_string(header_offset);

        if (!read_block(block)) {
            if (pending_extension) {
                throw DeltaError(ErrorKind::READ_ERROR,
                                 "archive ends after an extension header" + where +
                                 " in " + name());
            }
            // Missing end-of-archive marker is tolerated
            at_end_ = true;
            return false;
        }
        if (tar::is_zero_block(block)) {
            if (pending_extension) corrupt("end-of-archive marker follows an extension header" + where);
            at_end_ = true;
            return false;
        }

        tar::RawHeader hdr;
        std::memcpy(&hdr, block, BLOCK_SIZE);

        auto stored = tar::parse_numeric(hdr.chksum, sizeof(hdr.chksum));
        if (!stored) corrupt("unparseable header checksum" + where);
        if (!tar::checksum_matches(block, (u32)*stored)) {
            corrupt("header checksum mismatch" + where + " (stored " +
                    std::to_string(*stored) + ", computed " +
                    std::to_string(tar::compute_checksum(block)) + ")");
        }
        auto size = tar::parse_numeric(hdr.size, sizeof(hdr.size));
        if (!size) corrupt("unparseable size field" + where);

        raw_header_.insert(raw_header_.end(), block, block + BLOCK_SIZE);

        switch (hdr.typeflag) {
            case tar::TYPE_GNU_LONGNAME:
                long_name = strip_trailing_nuls(read_extension(hdr, *size));
                pending_extension = true;
                continue;
            case tar::TYPE_GNU_LONGLINK:
                long_link = strip_trailing_nuls(read_extension(hdr, *size));
                pending_extension = true;
                continue;
            case tar::TYPE_PAX_EXTENDED:
            case tar::TYPE_PAX_GLOBAL: {
                std::string data = read_extension(hdr, *size);
                std::map<std::string, std::string> records;
                if (!tar::parse_pax_records(data, records)) {
                    corrupt("malformed PAX header" + where);
                }
                for (auto& [k, v] : records) {
                    pax[k] = v;
                    if (hdr.typeflag == tar::TYPE_PAX_GLOBAL) global_pax_[k] = v;
                }
                pending_extension = true;
                continue;
            }
            default:
                break;
        }

        if (hdr.typeflag == tar::TYPE_GNU_SPARSE && block[tar::GNU_ISEXTENDED_OFFSET] != 0) {
            read_sparse_map(where);
        }

        // ---- Main header of the logical entry ----
        TarEntryInfo info;
        info.type = hdr.typeflag;

        auto mode  = tar::parse_numeric(hdr.mode,  sizeof(hdr.mode));
        auto uid   = tar::parse_numeric(hdr.uid,   sizeof(hdr.uid));
        auto gid   = tar::parse_numeric(hdr.gid,   sizeof(hdr.gid));
        auto mtime = tar::parse_numeric(hdr.mtime, sizeof(hdr.mtime));
        if (!mode)  corrupt("unparseable mode field" + where);
        if (!uid)   corrupt("unparseable uid field" + where);
        if (!gid)   corrupt("unparseable gid field" + where);
        if (!mtime) corrupt("unparseable mtime field" + where);
        info.mode     = (u32)(*mode & 07777);
        info.uid      = *uid;
        info.gid      = *gid;
        info.mtime    = *mtime;
        info.size     = *size;
        info.checksum = (u32)*stored;

        std::string raw_path;
        auto pax_path = pax.find("path");
        if (pax_path != pax.end()) {
            raw_path = pax_path->second;
        } else if (long_name) {
            raw_path = *long_name;
        } else {
            raw_path = tar::field_string(hdr.name, sizeof(hdr.name));
            // POSIX ustar splits long paths into prefix + name
            bool posix_ustar = std::memcmp(hdr.magic, "ustar\0", 6) == 0;
            std::string prefix = tar::field_string(hdr.prefix, sizeof(hdr.prefix));
            if (posix_ustar && !prefix.empty()) raw_path = prefix + "/" + raw_path;
        }
        info.path = tar::normalize_path(raw_path);
        if (info.path.empty()) corrupt("entry with empty path" + where);

        auto pax_link = pax.find("linkpath");
        if (pax_link != pax.end()) {
            info.link_name = pax_link->second;
        } else if (long_link) {
            info.link_name = *long_link;
        } else {
            info.link_name = tar::field_string(hdr.linkname, sizeof(hdr.linkname));
        }

        static const char* const numeric_keys[] = {"size", "uid", "gid", "mtime"};
        u64* targets[] = {&info.size, &info.uid, &info.gid, &info.mtime};
        for (size_t k = 0; k < 4; ++k) {
            auto it = pax.find(numeric_keys[k]);
            if (it == pax.end()) continue;
            auto v = tar::parse_pax_number(it->second);
            if (!v) corrupt(std::string("malformed PAX ") + numeric_keys[k] + where);
            *targets[k] = *v;
        }

        entry_             = std::move(info);
        data_remaining_    = entry_.size;
        padding_remaining_ = tar::padded_size(entry_.size) - entry_.size;
        ++entries_read_;
        return true;
    }
}
