// ============================================================
// archive_source.cpp -- Archive source selection
// ============================================================

#include "archive_source.hpp"
#include "tar_format.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

#include <zstd.h>

// ID1, ID2 and CM=8 (deflate, the only method gzip defines)
static constexpr u8 GZIP_MAGIC[3] = {0x1F, 0x8B, 0x08};

const char* to_string(ArchiveCodec codec) {
    switch (codec) {
        case ArchiveCodec::NONE: return "none";
        case ArchiveCodec::GZIP: return "gzip";
        case ArchiveCodec::ZSTD: return "zstd";
    }
    return "unknown";
}

ArchiveCodec sniff_codec(const u8* data, size_t len) {
    if (len >= 3 && data[0] == GZIP_MAGIC[0] && data[1] == GZIP_MAGIC[1] &&
        data[2] == GZIP_MAGIC[2]) {
        return ArchiveCodec::GZIP;
    }
    if (len >= 4) {
        // zstd frames start with a little-endian magic number
        u32 magic = (u32)data[0] | ((u32)data[1] << 8) |
                    ((u32)data[2] << 16) | ((u32)data[3] << 24);
        if (magic == ZSTD_MAGICNUMBER) return ArchiveCodec::ZSTD;
    }
    return ArchiveCodec::NONE;
}

static bool is_tar_header(const std::vector<u8>& block) {
    if (block.size() < tar::BLOCK_SIZE) return false;
    auto stored = tar::parse_numeric(reinterpret_cast<const char*>(block.data()) +
                                     tar::CHKSUM_OFFSET, tar::CHKSUM_LEN);
    return stored && tar::checksum_matches(block.data(), (u32)*stored);
}

std::unique_ptr<ArchiveSource> open_archive(const std::string& path, ArchiveCodec codec) {
    if (codec != ArchiveCodec::NONE) {
        throw DeltaError(ErrorKind::UNSUPPORTED_COMPRESSION,
                         std::string(to_string(codec)) +
                         " archives are not supported yet: " + path);
    }

    auto src = std::make_unique<PlainFileSource>(path);

    std::vector<u8> head = file_io::read_prefix(path, tar::BLOCK_SIZE);
    ArchiveCodec detected = sniff_codec(head.data(), head.size());
    // A valid tar header wins over a magic match (entry names are free-form)
    if (detected != ArchiveCodec::NONE && !is_tar_header(head)) {
        throw DeltaError(ErrorKind::UNSUPPORTED_COMPRESSION,
                         path + " looks " + to_string(detected) +
                         "-compressed; only plain tar archives are supported");
    }

    LOG_DEBUG("[archive] opened " + path + " (" +
              std::to_string(file_io::get_file_size(path)) + " bytes)");
    return src;
}
