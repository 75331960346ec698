#pragma once

// ============================================================
// tar_format.hpp -- POSIX ustar header layout and field codecs
//
// Covers ustar plus the GNU long-name/long-link records and PAX
// extended headers that common archivers emit.
// ============================================================

#include "../common/platform.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tar {

static constexpr size_t BLOCK_SIZE = 512;

// Longest extension payload (long name, PAX record set) we accept
static constexpr u64 MAX_EXTENSION_SIZE = 16ULL * 1024 * 1024;

// ---- Type flags ----
static constexpr char TYPE_REGULAR      = '0';
static constexpr char TYPE_REGULAR_OLD  = '\0';
static constexpr char TYPE_HARDLINK     = '1';
static constexpr char TYPE_SYMLINK      = '2';
static constexpr char TYPE_CHAR_DEVICE  = '3';
static constexpr char TYPE_BLOCK_DEVICE = '4';
static constexpr char TYPE_DIRECTORY    = '5';
static constexpr char TYPE_FIFO         = '6';
static constexpr char TYPE_GNU_LONGNAME = 'L';
static constexpr char TYPE_GNU_LONGLINK = 'K';
static constexpr char TYPE_PAX_EXTENDED = 'x';
static constexpr char TYPE_PAX_GLOBAL   = 'g';
static constexpr char TYPE_GNU_SPARSE   = 'S';

// ---- Old GNU sparse headers ----
// An 'S' header carries 4 sparse records; when its isextended byte is
// set, continuation blocks of 21 records follow before the payload,
// each with its own isextended byte. The payload is the stored
// (compacted) data of size bytes.
static constexpr size_t GNU_SPARSE_OFFSET         = 386;
static constexpr size_t GNU_ISEXTENDED_OFFSET     = 482;
static constexpr size_t GNU_REALSIZE_OFFSET       = 483;
static constexpr size_t GNU_EXT_ISEXTENDED_OFFSET = 504;

// ---- On-disk header block (512 bytes) ----
#pragma pack(push, 1)
struct RawHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};
#pragma pack(pop)
static_assert(sizeof(RawHeader) == BLOCK_SIZE, "RawHeader must be 512 bytes");

// Offset/length of the checksum field inside a header block
static constexpr size_t CHKSUM_OFFSET = 148;
static constexpr size_t CHKSUM_LEN    = 8;

bool is_zero_block(const u8* block);

// Parse a numeric header field: NUL/space terminated octal, or GNU
// base-256 when the high bit of the first byte is set.
// Returns nullopt for malformed content. An all-blank field reads as 0.
std::optional<u64> parse_numeric(const char* field, size_t len);

// Write value as zero-padded octal with a trailing NUL.
// Returns false if it does not fit.
bool format_octal(char* field, size_t len, u64 value);

// Write value as GNU base-256 (used when octal overflows)
void format_base256(char* field, size_t len, u64 value);

// Header checksum: sum of all bytes with the chksum field read as spaces.
u32 compute_checksum(const u8* block, bool signed_bytes = false);

// True if stored matches either the unsigned or the signed-byte sum
bool checksum_matches(const u8* block, u32 stored);

// Store the checksum of a fully populated header into its chksum field
void seal_checksum(RawHeader& hdr);

// Copy a NUL-terminated (or full-width) field into a string
std::string field_string(const char* field, size_t len);

// Round a payload size up to whole blocks
inline u64 padded_size(u64 size) {
    return (size + BLOCK_SIZE - 1) / BLOCK_SIZE * BLOCK_SIZE;
}

// Canonical archive-relative path: '/' separated, duplicate separators
// collapsed, "." components dropped, no trailing '/'.
std::string normalize_path(std::string_view path);

// Parse "<len> <key>=<value>\n" PAX records into out (later keys win).
// Returns false on malformed records.
bool parse_pax_records(std::string_view data, std::map<std::string, std::string>& out);

// Decimal PAX value (fractional part ignored, as for mtime)
std::optional<u64> parse_pax_number(const std::string& value);

} // namespace tar
