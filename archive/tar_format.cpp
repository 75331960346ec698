// ============================================================
// tar_format.cpp -- ustar field codecs
// ============================================================

#include "tar_format.hpp"
#include <cstring>
#include <vector>

namespace tar {

bool is_zero_block(const u8* block) {
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

std::optional<u64> parse_numeric(const char* field, size_t len) {
    const u8* p = reinterpret_cast<const u8*>(field);

    if (len > 0 && (p[0] & 0x80)) {
        // GNU base-256: big-endian, first byte carries the marker bit.
        // Negative values (0xFF marker) are not meaningful here.
        if (p[0] == 0xFF) return std::nullopt;
        u64 v = p[0] & 0x7F;
        for (size_t i = 1; i < len; ++i) {
            if (v >> 56) return std::nullopt;
            v = (v << 8) | p[i];
        }
        return v;
    }

    size_t i = 0;
    while (i < len && p[i] == ' ') ++i;

    u64 v = 0;
    for (; i < len && p[i] >= '0' && p[i] <= '7'; ++i) {
        if (v >> 61) return std::nullopt;
        v = (v << 3) | (u64)(p[i] - '0');
    }
    // Only blanks and NULs may follow the digits
    for (; i < len; ++i) {
        if (p[i] != ' ' && p[i] != '\0') return std::nullopt;
    }
    return v;
}

bool format_octal(char* field, size_t len, u64 value) {
    if (len < 2) return false;
    size_t digits = len - 1;
    std::memset(field, '0', digits);
    field[digits] = '\0';
    for (size_t i = digits; i-- > 0; ) {
        field[i] = (char)('0' + (value & 7));
        value >>= 3;
    }
    return value == 0;
}

void format_base256(char* field, size_t len, u64 value) {
    std::memset(field, 0, len);
    for (size_t i = len; i-- > 1; ) {
        field[i] = (char)(value & 0xFF);
        value >>= 8;
    }
    field[0] = (char)0x80;
}

u32 compute_checksum(const u8* block, bool signed_bytes) {
    i64 sum = 0;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (i >= CHKSUM_OFFSET && i < CHKSUM_OFFSET + CHKSUM_LEN) {
            sum += ' ';
        } else if (signed_bytes) {
            sum += (i8)block[i];
        } else {
            sum += block[i];
        }
    }
    return (u32)sum;
}

bool checksum_matches(const u8* block, u32 stored) {
    return compute_checksum(block, false) == stored ||
           compute_checksum(block, true) == stored;
}

void seal_checksum(RawHeader& hdr) {
    std::memset(hdr.chksum, ' ', sizeof(hdr.chksum));
    u32 sum = compute_checksum(reinterpret_cast<const u8*>(&hdr), false);
    // Conventional layout: six octal digits, NUL, space
    format_octal(hdr.chksum, 7, sum);
    hdr.chksum[7] = ' ';
}

std::string field_string(const char* field, size_t len) {
    size_t n = 0;
    while (n < len && field[n] != '\0') ++n;
    return std::string(field, n);
}

std::string normalize_path(std::string_view path) {
    std::vector<std::string_view> parts;
    size_t i = 0;
    while (i <= path.size()) {
        size_t j = path.find('/', i);
        if (j == std::string_view::npos) j = path.size();
        std::string_view comp = path.substr(i, j - i);
        if (!comp.empty() && comp != ".") parts.push_back(comp);
        i = j + 1;
    }

    std::string out;
    if (!path.empty() && path[0] == '/') out.push_back('/');
    for (size_t k = 0; k < parts.size(); ++k) {
        if (k > 0) out.push_back('/');
        out.append(parts[k].data(), parts[k].size());
    }
    if (out.empty() && !path.empty()) out = ".";
    return out;
}

bool parse_pax_records(std::string_view data, std::map<std::string, std::string>& out) {
    size_t pos = 0;
    while (pos < data.size()) {
        // Trailing NUL padding after the last record
        if (data[pos] == '\0') break;

        size_t sp = data.find(' ', pos);
        if (sp == std::string_view::npos || sp == pos) return false;

        u64 rec_len = 0;
        for (size_t k = pos; k < sp; ++k) {
            char c = data[k];
            if (c < '0' || c > '9') return false;
            rec_len = rec_len * 10 + (u64)(c - '0');
            if (rec_len > data.size()) return false;
        }
        if (rec_len == 0 || pos + rec_len > data.size()) return false;

        std::string_view rec = data.substr(sp + 1, pos + rec_len - (sp + 1));
        if (rec.empty() || rec.back() != '\n') return false;
        rec.remove_suffix(1);

        size_t eq = rec.find('=');
        if (eq == std::string_view::npos || eq == 0) return false;
        out[std::string(rec.substr(0, eq))] = std::string(rec.substr(eq + 1));

        pos += (size_t)rec_len;
    }
    return true;
}

std::optional<u64> parse_pax_number(const std::string& value) {
    if (value.empty()) return std::nullopt;
    u64 v = 0;
    size_t i = 0;
    for (; i < value.size() && value[i] != '.'; ++i) {
        char c = value[i];
        if (c < '0' || c > '9') return std::nullopt;
        if (v > (~0ULL - 9) / 10) return std::nullopt;
        v = v * 10 + (u64)(c - '0');
    }
    if (i == 0) return std::nullopt;
    return v;
}

} // namespace tar
