#pragma once

// ============================================================
// content_index.hpp -- Per-archive path -> fingerprint index
// ============================================================

#include "../common/platform.hpp"
#include "../common/hash.hpp"
#include "../archive/tar_reader.hpp"
#include <string>
#include <unordered_map>

// Identity of an entry's state. Two entries with the same bytes but
// different header metadata (mode, mtime, ...) have different
// structural checksums and therefore different fingerprints.
struct Fingerprint {
    hash::Sha1Digest content_hash{};
    u32 structural_checksum{0};

    bool operator==(const Fingerprint& o) const {
        return structural_checksum == o.structural_checksum &&
               content_hash == o.content_hash;
    }
    bool operator!=(const Fingerprint& o) const { return !(*this == o); }
};

using ContentIndex = std::unordered_map<std::string, Fingerprint, hash::PathHash>;

namespace delta {

// Index every logical entry of the archive in one sequential pass.
// Entries of every type are indexed; a duplicate path keeps the
// fingerprint of its last occurrence.
// label names the archive in diagnostics ("old", "new").
ContentIndex build_index(TarReader& reader, const std::string& label);

} // namespace delta
