#pragma once

// ============================================================
// manifest.hpp -- Diff manifest and its JSON encoding
//
// The manifest is the first entry of every delta archive, stored
// under MANIFEST_PATH. Path lists are kept sorted so the encoded
// bytes and the delta layout are reproducible.
// ============================================================

#include "../common/hash.hpp"
#include <string>
#include <unordered_set>
#include <vector>

// Well-known path of the manifest entry inside a delta archive
static constexpr const char* MANIFEST_PATH = "__delta_metadata.json";

// Header metadata of the manifest entry (fixed for reproducible output)
static constexpr u32 MANIFEST_MODE  = 0644;
static constexpr u64 MANIFEST_MTIME = 0;

using PathSet = std::unordered_set<std::string, hash::PathHash>;

struct DiffManifest {
    std::vector<std::string> changed;
    std::vector<std::string> added;
    std::vector<std::string> removed;

    bool empty() const { return changed.empty() && added.empty() && removed.empty(); }

    // Number of entries a delta built from this manifest carries
    size_t payload_count() const { return changed.size() + added.size(); }

    // Union of changed and added
    PathSet payload_paths() const;

    bool operator==(const DiffManifest& o) const {
        return changed == o.changed && added == o.added && removed == o.removed;
    }
    bool operator!=(const DiffManifest& o) const { return !(*this == o); }
};

namespace delta {

// Encode as compact JSON {"changed":[...],"added":[...],"removed":[...]}
// with each list sorted. Throws DeltaError(WRITE_ERROR) if a path
// cannot be represented (e.g. invalid UTF-8).
std::string serialize_manifest(const DiffManifest& manifest);

// Decode and validate manifest bytes. Lists come back sorted.
// Throws DeltaError(INVALID_MANIFEST) on malformed content, a missing
// or mistyped list, an empty path, or lists that share a path.
DiffManifest parse_manifest(const std::string& bytes);

} // namespace delta
