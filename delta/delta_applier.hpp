#pragma once

// ============================================================
// delta_applier.hpp -- Rebuild a new archive from old + delta
// ============================================================

#include "../archive/tar_reader.hpp"
#include "../archive/tar_writer.hpp"
#include "manifest.hpp"

struct ApplyStats {
    u64 kept_from_old{0};     // old entries copied unchanged
    u64 dropped_from_old{0};  // old entries removed or superseded
    u64 taken_from_delta{0};  // changed/added entries copied from the delta
    u64 bytes_written{0};
};

namespace delta {

// Read the delta's first entry and decode it as the manifest.
// Throws DeltaError: EMPTY_DELTA (no entries), MISSING_MANIFEST (first
// entry has another path), INVALID_MANIFEST (undecodable content).
DiffManifest read_manifest(TarReader& delta_archive);

// Write every old entry that is neither removed nor changed (old order),
// then every remaining delta entry (delta order), then finalize.
// The output is never interleaved or re-sorted.
// Delta entries must match the manifest: an unlisted payload entry, or
// a listed path with no payload, raises INVALID_MANIFEST.
ApplyStats apply_delta(TarReader& old_archive, TarReader& delta_archive, TarWriter& sink,
                       DiffManifest* manifest_out = nullptr);

} // namespace delta
