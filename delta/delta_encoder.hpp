#pragma once

// ============================================================
// delta_encoder.hpp -- Write a delta archive
//
// Layout: the manifest entry first, then a verbatim copy of every
// entry of the new archive whose path is changed or added, in
// new-archive order.
// ============================================================

#include "../archive/tar_reader.hpp"
#include "../archive/tar_writer.hpp"
#include "manifest.hpp"

struct EncodeStats {
    u64 entries_scanned{0};  // logical entries seen in the new archive
    u64 entries_copied{0};   // payload entries written (manifest excluded)
    u64 bytes_written{0};    // size of the finished delta archive
};

namespace delta {

// Write the manifest entry into sink (must be the sink's first entry)
void write_manifest_entry(const DiffManifest& manifest, TarWriter& sink);

// Encode and finalize the delta. Errors are attributed to
// Stage::ENCODE, or Stage::FINALIZE for the closing write.
EncodeStats encode_delta(TarReader& new_archive, const DiffManifest& manifest, TarWriter& sink);

} // namespace delta
