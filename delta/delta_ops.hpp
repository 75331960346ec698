#pragma once

// ============================================================
// delta_ops.hpp -- diff / apply entry points over archive paths
// ============================================================

#include "../archive/archive_source.hpp"
#include "delta_applier.hpp"
#include "delta_encoder.hpp"
#include "manifest.hpp"
#include <string>

struct DeltaConfig {
    ArchiveCodec codec{ArchiveCodec::NONE};
    bool parallel_index{true};  // index old and new archives concurrently
    bool verbose{false};        // DEBUG logging with index/manifest dumps
    std::string log_file;       // optional log file (append)
};

struct DiffResult {
    DiffManifest manifest;
    u64 old_entries{0};
    u64 new_entries{0};
    EncodeStats encode;
};

struct ApplyResult {
    DiffManifest manifest;
    ApplyStats apply;
};

namespace delta {

// Build a delta archive at out_path that turns old_path into new_path.
// All-or-nothing: on failure out_path is not created and a DeltaError
// naming the failed stage is thrown.
DiffResult diff(const std::string& old_path, const std::string& new_path,
                const std::string& out_path, const DeltaConfig& config);

// Rebuild the new archive at out_path from old_path and delta_path.
// Same failure contract as diff().
ApplyResult apply(const std::string& old_path, const std::string& delta_path,
                  const std::string& out_path, const DeltaConfig& config);

} // namespace delta
