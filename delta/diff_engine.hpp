#pragma once

// ============================================================
// diff_engine.hpp -- Classify paths between two content indexes
// ============================================================

#include "content_index.hpp"
#include "manifest.hpp"

namespace delta {

// Paths only in new_index are added, only in old_index removed, and in
// both with unequal fingerprints changed. Unchanged paths are not listed.
// Pure function; each list is sorted.
DiffManifest compute_diff(const ContentIndex& old_index, const ContentIndex& new_index);

} // namespace delta
