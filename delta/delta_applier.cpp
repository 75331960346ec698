// ============================================================
// delta_applier.cpp -- Delta archive decoder / applier
// ============================================================

#include "delta_applier.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <vector>

namespace delta {

// Upper bound on the manifest entry we are willing to buffer
static constexpr u64 MAX_MANIFEST_SIZE = 1ULL << 30;

DiffManifest read_manifest(TarReader& delta_archive) {
    try {
        if (!delta_archive.next()) {
            throw DeltaError(ErrorKind::EMPTY_DELTA,
                             delta_archive.name() + " contains no entries");
        }
        const TarEntryInfo& first = delta_archive.entry();
        if (first.path != MANIFEST_PATH) {
            throw DeltaError(ErrorKind::MISSING_MANIFEST,
                             "first entry of " + delta_archive.name() + " is '" +
                             first.path + "', expected '" + MANIFEST_PATH + "'");
        }
        if (first.size > MAX_MANIFEST_SIZE) {
            throw DeltaError(ErrorKind::INVALID_MANIFEST,
                             "manifest entry too large (" + std::to_string(first.size) + " bytes)");
        }

        std::string bytes((size_t)first.size, '\0');
        size_t got = 0;
        while (got < bytes.size()) {
            size_t n = delta_archive.read_data(&bytes[got], bytes.size() - got);
            if (n == 0) break;
            got += n;
        }

        DiffManifest m = parse_manifest(bytes);
        LOG_DEBUG("[apply] manifest: " + bytes);
        return m;
    } catch (const DeltaError& e) {
        throw e.at(Stage::DECODE_MANIFEST);
    }
}

ApplyStats apply_delta(TarReader& old_archive, TarReader& delta_archive, TarWriter& sink,
                       DiffManifest* manifest_out) {
    ApplyStats stats;
    DiffManifest manifest = read_manifest(delta_archive);

    PathSet superseded;
    superseded.insert(manifest.removed.begin(), manifest.removed.end());
    superseded.insert(manifest.changed.begin(), manifest.changed.end());
    const PathSet added(manifest.added.begin(), manifest.added.end());
    const PathSet payload = manifest.payload_paths();

    // ---- Pass 1: unaffected entries of the old archive ----
    try {
        while (old_archive.next()) {
            const TarEntryInfo& info = old_archive.entry();
            if (superseded.count(info.path)) {
                ++stats.dropped_from_old;
                LOG_DEBUG("[apply] drop " + info.path);
                continue;
            }
            if (added.count(info.path)) {
                LOG_WARN("[apply] " + old_archive.name() + " already contains added path '" +
                         info.path + "'; is it the base this delta was built from?");
            }
            sink.copy_entry(old_archive);
            ++stats.kept_from_old;
        }
    } catch (const DeltaError& e) {
        throw e.at(Stage::APPLY_OLD);
    }

    // ---- Pass 2: changed/added entries carried by the delta ----
    try {
        PathSet seen;
        while (delta_archive.next()) {
            const TarEntryInfo& info = delta_archive.entry();
            if (payload.count(info.path) == 0) {
                throw DeltaError(ErrorKind::INVALID_MANIFEST,
                                 "delta entry '" + info.path + "' is not listed in the manifest");
            }
            LOG_DEBUG("[apply] take " + info.path);
            sink.copy_entry(delta_archive);
            seen.insert(info.path);
            ++stats.taken_from_delta;
        }
        for (const auto& p : payload) {
            if (seen.count(p) == 0) {
                throw DeltaError(ErrorKind::INVALID_MANIFEST,
                                 "manifest lists '" + p + "' but the delta carries no entry for it");
            }
        }
    } catch (const DeltaError& e) {
        throw e.at(Stage::APPLY_DELTA);
    }

    try {
        sink.finalize();
    } catch (const DeltaError& e) {
        throw e.at(Stage::FINALIZE);
    }

    stats.bytes_written = sink.bytes_written();
    LOG_INFO("[apply] wrote " + sink.path() + ": " +
             std::to_string(stats.kept_from_old) + " kept, " +
             std::to_string(stats.dropped_from_old) + " dropped, " +
             std::to_string(stats.taken_from_delta) + " from delta, " +
             utils::format_bytes(stats.bytes_written));

    if (manifest_out) *manifest_out = std::move(manifest);
    return stats;
}

} // namespace delta
