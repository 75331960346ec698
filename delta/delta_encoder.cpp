// ============================================================
// delta_encoder.cpp -- Delta archive encoder
// ============================================================

#include "delta_encoder.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

namespace delta {

void write_manifest_entry(const DiffManifest& manifest, TarWriter& sink) {
    std::string bytes = serialize_manifest(manifest);

    TarEntryInfo meta;
    meta.path  = MANIFEST_PATH;
    meta.type  = tar::TYPE_REGULAR;
    meta.mode  = MANIFEST_MODE;
    meta.mtime = MANIFEST_MTIME;
    sink.append_entry(meta, bytes.data(), bytes.size());

    LOG_DEBUG("[encode] manifest " + std::to_string(bytes.size()) + " bytes: " + bytes);
}

EncodeStats encode_delta(TarReader& new_archive, const DiffManifest& manifest, TarWriter& sink) {
    EncodeStats stats;
    try {
        if (sink.entries_written() != 0) {
            throw DeltaError(ErrorKind::WRITE_ERROR,
                             "delta sink " + sink.path() + " already has entries");
        }
        write_manifest_entry(manifest, sink);

        const PathSet wanted = manifest.payload_paths();
        while (new_archive.next()) {
            ++stats.entries_scanned;
            const TarEntryInfo& info = new_archive.entry();
            if (wanted.count(info.path) == 0) continue;

            LOG_DEBUG("[encode] copy " + info.path + " (" +
                      utils::format_bytes(info.size) + ")");
            sink.copy_entry(new_archive);
            ++stats.entries_copied;
        }
    } catch (const DeltaError& e) {
        throw e.at(Stage::ENCODE);
    }

    try {
        sink.finalize();
    } catch (const DeltaError& e) {
        throw e.at(Stage::FINALIZE);
    }

    stats.bytes_written = sink.bytes_written();
    LOG_INFO("[encode] wrote " + sink.path() + ": " +
             std::to_string(stats.entries_copied) + " payload entries, " +
             utils::format_bytes(stats.bytes_written));
    return stats;
}

} // namespace delta
