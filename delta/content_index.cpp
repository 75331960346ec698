// ============================================================
// content_index.cpp -- Content index construction
// ============================================================

#include "content_index.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <vector>

namespace delta {

static constexpr size_t HASH_BUFFER_SIZE = 256 * 1024;

ContentIndex build_index(TarReader& reader, const std::string& label) {
    ContentIndex index;
    std::vector<u8> buf(HASH_BUFFER_SIZE);
    hash::Sha1Hasher hasher;
    u64 total_bytes = 0;
    u64 duplicates  = 0;
    u64 start_ms    = utils::now_ms();

    while (reader.next()) {
        const TarEntryInfo& info = reader.entry();

        hasher.reset();
        for (;;) {
            size_t n = reader.read_data(buf.data(), buf.size());
            if (n == 0) break;
            hasher.update(buf.data(), n);
            total_bytes += n;
        }

        Fingerprint fp;
        fp.content_hash        = hasher.digest();
        fp.structural_checksum = info.checksum;

        if (LOG_DEBUG_ENABLED()) {
            LOG_DEBUG("[index:" + label + "] " + info.path +
                      " sha1=" + hash::to_hex(fp.content_hash) +
                      " cksum=" + std::to_string(fp.structural_checksum) +
                      " size=" + std::to_string(info.size));
        }

        auto [it, inserted] = index.insert_or_assign(info.path, fp);
        (void)it;
        if (!inserted) ++duplicates;
    }

    if (duplicates > 0) {
        LOG_WARN("[index:" + label + "] " + reader.name() + " contains " +
                 std::to_string(duplicates) + " duplicate path(s); last occurrence wins");
    }
    LOG_INFO("[index:" + label + "] " + std::to_string(index.size()) + " entries, " +
             utils::format_bytes(total_bytes) + " hashed in " +
             std::to_string(utils::now_ms() - start_ms) + " ms");
    return index;
}

} // namespace delta
