// ============================================================
// diff_engine.cpp -- Index comparison
// ============================================================

#include "diff_engine.hpp"
#include "../common/logger.hpp"
#include <algorithm>

namespace delta {

static void dump_list(const char* tag, const std::vector<std::string>& paths) {
    for (const auto& p : paths) {
        LOG_DEBUG(std::string("[diff] ") + tag + " " + p);
    }
}

DiffManifest compute_diff(const ContentIndex& old_index, const ContentIndex& new_index) {
    DiffManifest m;

    for (const auto& [path, new_fp] : new_index) {
        auto it = old_index.find(path);
        if (it == old_index.end()) {
            m.added.push_back(path);
        } else if (it->second != new_fp) {
            m.changed.push_back(path);
        }
    }
    for (const auto& entry : old_index) {
        if (new_index.find(entry.first) == new_index.end()) {
            m.removed.push_back(entry.first);
        }
    }

    // Hash iteration order is unspecified; sort for reproducible output
    std::sort(m.changed.begin(), m.changed.end());
    std::sort(m.added.begin(),   m.added.end());
    std::sort(m.removed.begin(), m.removed.end());

    LOG_INFO("[diff] " + std::to_string(m.changed.size()) + " changed, " +
             std::to_string(m.added.size()) + " added, " +
             std::to_string(m.removed.size()) + " removed");
    if (LOG_DEBUG_ENABLED()) {
        dump_list("changed", m.changed);
        dump_list("added",   m.added);
        dump_list("removed", m.removed);
    }
    return m;
}

} // namespace delta
