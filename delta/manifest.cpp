// ============================================================
// manifest.cpp -- Diff manifest JSON codec
// ============================================================

#include "manifest.hpp"
#include "../common/errors.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

PathSet DiffManifest::payload_paths() const {
    PathSet s;
    s.reserve(changed.size() + added.size());
    s.insert(changed.begin(), changed.end());
    s.insert(added.begin(), added.end());
    return s;
}

namespace delta {

static const char* const LIST_KEYS[] = {"changed", "added", "removed"};

static std::vector<std::string> sorted_copy(const std::vector<std::string>& v) {
    std::vector<std::string> out(v);
    std::sort(out.begin(), out.end());
    return out;
}

std::string serialize_manifest(const DiffManifest& manifest) {
    // ordered_json keeps keys in insertion order
    nlohmann::ordered_json j;
    j["changed"] = sorted_copy(manifest.changed);
    j["added"]   = sorted_copy(manifest.added);
    j["removed"] = sorted_copy(manifest.removed);
    try {
        return j.dump();
    } catch (const json::exception& e) {
        throw DeltaError(ErrorKind::WRITE_ERROR,
                         std::string("cannot serialize manifest: ") + e.what());
    }
}

static std::vector<std::string> read_list(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end()) {
        throw DeltaError(ErrorKind::INVALID_MANIFEST, std::string("missing \"") + key + "\" list");
    }
    if (!it->is_array()) {
        throw DeltaError(ErrorKind::INVALID_MANIFEST, std::string("\"") + key + "\" is not a list");
    }
    std::vector<std::string> out;
    out.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw DeltaError(ErrorKind::INVALID_MANIFEST,
                             std::string("non-string path in \"") + key + "\"");
        }
        std::string path = item.get<std::string>();
        if (path.empty()) {
            throw DeltaError(ErrorKind::INVALID_MANIFEST,
                             std::string("empty path in \"") + key + "\"");
        }
        out.push_back(std::move(path));
    }
    std::sort(out.begin(), out.end());
    return out;
}

DiffManifest parse_manifest(const std::string& bytes) {
    json root = json::parse(bytes, nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded()) {
        throw DeltaError(ErrorKind::INVALID_MANIFEST, "manifest is not valid JSON");
    }
    if (!root.is_object()) {
        throw DeltaError(ErrorKind::INVALID_MANIFEST, "manifest root is not an object");
    }

    DiffManifest m;
    m.changed = read_list(root, LIST_KEYS[0]);
    m.added   = read_list(root, LIST_KEYS[1]);
    m.removed = read_list(root, LIST_KEYS[2]);

    // Each path may appear in at most one list, at most once
    PathSet seen;
    for (const auto* list : {&m.changed, &m.added, &m.removed}) {
        for (const auto& p : *list) {
            if (!seen.insert(p).second) {
                throw DeltaError(ErrorKind::INVALID_MANIFEST,
                                 "path listed more than once: " + p);
            }
        }
    }
    return m;
}

} // namespace delta
