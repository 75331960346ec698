#pragma once

// ============================================================
// errors.hpp -- Typed errors raised by the delta pipeline
//
// Every failure carries a kind (what went wrong) and a stage
// (which phase of diff/apply was running), so callers can
// report failures uniformly without parsing messages.
// ============================================================

#include <stdexcept>
#include <string>

enum class ErrorKind {
    CORRUPT_HEADER,          // unreadable/unparseable entry header
    READ_ERROR,              // I/O failure or truncation while reading
    WRITE_ERROR,             // I/O failure writing or finalizing output
    EMPTY_DELTA,             // delta archive has no entries
    MISSING_MANIFEST,        // first delta entry is not the manifest
    INVALID_MANIFEST,        // manifest bytes do not deserialize
    UNSUPPORTED_COMPRESSION, // compressed input requested or detected
};

enum class Stage {
    UNKNOWN,
    OPEN,
    INDEX_OLD,
    INDEX_NEW,
    DIFF,
    ENCODE,
    DECODE_MANIFEST,
    APPLY_OLD,
    APPLY_DELTA,
    FINALIZE,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CORRUPT_HEADER:          return "CorruptHeader";
        case ErrorKind::READ_ERROR:              return "ReadError";
        case ErrorKind::WRITE_ERROR:             return "WriteError";
        case ErrorKind::EMPTY_DELTA:             return "EmptyDelta";
        case ErrorKind::MISSING_MANIFEST:        return "MissingManifest";
        case ErrorKind::INVALID_MANIFEST:        return "InvalidManifest";
        case ErrorKind::UNSUPPORTED_COMPRESSION: return "UnsupportedCompression";
    }
    return "Unknown";
}

inline const char* to_string(Stage stage) {
    switch (stage) {
        case Stage::UNKNOWN:         return "unknown";
        case Stage::OPEN:            return "open";
        case Stage::INDEX_OLD:       return "index-old";
        case Stage::INDEX_NEW:       return "index-new";
        case Stage::DIFF:            return "diff";
        case Stage::ENCODE:          return "encode";
        case Stage::DECODE_MANIFEST: return "decode-manifest";
        case Stage::APPLY_OLD:       return "apply-old";
        case Stage::APPLY_DELTA:     return "apply-delta";
        case Stage::FINALIZE:        return "finalize";
    }
    return "unknown";
}

class DeltaError : public std::runtime_error {
public:
    DeltaError(ErrorKind kind, const std::string& detail, Stage stage = Stage::UNKNOWN)
        : std::runtime_error(compose(kind, stage, detail)),
          kind_(kind), stage_(stage), detail_(detail) {}

    ErrorKind kind() const { return kind_; }
    Stage stage() const { return stage_; }
    const std::string& detail() const { return detail_; }

    // Same error attributed to a pipeline stage. Keeps an already
    // assigned stage, so the innermost attribution wins.
    DeltaError at(Stage stage) const {
        if (stage_ != Stage::UNKNOWN) return *this;
        return DeltaError(kind_, detail_, stage);
    }

private:
    static std::string compose(ErrorKind kind, Stage stage, const std::string& detail) {
        std::string s;
        if (stage != Stage::UNKNOWN) {
            s += "[";
            s += to_string(stage);
            s += "] ";
        }
        s += to_string(kind);
        s += ": ";
        s += detail;
        return s;
    }

    ErrorKind   kind_;
    Stage       stage_;
    std::string detail_;
};
