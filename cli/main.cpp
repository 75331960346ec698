// ============================================================
// cli/main.cpp -- tardelta entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../delta/delta_ops.hpp"
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options] diff  <old.tar> <new.tar>   <out.delta.tar>\n"
        << "       " << prog << " [options] apply <old.tar> <delta.tar> <out.tar>\n"
        << "\n"
        << "  diff           write a delta archive holding changed/added entries\n"
        << "                 of new.tar plus a manifest\n"
        << "  apply          rebuild new.tar from old.tar and a delta archive\n"
        << "\nOptions:\n"
        << "  -v, --verbose    enable debug logging (index and manifest dumps)\n"
        << "  -c, --gzip       read gzip-compressed archives (not supported yet)\n"
        << "  --zstd           read zstd-compressed archives (not supported yet)\n"
        << "  --sequential     index old and new archives one after another\n"
        << "  --log-file PATH  also append log lines to PATH\n"
        << "  -h, --help       show this help\n"
        << "\nExample:\n"
        << "  " << prog << " diff release-1.tar release-2.tar update.tar\n"
        << "  " << prog << " apply release-1.tar update.tar release-2.tar\n";
}

int main(int argc, char* argv[]) {
    DeltaConfig cfg;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            cfg.verbose = true;
        } else if (std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--gzip") == 0) {
            cfg.codec = ArchiveCodec::GZIP;
        } else if (std::strcmp(argv[i], "--zstd") == 0) {
            cfg.codec = ArchiveCodec::ZSTD;
        } else if (std::strcmp(argv[i], "--sequential") == 0) {
            cfg.parallel_index = false;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            cfg.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.size() != 4) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string& command = positional[0];
    if (command != "diff" && command != "apply") {
        std::cerr << "ERROR: unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    }
    for (size_t i = 1; i < positional.size(); ++i) {
        if (!utils::validate_path(positional[i])) {
            std::cerr << "ERROR: Invalid path: " << positional[i] << "\n";
            return 1;
        }
    }

    Logger::get().set_level(cfg.verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        if (!cfg.log_file.empty()) {
            Logger::get().set_log_file(cfg.log_file);
        }

        if (command == "diff") {
            DiffResult r = delta::diff(positional[1], positional[2], positional[3], cfg);
            LOG_INFO("Delta written: " + std::to_string(r.manifest.changed.size()) +
                     " changed, " + std::to_string(r.manifest.added.size()) + " added, " +
                     std::to_string(r.manifest.removed.size()) + " removed (" +
                     utils::format_bytes(r.encode.bytes_written) + ")");
        } else {
            ApplyResult r = delta::apply(positional[1], positional[2], positional[3], cfg);
            LOG_INFO("Archive rebuilt: " +
                     std::to_string(r.apply.kept_from_old + r.apply.taken_from_delta) +
                     " entries (" + utils::format_bytes(r.apply.bytes_written) + ")");
        }
        return 0;
    } catch (const std::exception& e) {
        // DeltaError::what() already names the stage and error kind
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
