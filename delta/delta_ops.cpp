// ============================================================
// delta_ops.cpp -- diff / apply orchestration
// ============================================================

#include "delta_ops.hpp"
#include "content_index.hpp"
#include "diff_engine.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <future>
#include <memory>

namespace delta {

static std::unique_ptr<TarReader> open_reader(const std::string& path, ArchiveCodec codec,
                                              Stage stage) {
    try {
        return std::make_unique<TarReader>(open_archive(path, codec));
    } catch (const DeltaError& e) {
        throw e.at(stage);
    }
}

static ContentIndex index_archive(TarReader& reader, const char* label, Stage stage, u64& count) {
    try {
        ContentIndex idx = build_index(reader, label);
        count = reader.entries_read();
        return idx;
    } catch (const DeltaError& e) {
        throw e.at(stage);
    }
}

DiffResult diff(const std::string& old_path, const std::string& new_path,
                const std::string& out_path, const DeltaConfig& config) {
    u64 start_ms = utils::now_ms();
    LOG_INFO("diff: " + old_path + " -> " + new_path + " => " + out_path);

    DiffResult result;
    ContentIndex old_index;
    ContentIndex new_index;
    {
        auto old_reader = open_reader(old_path, config.codec, Stage::INDEX_OLD);
        auto new_reader = open_reader(new_path, config.codec, Stage::INDEX_NEW);

        if (config.parallel_index) {
            // The two indexes share nothing; both tasks are joined before
            // either result is used, even when one of them throws.
            auto old_task = std::async(std::launch::async, [&] {
                return index_archive(*old_reader, "old", Stage::INDEX_OLD, result.old_entries);
            });
            auto new_task = std::async(std::launch::async, [&] {
                return index_archive(*new_reader, "new", Stage::INDEX_NEW, result.new_entries);
            });
            old_task.wait();
            new_task.wait();
            old_index = old_task.get();
            new_index = new_task.get();
        } else {
            old_index = index_archive(*old_reader, "old", Stage::INDEX_OLD, result.old_entries);
            new_index = index_archive(*new_reader, "new", Stage::INDEX_NEW, result.new_entries);
        }
    }

    result.manifest = compute_diff(old_index, new_index);

    // Second pass over the new archive copies the payload entries
    auto new_reader = open_reader(new_path, config.codec, Stage::ENCODE);
    std::unique_ptr<TarWriter> sink;
    try {
        sink = std::make_unique<TarWriter>(out_path);
    } catch (const DeltaError& e) {
        throw e.at(Stage::OPEN);
    }
    result.encode = encode_delta(*new_reader, result.manifest, *sink);

    LOG_INFO("diff: done in " + std::to_string(utils::now_ms() - start_ms) + " ms");
    return result;
}

ApplyResult apply(const std::string& old_path, const std::string& delta_path,
                  const std::string& out_path, const DeltaConfig& config) {
    u64 start_ms = utils::now_ms();
    LOG_INFO("apply: " + old_path + " + " + delta_path + " => " + out_path);

    auto delta_reader = open_reader(delta_path, config.codec, Stage::DECODE_MANIFEST);
    auto old_reader   = open_reader(old_path, config.codec, Stage::APPLY_OLD);

    std::unique_ptr<TarWriter> sink;
    try {
        sink = std::make_unique<TarWriter>(out_path);
    } catch (const DeltaError& e) {
        throw e.at(Stage::OPEN);
    }

    ApplyResult result;
    result.apply = apply_delta(*old_reader, *delta_reader, *sink, &result.manifest);

    LOG_INFO("apply: done in " + std::to_string(utils::now_ms() - start_ms) + " ms");
    return result;
}

} // namespace delta
