#include "atx/transfer/sequence_planner.hpp"

#include "atx/transfer/part_calculator.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace atx::transfer {
namespace {

struct PlannedFile {
    const FileInfo* file;
    std::vector<Part> parts;
};

class SequenceBuilder {
public:
    SequenceBuilder(SequenceKind kind, const core::TransferLimits& limits)
        : kind_(kind), limits_(limits) {}

    void add(PlannedFile& planned) {
        const std::uint64_t size = planned.file->size;
        const std::size_t part_count = planned.parts.size();

        const bool oversized = size >= limits_.max_sequence_bytes;
        const bool overflows = current_.total_bytes + size > limits_.max_sequence_bytes ||
                               current_.files.size() + 1 > limits_.max_files_per_sequence ||
                               current_.total_parts + part_count > limits_.max_parts_per_sequence;

        if (!oversized && !overflows) {
            append(planned);
            return;
        }

        flush();
        append(planned);
        if (oversized) {
            flush();
        }
    }

    std::vector<Sequence> finish() {
        flush();
        return std::move(done_);
    }

private:
    void append(PlannedFile& planned) {
        current_.files.push_back(*planned.file);
        current_.total_bytes += planned.file->size;
        current_.total_parts += planned.parts.size();
        current_.parts_by_key[planned.file->key] = std::move(planned.parts);
    }

    void flush() {
        if (current_.files.empty()) {
            return;
        }
        current_.kind = kind_;
        done_.push_back(std::move(current_));
        current_ = Sequence{};
    }

    SequenceKind kind_;
    const core::TransferLimits& limits_;
    Sequence current_;
    std::vector<Sequence> done_;
};

} // namespace

Result<std::vector<Sequence>> plan_sequences(const std::vector<FileInfo>& files,
                                             const core::TransferLimits& limits) {
    if (files.empty()) {
        return Err<std::vector<Sequence>>(ErrorCode::NoFiles, "no files to sequence");
    }

    // Every file is checked before any sequence is built
    std::vector<PlannedFile> regular;
    std::vector<PlannedFile> preview;
    for (const auto& file : files) {
        auto parts = calculate_parts(file.key, file.size, limits);
        if (parts.size() > limits.max_parts_per_file) {
            return Err<std::vector<Sequence>>(ErrorCode::TooManyParts,
                "file '" + file.key + "' needs " + std::to_string(parts.size()) +
                " parts, limit per file is " + std::to_string(limits.max_parts_per_file));
        }
        if (parts.size() > limits.max_parts_per_sequence) {
            return Err<std::vector<Sequence>>(ErrorCode::TooManyParts,
                "file '" + file.key + "' needs " + std::to_string(parts.size()) +
                " parts, limit per sequence is " + std::to_string(limits.max_parts_per_sequence));
        }
        auto& bucket = file.is_preview ? preview : regular;
        bucket.push_back(PlannedFile{&file, std::move(parts)});
    }

    SequenceBuilder regular_builder(SequenceKind::Regular, limits);
    for (auto& planned : regular) {
        regular_builder.add(planned);
    }
    SequenceBuilder preview_builder(SequenceKind::Preview, limits);
    for (auto& planned : preview) {
        preview_builder.add(planned);
    }

    std::vector<Sequence> sequences = regular_builder.finish();
    auto previews = preview_builder.finish();
    for (auto& sequence : previews) {
        sequences.push_back(std::move(sequence));
    }

    std::uint32_t next_id = 1;
    for (auto& sequence : sequences) {
        sequence.id = next_id++;
    }

    spdlog::debug("[SequencesPlanned] files={} regular={} preview={} sequences={}",
                  files.size(), regular.size(), preview.size(), sequences.size());
    return Ok(std::move(sequences));
}

PlanSummary summarize(const std::vector<Sequence>& sequences) {
    PlanSummary summary;
    summary.sequences = sequences.size();
    for (const auto& sequence : sequences) {
        if (sequence.kind == SequenceKind::Preview) {
            ++summary.preview_sequences;
        } else {
            ++summary.regular_sequences;
        }
        summary.total_bytes += sequence.total_bytes;
        summary.total_parts += sequence.total_parts;
        for (const auto& file : sequence.files) {
            ++summary.total_files;
            if (file.is_preview) {
                ++summary.preview_files;
            } else {
                ++summary.regular_files;
            }
            if (file.size == 0) {
                ++summary.zero_byte_files;
            }
        }
    }
    return summary;
}

} // namespace atx::transfer
