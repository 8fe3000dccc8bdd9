#include "atx/transfer/report.hpp"

#include "atx/core/format.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace atx::transfer {
namespace {

using json = nlohmann::json;
using core::format_duration;
using core::format_file_size;
using core::format_rate;

std::string kind_name(SequenceKind kind) {
    return kind == SequenceKind::Preview ? "preview" : "regular";
}

json error_json(const std::optional<Error>& error) {
    if (!error) {
        return nullptr;
    }
    json node = {
        {"code", std::string(error_code_name(error->code))},
        {"message", error->message},
    };
    if (error->http_status) {
        node["http_status"] = *error->http_status;
    }
    return node;
}

} // namespace

json to_json(const PlanSummary& summary) {
    return {
        {"total_files", summary.total_files},
        {"regular_files", summary.regular_files},
        {"preview_files", summary.preview_files},
        {"zero_byte_files", summary.zero_byte_files},
        {"total_size", summary.total_bytes},
        {"total_size_formatted", format_file_size(summary.total_bytes)},
        {"total_parts", summary.total_parts},
        {"total_sequences", summary.sequences},
        {"regular_sequences", summary.regular_sequences},
        {"preview_sequences", summary.preview_sequences},
    };
}

json to_json(const UploadResult& result) {
    json sequences = json::array();
    for (const auto& sequence : result.sequences) {
        json failed = json::array();
        for (const auto& file : sequence.failed_files) {
            failed.push_back({{"key", file.key}, {"error", file.error}});
        }
        sequences.push_back({
            {"sequence_id", sequence.sequence_id},
            {"kind", kind_name(sequence.kind)},
            {"state", std::string(sequence_state_name(sequence.state))},
            {"upload_id", sequence.session_id},
            {"successful_files", sequence.successful_files},
            {"failed_files", failed},
            {"total_parts", sequence.total_parts},
            {"successful_parts", sequence.successful_parts},
            {"failed_parts", sequence.failed_parts},
            {"error", error_json(sequence.error)},
            {"completion_result", sequence.finalize_response ? sequence.finalize_response->raw : json(nullptr)},
        });
    }

    json failed = json::array();
    for (const auto& file : result.failed) {
        failed.push_back({{"key", file.key}, {"sequence_id", file.sequence_id}, {"error", file.error}});
    }

    return {
        {"overall_success", result.overall_success},
        {"total_files", result.total_files},
        {"successful_files", result.successful_files},
        {"failed_files", result.failed_files},
        {"total_size", result.total_bytes},
        {"total_size_formatted", format_file_size(result.total_bytes)},
        {"transferred_size", result.transferred_bytes},
        {"upload_duration", result.duration_seconds},
        {"average_speed", result.average_speed},
        {"average_speed_formatted", format_rate(result.average_speed)},
        {"asynchronous_processing", result.asynchronous_processing},
        {"large_file_asynchronous_handling", result.large_file_async},
        {"failed", failed},
        {"sequence_results", sequences},
    };
}

json to_json(const DownloadResult& result) {
    json successful = json::array();
    for (const auto& file : result.successful) {
        successful.push_back({
            {"key", file.key},
            {"local_path", file.local_path.string()},
            {"size", file.bytes},
            {"attempts", file.attempts},
        });
    }
    json failed = json::array();
    for (const auto& file : result.failed) {
        failed.push_back({
            {"key", file.key},
            {"local_path", file.local_path.string()},
            {"error", file.error},
            {"attempts", file.attempts},
        });
    }
    return {
        {"overall_success", result.overall_success},
        {"total_files", result.total_files},
        {"successful_files", result.successful.size()},
        {"failed_files", result.failed.size()},
        {"total_size", result.total_bytes},
        {"total_size_formatted", format_file_size(result.total_bytes)},
        {"download_duration", result.duration_seconds},
        {"average_speed", result.average_speed},
        {"average_speed_formatted", format_rate(result.average_speed)},
        {"successful", successful},
        {"failed", failed},
    };
}

json to_json(const ShareableLinks& links) {
    json entries = json::array();
    for (const auto& link : links.links) {
        entries.push_back({
            {"filePath", link.key},
            {"downloadUrl", link.url},
            {"expiresIn", link.expires_in_seconds},
            {"downloadType", "assetFile"},
        });
    }
    json failed = json::array();
    for (const auto& file : links.failed) {
        failed.push_back({{"filePath", file.key}, {"error", file.error}});
    }
    return {
        {"shareableLinks", entries},
        {"totalFiles", links.links.size()},
        {"failed", failed},
    };
}

std::string render_plan(const PlanSummary& summary) {
    std::string out = "Upload plan:\n";
    out += fmt::format("  Files: {} ({} regular, {} preview", summary.total_files,
                       summary.regular_files, summary.preview_files);
    if (summary.zero_byte_files > 0) {
        out += fmt::format(", {} empty", summary.zero_byte_files);
    }
    out += ")\n";
    out += fmt::format("  Total size: {}\n", format_file_size(summary.total_bytes));
    out += fmt::format("  Parts: {}\n", summary.total_parts);
    out += fmt::format("  Sequences: {}\n", summary.sequences);
    return out;
}

std::string render_upload_report(const UploadResult& result) {
    std::string out;
    if (result.overall_success) {
        out += "Upload completed successfully!\n";
    } else if (result.successful_files > 0) {
        out += "Upload completed with some failures\n";
    } else {
        out += "Upload failed\n";
    }

    if (result.large_file_async) {
        out += "\nLarge file processing:\n";
        out += "  Your upload contains large files that will undergo separate asynchronous processing.\n";
        out += "  Files may take longer to appear in the asset.\n";
    } else if (result.asynchronous_processing) {
        out += "\nThe server accepted the upload for asynchronous processing.\n";
    }

    out += "\nResults:\n";
    out += fmt::format("  Successful files: {}/{}\n", result.successful_files, result.total_files);
    if (result.failed_files > 0) {
        out += fmt::format("  Failed files: {}\n", result.failed_files);
    }
    out += fmt::format("  Total size: {}\n", format_file_size(result.total_bytes));
    out += fmt::format("  Duration: {}\n", format_duration(result.duration_seconds));
    out += fmt::format("  Average speed: {}\n", format_rate(result.average_speed));

    if (!result.failed.empty()) {
        out += "\nFailed files:\n";
        for (const auto& file : result.failed) {
            out += fmt::format("  - {} ({})\n", file.key, file.error);
        }
    }
    return out;
}

std::string render_download_report(const DownloadResult& result) {
    std::string out;
    if (result.overall_success) {
        out += "Download completed successfully!\n";
    } else if (!result.successful.empty()) {
        out += "Download completed with some failures\n";
    } else {
        out += "Download failed\n";
    }

    out += "\nResults:\n";
    out += fmt::format("  Successful files: {}/{}\n", result.successful.size(), result.total_files);
    if (!result.failed.empty()) {
        out += fmt::format("  Failed files: {}\n", result.failed.size());
    }
    out += fmt::format("  Total size: {}\n", format_file_size(result.total_bytes));
    out += fmt::format("  Duration: {}\n", format_duration(result.duration_seconds));
    out += fmt::format("  Average speed: {}\n", format_rate(result.average_speed));

    if (!result.failed.empty()) {
        out += "\nFailed files:\n";
        for (const auto& file : result.failed) {
            out += fmt::format("  - {} ({})\n", file.key, file.error);
        }
    }
    return out;
}

std::string render_shareable_links(const ShareableLinks& links) {
    std::string out = fmt::format("Shareable links ({}):\n", links.links.size());
    for (const auto& link : links.links) {
        out += fmt::format("  {}\n    {}\n    expires in {}\n", link.key, link.url,
                           format_duration(static_cast<double>(link.expires_in_seconds)));
    }
    if (!links.failed.empty()) {
        out += "\nNo link for:\n";
        for (const auto& file : links.failed) {
            out += fmt::format("  - {} ({})\n", file.key, file.error);
        }
    }
    return out;
}

std::string render_progress_line(const ProgressSnapshot& snapshot, std::size_t bar_width) {
    const double fraction = snapshot.fraction();
    const auto filled = static_cast<std::size_t>(std::floor(fraction * static_cast<double>(bar_width)));
    std::string bar(std::min(filled, bar_width), '#');
    bar.append(bar_width - bar.size(), '-');

    const auto eta = snapshot.eta_seconds();
    return fmt::format("[{}] {:5.1f}% {}/{} | {} | active {} | ETA {}",
                       bar, fraction * 100.0,
                       format_file_size(snapshot.completed_bytes), format_file_size(snapshot.total_bytes),
                       format_rate(snapshot.throughput()), snapshot.active_transfers,
                       eta ? format_duration(*eta) : std::string("calculating..."));
}

} // namespace atx::transfer
