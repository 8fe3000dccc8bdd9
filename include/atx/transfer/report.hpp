#pragma once

#include "atx/transfer/download_orchestrator.hpp"
#include "atx/transfer/download_selection.hpp"
#include "atx/transfer/progress.hpp"
#include "atx/transfer/sequence_planner.hpp"
#include "atx/transfer/upload_orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace atx::transfer {

// Machine-readable run summaries (--json-output)
nlohmann::json to_json(const PlanSummary& summary);
nlohmann::json to_json(const UploadResult& result);
nlohmann::json to_json(const DownloadResult& result);
nlohmann::json to_json(const ShareableLinks& links);

// Terminal text
std::string render_plan(const PlanSummary& summary);
std::string render_upload_report(const UploadResult& result);
std::string render_download_report(const DownloadResult& result);
std::string render_shareable_links(const ShareableLinks& links);

/**
 * @brief One-line progress display
 *
 * "[#####-----]  42.0% 1.2 GB/2.9 GB | 35.1 MB/s | active 10 | ETA 48s"
 */
std::string render_progress_line(const ProgressSnapshot& snapshot, std::size_t bar_width = 30);

} // namespace atx::transfer
