#include <gtest/gtest.h>
#include "atx/transfer/report.hpp"

using namespace atx::transfer;

namespace {

UploadResult partial_upload() {
    UploadResult result;
    result.overall_success = false;
    result.total_files = 3;
    result.successful_files = 2;
    result.failed_files = 1;
    result.total_bytes = 2048;
    result.transferred_bytes = 1024;
    result.duration_seconds = 2.0;
    result.average_speed = 512.0;

    SequenceResult sequence;
    sequence.sequence_id = 1;
    sequence.state = SequenceState::PartiallyFailed;
    sequence.session_id = "upl-1";
    sequence.successful_files = {"a.bin", "b.bin"};
    sequence.failed_files = {{"c.bin", 1, "1 of 2 parts failed"}};
    sequence.total_parts = 4;
    sequence.successful_parts = 3;
    sequence.failed_parts = 1;
    result.sequences.push_back(sequence);
    result.failed = sequence.failed_files;
    return result;
}

} // namespace

TEST(ReportTest, UploadJsonShape) {
    const auto json = to_json(partial_upload());

    EXPECT_EQ(json.at("overall_success"), false);
    EXPECT_EQ(json.at("total_files"), 3);
    EXPECT_EQ(json.at("successful_files"), 2);
    EXPECT_EQ(json.at("failed_files"), 1);
    EXPECT_EQ(json.at("total_size_formatted"), "2.0 KB");
    EXPECT_EQ(json.at("average_speed_formatted"), "512.0 B/s");
    ASSERT_EQ(json.at("failed").size(), 1u);
    EXPECT_EQ(json.at("failed")[0].at("key"), "c.bin");

    const auto& sequence = json.at("sequence_results")[0];
    EXPECT_EQ(sequence.at("state"), "partially_failed");
    EXPECT_EQ(sequence.at("upload_id"), "upl-1");
    EXPECT_EQ(sequence.at("successful_files").size(), 2u);
    EXPECT_TRUE(sequence.at("error").is_null());
    EXPECT_TRUE(sequence.at("completion_result").is_null());
}

TEST(ReportTest, SequenceErrorIsSerialized) {
    auto result = partial_upload();
    result.sequences[0].error = atx::Error(atx::ErrorCode::FinalizeFailed, "upload completion failed", 500L);

    const auto json = to_json(result);
    const auto& error = json.at("sequence_results")[0].at("error");
    EXPECT_EQ(error.at("code"), "finalize_failed");
    EXPECT_EQ(error.at("http_status"), 500);
}

TEST(ReportTest, UploadTextHeadlines) {
    auto result = partial_upload();
    const auto partial = render_upload_report(result);
    EXPECT_EQ(partial.rfind("Upload completed with some failures", 0), 0u);
    EXPECT_NE(partial.find("Successful files: 2/3"), std::string::npos);
    EXPECT_NE(partial.find("  - c.bin (1 of 2 parts failed)"), std::string::npos);

    result.successful_files = 0;
    EXPECT_EQ(render_upload_report(result).rfind("Upload failed", 0), 0u);

    UploadResult clean;
    clean.overall_success = true;
    clean.large_file_async = true;
    const auto text = render_upload_report(clean);
    EXPECT_EQ(text.rfind("Upload completed successfully!", 0), 0u);
    EXPECT_NE(text.find("Large file processing"), std::string::npos);
    EXPECT_EQ(text.find("Failed files:"), std::string::npos);
}

TEST(ReportTest, PlanSummary) {
    PlanSummary summary;
    summary.total_files = 4;
    summary.regular_files = 3;
    summary.preview_files = 1;
    summary.zero_byte_files = 1;
    summary.total_bytes = 1536;
    summary.total_parts = 3;
    summary.sequences = 2;

    const auto text = render_plan(summary);
    EXPECT_NE(text.find("Files: 4 (3 regular, 1 preview, 1 empty)"), std::string::npos);
    EXPECT_NE(text.find("Total size: 1.5 KB"), std::string::npos);
    EXPECT_EQ(to_json(summary).at("total_sequences"), 2);
}

TEST(ReportTest, DownloadJsonAndText) {
    DownloadResult result;
    result.total_files = 2;
    result.successful.push_back({"a", "/dest/a", 10, 1});
    result.failed.push_back({"b", "/dest/b", "http_status: gone (HTTP 404)", 3});
    result.total_bytes = 10;

    const auto json = to_json(result);
    EXPECT_EQ(json.at("successful_files"), 1);
    EXPECT_EQ(json.at("failed")[0].at("attempts"), 3);
    EXPECT_EQ(json.at("successful")[0].at("local_path"), "/dest/a");

    const auto text = render_download_report(result);
    EXPECT_EQ(text.rfind("Download completed with some failures", 0), 0u);
    EXPECT_NE(text.find("  - b (http_status: gone (HTTP 404))"), std::string::npos);
}

TEST(ReportTest, ShareableLinksJsonAndText) {
    ShareableLinks links;
    links.links.push_back({"/models/a.glb", "https://s3/a?sig=1", 86400});
    links.failed.push_back({"/gone.bin", "not_found: no such key (HTTP 404)"});

    const auto json = to_json(links);
    ASSERT_EQ(json.at("shareableLinks").size(), 1u);
    EXPECT_EQ(json.at("shareableLinks")[0].at("filePath"), "/models/a.glb");
    EXPECT_EQ(json.at("shareableLinks")[0].at("downloadUrl"), "https://s3/a?sig=1");
    EXPECT_EQ(json.at("shareableLinks")[0].at("expiresIn"), 86400);
    EXPECT_EQ(json.at("totalFiles"), 1);
    EXPECT_EQ(json.at("failed")[0].at("filePath"), "/gone.bin");

    const auto text = render_shareable_links(links);
    EXPECT_EQ(text.rfind("Shareable links (1):", 0), 0u);
    EXPECT_NE(text.find("expires in 24h 0m"), std::string::npos);
    EXPECT_NE(text.find("  - /gone.bin (not_found: no such key (HTTP 404))"), std::string::npos);
}

TEST(ReportTest, ProgressLine) {
    ProgressSnapshot snapshot;
    snapshot.total_files = 1;
    snapshot.total_bytes = 1000;
    snapshot.completed_bytes = 500;
    snapshot.active_transfers = 2;
    snapshot.elapsed_seconds = 1.0;

    const auto line = render_progress_line(snapshot, 10);
    EXPECT_EQ(line.rfind("[#####-----]  50.0%", 0), 0u);
    EXPECT_NE(line.find("active 2"), std::string::npos);
    EXPECT_NE(line.find("ETA 1.0s"), std::string::npos);

    snapshot.completed_bytes = 0;
    EXPECT_NE(render_progress_line(snapshot, 10).find("ETA calculating..."), std::string::npos);
}
