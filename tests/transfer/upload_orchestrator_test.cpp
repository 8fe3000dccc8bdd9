#include <gtest/gtest.h>
#include "atx/transfer/upload_orchestrator.hpp"

#include "atx/events/components.hpp"
#include "atx/net/api_client.hpp"
#include "atx/transfer/sequence_planner.hpp"
#include "support/test_support.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>

using namespace atx::transfer;
using atx::ErrorCode;
using atx::events::EventBus;
using atx::events::MetricsComponent;
using atx::test::FakeAssetApi;
using atx::test::FakeTransferClient;
namespace fs = std::filesystem;

class UploadOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = atx::test::create_temp_dir("atx_upload_");

        limits_.small_chunk_size = 10;
        limits_.large_chunk_size = 40;
        limits_.small_chunk_threshold = 1000;

        config_.max_parallel_uploads = 4;
        config_.upload_retry = atx::test::instant_retry(2);
        config_.limits = limits_;
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    FileInfo add_file(const std::string& key, std::size_t size) {
        const auto path = root_ / key;
        const auto content = atx::test::pattern_bytes(size);
        atx::test::write_file(path, content);
        contents_[key] = content;
        return FileInfo(path, key, size);
    }

    std::vector<Sequence> plan(const std::vector<FileInfo>& files) {
        auto planned = plan_sequences(files, limits_);
        EXPECT_TRUE(planned.is_ok());
        return planned.take();
    }

    UploadResult run(const std::vector<Sequence>& sequences, ProgressCallback on_progress = {}) {
        UploadOrchestrator orchestrator(api_, client_, config_, bus_, UploadType::AssetFile,
                                        [](std::chrono::milliseconds) {});
        return orchestrator.run(sequences, std::move(on_progress));
    }

    /// Rebuilds each finalized file from the bytes the client received, in part order.
    std::map<std::string, std::string> reassembled() const {
        std::map<std::string, std::string> files;
        const auto uploads = client_.uploads();
        for (const auto& call : api_.complete_calls()) {
            for (const auto& file : call.files) {
                std::string data;
                for (const auto& part : file.parts) {
                    const auto url = "mem://" + call.session_id + "/" + file.key + "/" +
                                     std::to_string(part.part_number);
                    data += uploads.at(url);
                }
                files[file.key] = data;
            }
        }
        return files;
    }

    fs::path root_;
    atx::core::TransferLimits limits_;
    atx::core::TransferConfig config_;
    std::map<std::string, std::string> contents_;
    FakeAssetApi api_;
    FakeTransferClient client_;
    EventBus bus_;
};

TEST_F(UploadOrchestratorTest, UploadsAndFinalizesEveryFile) {
    MetricsComponent metrics(bus_);
    const auto sequences = plan({add_file("a.bin", 25), add_file("b.bin", 10), add_file("c.bin", 3)});

    const auto result = run(sequences);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(result.total_files, 3u);
    EXPECT_EQ(result.successful_files, 3u);
    EXPECT_EQ(result.failed_files, 0u);
    EXPECT_EQ(result.total_bytes, 38u);
    EXPECT_EQ(result.transferred_bytes, 38u);
    ASSERT_EQ(result.sequences.size(), 1u);
    EXPECT_EQ(result.sequences[0].state, SequenceState::Completed);
    EXPECT_EQ(result.sequences[0].session_id, "session-1");
    EXPECT_EQ(result.sequences[0].successful_parts, 5u);

    const auto files = reassembled();
    ASSERT_EQ(files.size(), 3u);
    for (const auto& [key, content] : contents_) {
        EXPECT_EQ(files.at(key), content) << key;
    }

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.sequences_initialized.load(), 1u);
    EXPECT_EQ(stats.sequences_finalized.load(), 1u);
    EXPECT_EQ(stats.parts_transferred.load(), 5u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 38u);
    EXPECT_EQ(stats.files_uploaded.load(), 3u);
}

TEST_F(UploadOrchestratorTest, CompletionListsPartsInAscendingOrder) {
    const auto sequences = plan({add_file("wide.bin", 95)});
    run(sequences);

    const auto calls = api_.complete_calls();
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_EQ(calls[0].files.size(), 1u);
    const auto& parts = calls[0].files[0].parts;
    ASSERT_EQ(parts.size(), 10u);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(parts[i].part_number, i + 1);
        EXPECT_FALSE(parts[i].token.empty());
    }
    EXPECT_EQ(calls[0].files[0].upload_file_id, "s3-wide.bin");
}

TEST_F(UploadOrchestratorTest, ZeroByteFileIsFinalizedWithoutParts) {
    const auto sequences = plan({add_file("empty.bin", 0)});

    const auto result = run(sequences);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(client_.total_calls(), 0);
    const auto init_calls = api_.initialize_calls();
    ASSERT_EQ(init_calls.size(), 1u);
    EXPECT_EQ(init_calls[0][0].part_count, 0u);

    const auto calls = api_.complete_calls();
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_EQ(calls[0].files.size(), 1u);
    EXPECT_EQ(calls[0].files[0].key, "empty.bin");
    EXPECT_TRUE(calls[0].files[0].parts.empty());
}

TEST_F(UploadOrchestratorTest, TransientPartFailureIsRetried) {
    MetricsComponent metrics(bus_);
    const auto sequences = plan({add_file("a.bin", 15)});
    client_.failures_before_success["mem://session-1/a.bin/2"] = 2;

    const auto result = run(sequences);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(client_.calls("mem://session-1/a.bin/1"), 1);
    EXPECT_EQ(client_.calls("mem://session-1/a.bin/2"), 3);
    EXPECT_EQ(metrics.get_stats().retries.load(), 2u);
    EXPECT_EQ(reassembled().at("a.bin"), contents_.at("a.bin"));
}

TEST_F(UploadOrchestratorTest, ExhaustedPartFailsOnlyItsFile) {
    MetricsComponent metrics(bus_);
    const auto sequences = plan({add_file("good.bin", 12), add_file("bad.bin", 12)});
    client_.failures_before_success["mem://session-1/bad.bin/1"] = -1;

    const auto result = run(sequences);

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(result.successful_files, 1u);
    EXPECT_EQ(result.failed_files, 1u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].key, "bad.bin");
    EXPECT_EQ(result.failed[0].sequence_id, 1u);
    EXPECT_NE(result.failed[0].error.find("1 of 2 parts failed"), std::string::npos);

    // max_retries + 1 attempts, then the part is given up
    EXPECT_EQ(client_.calls("mem://session-1/bad.bin/1"), 3);
    EXPECT_EQ(metrics.get_stats().parts_failed.load(), 1u);

    ASSERT_EQ(result.sequences.size(), 1u);
    EXPECT_EQ(result.sequences[0].state, SequenceState::PartiallyFailed);
    EXPECT_EQ(result.sequences[0].failed_parts, 1u);

    const auto calls = api_.complete_calls();
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_EQ(calls[0].files.size(), 1u);
    EXPECT_EQ(calls[0].files[0].key, "good.bin");
}

TEST_F(UploadOrchestratorTest, FinalizeSkippedWhenNothingTransferred) {
    const auto sequences = plan({add_file("bad.bin", 5)});
    client_.failures_before_success["mem://session-1/bad.bin/1"] = -1;

    const auto result = run(sequences);

    EXPECT_FALSE(result.overall_success);
    EXPECT_TRUE(api_.complete_calls().empty());
    ASSERT_EQ(result.sequences.size(), 1u);
    EXPECT_EQ(result.sequences[0].state, SequenceState::Failed);
}

TEST_F(UploadOrchestratorTest, InitializeFailureFailsWholeSequence) {
    MetricsComponent metrics(bus_);
    api_.initialize_handler = [](const std::vector<atx::net::UploadFileRequest>&)
        -> atx::Result<atx::net::InitializeUploadResponse> {
        return atx::Err<atx::net::InitializeUploadResponse>(
            atx::Error(ErrorCode::Authentication, "token expired", 401L));
    };
    const auto sequences = plan({add_file("a.bin", 5), add_file("b.bin", 5)});

    const auto result = run(sequences);

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(result.failed_files, 2u);
    EXPECT_EQ(client_.total_calls(), 0);
    EXPECT_TRUE(api_.complete_calls().empty());
    ASSERT_EQ(result.sequences.size(), 1u);
    EXPECT_EQ(result.sequences[0].state, SequenceState::Failed);
    ASSERT_TRUE(result.sequences[0].error.has_value());
    EXPECT_EQ(result.sequences[0].error->code, ErrorCode::Authentication);
    EXPECT_EQ(metrics.get_stats().sequences_failed.load(), 1u);
}

TEST_F(UploadOrchestratorTest, FileMissingFromInitializeResponseFails) {
    api_.initialize_handler = [](const std::vector<atx::net::UploadFileRequest>& files)
        -> atx::Result<atx::net::InitializeUploadResponse> {
        atx::net::InitializeUploadResponse response;
        response.session_id = "custom";
        for (const auto& file : files) {
            if (file.key == "dropped.bin") {
                continue;
            }
            atx::net::InitializedFile initialized{file.key, "id-" + file.key, {}};
            for (std::uint32_t n = 1; n <= file.part_count; ++n) {
                initialized.part_targets.push_back({n, "mem://custom/" + file.key + "/" + std::to_string(n)});
            }
            response.files.push_back(std::move(initialized));
        }
        return atx::Ok(std::move(response));
    };
    const auto sequences = plan({add_file("kept.bin", 5), add_file("dropped.bin", 5)});

    const auto result = run(sequences);

    EXPECT_EQ(result.successful_files, 1u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].key, "dropped.bin");
    EXPECT_EQ(result.sequences[0].session_id, "custom");
}

TEST_F(UploadOrchestratorTest, FinalizeErrorFailsSubmittedFiles) {
    api_.complete_handler = [](const FakeAssetApi::CompleteCall&)
        -> atx::Result<atx::net::CompleteUploadResponse> {
        return atx::Err<atx::net::CompleteUploadResponse>(
            atx::Error(ErrorCode::ApiError, "internal error", 500L));
    };
    const auto sequences = plan({add_file("a.bin", 5)});

    const auto result = run(sequences);

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(result.failed_files, 1u);
    ASSERT_TRUE(result.sequences[0].error.has_value());
    EXPECT_EQ(result.sequences[0].error->code, ErrorCode::FinalizeFailed);
    EXPECT_EQ(result.sequences[0].error->http_status.value_or(0), 500);
    EXPECT_EQ(result.sequences[0].state, SequenceState::Failed);
}

TEST_F(UploadOrchestratorTest, FileMissingFromCompletionResultsFails) {
    api_.complete_handler = [](const FakeAssetApi::CompleteCall& call)
        -> atx::Result<atx::net::CompleteUploadResponse> {
        atx::net::CompleteUploadResponse response;
        response.overall_success = false;
        response.file_results.push_back({call.files[0].key, call.files[0].upload_file_id, true, ""});
        return atx::Ok(std::move(response));
    };
    const auto sequences = plan({add_file("a.bin", 5), add_file("b.bin", 5)});

    const auto result = run(sequences);

    EXPECT_EQ(result.successful_files, 1u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].key, "b.bin");
    EXPECT_EQ(result.failed[0].error, "file missing from upload completion response");
    EXPECT_EQ(result.sequences[0].state, SequenceState::PartiallyFailed);
}

TEST_F(UploadOrchestratorTest, RejectedFileReportsServerError) {
    api_.complete_handler = [](const FakeAssetApi::CompleteCall& call)
        -> atx::Result<atx::net::CompleteUploadResponse> {
        atx::net::CompleteUploadResponse response;
        for (const auto& file : call.files) {
            response.file_results.push_back({file.key, file.upload_file_id, false, "checksum mismatch"});
        }
        return atx::Ok(std::move(response));
    };
    const auto sequences = plan({add_file("a.bin", 5)});

    const auto result = run(sequences);

    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].error, "checksum mismatch");
    EXPECT_EQ(result.sequences[0].state, SequenceState::Failed);
}

TEST_F(UploadOrchestratorTest, AsynchronousCompletionCountsAsSuccess) {
    api_.complete_handler = [](const FakeAssetApi::CompleteCall&) {
        return atx::net::parse_complete_response(503, "");
    };
    const auto sequences = plan({add_file("a.bin", 5), add_file("b.bin", 5)});

    const auto result = run(sequences);

    EXPECT_TRUE(result.overall_success);
    EXPECT_TRUE(result.asynchronous_processing);
    EXPECT_EQ(result.successful_files, 2u);
}

TEST_F(UploadOrchestratorTest, PreviewFinalizeWaitsForRegularTransfers) {
    client_.delay_for = [](const std::string& url) {
        return url.find("previewFile") == std::string::npos ? std::chrono::milliseconds(30)
                                                            : std::chrono::milliseconds(0);
    };

    bool regular_done_before_preview = false;
    api_.complete_handler = [this, &regular_done_before_preview](const FakeAssetApi::CompleteCall& call)
        -> atx::Result<atx::net::CompleteUploadResponse> {
        if (call.files[0].key == "model.glb.previewFile.png") {
            std::size_t regular_parts = 0;
            for (const auto& [url, body] : client_.uploads()) {
                if (url.find("/model.glb/") != std::string::npos) {
                    ++regular_parts;
                }
            }
            regular_done_before_preview = regular_parts == 3;
        }
        atx::net::CompleteUploadResponse response;
        response.overall_success = true;
        for (const auto& file : call.files) {
            response.file_results.push_back({file.key, file.upload_file_id, true, ""});
        }
        return atx::Ok(std::move(response));
    };

    const auto sequences = plan({add_file("model.glb.previewFile.png", 4), add_file("model.glb", 30)});
    ASSERT_EQ(sequences.size(), 2u);
    EXPECT_EQ(sequences[1].kind, SequenceKind::Preview);

    const auto result = run(sequences);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(api_.complete_calls().size(), 2u);
    EXPECT_TRUE(regular_done_before_preview);
}

TEST_F(UploadOrchestratorTest, FailedRegularSequenceDoesNotBlockPreview) {
    api_.initialize_handler = [](const std::vector<atx::net::UploadFileRequest>& files)
        -> atx::Result<atx::net::InitializeUploadResponse> {
        if (files[0].key == "model.glb") {
            return atx::Err<atx::net::InitializeUploadResponse>(ErrorCode::ApiError, "rejected");
        }
        atx::net::InitializeUploadResponse response;
        response.session_id = "preview-session";
        for (const auto& file : files) {
            atx::net::InitializedFile initialized{file.key, "id", {}};
            for (std::uint32_t n = 1; n <= file.part_count; ++n) {
                initialized.part_targets.push_back({n, "mem://p/" + file.key + "/" + std::to_string(n)});
            }
            response.files.push_back(std::move(initialized));
        }
        return atx::Ok(std::move(response));
    };

    const auto sequences = plan({add_file("model.glb", 8), add_file("model.glb.previewFile.png", 4)});
    const auto result = run(sequences);

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(result.successful_files, 1u);
    ASSERT_EQ(result.sequences.size(), 2u);
    EXPECT_EQ(result.sequences[0].state, SequenceState::Failed);
    EXPECT_EQ(result.sequences[1].state, SequenceState::Completed);
}

TEST_F(UploadOrchestratorTest, ParallelismNeverExceedsConfiguredLimit) {
    config_.max_parallel_uploads = 3;
    client_.delay_for = [](const std::string&) { return std::chrono::milliseconds(5); };

    std::vector<FileInfo> files;
    for (int i = 0; i < 4; ++i) {
        files.push_back(add_file("f" + std::to_string(i) + ".bin", 50));
    }
    limits_.max_files_per_sequence = 2;
    const auto sequences = plan(files);
    ASSERT_EQ(sequences.size(), 2u);

    const auto result = run(sequences);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(client_.total_calls(), 20);
    EXPECT_GE(client_.peak_in_flight(), 1);
    EXPECT_LE(client_.peak_in_flight(), 3);
}

TEST_F(UploadOrchestratorTest, ProgressNeverMovesBackwards) {
    std::mutex mutex;
    std::vector<std::uint64_t> observed;
    std::uint64_t total = 0;
    bool settled = false;

    config_.max_parallel_uploads = 8;
    const auto sequences = plan({add_file("a.bin", 95), add_file("b.bin", 87), add_file("c.bin", 0)});
    run(sequences, [&](const TransferProgress& progress) {
        const auto snapshot = progress.snapshot();
        std::lock_guard lock(mutex);
        total = snapshot.total_bytes;
        observed.push_back(snapshot.completed_bytes);
        settled = progress.settled();
    });

    ASSERT_FALSE(observed.empty());
    for (std::size_t i = 1; i < observed.size(); ++i) {
        EXPECT_LE(observed[i - 1], observed[i]) << "frame " << i;
    }
    EXPECT_EQ(total, 182u);
    EXPECT_EQ(observed.back(), 182u);
    EXPECT_TRUE(settled);
}

TEST_F(UploadOrchestratorTest, ThrowingDriverFailsItsSequence) {
    MetricsComponent metrics(bus_);
    api_.initialize_handler = [](const std::vector<atx::net::UploadFileRequest>&)
        -> atx::Result<atx::net::InitializeUploadResponse> {
        throw std::runtime_error("unexpected reply");
    };
    const auto sequences = plan({add_file("a.bin", 5), add_file("b.bin", 5)});

    UploadResult result;
    ASSERT_NO_THROW(result = run(sequences));

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(result.failed_files, 2u);
    ASSERT_EQ(result.sequences.size(), 1u);
    EXPECT_EQ(result.sequences[0].state, SequenceState::Failed);
    ASSERT_TRUE(result.sequences[0].error.has_value());
    EXPECT_EQ(result.sequences[0].error->code, ErrorCode::Internal);
    EXPECT_NE(result.sequences[0].error->message.find("unexpected reply"), std::string::npos);
    EXPECT_EQ(client_.total_calls(), 0);
    EXPECT_EQ(metrics.get_stats().sequences_failed.load(), 1u);
}

TEST_F(UploadOrchestratorTest, NonUtf8FileNameFailsWithoutCrashing) {
    std::atomic<int> sent{0};
    atx::core::ApiConfig api_config;
    api_config.base_url = "https://api.example.com";
    atx::net::RestAssetApi rest(api_config, "db", "asset", atx::test::instant_retry(0),
        [&](const atx::net::HttpRequest&) -> atx::Result<atx::net::HttpResponse> {
            ++sent;
            return atx::Err<atx::net::HttpResponse>(ErrorCode::Network, "unreachable");
        },
        [](std::chrono::milliseconds) {});
    const auto sequences = plan({add_file("caf\xe9.bin", 12)});

    UploadOrchestrator orchestrator(rest, client_, config_, bus_, UploadType::AssetFile,
                                    [](std::chrono::milliseconds) {});
    UploadResult result;
    ASSERT_NO_THROW(result = orchestrator.run(sequences));

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(result.failed_files, 1u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].key, "caf\xe9.bin");
    EXPECT_EQ(sent.load(), 0);
    EXPECT_EQ(client_.total_calls(), 0);
}

TEST(ReadByteRangeTest, ReadsRequestedSlice) {
    const auto dir = atx::test::create_temp_dir();
    atx::test::write_file(dir / "f.bin", "0123456789");

    auto slice = read_byte_range(dir / "f.bin", 3, 4);
    ASSERT_TRUE(slice.is_ok());
    EXPECT_EQ(std::string(slice.value().begin(), slice.value().end()), "3456");

    auto past_end = read_byte_range(dir / "f.bin", 8, 4);
    ASSERT_TRUE(past_end.is_error());
    EXPECT_EQ(past_end.error().code, ErrorCode::Io);

    auto missing = read_byte_range(dir / "nope.bin", 0, 1);
    EXPECT_TRUE(missing.is_error());

    fs::remove_all(dir);
}

TEST(FinalizeGateTest, OpensAfterEveryRegularSequence) {
    FinalizeGate gate(2);
    EXPECT_EQ(gate.pending(), 2u);
    gate.regular_dispatched();
    gate.regular_dispatched();
    gate.regular_dispatched();
    EXPECT_EQ(gate.pending(), 0u);
    gate.wait_for_regular();
}

TEST(FinalizeGateTest, NoRegularSequencesMeansOpen) {
    FinalizeGate gate(0);
    gate.wait_for_regular();
    EXPECT_EQ(gate.pending(), 0u);
}
