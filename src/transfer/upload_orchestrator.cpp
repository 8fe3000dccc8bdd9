#include "atx/transfer/upload_orchestrator.hpp"

#include "atx/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <fstream>
#include <future>
#include <map>
#include <set>

namespace atx::transfer {
namespace {

using Clock = std::chrono::steady_clock;

// Signals the gate once, on whichever path the regular driver leaves by
class GateSignal {
public:
    GateSignal(FinalizeGate& gate, bool armed) : gate_(gate), armed_(armed) {}
    ~GateSignal() { fire(); }

    GateSignal(const GateSignal&) = delete;
    GateSignal& operator=(const GateSignal&) = delete;

    void fire() {
        if (armed_) {
            armed_ = false;
            gate_.regular_dispatched();
        }
    }

private:
    FinalizeGate& gate_;
    bool armed_;
};

class DoneOnExit {
public:
    explicit DoneOnExit(concurrency::WaitGroup& group) : group_(group) {}
    ~DoneOnExit() { group_.done(); }

    DoneOnExit(const DoneOnExit&) = delete;
    DoneOnExit& operator=(const DoneOnExit&) = delete;

private:
    concurrency::WaitGroup& group_;
};

std::chrono::milliseconds elapsed_ms(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

} // namespace

FinalizeGate::FinalizeGate(std::size_t regular_sequences) : remaining_(regular_sequences) {}

void FinalizeGate::regular_dispatched() {
    bool open = false;
    {
        std::unique_lock lock(mutex_);
        if (remaining_ > 0) {
            --remaining_;
        }
        open = remaining_ == 0;
    }
    if (open) {
        cv_.notify_all();
    }
}

void FinalizeGate::wait_for_regular() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return remaining_ == 0; });
}

std::size_t FinalizeGate::pending() const {
    std::unique_lock lock(mutex_);
    return remaining_;
}

Result<std::vector<char>> read_byte_range(const std::filesystem::path& path,
                                          std::uint64_t offset,
                                          std::uint64_t length) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::vector<char>>(ErrorCode::Io, "cannot open " + path.string());
    }
    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) {
        return Err<std::vector<char>>(ErrorCode::Io,
            "cannot seek to byte " + std::to_string(offset) + " in " + path.string());
    }

    std::vector<char> buffer(static_cast<std::size_t>(length));
    file.read(buffer.data(), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(file.gcount()) != length) {
        return Err<std::vector<char>>(ErrorCode::Io,
            "short read from " + path.string() + ": wanted " + std::to_string(length) +
            " bytes at " + std::to_string(offset) + ", got " + std::to_string(file.gcount()));
    }
    return Ok(std::move(buffer));
}

UploadOrchestrator::UploadOrchestrator(net::AssetApi& api,
                                       net::TransferClient& client,
                                       core::TransferConfig config,
                                       events::EventBus& bus,
                                       UploadType upload_type,
                                       Sleeper sleeper)
    : api_(api),
      client_(client),
      config_(std::move(config)),
      bus_(bus),
      upload_type_(upload_type),
      sleeper_(std::move(sleeper)) {}

UploadResult UploadOrchestrator::run(const std::vector<Sequence>& sequences, ProgressCallback on_progress) {
    const auto started = Clock::now();

    TransferProgress progress(std::move(on_progress));
    std::size_t regular_count = 0;
    for (const auto& sequence : sequences) {
        if (sequence.kind == SequenceKind::Regular) {
            ++regular_count;
        }
        for (const auto& file : sequence.files) {
            const auto parts = sequence.parts_by_key.find(file.key);
            progress.register_file(file.key, file.size,
                                   parts == sequence.parts_by_key.end() ? 0 : parts->second.size());
        }
    }

    concurrency::CountingSemaphore semaphore(config_.max_parallel_uploads);
    concurrency::WorkerPool pool(config_.max_parallel_uploads);
    FinalizeGate gate(regular_count);
    RunContext context{progress, semaphore, pool, gate};

    spdlog::info("[UploadStarted] sequences={} regular={} preview={} parallel={}",
                 sequences.size(), regular_count, sequences.size() - regular_count,
                 config_.max_parallel_uploads);

    std::vector<std::future<SequenceResult>> drivers;
    drivers.reserve(sequences.size());
    for (const auto& sequence : sequences) {
        drivers.push_back(std::async(std::launch::async, [this, &sequence, &context]() {
            try {
                return drive_sequence(sequence, context);
            } catch (const std::exception& e) {
                return abandon_sequence(sequence, context, e.what());
            }
        }));
    }

    UploadResult result;
    for (auto& driver : drivers) {
        result.sequences.push_back(driver.get());
    }
    pool.join();

    result.overall_success = true;
    for (const auto& sequence : sequences) {
        result.total_files += sequence.files.size();
        result.total_bytes += sequence.total_bytes;
    }
    for (const auto& sequence_result : result.sequences) {
        result.successful_files += sequence_result.successful_files.size();
        result.failed_files += sequence_result.failed_files.size();
        result.failed.insert(result.failed.end(),
                             sequence_result.failed_files.begin(), sequence_result.failed_files.end());
        if (!sequence_result.failed_files.empty() || sequence_result.error) {
            result.overall_success = false;
        }
        if (sequence_result.finalize_response) {
            result.asynchronous_processing |= sequence_result.finalize_response->asynchronous_processing;
            result.large_file_async |= sequence_result.finalize_response->large_file_async;
        }
    }

    const auto snapshot = progress.snapshot();
    result.transferred_bytes = snapshot.completed_bytes;
    result.duration_seconds = std::chrono::duration<double>(Clock::now() - started).count();
    result.average_speed = result.duration_seconds > 0.0
        ? static_cast<double>(result.transferred_bytes) / result.duration_seconds
        : 0.0;

    spdlog::info("[UploadFinished] success={} files={} succeeded={} failed={} bytes={}",
                 result.overall_success, result.total_files, result.successful_files,
                 result.failed_files, result.transferred_bytes);
    return result;
}

SequenceResult UploadOrchestrator::drive_sequence(const Sequence& sequence, RunContext& context) {
    SequenceResult result;
    result.sequence_id = sequence.id;
    result.kind = sequence.kind;
    result.total_parts = sequence.total_parts;

    GateSignal gate_signal(context.gate, sequence.kind == SequenceKind::Regular);
    SequenceSession session(sequence.id, sequence.kind);

    auto fail_file = [&](const std::string& key, const std::string& error) {
        result.failed_files.push_back({key, sequence.id, error});
        context.progress.file_failed(key, error);
    };

    auto advance = [&](Result<void> step) {
        if (step.is_error()) {
            spdlog::warn("[SequenceState] sequence={} {}", sequence.id, step.error().describe());
        }
    };

    auto finish = [&]() {
        result.state = session.state();
        result.session_id = session.upload_session_id();
        return result;
    };

    // Initializing
    advance(session.transition_to(SequenceState::Initializing));
    std::vector<net::UploadFileRequest> manifest;
    for (const auto& file : sequence.files) {
        const auto parts = sequence.parts_by_key.find(file.key);
        manifest.push_back({file.key, file.size,
                            parts == sequence.parts_by_key.end() ? 0 : parts->second.size()});
    }

    auto initialized = api_.initialize_upload(upload_type_, manifest);
    if (initialized.is_error()) {
        const auto message = initialized.error().describe();
        advance(session.mark_failed(message));
        result.error = initialized.error();
        for (const auto& file : sequence.files) {
            fail_file(file.key, "upload initialization failed: " + message);
        }
        bus_.emit(events::SequenceFailedEvent{sequence.id, "initialize", message, sequence.files.size()});
        return finish();
    }
    const auto init = initialized.take();
    session.set_upload_session_id(init.session_id);
    bus_.emit(events::SequenceInitializedEvent{sequence.id, sequence.kind, init.session_id,
                                               sequence.files.size(), sequence.total_parts,
                                               sequence.total_bytes});

    // Transferring
    advance(session.transition_to(SequenceState::Transferring));
    std::map<std::string, const net::InitializedFile*> targets_by_key;
    for (const auto& file : init.files) {
        targets_by_key[file.key] = &file;
    }

    // Sized before any task starts; tasks hold pointers into it
    std::vector<PartTransferState> states;
    states.reserve(sequence.total_parts);
    std::vector<const FileInfo*> eligible;
    std::map<std::string, std::string> upload_file_ids;

    for (const auto& file : sequence.files) {
        const auto parts_it = sequence.parts_by_key.find(file.key);
        const std::vector<Part> no_parts;
        const auto& parts = parts_it == sequence.parts_by_key.end() ? no_parts : parts_it->second;

        const auto target_it = targets_by_key.find(file.key);
        if (target_it == targets_by_key.end()) {
            fail_file(file.key, "initialize response did not include this file");
            continue;
        }
        const auto& targets = target_it->second->part_targets;
        if (targets.size() != parts.size()) {
            fail_file(file.key, "expected " + std::to_string(parts.size()) + " part targets, got " +
                                std::to_string(targets.size()));
            continue;
        }

        std::map<std::uint32_t, const std::string*> url_by_part;
        for (const auto& target : targets) {
            url_by_part[target.part_number] = &target.url;
        }
        const bool complete = std::all_of(parts.begin(), parts.end(), [&](const Part& part) {
            return url_by_part.count(part.part_number) == 1;
        });
        if (!complete) {
            fail_file(file.key, "part targets do not match the planned part numbers");
            continue;
        }

        eligible.push_back(&file);
        upload_file_ids[file.key] = target_it->second->upload_file_id;
        for (const auto& part : parts) {
            PartTransferState state;
            state.file_key = file.key;
            state.sequence_id = sequence.id;
            state.part = part;
            state.target_url = *url_by_part[part.part_number];
            states.push_back(std::move(state));
        }
    }

    std::map<std::string, const FileInfo*> files_by_key;
    for (const auto* file : eligible) {
        files_by_key[file->key] = file;
    }

    concurrency::WaitGroup pending;
    pending.add(states.size());
    for (auto& state : states) {
        const auto& local_path = files_by_key.at(state.file_key)->local_path;
        context.pool.submit([this, &state, &local_path, &context, &pending]() {
            DoneOnExit done(pending);
            transfer_part(state, local_path, context);
        });
    }
    pending.wait();

    // Finalizing
    std::map<std::string, std::vector<const PartTransferState*>> states_by_key;
    for (const auto& state : states) {
        states_by_key[state.file_key].push_back(&state);
        if (state.status == PartStatus::Completed) {
            ++result.successful_parts;
        } else {
            ++result.failed_parts;
        }
    }

    std::vector<net::CompleteFileRequest> completions;
    for (const auto* file : eligible) {
        const auto& file_states = states_by_key[file->key];
        std::size_t failed = 0;
        std::string last_error;
        net::CompleteFileRequest request{file->key, upload_file_ids[file->key], {}};
        for (const auto* state : file_states) {
            if (state->status == PartStatus::Completed) {
                request.parts.push_back({state->part.part_number, state->completion_token});
            } else {
                ++failed;
                last_error = state->last_error.empty() ? "part did not complete" : state->last_error;
            }
        }
        if (failed > 0) {
            fail_file(file->key, std::to_string(failed) + " of " + std::to_string(file_states.size()) +
                                 " parts failed: " + last_error);
            continue;
        }
        std::sort(request.parts.begin(), request.parts.end(),
                  [](const net::CompletedPart& a, const net::CompletedPart& b) {
                      return a.part_number < b.part_number;
                  });
        completions.push_back(std::move(request));
    }

    advance(session.transition_to(SequenceState::Finalizing));

    if (sequence.kind == SequenceKind::Preview) {
        context.gate.wait_for_regular();
    }

    if (completions.empty()) {
        gate_signal.fire();
        spdlog::warn("[SequenceSkipped] sequence={} no file transferred completely, finalize not called",
                     sequence.id);
        advance(session.mark_failed("no file transferred completely"));
        return finish();
    }

    gate_signal.fire();
    auto completed = api_.complete_upload(init.session_id, upload_type_, completions);
    if (completed.is_error()) {
        const auto message = completed.error().describe();
        advance(session.mark_failed(message));
        result.error = Error(ErrorCode::FinalizeFailed, "upload completion failed: " + message,
                             completed.error().http_status);
        for (const auto& request : completions) {
            fail_file(request.key, "upload completion failed: " + message);
        }
        bus_.emit(events::SequenceFailedEvent{sequence.id, "finalize", message, completions.size()});
        return finish();
    }

    const auto& response = completed.value();
    std::map<std::string, const net::FileCompletionResult*> results_by_key;
    for (const auto& file_result : response.file_results) {
        results_by_key[file_result.key] = &file_result;
    }

    for (const auto& request : completions) {
        bool succeeded = false;
        std::string error;
        if (response.asynchronous_processing) {
            succeeded = true;
        } else if (response.file_results.empty()) {
            succeeded = response.overall_success;
            error = response.message.empty() ? "upload completion reported failure" : response.message;
        } else {
            const auto it = results_by_key.find(request.key);
            if (it == results_by_key.end()) {
                error = "file missing from upload completion response";
            } else {
                succeeded = it->second->success;
                error = it->second->error.empty() ? "rejected by upload completion" : it->second->error;
            }
        }

        if (succeeded) {
            result.successful_files.push_back(request.key);
            context.progress.file_completed(request.key);
        } else {
            fail_file(request.key, error);
        }
    }
    result.finalize_response = response;

    if (result.failed_files.empty()) {
        advance(session.transition_to(SequenceState::Completed));
    } else if (!result.successful_files.empty()) {
        advance(session.transition_to(SequenceState::PartiallyFailed));
    } else {
        advance(session.mark_failed("every file failed"));
    }

    bus_.emit(events::SequenceFinalizedEvent{sequence.id, sequence.kind, init.session_id,
                                             result.successful_files.size(), result.failed_files.size(),
                                             response.asynchronous_processing});
    return finish();
}

SequenceResult UploadOrchestrator::abandon_sequence(const Sequence& sequence,
                                                   RunContext& context,
                                                   const std::string& reason) {
    spdlog::error("[SequenceAborted] sequence={} error={}", sequence.id, reason);

    SequenceResult result;
    result.sequence_id = sequence.id;
    result.kind = sequence.kind;
    result.state = SequenceState::Failed;
    result.total_parts = sequence.total_parts;
    result.error = Error(ErrorCode::Internal, "sequence aborted: " + reason);
    for (const auto& file : sequence.files) {
        result.failed_files.push_back({file.key, sequence.id, "sequence aborted: " + reason});
        context.progress.file_failed(file.key, reason);
    }
    bus_.emit(events::SequenceFailedEvent{sequence.id, "driver", reason, sequence.files.size()});
    return result;
}

void UploadOrchestrator::transfer_part(PartTransferState& state,
                                       const std::filesystem::path& local_path,
                                       RunContext& context) {
    concurrency::SemaphoreGuard slot(context.semaphore);
    context.progress.transfer_started();
    context.progress.part_started(state.file_key);
    state.status = PartStatus::InFlight;
    state.started_at = Clock::now();

    auto outcome = retry_with_backoff(
        config_.upload_retry,
        [&](std::uint32_t attempt) -> Result<std::string> {
            state.attempts = attempt + 1;
            auto bytes = read_byte_range(local_path, state.part.start_byte, state.part.length);
            if (bytes.is_error()) {
                return Err<std::string>(bytes.error());
            }
            return client_.put_part(state.target_url, bytes.value());
        },
        sleeper_,
        [&](std::uint32_t attempt, const Error& error, std::chrono::milliseconds delay) {
            bus_.emit(events::PartRetryEvent{state.sequence_id, state.file_key, state.part.part_number,
                                             attempt + 1, error.describe(), delay});
        });

    state.finished_at = Clock::now();
    if (outcome.is_ok()) {
        state.completion_token = outcome.take();
        state.status = PartStatus::Completed;
        context.progress.part_completed(state.file_key, state.part.length);
        bus_.emit(events::PartTransferredEvent{state.sequence_id, state.file_key, state.part.part_number,
                                               state.part.length, state.attempts,
                                               elapsed_ms(state.started_at, state.finished_at)});
    } else {
        state.status = PartStatus::Failed;
        state.last_error = outcome.error().describe();
        context.progress.part_failed(state.file_key);
        bus_.emit(events::PartFailedEvent{state.sequence_id, state.file_key, state.part.part_number,
                                          state.attempts, state.last_error, config_.force_skip});
    }
    context.progress.transfer_finished();
}

} // namespace atx::transfer
