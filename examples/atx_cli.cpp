#include "atx/concurrency/thread_safe_queue.hpp"
#include "atx/core/config.hpp"
#include "atx/core/logging.hpp"
#include "atx/events/components.hpp"
#include "atx/events/event_bus.hpp"
#include "atx/net/api_client.hpp"
#include "atx/net/http.hpp"
#include "atx/net/transfer_client.hpp"
#include "atx/transfer/download_orchestrator.hpp"
#include "atx/transfer/download_selection.hpp"
#include "atx/transfer/file_collector.hpp"
#include "atx/transfer/progress.hpp"
#include "atx/transfer/report.hpp"
#include "atx/transfer/sequence_planner.hpp"
#include "atx/transfer/upload_orchestrator.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

using atx::concurrency::ThreadSafeQueue;
using atx::transfer::ProgressSnapshot;
using atx::transfer::ProgressThrottle;
using atx::transfer::TransferProgress;

namespace {

struct CliOptions {
    std::string command;
    std::string database_id;
    std::string asset_id;
    std::optional<fs::path> config_file;
    std::optional<std::string> base_url;
    std::optional<std::string> token;
    std::optional<std::size_t> parallel;
    std::optional<std::uint32_t> retries;
    std::optional<fs::path> log_file;
    bool force_skip = false;
    bool json_output = false;
    bool hide_progress = false;
    bool verbose = false;

    // upload
    std::optional<fs::path> directory;
    bool recursive = false;
    bool asset_preview = false;
    std::string asset_location = "/";

    // download
    std::optional<fs::path> output;
    std::optional<fs::path> manifest;
    std::optional<std::string> file_key;
    std::optional<std::uint32_t> timeout_seconds;
    bool flatten = false;
    bool file_previews = false;
    bool shareable_links_only = false;

    std::vector<std::string> positional;
};

void print_usage(const char* program) {
    std::cerr
        << "Usage:\n"
        << "  " << program << " upload -d DB -a ASSET [--directory DIR [--recursive]] [FILES...]\n"
        << "      [--asset-preview] [--asset-location LOC] [--parallel N] [--retries N]\n"
        << "      [--force-skip] [--json-output] [--hide-progress]\n"
        << "  " << program << " download -d DB -a ASSET --output DIR [--file-key KEY [--recursive]]\n"
        << "      [--file-previews] [--flatten] [--timeout SECONDS] [KEYS...]\n"
        << "  " << program << " download -d DB -a ASSET --shareable-links-only [--file-key KEY [--recursive]]\n"
        << "  " << program << " download --output DIR --manifest FILE\n"
        << "\n  Without KEYS or --file-key every file of the asset is downloaded.\n"
        << "\nCommon options:\n"
        << "  --config FILE      JSON profile (api, transfer, logging sections)\n"
        << "  --base-url URL     API base URL (or ATX_API_URL)\n"
        << "  --token TOKEN      Bearer token (or ATX_API_TOKEN)\n"
        << "  --log-file FILE    Also write logs to FILE\n"
        << "  --verbose          Debug logging\n";
}

std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(flag + " requires a value");
    }
    return argv[++i];
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;
    if (argc < 2) {
        throw std::invalid_argument("missing command");
    }
    options.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-d" || arg == "--database") {
            options.database_id = require_value(argc, argv, i, arg);
        } else if (arg == "-a" || arg == "--asset") {
            options.asset_id = require_value(argc, argv, i, arg);
        } else if (arg == "--config") {
            options.config_file = require_value(argc, argv, i, arg);
        } else if (arg == "--base-url") {
            options.base_url = require_value(argc, argv, i, arg);
        } else if (arg == "--token") {
            options.token = require_value(argc, argv, i, arg);
        } else if (arg == "--parallel" || arg == "--parallel-uploads" || arg == "--parallel-downloads") {
            options.parallel = std::stoul(require_value(argc, argv, i, arg));
        } else if (arg == "--retries" || arg == "--retry-attempts") {
            options.retries = static_cast<std::uint32_t>(std::stoul(require_value(argc, argv, i, arg)));
        } else if (arg == "--log-file") {
            options.log_file = require_value(argc, argv, i, arg);
        } else if (arg == "--force-skip") {
            options.force_skip = true;
        } else if (arg == "--json-output") {
            options.json_output = true;
        } else if (arg == "--hide-progress") {
            options.hide_progress = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--directory") {
            options.directory = require_value(argc, argv, i, arg);
        } else if (arg == "--recursive") {
            options.recursive = true;
        } else if (arg == "--asset-preview") {
            options.asset_preview = true;
        } else if (arg == "--asset-location") {
            options.asset_location = require_value(argc, argv, i, arg);
        } else if (arg == "--output") {
            options.output = require_value(argc, argv, i, arg);
        } else if (arg == "--manifest") {
            options.manifest = require_value(argc, argv, i, arg);
        } else if (arg == "--flatten" || arg == "--flatten-download-tree") {
            options.flatten = true;
        } else if (arg == "--file-key") {
            options.file_key = require_value(argc, argv, i, arg);
        } else if (arg == "--file-previews") {
            options.file_previews = true;
        } else if (arg == "--shareable-links-only") {
            options.shareable_links_only = true;
        } else if (arg == "--timeout") {
            options.timeout_seconds = static_cast<std::uint32_t>(std::stoul(require_value(argc, argv, i, arg)));
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

atx::Result<atx::core::ClientConfig> build_config(const CliOptions& options) {
    atx::core::ClientConfig config;
    if (options.config_file) {
        auto loaded = atx::core::load_config(*options.config_file);
        if (loaded.is_error()) {
            return loaded;
        }
        config = loaded.take();
    }

    if (const char* url = std::getenv("ATX_API_URL")) {
        config.api.base_url = url;
    }
    if (const char* token = std::getenv("ATX_API_TOKEN")) {
        config.api.access_token = token;
    }
    if (options.base_url) {
        config.api.base_url = *options.base_url;
    }
    if (options.token) {
        config.api.access_token = *options.token;
    }
    if (options.parallel) {
        config.transfer.max_parallel_uploads = *options.parallel;
        config.transfer.max_parallel_downloads = *options.parallel;
    }
    if (options.retries) {
        config.transfer.upload_retry.max_retries = *options.retries;
        config.transfer.download_retry.max_retries = *options.retries;
    }
    if (options.force_skip) {
        config.transfer.force_skip = true;
    }
    if (options.timeout_seconds) {
        config.transfer.request_timeout = std::chrono::seconds(*options.timeout_seconds);
    }
    if (options.log_file) {
        config.logging.file = *options.log_file;
    }
    if (options.verbose) {
        config.logging.level = "debug";
    }

    auto valid = atx::core::validate(config);
    if (valid.is_error()) {
        return atx::Err<atx::core::ClientConfig>(valid.error());
    }
    return atx::Ok(std::move(config));
}

// File names need not be UTF-8; invalid bytes are printed as U+FFFD
void print_json(const json& document) {
    std::cout << document.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}

/**
 * @brief Renders throttled progress lines on its own thread
 *
 * Workers only push the latest snapshot; stderr writes happen here.
 */
class ProgressDisplay {
public:
    explicit ProgressDisplay(bool enabled)
        : enabled_(enabled), throttle_(std::chrono::milliseconds(250)) {
        if (enabled_) {
            renderer_ = std::thread([this]() { render_loop(); });
        }
    }

    ~ProgressDisplay() { finish(); }

    ProgressDisplay(const ProgressDisplay&) = delete;
    ProgressDisplay& operator=(const ProgressDisplay&) = delete;

    atx::transfer::ProgressCallback callback() {
        if (!enabled_) {
            return {};
        }
        return [this](const TransferProgress& progress) {
            if (throttle_.should_render(progress.settled())) {
                snapshots_.push_latest(progress.snapshot());
            }
        };
    }

    void finish() {
        if (!renderer_.joinable()) {
            return;
        }
        snapshots_.shutdown();
        renderer_.join();
        std::cerr << "\n";
    }

private:
    void render_loop() {
        while (auto snapshot = snapshots_.pop()) {
            std::cerr << "\r" << atx::transfer::render_progress_line(*snapshot) << std::flush;
        }
    }

    bool enabled_;
    ProgressThrottle throttle_;
    ThreadSafeQueue<ProgressSnapshot> snapshots_;
    std::thread renderer_;
};

int run_upload(const CliOptions& options, const atx::core::ClientConfig& config) {
    using namespace atx::transfer;

    if (options.database_id.empty() || options.asset_id.empty()) {
        throw std::invalid_argument("upload requires -d/--database and -a/--asset");
    }
    if (options.directory && !options.positional.empty()) {
        throw std::invalid_argument("use either --directory or a list of files, not both");
    }

    auto collected = options.directory
        ? collect_from_directory(*options.directory, options.recursive, options.asset_location)
        : collect_from_list(std::vector<fs::path>(options.positional.begin(), options.positional.end()),
                            options.asset_location);
    if (collected.is_error()) {
        spdlog::error("Upload validation failed: {}", collected.error().describe());
        return 1;
    }
    auto files = collected.take();

    const auto upload_type = options.asset_preview ? UploadType::AssetPreview : UploadType::AssetFile;
    if (upload_type == UploadType::AssetPreview && files.size() != 1) {
        spdlog::error("Upload validation failed: an asset preview upload takes exactly one file");
        return 1;
    }
    for (const auto& file : files) {
        auto valid = validate_for_upload(file, upload_type, config.transfer.limits);
        if (valid.is_error()) {
            spdlog::error("Upload validation failed: {}", valid.error().describe());
            return 1;
        }
    }
    for (const auto& orphan : find_orphan_previews(files)) {
        spdlog::warn("Preview file {} has no matching base file in this upload", orphan);
    }

    auto planned = plan_sequences(files, config.transfer.limits);
    if (planned.is_error()) {
        spdlog::error("Upload planning failed: {}", planned.error().describe());
        return 1;
    }
    const auto sequences = planned.take();
    const auto summary = summarize(sequences);
    if (!options.json_output) {
        std::cout << render_plan(summary) << std::flush;
    }

    atx::events::EventBus bus;
    atx::events::LoggerComponent logger(bus);
    atx::events::MetricsComponent metrics(bus);

    atx::net::RestAssetApi api(config.api, options.database_id, options.asset_id, config.transfer.upload_retry);
    atx::net::CurlTransferClient client(config.transfer.request_timeout, config.api.connect_timeout);
    UploadOrchestrator orchestrator(api, client, config.transfer, bus, upload_type);

    UploadResult result;
    {
        ProgressDisplay display(!options.hide_progress && !options.json_output);
        result = orchestrator.run(sequences, display.callback());
    }
    metrics.print_stats();

    if (options.json_output) {
        json out = to_json(result);
        out["plan"] = to_json(summary);
        print_json(out);
    } else {
        std::cout << render_upload_report(result);
    }
    return result.overall_success ? 0 : 1;
}

atx::Result<std::vector<atx::transfer::DownloadRequest>> load_manifest(const fs::path& path, const fs::path& root) {
    using atx::transfer::DownloadRequest;

    std::ifstream in(path);
    if (!in) {
        return atx::Err<std::vector<DownloadRequest>>(atx::ErrorCode::InvalidFile,
                                                      "cannot open manifest " + path.string());
    }
    try {
        const json document = json::parse(in);
        std::vector<DownloadRequest> requests;
        for (const auto& entry : document) {
            DownloadRequest request;
            request.key = entry.at("key").get<std::string>();
            request.url = entry.at("url").get<std::string>();
            request.local_path = entry.contains("local_path")
                ? fs::path(entry.at("local_path").get<std::string>())
                : root / fs::path(request.key).relative_path();
            if (entry.contains("size")) {
                request.expected_size = entry.at("size").get<std::uint64_t>();
            }
            requests.push_back(std::move(request));
        }
        return atx::Ok(std::move(requests));
    } catch (const json::exception& e) {
        return atx::Err<std::vector<DownloadRequest>>(atx::ErrorCode::InvalidConfig,
                                                      "invalid manifest " + path.string() + ": " + e.what());
    }
}

int run_download(const CliOptions& options, const atx::core::ClientConfig& config) {
    using namespace atx::transfer;

    if (!options.output && !options.shareable_links_only) {
        throw std::invalid_argument("download requires --output unless --shareable-links-only is set");
    }
    if (options.manifest && (options.shareable_links_only || options.file_key || !options.positional.empty())) {
        throw std::invalid_argument("--manifest cannot be combined with keys, --file-key or --shareable-links-only");
    }
    if (options.file_previews && !options.file_key && options.positional.empty()) {
        throw std::invalid_argument("--file-previews requires --file-key or a list of keys");
    }

    std::vector<DownloadRequest> requests;
    if (options.manifest) {
        auto loaded = load_manifest(*options.manifest, *options.output);
        if (loaded.is_error()) {
            spdlog::error("Download preparation failed: {}", loaded.error().describe());
            return 1;
        }
        requests = loaded.take();
    } else {
        if (options.database_id.empty() || options.asset_id.empty()) {
            throw std::invalid_argument("download requires -d/--database and -a/--asset");
        }
        atx::net::RestAssetApi api(config.api, options.database_id, options.asset_id,
                                   config.transfer.download_retry);

        DownloadSelection selection;
        selection.keys = options.positional;
        selection.file_key = options.file_key;
        selection.recursive = options.recursive;
        selection.include_previews = options.file_previews;

        auto selected = select_remote_files(api, selection);
        if (selected.is_error()) {
            spdlog::error("Download preparation failed: {}", selected.error().describe());
            return 1;
        }

        if (options.shareable_links_only) {
            const auto links = collect_shareable_links(api, selected.value());
            if (options.json_output) {
                print_json(to_json(links));
            } else {
                std::cout << render_shareable_links(links);
            }
            return links.failed.empty() && !links.links.empty() ? 0 : 1;
        }

        auto resolved = resolve_remote_files(api, selected.value(), *options.output, options.flatten);
        if (resolved.is_error()) {
            spdlog::error("Download preparation failed: {}", resolved.error().describe());
            return 1;
        }
        requests = resolved.take();
    }

    atx::events::EventBus bus;
    atx::events::LoggerComponent logger(bus);
    atx::events::MetricsComponent metrics(bus);

    atx::net::CurlTransferClient client(config.transfer.request_timeout, config.api.connect_timeout);
    DownloadOrchestrator orchestrator(client, config.transfer, bus);

    DownloadResult result;
    {
        ProgressDisplay display(!options.hide_progress && !options.json_output);
        result = orchestrator.run(requests, display.callback());
    }
    metrics.print_stats();

    if (options.json_output) {
        print_json(to_json(result));
    } else {
        std::cout << render_download_report(result);
    }
    return result.overall_success ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        const CliOptions options = parse_args(argc, argv);
        if (options.command == "--help" || options.command == "help") {
            print_usage(argv[0]);
            return 0;
        }

        auto config = build_config(options);
        if (config.is_error()) {
            spdlog::error("Configuration error: {}", config.error().describe());
            return 1;
        }
        auto logging = atx::core::configure_logging(config.value().logging);
        if (logging.is_error()) {
            spdlog::error("Logging setup failed: {}", logging.error().describe());
            return 1;
        }

        atx::net::CurlGlobal curl;
        if (options.command == "upload") {
            return run_upload(options, config.value());
        }
        if (options.command == "download") {
            return run_download(options, config.value());
        }
        throw std::invalid_argument("unknown command " + options.command);
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        print_usage(argv[0]);
        return 1;
    } catch (const std::out_of_range& e) {
        spdlog::error("Numeric argument out of range: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
