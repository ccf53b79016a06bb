// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/capability_prober.hpp>
#include <reel/core/error.hpp>
#include <reel/core/url.hpp>
#include <reel/disk/error.hpp>
#include <reel/disk/finalizer.hpp>
#include <reel/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

using namespace reel::core;

namespace fs = std::filesystem;

namespace reel::cli {

namespace {

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) noexcept {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Value of "--flag VALUE" or "--flag=VALUE"; nullopt when missing
std::optional<std::string> take_value(std::string_view arg, std::string_view flag,
                                      int& i, int argc, char* argv[]) {
    if (arg.size() > flag.size() && arg[flag.size()] == '=') {
        return std::string(arg.substr(flag.size() + 1));
    }
    if (i + 1 < argc) {
        return std::string(argv[++i]);
    }
    return std::nullopt;
}

bool matches(std::string_view arg, std::string_view flag) noexcept {
    return arg == flag || (arg.starts_with(flag) && arg.size() > flag.size() && arg[flag.size()] == '=');
}

std::string join(const std::string& dir, const std::string& name) {
    if (dir.empty() || fs::path(name).is_absolute()) return name;
    return (fs::path(dir) / name).string();
}

// Interruptible pause between tasks
void pause_for(std::chrono::milliseconds delay, std::stop_token stop) {
    if (delay.count() <= 0) return;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, delay, [] { return false; });
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.help = true;
                return args;
            }
            if (arg == "-v" || arg == "--version") {
                args.version = true;
                return args;
            }
            if (arg == "-V" || arg == "--verbose") {
                args.verbose = true;
                continue;
            }
            if (arg == "-q" || arg == "--quiet") {
                args.quiet = true;
                continue;
            }
            if (arg == "-i" || arg == "--info") {
                args.info = true;
                continue;
            }

            if (arg == "-o" || matches(arg, "--output")) {
                auto value = take_value(arg, arg == "-o" ? "-o" : "--output", i, argc, argv);
                if (value) args.output_file = *value;
                else args.errors.push_back("Missing value for " + arg);
                continue;
            }
            if (arg == "-d" || matches(arg, "--directory")) {
                auto value = take_value(arg, arg == "-d" ? "-d" : "--directory", i, argc, argv);
                if (value) args.output_dir = *value;
                else args.errors.push_back("Missing value for " + arg);
                continue;
            }
            if (matches(arg, "--referer")) {
                auto value = take_value(arg, "--referer", i, argc, argv);
                if (value) args.referer = *value;
                else args.errors.push_back("Missing value for --referer");
                continue;
            }
            if (matches(arg, "--manifest")) {
                auto value = take_value(arg, "--manifest", i, argc, argv);
                if (value) args.manifest = *value;
                else args.errors.push_back("Missing value for --manifest");
                continue;
            }
            if (matches(arg, "--config")) {
                auto value = take_value(arg, "--config", i, argc, argv);
                if (value) args.config_file = *value;
                else args.errors.push_back("Missing value for --config");
                continue;
            }
            if (matches(arg, "--sample-bytes")) {
                auto value = take_value(arg, "--sample-bytes", i, argc, argv);
                auto n = value ? parse_unsigned<std::uint64_t>(*value) : std::nullopt;
                if (n) args.sample_bytes = *n;
                else args.errors.push_back("Invalid value for --sample-bytes");
                continue;
            }
            if (matches(arg, "--retries")) {
                auto value = take_value(arg, "--retries", i, argc, argv);
                auto n = value ? parse_unsigned<std::uint32_t>(*value) : std::nullopt;
                if (n && *n > 0) args.retries = *n;
                else args.errors.push_back("Invalid value for --retries (must be at least 1)");
                continue;
            }

            // URL arguments (no option)
            if (arg.starts_with("http://") || arg.starts_with("https://")) {
                args.urls.push_back(arg);
                continue;
            }

            if (arg.starts_with("-")) {
                args.errors.push_back("Unknown option: " + arg);
            } else {
                args.errors.push_back("Not an http(s) URL: " + arg);
            }
        }
    } catch (const std::exception& e) {
        args.errors.emplace_back(e.what());
    }

    return args;
}

//=============================================================================
// Manifest and task building
//=============================================================================

std::expected<std::vector<TransferTask>, std::error_code>
parse_manifest(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_array()) {
            spdlog::error("Manifest must be a JSON array");
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }

        std::vector<TransferTask> tasks;
        tasks.reserve(j.size());

        for (const auto& entry : j) {
            if (!entry.is_object() || !entry.contains("url")) {
                spdlog::error("Manifest entry without a url: {}", entry.dump());
                return std::unexpected(make_error_code(TransferErrc::invalid_config));
            }

            TransferTask task;
            task.source_url = entry["url"].get<std::string>();
            task.destination_path = entry.value("output", std::string{});
            task.referer = entry.value("referer", std::string{});
            task.label = entry.value("label", std::string{});
            tasks.push_back(std::move(task));
        }
        return tasks;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid manifest: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    } catch (const std::exception& e) {
        spdlog::error("Invalid manifest: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
}

std::expected<std::vector<TransferTask>, std::error_code>
load_manifest(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        return parse_manifest(ss.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::expected<std::vector<TransferTask>, std::error_code>
build_tasks(const CliArgs& args, const SessionConfig& session) noexcept {
    try {
        std::vector<TransferTask> tasks;

        if (!args.manifest.empty()) {
            auto loaded = load_manifest(args.manifest);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            tasks = std::move(*loaded);
        }

        for (const auto& url : args.urls) {
            TransferTask task;
            task.source_url = url;
            tasks.push_back(std::move(task));
        }

        if (tasks.empty()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_task));
        }

        // A single output name cannot serve several tasks
        if (!args.output_file.empty() && tasks.size() > 1) {
            spdlog::error("--output needs exactly one task, got {}", tasks.size());
            return std::unexpected(make_error_code(TransferErrc::invalid_task));
        }

        for (auto& task : tasks) {
            auto url = Url::parse(task.source_url);
            if (!url) {
                spdlog::error("Invalid URL: {}", task.source_url);
                return std::unexpected(url.error());
            }

            std::string name = task.destination_path;
            if (name.empty()) {
                name = args.output_file.empty() ? url->filename() : args.output_file;
            }
            task.destination_path = join(args.output_dir, name);

            if (session.sample_bytes > 0) {
                task.destination_path = disk::sample_path(task.destination_path);
            }

            if (task.referer.empty()) task.referer = args.referer;
            if (task.label.empty()) task.label = fs::path(task.destination_path).filename().string();

            task.max_retries = session.max_retries;
            task.sample_bytes = session.sample_bytes;
        }
        return tasks;
    } catch (const std::exception& e) {
        spdlog::error("Cannot build tasks: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_task));
    }
}

//=============================================================================
// Commands
//=============================================================================

BatchSummary run_batch(TransferEngine& engine,
                       const std::vector<TransferTask>& tasks,
                       const SessionConfig& session,
                       bool show_progress,
                       std::stop_token stop) noexcept {
    BatchSummary summary;

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (stop.stop_requested()) break;
        const auto& task = tasks[i];

        std::cout << "[" << (i + 1) << "/" << tasks.size() << "] " << task.label << std::endl;

        ProgressBar bar(task.label);
        if (show_progress) {
            engine.callback([&bar](const ProgressView& view) { bar.update(view); });
            engine.retry_callback([&bar](std::uint32_t, std::chrono::milliseconds, const std::error_code&) {
                bar.interrupt();
            });
        } else {
            engine.callback({});
            engine.retry_callback({});
        }

        auto result = engine.run(task, stop);
        bar.interrupt();

        if (!result) {
            ++summary.failed;
            std::cout << "  Failed: " << result.error().message() << std::endl;
            if (result.error() == TransferErrc::cancelled) break;
            continue;
        }

        if (*result == TransferStatus::already_complete) {
            ++summary.skipped;
            std::cout << "  Already complete: " << task.destination_path << std::endl;
            continue;
        }

        ++summary.downloaded;
        std::cout << "  Saved: " << task.destination_path << std::endl;

        if (i + 1 < tasks.size()) {
            pause_for(session.polite_pause, stop);
        }
    }

    engine.callback({});
    engine.retry_callback({});
    return summary;
}

void print_summary(const BatchSummary& summary) noexcept {
    std::cout << "\n";
    std::cout << "Downloaded: " << summary.downloaded
              << "  Skipped: " << summary.skipped
              << "  Failed: " << summary.failed
              << "  (total " << summary.total() << ")" << std::endl;
}

CliResult info(HttpTransport& transport,
               const SessionConfig& session,
               const std::string& url,
               std::string_view referer) noexcept {
    auto parsed = Url::parse(url);
    if (!parsed || !parsed->is_http()) {
        std::cout << "Error: Invalid URL: " << url << std::endl;
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    CapabilityProber prober(transport, session);
    auto cap = prober.probe(url, referer);

    std::cout << "URL: " << url << std::endl;
    std::cout << "Host: " << parsed->host() << std::endl;
    std::cout << "Filename: " << parsed->filename() << std::endl;
    if (cap.size) {
        std::cout << "Size: " << format_bytes(*cap.size) << " (" << *cap.size << " bytes)" << std::endl;
    } else {
        std::cout << "Size: unknown" << std::endl;
    }
    std::cout << "Accepts-Ranges: " << (cap.accepts_ranges ? "yes" : "no") << std::endl;

    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Reel " << reel::version.to_string() << " - Resumable media downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -v, --version            Show version information\n";
    std::cout << "  -V, --verbose            Print detailed progress logs\n";
    std::cout << "  -q, --quiet              Quiet mode (no progress bar, warnings only)\n";
    std::cout << "  -o, --output <FILE>      Save to specified file (single task)\n";
    std::cout << "  -d, --directory <DIR>    Save into specified directory\n";
    std::cout << "  -i, --info               Show size and range support without downloading\n";
    std::cout << "      --sample-bytes <N>   Fetch only the first N bytes into name.sample.ext\n";
    std::cout << "      --retries <N>        Attempts per task (default: " << RETRY_COUNT << ")\n";
    std::cout << "      --referer <URL>      Referer header for every task\n";
    std::cout << "      --manifest <FILE>    JSON array of {url, output, referer, label}\n";
    std::cout << "      --config <FILE>      JSON session config\n";
    std::cout << "\n";
    std::cout << "ENVIRONMENT:\n";
    std::cout << "  REEL_COOKIE              Cookie header value\n";
    std::cout << "  REEL_COOKIE_FILE         File holding the cookie header value\n";
    std::cout << "  REEL_SAMPLE_BYTES        Default for --sample-bytes\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/lesson.mp4\n";
    std::cout << "  " << program_name << " -d videos --manifest lessons.json\n";
    std::cout << "  " << program_name << " --sample-bytes 65536 https://example.com/lesson.mp4\n";
}

void print_version() noexcept {
    std::cout << "Reel " << reel::version.to_string() << std::endl;
    std::cout << "Built " << reel::BUILD_DATE << " " << reel::BUILD_TIME << "\n";
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann/json\n";
}

} // namespace reel::cli
