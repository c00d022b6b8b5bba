// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/cli/commands.hpp>
#include <tandem/cli/progress_bar.hpp>
#include <tandem/core/error.hpp>
#include <tandem/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace tandem::cli {

namespace {

template<typename T>
bool parse_number(std::string_view text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size() && out > 0;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value = [&](int& i, std::string_view flag) -> std::optional<std::string> {
        if (i + 1 < argc) {
            return std::string(argv[++i]);
        }
        args.errors.push_back("missing value for " + std::string(flag));
        return std::nullopt;
    };

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
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-j" || arg == "--json") {
            args.json = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info_only = true;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value(i, arg)) args.config_file = *v;
        } else if (arg == "-e" || arg == "--executor") {
            args.executor = value(i, arg);
        } else if (arg == "-u" || arg == "--base-url") {
            args.base_url = value(i, arg);
        } else if (arg == "-s" || arg == "--serial") {
            args.serial = value(i, arg);
        } else if (arg == "-d" || arg == "--directory") {
            args.output_dir = value(i, arg);
        } else if (arg == "-n" || arg == "--workers") {
            if (auto v = value(i, arg); v && !parse_number(*v, args.workers)) {
                args.errors.push_back("invalid worker count: " + *v);
            }
        } else if (arg == "-k" || arg == "--chunk-size") {
            if (auto v = value(i, arg); v && !parse_number(*v, args.chunk_mib)) {
                args.errors.push_back("invalid chunk size: " + *v);
            }
        } else if (arg.size() > 1 && arg.starts_with('-')) {
            args.errors.push_back("unknown option: " + arg);
        } else {
            args.remote_paths.push_back(std::move(arg));
        }
    }

    return args;
}

std::expected<core::EngineConfig, std::error_code> build_config(const CliArgs& args) {
    core::EngineConfig config;
    if (!args.config_file.empty()) {
        auto loaded = core::EngineConfig::load(args.config_file);
        if (!loaded) {
            spdlog::error("Cannot load config {}: {}", args.config_file, loaded.error().message());
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (args.executor) {
        auto kind = core::parse_executor_kind(*args.executor);
        if (!kind) {
            spdlog::error("Unknown executor '{}'", *args.executor);
            return std::unexpected(kind.error());
        }
        config.executor = *kind;
    }
    if (args.base_url) config.base_url = *args.base_url;
    if (args.serial) config.adb_serial = *args.serial;
    if (args.output_dir) config.downloads_dir = *args.output_dir;
    if (args.workers > 0) config.worker_count = args.workers;
    if (args.chunk_mib > 0) config.chunk_size = args.chunk_mib * 1024 * 1024;
    if (args.verbose) config.log_level = "debug";

    if (auto ec = config.validate()) {
        spdlog::error("Invalid configuration: {}", ec.message());
        return std::unexpected(ec);
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(core::TransferService& service,
                   const std::vector<std::string>& remote_paths,
                   bool json,
                   bool quiet) {
    struct Running {
        std::string remote_path;
        std::string job_id;
        std::shared_ptr<core::ProgressSubscription> subscription;
    };

    std::vector<Running> running;
    int failures = 0;

    for (const auto& path : remote_paths) {
        auto started = service.start_remote(path);
        if (!started) {
            std::cerr << "Error: " << path << ": " << started.error().message() << std::endl;
            ++failures;
            continue;
        }
        auto sub = service.subscribe(started->job_id);
        if (!sub) {
            std::cerr << "Error: " << path << ": " << sub.error().message() << std::endl;
            ++failures;
            continue;
        }
        if (!quiet && !json) {
            std::cout << started->file_name << " (" << started->file_size_formatted << ")" << std::endl;
        }
        running.push_back({path, started->job_id, std::move(*sub)});
    }

    std::mutex out_mutex;
    std::mutex result_mutex;
    const bool inline_bars = running.size() == 1;

    {
        std::vector<std::jthread> watchers;
        watchers.reserve(running.size());

        for (auto& r : running) {
            watchers.emplace_back([&, job = &r] {
                const auto& path = job->remote_path;
                ProgressBar bar(std::cout, core::sanitize_file_name(path.substr(path.find_last_of('/') + 1)));
                bar.inline_mode(inline_bars);

                std::optional<core::ProgressSnapshot> last;
                while (auto snap = job->subscription->next()) {
                    last = snap;
                    std::lock_guard<std::mutex> lock(out_mutex);
                    if (json) {
                        nlohmann::json j = *snap;
                        std::cout << "data: " << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                              << "\n" << std::flush;
                    } else if (!quiet) {
                        bar.update(*snap);
                    }
                }

                const bool ok = last && last->status == core::TransferStatus::completed;
                {
                    std::lock_guard<std::mutex> lock(out_mutex);
                    if (!quiet && !json && last) {
                        bar.finish(*last);
                    }
                    if (!ok && !json) {
                        std::cerr << "Error: " << path << ": "
                                  << (last && last->error ? *last->error : std::string("transfer did not complete"))
                                  << std::endl;
                    }
                }
                if (!ok) {
                    std::lock_guard<std::mutex> lock(result_mutex);
                    ++failures;
                }
            });
        }
    } // Watchers joined here

    for (const auto& r : running) {
        if (auto file = service.fetch_completed_file(r.job_id)) {
            spdlog::info("Saved {} ({})", file->path.string(), core::format_bytes(file->size));
        }
    }

    return failures == 0 ? 0 : 1;
}

CliResult info(core::TransferService& service, const std::vector<std::string>& remote_paths) {
    int failures = 0;
    for (const auto& path : remote_paths) {
        auto size = service.executor().stat_size(path);
        if (!size) {
            std::cout << "Error: " << path << ": " << size.error().code.message();
            if (!size.error().detail.empty()) {
                std::cout << " (" << size.error().detail << ")";
            }
            std::cout << std::endl;
            ++failures;
            continue;
        }

        const auto chunk_size = service.config().chunk_size;
        std::cout << "Path: " << path << std::endl;
        std::cout << "Size: " << core::format_bytes(*size) << " (" << *size << " bytes)" << std::endl;
        std::cout << "Chunks: " << (*size + chunk_size - 1) / chunk_size
                  << " x " << core::format_bytes(chunk_size) << std::endl;
        std::cout << "Executor: " << service.executor().name() << std::endl;
    }
    return failures == 0 ? 0 : 1;
}

void print_help(std::string_view program_name) {
    std::cout << "Tandem " << program_name << " - parallel chunked file transfer\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <REMOTE-PATH>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -j, --json              Print progress as 'data: {json}' lines\n";
    std::cout << "  -c, --config <FILE>     Load settings from a JSON file\n";
    std::cout << "  -e, --executor <NAME>   Remote transport: adb (default) or curl\n";
    std::cout << "  -u, --base-url <URL>    URL prefix for remote paths (curl)\n";
    std::cout << "  -s, --serial <ID>       adb device serial\n";
    std::cout << "  -d, --directory <DIR>   Save into directory (default: downloads)\n";
    std::cout << "  -n, --workers <N>       Parallel range reads per file (default: 4)\n";
    std::cout << "  -k, --chunk-size <MiB>  Chunk size in MiB (default: 50)\n";
    std::cout << "  -i, --info              Show file size without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " /sdcard/DCIM/Camera/VID_0001.mp4\n";
    std::cout << "  " << program_name << " -n 8 -k 16 /sdcard/Download/a.zip /sdcard/Download/b.zip\n";
    std::cout << "  " << program_name << " -e curl -u https://example.com/files /large.iso\n";
}

void print_version() {
    std::cout << "Tandem " << tandem::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << "\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace tandem::cli
