// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/cli/progress_bar.hpp>
#include <ferry/core/download_engine.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/http_session.hpp>
#include <ferry/core/remote_object.hpp>
#include <ferry/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace ferry::core;

namespace chrono = std::chrono;

namespace ferry::cli {

volatile std::sig_atomic_t stop_requested = 0;

namespace {

template<typename T>
std::optional<T> parse_number(std::string_view s) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

void handle_signal(int) {
    stop_requested = 1;
}

HttpOptions http_options(const TransferConfig& config) {
    HttpOptions opts;
    opts.connect_timeout = config.connect_timeout;
    opts.stall_timeout = chrono::seconds{STALL_TIMEOUT_SEC};
    opts.bearer_token = config.bearer_token;
    opts.headers = config.headers;
    return opts;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto fail = [&args](std::string message) {
        if (args.error.empty()) args.error = std::move(message);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) return std::string(argv[++i]);
            fail("option " + arg + " requires a value");
            return std::nullopt;
        };
        auto number = [&]<typename T>(std::optional<T>& out) {
            if (auto v = value()) {
                out = parse_number<T>(*v);
                if (!out) fail("invalid number for " + arg + ": " + *v);
            }
        };

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
        } else if (arg == "-i" || arg == "--info") {
            args.list_only = true;
        } else if (arg == "--clean") {
            args.clean = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value()) args.output_file = *v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value()) args.output_dir = *v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value()) args.config_file = *v;
        } else if (arg == "--token") {
            if (auto v = value()) args.token = *v;
        } else if (arg == "--url-template") {
            if (auto v = value()) args.url_template = *v;
        } else if (arg == "-H" || arg == "--header") {
            if (auto v = value()) {
                auto colon = v->find(':');
                if (colon == std::string::npos || colon == 0) {
                    fail("header must look like 'Name: value': " + *v);
                } else {
                    std::string_view sv(*v);
                    args.headers.emplace_back(std::string(trim(sv.substr(0, colon))),
                                              std::string(trim(sv.substr(colon + 1))));
                }
            }
        } else if (arg == "-n" || arg == "--workers") {
            number(args.workers);
        } else if (arg == "-s" || arg == "--segment-size") {
            number(args.segment_mb);
        } else if (arg == "-r" || arg == "--retries") {
            number(args.retries);
        } else if (arg == "-t" || arg == "--timeout") {
            number(args.timeout_sec);
        } else if (arg == "--memory-threshold") {
            number(args.memory_threshold_mb);
        } else if (arg.size() > 1 && arg.front() == '-') {
            fail("unknown option: " + arg);
        } else {
            // Object id or URL
            args.ids.push_back(arg);
        }
    }

    return args;
}

std::expected<TransferConfig, std::error_code>
build_config(const CliArgs& args) noexcept {
    try {
        TransferConfig config;
        if (!args.config_file.empty()) {
            auto loaded = load_config(args.config_file);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            config = std::move(*loaded);
        }

        if (const char* env = std::getenv(ENV_TOKEN.data()); env && *env) {
            config.bearer_token = env;
        }

        if (!args.output_dir.empty()) config.output_dir = args.output_dir;
        if (args.workers) config.workers = *args.workers;
        if (args.segment_mb) {
            auto bytes = to_bytes(*args.segment_mb, MIB);
            if (!bytes) return std::unexpected(bytes.error());
            config.segment_size = *bytes;
        }
        if (args.retries) config.max_retries = *args.retries;
        if (args.timeout_sec) config.request_timeout = chrono::seconds{*args.timeout_sec};
        if (args.memory_threshold_mb) {
            auto bytes = to_bytes(*args.memory_threshold_mb, MIB);
            if (!bytes) return std::unexpected(bytes.error());
            config.memory_threshold = *bytes;
        }
        if (args.token) config.bearer_token = *args.token;
        if (args.url_template) config.url_template = *args.url_template;
        for (const auto& [name, value] : args.headers) {
            config.headers[name] = value;
        }
        if (args.clean) config.keep_parts_on_failure = false;

        if (auto ec = config.validate()) {
            return std::unexpected(ec);
        }
        return config;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

void configure_logging(const TransferConfig& config, bool verbose, bool quiet) noexcept {
    auto level = spdlog::level::from_str(config.log_level);
    if (verbose) {
        level = spdlog::level::debug;
    } else if (quiet) {
        level = std::max(level, spdlog::level::err);
    }
    spdlog::set_level(level);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}

void install_signal_handlers() noexcept {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const std::string& id,
                   const std::string& output,
                   const TransferConfig& config,
                   bool quiet) noexcept {
    try {
        HttpSession::global_init();

        HttpSession session(http_options(config));
        HttpCatalog catalog(session, config.url_template);
        DownloadEngine engine(catalog, session, config);

        if (!output.empty()) {
            engine.output_path(output);
        }

        ProgressBar bar("Downloading");
        if (!quiet) {
            engine.callback([&bar](const ProgressSample& s) { bar.update(s); });
        }

        // Poll for Ctrl-C while the engine runs on this thread
        std::jthread watcher([&engine](std::stop_token st) {
            while (!st.stop_requested()) {
                if (stop_requested) {
                    engine.cancel();
                    return;
                }
                std::this_thread::sleep_for(chrono::milliseconds(100));
            }
        });

        auto result = engine.run(id);
        watcher.request_stop();

        HttpSession::global_cleanup();

        if (!result) {
            if (!quiet) bar.clear();
            auto ec = result.error();
            if (ec == DownloadErrc::cancelled) {
                std::cout << "Download cancelled" << std::endl;
            } else {
                std::cerr << "Error: " << to_string(error_class(ec)) << ": " << ec.message() << std::endl;
            }
            return std::unexpected(ec);
        }

        if (!quiet) {
            bar.finish();
            std::cout << "Saved " << result->path.string() << " (" << result->size << " bytes";
            if (result->resumed_segments > 0) {
                std::cout << ", " << result->resumed_segments << "/" << result->segments << " parts resumed";
            }
            std::cout << ")" << std::endl;
        }
        return 0;
    } catch (const std::system_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(e.code());
    }
}

CliResult info(const std::string& id, const TransferConfig& config) noexcept {
    HttpSession::global_init();

    HttpSession session(http_options(config));
    HttpCatalog catalog(session, config.url_template);
    auto object = catalog.resolve(id);

    HttpSession::global_cleanup();

    if (!object) {
        std::cerr << "Error: " << object.error().message() << std::endl;
        return std::unexpected(object.error());
    }

    std::cout << "ID: " << object->id << std::endl;
    std::cout << "URL: " << object->url << std::endl;
    std::cout << "Name: " << object->name << std::endl;
    std::cout << "Size: " << object->total_size << std::endl;
    std::cout << "Accepts-Ranges: " << (object->supports_ranges ? "yes" : "no") << std::endl;

    if (auto plan = plan_segments(static_cast<std::int64_t>(object->total_size),
                                  static_cast<std::int64_t>(config.segment_size),
                                  config.workers)) {
        std::cout << "Segments: " << plan->segments.size()
                  << " x " << config.segment_size / MIB << " MB, "
                  << plan->workers << " workers" << std::endl;
    }

    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Ferry " << ferry::version.to_string() << " - segmented, resumable downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL-or-ID>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version information\n";
    std::cout << "  -V, --verbose             Enable debug logging\n";
    std::cout << "  -q, --quiet               Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>       Save to specified file\n";
    std::cout << "  -d, --directory <DIR>     Save to specified directory (default: downloads)\n";
    std::cout << "  -n, --workers <N>         Parallel connections (default: 8)\n";
    std::cout << "  -s, --segment-size <MB>   Part size in MB (default: 64)\n";
    std::cout << "  -r, --retries <N>         Retries per part (default: 3)\n";
    std::cout << "  -t, --timeout <SEC>       Per-request timeout (default: 300)\n";
    std::cout << "  -c, --config <FILE>       JSON configuration file\n";
    std::cout << "      --token <TOKEN>       Bearer token (or set " << ENV_TOKEN << ")\n";
    std::cout << "  -H, --header <K: V>       Extra request header (repeatable)\n";
    std::cout << "      --url-template <T>    Map IDs to URLs, e.g. https://host/files/{id}\n";
    std::cout << "      --memory-threshold <MB>  Stage objects up to this size in memory\n";
    std::cout << "      --clean               Delete partial parts if the download fails\n";
    std::cout << "  -i, --info                Show object info without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o myfile.zip https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -n 16 -s 32 https://example.com/large.iso\n";
    std::cout << "  " << program_name << " --url-template 'https://api.example.com/v1/files/{id}?alt=media' 1AbC\n";
    std::cout << "\n";
    std::cout << "Interrupted downloads resume from the parts directory next to the output file.\n";
}

void print_version() noexcept {
    std::cout << "Ferry " << ferry::version.to_string() << " (built " << ferry::BUILD_DATE << ")" << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace ferry::cli
