// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/cli/commands.hpp>
#include <steady/cli/progress_bar.hpp>
#include <steady/core/capabilities.hpp>
#include <steady/core/downloader.hpp>
#include <steady/core/hasher.hpp>
#include <steady/core/segment.hpp>
#include <steady/core/url.hpp>
#include <steady/version.hpp>
#include <iostream>

using namespace steady::core;

namespace steady::cli {

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto take_value = [&](int& i, std::string_view opt, std::string& out) {
        if (i + 1 < argc) {
            out = argv[++i];
        } else {
            args.errors.push_back(std::string(opt) + " requires a value");
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

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
            args.info = true;
        } else if (arg == "-o" || arg == "--output") {
            take_value(i, arg, args.output_file);
        } else if (arg == "-c" || arg == "--config") {
            take_value(i, arg, args.config_file);
        } else if (arg.starts_with("-")) {
            args.errors.push_back("unknown option " + std::string(arg));
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.errors.push_back("only one URL may be given");
        }
    }

    if (args.url.empty()) {
        args.errors.push_back("no URL specified");
    }
    return args;
}

std::expected<EngineConfig, std::error_code> resolve_config(const CliArgs& args) noexcept {
    if (args.config_file.empty()) {
        return EngineConfig{};
    }
    return EngineConfig::load(args.config_file);
}

//=============================================================================
// Commands
//=============================================================================

int download(HttpClient& client, const CliArgs& args, const EngineConfig& config,
             std::stop_token stoken) {
    auto url = Url::parse(args.url);
    if (!url || !url->is_http()) {
        std::cerr << "Error: invalid URL: " << args.url << std::endl;
        return EXIT_USAGE;
    }

    std::string output = args.output_file.empty() ? url->filename() : args.output_file;

    Downloader downloader(client, config);
    ProgressBar bar(std::cout, output);

    ProgressSink sink;
    if (!args.quiet) {
        sink = [&bar](const TransferProgress& p) {
            if (p.status_note) {
                bar.note(*p.status_note);
            }
            bar.update(p.bytes_transferred, p.total_bytes);
        };
    }

    auto result = downloader.download(url->str(), output, sink, stoken);

    if (!args.quiet) {
        if (result.ok()) bar.finish();
        else bar.clear();
    }

    switch (result.outcome) {
        case DownloadOutcome::success:
            if (!args.quiet) {
                std::cout << "Saved " << output << " ("
                          << ProgressBar::format_bytes(result.bytes_transferred) << ")";
                if (result.computed_hash) {
                    std::cout << " md5 " << to_hex(*result.computed_hash);
                }
                std::cout << std::endl;
            }
            return EXIT_OK;
        case DownloadOutcome::cancelled:
            std::cerr << "Download cancelled" << std::endl;
            return EXIT_FAILED;
        case DownloadOutcome::integrity_failure:
        case DownloadOutcome::transient_failure:
            std::cerr << "Error: download failed after " << result.attempts << " attempt(s): "
                      << result.error.message() << std::endl;
            return EXIT_FAILED;
    }
    return EXIT_FAILED;
}

int info(HttpClient& client, const std::string& url, std::stop_token stoken) {
    auto parsed = Url::parse(url);
    if (!parsed || !parsed->is_http()) {
        std::cerr << "Error: invalid URL: " << url << std::endl;
        return EXIT_USAGE;
    }

    auto response = client.probe(parsed->str(), stoken);
    if (!response) {
        std::cerr << "Error: " << response.error().message() << std::endl;
        return EXIT_FAILED;
    }

    auto caps = parse_capabilities(*response);

    std::cout << "URL: " << url << "\n";
    std::cout << "Host: " << parsed->host() << ":"
              << (parsed->port().empty() ? std::to_string(parsed->default_port()) : parsed->port())
              << (parsed->is_secure() ? " (TLS)" : "") << "\n";
    std::cout << "Status: " << caps.http_status << "\n";
    std::cout << "Content-Length: "
              << (caps.declared_content_length ? std::to_string(*caps.declared_content_length) : "unknown") << "\n";
    std::cout << "Accepts-Ranges: " << (caps.supports_range_requests ? "yes" : "no") << "\n";
    std::cout << "Content-MD5: "
              << (caps.declared_content_hash ? to_hex(*caps.declared_content_hash) : "none") << "\n";
    std::cout << "Strategy: " << to_string(select_strategy(caps)) << std::endl;

    return caps.http_status == 200 ? EXIT_OK : EXIT_FAILED;
}

void print_help(std::string_view program_name) {
    std::cout << "steady " << steady::version.to_string() << " - reliable single-file downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             No progress bar, errors only\n";
    std::cout << "  -o, --output <FILE>     Save to specified file\n";
    std::cout << "  -c, --config <FILE>     Read engine settings from a JSON file\n";
    std::cout << "  -i, --info              Show what the server declares without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o installer.msi https://example.com/latest.msi\n";
    std::cout << "  " << program_name << " -c steady.json https://example.com/large.iso\n";
}

void print_version() {
    std::cout << "steady " << steady::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, OpenSSL, spdlog, nlohmann/json\n";
}

} // namespace steady::cli
