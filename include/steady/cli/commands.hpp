// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/config.hpp>
#include <steady/core/http_client.hpp>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace steady::cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_file;
    std::string config_file;
    std::vector<std::string> errors;  // usage problems found while parsing
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Load -c FILE or fall back to built-in defaults
[[nodiscard]] std::expected<core::EngineConfig, std::error_code>
resolve_config(const CliArgs& args) noexcept;

// Download args.url; prints a progress bar unless quiet
[[nodiscard]] int download(core::HttpClient& client, const CliArgs& args,
                           const core::EngineConfig& config, std::stop_token stoken);

// Probe only and print what the server declares
[[nodiscard]] int info(core::HttpClient& client, const std::string& url, std::stop_token stoken);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace steady::cli
