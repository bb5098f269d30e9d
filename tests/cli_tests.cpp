// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include "fake_http_client.hpp"
#include <steady/cli/commands.hpp>
#include <steady/cli/progress_bar.hpp>
#include <steady/version.hpp>
#include <iostream>
#include <sstream>
#include <vector>

using namespace steady::cli;
using steady::test::FakeHttpClient;
using steady::test::TempDir;
using steady::test::bytes;
using steady::test::read_file;

namespace {

CliArgs parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    static std::string program = "steady";
    argv.push_back(program.data());
    for (auto& w : words) argv.push_back(w.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("URL with output and config") {
        auto args = parse({"-o", "out.bin", "--config", "steady.json", "-V", "https://example.com/f"});
        CHECK(args.errors.empty());
        CHECK(args.url == "https://example.com/f");
        CHECK(args.output_file == "out.bin");
        CHECK(args.config_file == "steady.json");
        CHECK(args.verbose);
        CHECK(!args.info);
    }

    SECTION("Help and version short-circuit") {
        CHECK(parse({"-h"}).help);
        CHECK(parse({"--version", "--bogus"}).version);
    }

    SECTION("Usage errors are collected") {
        CHECK(parse({}).errors.size() == 1);
        CHECK(!parse({"--bogus", "http://x/"}).errors.empty());
        CHECK(!parse({"http://x/a", "http://x/b"}).errors.empty());
        CHECK(!parse({"http://x/a", "-o"}).errors.empty());
    }
}

TEST_CASE("resolve_config", "[cli]") {
    CliArgs args;
    auto defaults = resolve_config(args);
    REQUIRE(defaults.has_value());
    CHECK(defaults->max_attempts == steady::core::DEFAULT_MAX_ATTEMPTS);

    args.config_file = "/nonexistent/steady.json";
    CHECK(!resolve_config(args).has_value());
}

TEST_CASE("download command", "[cli]") {
    TempDir dir;
    FakeHttpClient client(bytes({1, 2, 3}));
    auto args = parse({"-q", "-o", dir.file("f.bin"), "http://example.com/f"});
    steady::core::EngineConfig cfg;
    cfg.max_attempts = 1;

    SECTION("Success writes the file") {
        CHECK(download(client, args, cfg, {}) == EXIT_OK);
        CHECK(read_file(dir.file("f.bin")) == bytes({1, 2, 3}));
    }

    SECTION("Server failure is a failed exit") {
        client.status = 500;
        CHECK(download(client, args, cfg, {}) == EXIT_FAILED);
    }

    SECTION("Malformed URL is a usage error") {
        args.url = "not a url";
        CHECK(download(client, args, cfg, {}) == EXIT_USAGE);
        CHECK(client.probe_calls == 0);
    }
}

TEST_CASE("ProgressBar::format_bytes", "[cli]") {
    CHECK(ProgressBar::format_bytes(512) == "512 B");
    CHECK(ProgressBar::format_bytes(2048) == "2 KB");
    CHECK(ProgressBar::format_bytes(1536 * 1024) == "1.5 MB");
    CHECK(ProgressBar::format_bytes(3ull * 1024 * 1024 * 1024) == "3.00 GB");
}

TEST_CASE("ProgressBar rendering", "[cli]") {
    CHECK(ProgressBar::render_bar(0.0, 4) == "[>   ]");
    CHECK(ProgressBar::render_bar(0.5, 4) == "[==> ]");
    CHECK(ProgressBar::render_bar(1.0, 4) == "[====]");
    CHECK(ProgressBar::render_bar(7.0, 4) == "[====]");

    std::ostringstream out;
    ProgressBar bar(out, "file.bin");
    bar.update(50, 100);
    CHECK(out.str().find("file.bin") != std::string::npos);
    CHECK(out.str().find(" 50%") != std::string::npos);

    SECTION("Unchanged percent does not redraw") {
        auto before = out.str().size();
        bar.update(50, 100);
        CHECK(out.str().size() == before);
    }

    SECTION("Unknown total shows a counter") {
        bar.update(128 * 1024, std::nullopt);
        CHECK(out.str().find("128 KB received") != std::string::npos);
    }
}

TEST_CASE("User agent carries the version", "[cli]") {
    CHECK(steady::user_agent() == "steady/" + steady::version.to_string());
}

TEST_CASE("info command", "[cli]") {
    FakeHttpClient client(bytes({1, 2, 3}));

    std::ostringstream captured;
    auto* old = std::cout.rdbuf(captured.rdbuf());
    const int https_rc = info(client, "https://example.com/f", {});
    const int port_rc = info(client, "http://example.com:8080/f", {});
    const int bad_rc = info(client, "example.com/f", {});
    std::cout.rdbuf(old);

    CHECK(https_rc == EXIT_OK);
    CHECK(port_rc == EXIT_OK);
    CHECK(bad_rc == EXIT_USAGE);
    CHECK(client.probe_calls == 2);

    const auto text = captured.str();
    CHECK(text.find("Host: example.com:443 (TLS)") != std::string::npos);
    CHECK(text.find("Host: example.com:8080\n") != std::string::npos);
    CHECK(text.find("Strategy: chunked") != std::string::npos);
}
