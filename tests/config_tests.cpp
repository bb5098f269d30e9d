// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include "fake_http_client.hpp"
#include <steady/core/config.hpp>
#include <steady/disk/error.hpp>
#include <fstream>

using namespace steady::core;
using steady::test::TempDir;

TEST_CASE("EngineConfig defaults", "[config]") {
    EngineConfig cfg;
    CHECK(cfg.buffer_size == 8 * 1024);
    CHECK(cfg.chunk_size == 1024 * 1024);
    CHECK(cfg.max_attempts == 4);
    CHECK(cfg.retry_base_delay == std::chrono::milliseconds{500});
    CHECK(cfg.remove_partial_on_cancel);
    CHECK(cfg.verify_tls);
    CHECK(!cfg.validate());
}

TEST_CASE("EngineConfig::validate", "[config]") {
    EngineConfig cfg;

    SECTION("Zero sizes") {
        cfg.buffer_size = 0;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }
    SECTION("Zero chunk") {
        cfg.chunk_size = 0;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }
    SECTION("Zero attempts") {
        cfg.max_attempts = 0;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }
    SECTION("Max delay below base delay") {
        cfg.retry_max_delay = std::chrono::milliseconds{100};
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("EngineConfig::from_json", "[config]") {
    SECTION("Missing keys keep defaults") {
        auto cfg = EngineConfig::from_json(R"({"chunk_size": 4096, "max_attempts": 2,
                                               "retry_base_delay_ms": 10, "retry_max_delay_ms": 40,
                                               "remove_partial_on_cancel": false, "verify_tls": false})");
        REQUIRE(cfg.has_value());
        CHECK(cfg->chunk_size == 4096);
        CHECK(cfg->max_attempts == 2);
        CHECK(cfg->retry_base_delay == std::chrono::milliseconds{10});
        CHECK(cfg->retry_max_delay == std::chrono::milliseconds{40});
        CHECK(!cfg->remove_partial_on_cancel);
        CHECK(!cfg->verify_tls);
        CHECK(cfg->buffer_size == DEFAULT_BUFFER_SIZE);
    }

    SECTION("Empty object is the default config") {
        auto cfg = EngineConfig::from_json("{}");
        REQUIRE(cfg.has_value());
        CHECK(cfg->max_attempts == DEFAULT_MAX_ATTEMPTS);
    }

    SECTION("Rejected documents") {
        CHECK(EngineConfig::from_json("not json").error() == DownloadErrc::invalid_config);
        CHECK(EngineConfig::from_json("[1, 2]").error() == DownloadErrc::invalid_config);
        CHECK(EngineConfig::from_json(R"({"chunk_size": "big"})").error() == DownloadErrc::invalid_config);
        CHECK(EngineConfig::from_json(R"({"buffer_size": 0})").error() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("EngineConfig::load", "[config]") {
    TempDir dir;

    SECTION("Reads a file") {
        auto path = dir.file("steady.json");
        std::ofstream(path) << R"({"max_attempts": 7})";
        auto cfg = EngineConfig::load(path);
        REQUIRE(cfg.has_value());
        CHECK(cfg->max_attempts == 7);
    }

    SECTION("Missing file") {
        CHECK(EngineConfig::load(dir.file("absent.json")).error() == steady::disk::DiskErrc::open_failed);
    }
}
