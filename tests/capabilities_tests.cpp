// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include "fake_http_client.hpp"
#include <steady/core/capabilities.hpp>

using namespace steady::core;
using steady::test::FakeHttpClient;
using steady::test::bytes;

namespace {

HttpResponse response(std::map<std::string, std::string> headers, std::int32_t status = 200) {
    HttpResponse r;
    r.status_code = status;
    r.headers = std::move(headers);
    return r;
}

} // namespace

TEST_CASE("parse_capabilities - Content-Length", "[capabilities]") {
    CHECK(parse_capabilities(response({{"content-length", "3"}})).declared_content_length == 3u);
    CHECK(parse_capabilities(response({{"content-length", "5000000000"}})).declared_content_length == 5'000'000'000u);

    SECTION("Absent or unparsable means unknown") {
        CHECK(!parse_capabilities(response({})).declared_content_length);
        CHECK(!parse_capabilities(response({{"content-length", "abc"}})).declared_content_length);
        CHECK(!parse_capabilities(response({{"content-length", "-1"}})).declared_content_length);
        CHECK(!parse_capabilities(response({{"content-length", "12x"}})).declared_content_length);
        CHECK(!parse_capabilities(response({{"content-length", ""}})).declared_content_length);
    }
}

TEST_CASE("parse_capabilities - Accept-Ranges", "[capabilities]") {
    CHECK(parse_capabilities(response({{"accept-ranges", "bytes"}})).supports_range_requests);
    CHECK(parse_capabilities(response({{"accept-ranges", "Bytes"}})).supports_range_requests);
    CHECK(parse_capabilities(response({{"accept-ranges", "none, bytes"}})).supports_range_requests);

    CHECK(!parse_capabilities(response({{"accept-ranges", "none"}})).supports_range_requests);
    CHECK(!parse_capabilities(response({{"accept-ranges", "bytesx"}})).supports_range_requests);
    CHECK(!parse_capabilities(response({})).supports_range_requests);
}

TEST_CASE("parse_capabilities - Content-MD5", "[capabilities]") {
    SECTION("Valid digest is decoded") {
        auto caps = parse_capabilities(response({{"content-md5", "Uonfc331cyb83SJZevsfrA=="}}));
        REQUIRE(caps.declared_content_hash);
        CHECK(to_hex(*caps.declared_content_hash) == "5289df737df57326fcdd22597afb1fac");
    }

    SECTION("Short digest is kept so it fails verification") {
        auto caps = parse_capabilities(response({{"content-md5", "BAUG"}}));
        REQUIRE(caps.declared_content_hash);
        CHECK(*caps.declared_content_hash == Digest{4, 5, 6});
    }

    SECTION("Malformed base64 is ignored") {
        CHECK(!parse_capabilities(response({{"content-md5", "not base64!"}})).declared_content_hash);
        CHECK(!parse_capabilities(response({})).declared_content_hash);
    }
}

TEST_CASE("probe_capabilities", "[capabilities]") {
    FakeHttpClient client(bytes({1, 2, 3}));

    SECTION("200 yields capabilities") {
        auto caps = probe_capabilities(client, "http://x/f", {});
        REQUIRE(caps.has_value());
        CHECK(caps->http_status == 200);
        CHECK(caps->declared_content_length == 3u);
        CHECK(caps->supports_range_requests);
    }

    SECTION("Non-200 is rejected and the status reported") {
        client.status = 404;
        std::int32_t rejected = 0;
        auto caps = probe_capabilities(client, "http://x/f", {}, &rejected);
        REQUIRE(!caps.has_value());
        CHECK(caps.error() == DownloadErrc::probe_rejected);
        CHECK(rejected == 404);
    }

    SECTION("206 from a metadata request is still a rejection") {
        client.status = 206;
        CHECK(probe_capabilities(client, "http://x/f", {}).error() == DownloadErrc::probe_rejected);
    }

    SECTION("Transport errors pass through") {
        client.probe_errors = 1;
        CHECK(probe_capabilities(client, "http://x/f", {}).error() == DownloadErrc::network_error);
    }
}
