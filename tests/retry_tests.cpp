// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <steady/core/retry.hpp>
#include <thread>

using namespace steady::core;
using namespace std::chrono_literals;

namespace {

DownloadResult failed(DownloadErrc errc, std::int32_t status = 0) {
    DownloadResult r;
    r.outcome = DownloadOutcome::transient_failure;
    r.error = make_error_code(errc);
    r.http_status = status;
    return r;
}

DownloadResult corrupt(Digest digest) {
    DownloadResult r;
    r.outcome = DownloadOutcome::integrity_failure;
    r.error = make_error_code(DownloadErrc::checksum_mismatch);
    r.computed_hash = std::move(digest);
    return r;
}

DownloadResult succeeded() {
    DownloadResult r;
    r.outcome = DownloadOutcome::success;
    return r;
}

RetryPolicy no_wait(std::uint32_t attempts) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.backoff = [](std::uint32_t) { return 0ms; };
    policy.should_retry = default_retry_predicate();
    return policy;
}

} // namespace

TEST_CASE("exponential_backoff", "[retry]") {
    auto backoff = exponential_backoff(500ms, 8000ms);
    CHECK(backoff(0) == 0ms);
    CHECK(backoff(1) == 500ms);
    CHECK(backoff(2) == 1000ms);
    CHECK(backoff(3) == 2000ms);
    CHECK(backoff(5) == 8000ms);
    CHECK(backoff(40) == 8000ms);

    CHECK(exponential_backoff(0ms, 0ms)(3) == 0ms);
}

TEST_CASE("default_retry_predicate", "[retry]") {
    auto retry = default_retry_predicate();

    SECTION("Terminal outcomes stop") {
        CHECK(!retry(succeeded()));
        DownloadResult cancelled;
        cancelled.outcome = DownloadOutcome::cancelled;
        CHECK(!retry(cancelled));
    }

    SECTION("Transport failures retry") {
        CHECK(retry(failed(DownloadErrc::network_error)));
        CHECK(retry(failed(DownloadErrc::network_error)));
        CHECK(retry(failed(DownloadErrc::timeout)));
    }

    SECTION("Bad input never retries") {
        CHECK(!retry(failed(DownloadErrc::invalid_url)));
        CHECK(!retry(failed(DownloadErrc::invalid_config)));
    }

    SECTION("Same rejected status twice stops") {
        CHECK(retry(failed(DownloadErrc::probe_rejected, 404)));
        CHECK(!retry(failed(DownloadErrc::probe_rejected, 404)));
    }

    SECTION("A different rejection in between resets the streak") {
        CHECK(retry(failed(DownloadErrc::probe_rejected, 503)));
        CHECK(retry(failed(DownloadErrc::network_error)));
        CHECK(retry(failed(DownloadErrc::probe_rejected, 503)));
    }

    SECTION("Same corrupt digest twice stops") {
        CHECK(retry(corrupt({1, 2})));
        CHECK(retry(corrupt({3, 4})));
        CHECK(!retry(corrupt({3, 4})));
    }
}

TEST_CASE("run_with_retry", "[retry]") {
    SECTION("Success on the first attempt") {
        int calls = 0;
        auto r = run_with_retry(no_wait(4), [&](std::uint32_t) { ++calls; return succeeded(); }, {});
        CHECK(r.ok());
        CHECK(r.attempts == 1);
        CHECK(calls == 1);
    }

    SECTION("Recovers after transient failures") {
        auto r = run_with_retry(no_wait(4), [](std::uint32_t n) {
            return n < 3 ? failed(DownloadErrc::network_error) : succeeded();
        }, {});
        CHECK(r.ok());
        CHECK(r.attempts == 3);
    }

    SECTION("Gives up after max_attempts with the last error") {
        std::vector<std::uint32_t> seen;
        auto r = run_with_retry(no_wait(3), [&](std::uint32_t n) {
            seen.push_back(n);
            return failed(DownloadErrc::server_error);
        }, {});
        CHECK(r.outcome == DownloadOutcome::transient_failure);
        CHECK(r.error == DownloadErrc::server_error);
        CHECK(r.attempts == 3);
        CHECK(seen == std::vector<std::uint32_t>{1, 2, 3});
    }

    SECTION("Backoff is asked with the count of failures so far") {
        std::vector<std::uint32_t> asked;
        RetryPolicy policy = no_wait(3);
        policy.backoff = [&](std::uint32_t n) { asked.push_back(n); return 0ms; };
        (void)run_with_retry(policy, [](std::uint32_t) { return failed(DownloadErrc::timeout); }, {});
        CHECK(asked == std::vector<std::uint32_t>{1, 2});
    }

    SECTION("Predicate veto ends early") {
        auto r = run_with_retry(no_wait(5), [](std::uint32_t) {
            return failed(DownloadErrc::probe_rejected, 404);
        }, {});
        CHECK(r.attempts == 2);
        CHECK(r.http_status == 404);
    }

    SECTION("Cancellation during backoff") {
        std::stop_source stop;
        RetryPolicy policy = no_wait(4);
        policy.backoff = [](std::uint32_t) { return 10s; };

        std::jthread canceller([&] {
            std::this_thread::sleep_for(20ms);
            stop.request_stop();
        });

        auto started = std::chrono::steady_clock::now();
        auto r = run_with_retry(policy, [](std::uint32_t) { return failed(DownloadErrc::network_error); },
                                stop.get_token());
        CHECK(r.outcome == DownloadOutcome::cancelled);
        CHECK(r.error == DownloadErrc::cancelled);
        CHECK(r.attempts == 1);
        CHECK(std::chrono::steady_clock::now() - started < 5s);
    }
}

TEST_CASE("interruptible_sleep", "[retry]") {
    CHECK(interruptible_sleep(0ms, {}));
    CHECK(interruptible_sleep(1ms, {}));

    std::stop_source stop;
    stop.request_stop();
    CHECK(!interruptible_sleep(10s, stop.get_token()));
}
