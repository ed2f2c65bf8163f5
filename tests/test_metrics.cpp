#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/metrics.hpp"

#include <string>

using voice_bridge::Metrics;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}

TEST_CASE("channel counters render with their label") {
    auto& metrics = Metrics::instance();
    metrics.session_started("telephony");
    metrics.session_started("telephony");
    metrics.session_ended("telephony");
    metrics.barge_in("telephony");
    metrics.transcript_line("caller");

    const auto text = metrics.render_prometheus();
    REQUIRE(contains(text, "# TYPE voice_sessions_started_total counter\n"));
    REQUIRE(contains(text, "voice_sessions_started_total{channel=\"telephony\"} 2\n"));
    REQUIRE(contains(text, "voice_sessions_ended_total{channel=\"telephony\"} 1\n"));
    REQUIRE(contains(text, "barge_in_total{channel=\"telephony\"} 1\n"));
    REQUIRE(contains(text, "transcript_lines_total{sender=\"caller\"} 1\n"));
    REQUIRE_FALSE(contains(text, "channel=\"browser\""));
}

TEST_CASE("webhook latency lands in cumulative buckets") {
    auto& metrics = Metrics::instance();
    metrics.increment_webhook_request();
    metrics.observe_webhook_latency(0.03);

    const auto text = metrics.render_prometheus();
    REQUIRE(contains(text, "webhook_requests_total 1\n"));
    REQUIRE(contains(text, "webhook_response_seconds_bucket{le=\"0.025000\"} 0\n"));
    REQUIRE(contains(text, "webhook_response_seconds_bucket{le=\"0.050000\"} 1\n"));
    REQUIRE(contains(text, "webhook_response_seconds_bucket{le=\"+Inf\"} 1\n"));
    REQUIRE(contains(text, "webhook_response_seconds_count 1\n"));
}
