#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/bridge/duplex.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/utils/blocking_queue.hpp"

#include <atomic>
#include <string>

using voice_bridge::bridge::run_duplex;
using voice_bridge::utils::BlockingQueue;

TEST_CASE("first loop to finish cancels the other") {
    BlockingQueue<int> outbound_events;
    std::atomic<int> cancels{0};
    std::atomic<bool> outbound_done{false};

    run_duplex([]() {},
               [&]() {
                   while (outbound_events.pop()) {
                   }
                   outbound_done = true;
               },
               [&]() {
                   ++cancels;
                   outbound_events.cancel();
               });

    REQUIRE(cancels == 1);
    REQUIRE(outbound_done);
}

TEST_CASE("error of the first loop is rethrown after both join") {
    BlockingQueue<int> inbound_frames;
    std::atomic<bool> inbound_done{false};

    REQUIRE_THROWS_AS(
        run_duplex(
            [&]() {
                while (inbound_frames.pop()) {
                }
                inbound_done = true;
            },
            []() { throw voice_bridge::AIServiceError("upstream closed"); },
            [&]() { inbound_frames.cancel(); }),
        voice_bridge::AIServiceError);
    REQUIRE(inbound_done);
}

TEST_CASE("error raised while cancelling does not replace the first outcome") {
    BlockingQueue<int> frames;
    REQUIRE_NOTHROW(run_duplex(
        []() {},
        [&]() {
            while (frames.pop()) {
            }
            throw voice_bridge::TransportError("interrupted");
        },
        [&]() { frames.cancel(); }));
}
