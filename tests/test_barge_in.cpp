#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/config.hpp"
#include "voice_bridge/vad/barge_in.hpp"
#include "voice_bridge/vad/classifier.hpp"

#include <cmath>
#include <memory>
#include <vector>

namespace vad = voice_bridge::vad;

namespace {

std::vector<int16_t> voiced(size_t count, double amplitude = 8000.0) {
    std::vector<int16_t> samples(count);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = static_cast<int16_t>(
            std::lround(amplitude * std::sin(2.0 * 3.14159265358979 * 200.0 * i / 16000.0)));
    }
    return samples;
}

std::vector<int16_t> silence(size_t count) {
    return std::vector<int16_t>(count, 0);
}

vad::BargeInController make_controller(int aggressiveness = 2) {
    return vad::BargeInController(std::make_unique<vad::EnergyFrameClassifier>(aggressiveness));
}

}

TEST_CASE("energy classifier separates voiced frames from silence and hiss") {
    vad::EnergyFrameClassifier classifier(2);
    REQUIRE(classifier.is_speech(voiced(320)));
    REQUIRE_FALSE(classifier.is_speech(silence(320)));
    REQUIRE_FALSE(classifier.is_speech(voiced(320, 200.0)));

    std::vector<int16_t> hiss(320);
    for (size_t i = 0; i < hiss.size(); ++i) {
        hiss[i] = static_cast<int16_t>(i % 2 == 0 ? 3000 : -3000);
    }
    REQUIRE_FALSE(classifier.is_speech(hiss));
}

TEST_CASE("aggressiveness raises the level gate") {
    vad::EnergyFrameClassifier gentle(0);
    vad::EnergyFrameClassifier strict(3);
    REQUIRE(gentle.rms_threshold() < strict.rms_threshold());

    const auto quiet = voiced(320, 400.0);
    REQUIRE(gentle.is_speech(quiet));
    REQUIRE_FALSE(strict.is_speech(quiet));
}

TEST_CASE("barge-in fires once per idle to speaking transition") {
    auto controller = make_controller();
    REQUIRE(controller.state() == vad::BargeInState::Idle);

    const std::vector<std::vector<int16_t>> chunks{
        silence(320), voiced(320), voiced(320), silence(320), voiced(640), silence(320)};
    int clears = 0;
    for (const auto& chunk : chunks) {
        if (controller.process_chunk(chunk)) {
            ++clears;
        }
    }
    REQUIRE(clears == 2);
    REQUIRE(controller.state() == vad::BargeInState::Idle);
}

TEST_CASE("one speech frame anywhere in the chunk counts") {
    auto controller = make_controller();
    auto chunk = silence(960);
    const auto speech = voiced(320);
    std::copy(speech.begin(), speech.end(), chunk.begin() + 640);
    REQUIRE(controller.process_chunk(chunk));
    REQUIRE(controller.state() == vad::BargeInState::Speaking);
}

TEST_CASE("chunks shorter than a frame read as silence") {
    auto controller = make_controller();
    REQUIRE(controller.process_chunk(voiced(320)));
    REQUIRE_FALSE(controller.process_chunk(voiced(100)));
    REQUIRE(controller.state() == vad::BargeInState::Idle);
}

TEST_CASE("classifier factory defaults to the energy backend") {
    voice_bridge::Config config;
    config.vad_aggressiveness = 1;
    vad::ClassifierFactory factory(config);
    auto classifier = factory.create();
    REQUIRE(dynamic_cast<vad::EnergyFrameClassifier*>(classifier.get()) != nullptr);
}

TEST_CASE("controller requires a classifier") {
    REQUIRE_THROWS_AS(vad::BargeInController(nullptr), std::invalid_argument);
}
