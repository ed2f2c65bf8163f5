#include "voice_bridge/vad/classifier.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/vad/model.hpp"

namespace voice_bridge {
namespace vad {

namespace {

constexpr std::array<double, 4> kRmsThresholds{150.0, 250.0, 400.0, 650.0};
constexpr std::array<double, 4> kZeroCrossingCeilings{1.0, 0.5, 0.4, 0.3};
constexpr std::array<float, 4> kSileroThresholds{0.3f, 0.5f, 0.65f, 0.8f};

size_t level_index(int aggressiveness) {
    return static_cast<size_t>(std::clamp(aggressiveness, 0, 3));
}

}

EnergyFrameClassifier::EnergyFrameClassifier(int aggressiveness)
    : rms_threshold_(kRmsThresholds[level_index(aggressiveness)]),
      max_zero_crossing_rate_(kZeroCrossingCeilings[level_index(aggressiveness)]) {}

bool EnergyFrameClassifier::is_speech(const std::vector<int16_t>& frame) {
    if (frame.empty()) {
        return false;
    }
    double sum_squares = 0.0;
    size_t crossings = 0;
    for (size_t i = 0; i < frame.size(); ++i) {
        const double sample = frame[i];
        sum_squares += sample * sample;
        if (i > 0 && ((frame[i - 1] < 0) != (frame[i] < 0))) {
            ++crossings;
        }
    }
    const double rms = std::sqrt(sum_squares / static_cast<double>(frame.size()));
    if (rms < rms_threshold_) {
        return false;
    }
    const double zcr = static_cast<double>(crossings) / static_cast<double>(frame.size());
    return zcr <= max_zero_crossing_rate_;
}

SileroFrameClassifier::SileroFrameClassifier(std::shared_ptr<const SileroModel> model,
                                             int aggressiveness)
    : model_(std::move(model)),
      threshold_(kSileroThresholds[level_index(aggressiveness)]),
      context_(SileroModel::kWindowSamples, 0.0f),
      state_(model_->initial_state()) {}

bool SileroFrameClassifier::is_speech(const std::vector<int16_t>& frame) {
    if (frame.empty()) {
        return false;
    }
    const auto shift = std::min(frame.size(), context_.size());
    std::rotate(context_.begin(), context_.begin() + static_cast<std::ptrdiff_t>(shift),
                context_.end());
    const auto offset = frame.size() - shift;
    for (size_t i = 0; i < shift; ++i) {
        context_[context_.size() - shift + i] =
            static_cast<float>(frame[offset + i]) / 32768.0f;
    }
    return model_->speech_probability(context_, state_) > threshold_;
}

ClassifierFactory::ClassifierFactory(const Config& config) : config_(config) {
    if (config_.vad_backend == "silero") {
        try {
            silero_ = std::make_shared<const SileroModel>(config_.vad_model_path);
        } catch (const std::exception& ex) {
            throw ConfigurationError(std::string("Failed to load VAD model: ") + ex.what());
        }
        logging::info("Silero VAD model loaded", {kv("path", config_.vad_model_path)});
    }
}

std::unique_ptr<FrameClassifier> ClassifierFactory::create() {
    if (silero_) {
        return std::make_unique<SileroFrameClassifier>(silero_, config_.vad_aggressiveness);
    }
    return std::make_unique<EnergyFrameClassifier>(config_.vad_aggressiveness);
}

}
}
