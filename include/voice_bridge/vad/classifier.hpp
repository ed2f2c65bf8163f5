#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "voice_bridge/config.hpp"

namespace voice_bridge {
namespace vad {

class SileroModel;

// Classifies one 20ms 16kHz frame as speech or silence.
class FrameClassifier {
public:
    virtual ~FrameClassifier() = default;
    virtual bool is_speech(const std::vector<int16_t>& frame) = 0;
};

// RMS level gate plus a zero-crossing ceiling that rejects hiss. Higher
// aggressiveness raises the level gate and lowers the crossing ceiling.
class EnergyFrameClassifier : public FrameClassifier {
public:
    explicit EnergyFrameClassifier(int aggressiveness);

    bool is_speech(const std::vector<int16_t>& frame) override;

    double rms_threshold() const { return rms_threshold_; }

private:
    double rms_threshold_;
    double max_zero_crossing_rate_;
};

// Feeds the model a rolling window ending at the current frame, since the
// network wants 512 samples and a frame carries 320.
class SileroFrameClassifier : public FrameClassifier {
public:
    SileroFrameClassifier(std::shared_ptr<const SileroModel> model, int aggressiveness);

    bool is_speech(const std::vector<int16_t>& frame) override;

private:
    std::shared_ptr<const SileroModel> model_;
    float threshold_;
    std::vector<float> context_;
    std::vector<float> state_;
};

// Builds one classifier per connection. The Silero network is loaded once, when
// the factory is constructed, and shared by every classifier it creates.
class ClassifierFactory {
public:
    explicit ClassifierFactory(const Config& config);

    std::unique_ptr<FrameClassifier> create();

private:
    const Config& config_;
    std::shared_ptr<const SileroModel> silero_;
};

}
}
