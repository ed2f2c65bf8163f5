#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "voice_bridge/vad/classifier.hpp"

namespace voice_bridge {
namespace vad {

enum class BargeInState {
    Idle,
    Speaking
};

class BargeInController {
public:
    explicit BargeInController(std::unique_ptr<FrameClassifier> classifier);

    // Classifies the chunk in 20ms frames. Returns true only on the
    // Idle -> Speaking transition; the caller must clear playback then.
    bool process_chunk(const std::vector<int16_t>& pcm16k);

    BargeInState state() const { return state_; }

private:
    std::unique_ptr<FrameClassifier> classifier_;
    BargeInState state_ = BargeInState::Idle;
};

}
}
