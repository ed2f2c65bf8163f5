#include "voice_bridge/vad/barge_in.hpp"

#include <stdexcept>

#include "voice_bridge/audio/transcoder.hpp"

namespace voice_bridge {
namespace vad {

BargeInController::BargeInController(std::unique_ptr<FrameClassifier> classifier)
    : classifier_(std::move(classifier)) {
    if (!classifier_) {
        throw std::invalid_argument("BargeInController requires a classifier");
    }
}

bool BargeInController::process_chunk(const std::vector<int16_t>& pcm16k) {
    bool speaking_now = false;
    for (const auto& frame : audio::split_frames(pcm16k, audio::kModelInputSampleRate)) {
        if (classifier_->is_speech(frame)) {
            speaking_now = true;
            break;
        }
    }

    if (!speaking_now) {
        state_ = BargeInState::Idle;
        return false;
    }
    if (state_ == BargeInState::Idle) {
        state_ = BargeInState::Speaking;
        return true;
    }
    return false;
}

}
}
