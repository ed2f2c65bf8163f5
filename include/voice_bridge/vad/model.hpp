#pragma once

#include <filesystem>
#include <memory>
#include <vector>

namespace voice_bridge {
namespace vad {

// Silero VAD network loaded once per process. The recurrent state lives with
// the caller so one model serves every connection.
class SileroModel {
public:
    static constexpr int kSampleRate = 16000;
    static constexpr size_t kWindowSamples = 512;

    explicit SileroModel(const std::filesystem::path& model_path);
    ~SileroModel();

    std::vector<float> initial_state() const;
    float speech_probability(const std::vector<float>& window,
                             std::vector<float>& state) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
