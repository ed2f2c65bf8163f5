#include "voice_bridge/vad/model.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

#include <onnxruntime_cxx_api.h>

namespace voice_bridge {
namespace vad {

namespace {

constexpr size_t kStateSize = 2 * 1 * 128;

Ort::Env& ort_env() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "voice_bridge_vad");
    return env;
}

std::vector<std::string> node_names(const Ort::Session& session, bool inputs) {
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = inputs ? session.GetInputCount() : session.GetOutputCount();
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto name = inputs ? session.GetInputNameAllocated(i, allocator)
                           : session.GetOutputNameAllocated(i, allocator);
        names.emplace_back(name ? name.get() : "");
    }
    return names;
}

bool has_name(const std::vector<std::string>& names, const std::string& needle) {
    return std::find(names.begin(), names.end(), needle) != names.end();
}

Ort::SessionOptions session_options() {
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(1);
    options.SetInterOpNumThreads(1);
    return options;
}

}

struct SileroModel::Impl {
    Ort::Session session;
    bool has_sr;
    bool has_state;
    bool has_state_out;

    explicit Impl(const std::filesystem::path& model_path)
        : session(ort_env(), model_path.string().c_str(), session_options()) {
        const auto inputs = node_names(session, true);
        const auto outputs = node_names(session, false);
        if (!has_name(inputs, "input")) {
            throw std::runtime_error("VAD model missing input node 'input'");
        }
        if (!has_name(outputs, "output")) {
            throw std::runtime_error("VAD model missing output node 'output'");
        }
        has_sr = has_name(inputs, "sr");
        has_state = has_name(inputs, "state");
        has_state_out = has_name(outputs, "stateN");
    }
};

SileroModel::SileroModel(const std::filesystem::path& model_path)
    : impl_(std::make_unique<Impl>(model_path)) {}

SileroModel::~SileroModel() = default;

std::vector<float> SileroModel::initial_state() const {
    return std::vector<float>(kStateSize, 0.0f);
}

float SileroModel::speech_probability(const std::vector<float>& window,
                                      std::vector<float>& state) const {
    if (window.empty()) {
        return 0.0f;
    }
    if (state.size() != kStateSize) {
        state = initial_state();
    }

    Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(
        OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<Ort::Value> inputs;
    std::vector<const char*> input_names;

    std::array<int64_t, 2> input_shape{1, static_cast<int64_t>(window.size())};
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(window.data()), window.size(),
        input_shape.data(), input_shape.size()));
    input_names.push_back("input");

    std::array<int64_t, 1> sr_shape{1};
    std::array<int64_t, 1> sr_value{kSampleRate};
    if (impl_->has_sr) {
        inputs.emplace_back(Ort::Value::CreateTensor<int64_t>(
            mem_info, sr_value.data(), sr_value.size(), sr_shape.data(), sr_shape.size()));
        input_names.push_back("sr");
    }

    std::array<int64_t, 3> state_shape{2, 1, 128};
    if (impl_->has_state) {
        inputs.emplace_back(Ort::Value::CreateTensor<float>(
            mem_info, state.data(), state.size(), state_shape.data(), state_shape.size()));
        input_names.push_back("state");
    }

    std::vector<const char*> output_names{"output"};
    if (impl_->has_state_out) {
        output_names.push_back("stateN");
    }

    auto outputs = impl_->session.Run(
        Ort::RunOptions{nullptr},
        input_names.data(), inputs.data(), inputs.size(),
        output_names.data(), output_names.size());

    float prob = 0.0f;
    if (!outputs.empty() && outputs[0].IsTensor()) {
        const auto* data = outputs[0].GetTensorData<float>();
        prob = data ? data[0] : 0.0f;
    }
    if (impl_->has_state_out && outputs.size() > 1 && outputs[1].IsTensor()) {
        const auto* data = outputs[1].GetTensorData<float>();
        const auto count = outputs[1].GetTensorTypeAndShapeInfo().GetElementCount();
        if (data && count == kStateSize) {
            state.assign(data, data + count);
        }
    }
    return prob;
}

}
}
