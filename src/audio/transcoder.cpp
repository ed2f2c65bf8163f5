#include "voice_bridge/audio/transcoder.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace voice_bridge::audio {

namespace {

constexpr int kMulawBias = 0x84;
constexpr int kMulawClip = 32635;

}

uint8_t linear_to_mulaw(int16_t sample) {
    int value = sample;
    const int sign = value < 0 ? 0x80 : 0x00;
    if (value < 0) {
        value = -value;
    }
    value = std::min(value, kMulawClip) + kMulawBias;

    int exponent = 7;
    for (int mask = 0x4000; (value & mask) == 0 && exponent > 0; mask >>= 1) {
        --exponent;
    }
    const int mantissa = (value >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

int16_t mulaw_to_linear(uint8_t encoded) {
    const int value = static_cast<uint8_t>(~encoded);
    const int sign = value & 0x80;
    const int exponent = (value >> 4) & 0x07;
    const int mantissa = value & 0x0F;
    const int magnitude = (((mantissa << 3) + kMulawBias) << exponent) - kMulawBias;
    return static_cast<int16_t>(sign ? -magnitude : magnitude);
}

std::vector<int16_t> mulaw_decode(const std::string& encoded) {
    std::vector<int16_t> samples;
    samples.reserve(encoded.size());
    for (unsigned char byte : encoded) {
        samples.push_back(mulaw_to_linear(byte));
    }
    return samples;
}

std::string mulaw_encode(const std::vector<int16_t>& samples) {
    std::string encoded;
    encoded.reserve(samples.size());
    for (auto sample : samples) {
        encoded.push_back(static_cast<char>(linear_to_mulaw(sample)));
    }
    return encoded;
}

std::vector<int16_t> pcm16_from_bytes(const std::string& bytes) {
    std::vector<int16_t> samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto low = static_cast<uint8_t>(bytes[2 * i]);
        const auto high = static_cast<uint8_t>(bytes[2 * i + 1]);
        samples[i] = static_cast<int16_t>(static_cast<uint16_t>(low | (high << 8)));
    }
    return samples;
}

std::string pcm16_to_bytes(const std::vector<int16_t>& samples) {
    std::string bytes(samples.size() * 2, '\0');
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto value = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<char>(value & 0xFF);
        bytes[2 * i + 1] = static_cast<char>((value >> 8) & 0xFF);
    }
    return bytes;
}

std::vector<int16_t> resample(const std::vector<int16_t>& samples, int in_rate, int out_rate) {
    if (in_rate <= 0 || out_rate <= 0) {
        throw std::invalid_argument("sample rates must be positive");
    }
    if (in_rate == out_rate || samples.empty()) {
        return samples;
    }
    const auto out_count = static_cast<size_t>(
        static_cast<uint64_t>(samples.size()) * static_cast<uint64_t>(out_rate) /
        static_cast<uint64_t>(in_rate));
    std::vector<int16_t> output(out_count);
    const double step = static_cast<double>(in_rate) / static_cast<double>(out_rate);
    const size_t last = samples.size() - 1;
    for (size_t i = 0; i < out_count; ++i) {
        const double position = static_cast<double>(i) * step;
        const auto index = std::min(static_cast<size_t>(position), last);
        const auto next = std::min(index + 1, last);
        const double frac = position - static_cast<double>(index);
        const double value = samples[index] * (1.0 - frac) + samples[next] * frac;
        output[i] = static_cast<int16_t>(std::clamp(std::lround(value), -32768L, 32767L));
    }
    return output;
}

std::vector<int16_t> mulaw8k_to_pcm16k(const std::string& mulaw) {
    return resample(mulaw_decode(mulaw), kTelephonySampleRate, kModelInputSampleRate);
}

std::string pcm16k_to_mulaw8k(const std::vector<int16_t>& pcm16k) {
    return mulaw_encode(resample(pcm16k, kModelInputSampleRate, kTelephonySampleRate));
}

std::vector<int16_t> pcm16k_to_pcm24k(const std::vector<int16_t>& pcm16k) {
    return resample(pcm16k, kModelInputSampleRate, kModelOutputSampleRate);
}

std::vector<int16_t> pcm24k_to_pcm16k(const std::vector<int16_t>& pcm24k) {
    return resample(pcm24k, kModelOutputSampleRate, kModelInputSampleRate);
}

std::vector<int16_t> to_pcm16k(const std::vector<int16_t>& samples, int sample_rate) {
    if (sample_rate == kModelOutputSampleRate) {
        return pcm24k_to_pcm16k(samples);
    }
    return resample(samples, sample_rate, kModelInputSampleRate);
}

size_t frame_samples(int sample_rate) {
    return static_cast<size_t>(sample_rate) * kFrameDurationMs / 1000;
}

std::vector<std::vector<int16_t>> split_frames(const std::vector<int16_t>& samples,
                                               int sample_rate) {
    const auto step = frame_samples(sample_rate);
    std::vector<std::vector<int16_t>> frames;
    if (step == 0) {
        return frames;
    }
    frames.reserve(samples.size() / step);
    for (size_t offset = 0; offset + step <= samples.size(); offset += step) {
        frames.emplace_back(samples.begin() + static_cast<std::ptrdiff_t>(offset),
                            samples.begin() + static_cast<std::ptrdiff_t>(offset + step));
    }
    return frames;
}

std::vector<std::string> split_mulaw_frames(const std::string& mulaw, int sample_rate) {
    const auto step = frame_samples(sample_rate);
    std::vector<std::string> frames;
    if (step == 0) {
        return frames;
    }
    frames.reserve(mulaw.size() / step);
    for (size_t offset = 0; offset + step <= mulaw.size(); offset += step) {
        frames.push_back(mulaw.substr(offset, step));
    }
    return frames;
}

}
