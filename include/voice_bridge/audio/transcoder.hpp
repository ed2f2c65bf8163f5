#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voice_bridge {
namespace audio {

constexpr int kTelephonySampleRate = 8000;
constexpr int kModelInputSampleRate = 16000;
constexpr int kModelOutputSampleRate = 24000;
constexpr int kFrameDurationMs = 20;

// All functions are stateless: no resampler history carries over between calls.

uint8_t linear_to_mulaw(int16_t sample);
int16_t mulaw_to_linear(uint8_t encoded);

std::vector<int16_t> mulaw_decode(const std::string& encoded);
std::string mulaw_encode(const std::vector<int16_t>& samples);

// Little-endian signed 16-bit mono. A trailing odd byte is ignored.
std::vector<int16_t> pcm16_from_bytes(const std::string& bytes);
std::string pcm16_to_bytes(const std::vector<int16_t>& samples);

// Linear interpolation; output length is floor(n * out_rate / in_rate).
std::vector<int16_t> resample(const std::vector<int16_t>& samples, int in_rate, int out_rate);

std::vector<int16_t> mulaw8k_to_pcm16k(const std::string& mulaw);
std::string pcm16k_to_mulaw8k(const std::vector<int16_t>& pcm16k);
std::vector<int16_t> pcm16k_to_pcm24k(const std::vector<int16_t>& pcm16k);
std::vector<int16_t> pcm24k_to_pcm16k(const std::vector<int16_t>& pcm24k);

// Model audio at whatever rate it was tagged with, brought to 16kHz.
std::vector<int16_t> to_pcm16k(const std::vector<int16_t>& samples, int sample_rate);

size_t frame_samples(int sample_rate);

// Cuts into 20ms frames at sample_rate. A trailing partial frame is dropped.
std::vector<std::vector<int16_t>> split_frames(const std::vector<int16_t>& samples,
                                               int sample_rate);
// Same for mu-law, one byte per sample.
std::vector<std::string> split_mulaw_frames(const std::string& mulaw, int sample_rate);

}
}
