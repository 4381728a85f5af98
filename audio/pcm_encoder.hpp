#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// Turns captured float buffers into the recognizer's wire format:
// mono, target rate, signed 16-bit little-endian.
namespace Audio {

std::vector<float> downmixToMono(const float* interleaved, size_t frameCount, int channels);

// Linear interpolation. Output length = round(in.size() * toRate / fromRate).
std::vector<float> resampleLinear(const std::vector<float>& in, int fromRate, int toRate);

// Clamp to [-1,1]; negatives scale by 0x8000, positives by 0x7FFF
std::vector<int16_t> floatToPcm16(const std::vector<float>& samples);

std::string packLittleEndian(const std::vector<int16_t>& samples);

class PcmEncoder {
public:
    PcmEncoder(int captureRate, int targetRate);

    // Float samples at the target rate, mono (used by the local recognizer)
    std::vector<float> toMono(const float* interleaved, size_t frameCount, int channels) const;

    // Binary frame ready to send
    std::string encode(const float* interleaved, size_t frameCount, int channels) const;

    int captureRate() const { return captureRate_; }
    int targetRate() const { return targetRate_; }

private:
    int captureRate_;
    int targetRate_;
};

} // namespace Audio
