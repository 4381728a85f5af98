#include "pcm_encoder.hpp"

#include <algorithm>
#include <cmath>

namespace Audio {

std::vector<float> downmixToMono(const float* interleaved, size_t frameCount, int channels) {
    std::vector<float> mono;
    if (!interleaved || frameCount == 0) return mono;

    if (channels <= 1) {
        mono.assign(interleaved, interleaved + frameCount);
        return mono;
    }

    mono.resize(frameCount);
    for (size_t i = 0; i < frameCount; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * static_cast<size_t>(channels) + static_cast<size_t>(c)];
        }
        mono[i] = sum / static_cast<float>(channels);
    }
    return mono;
}

std::vector<float> resampleLinear(const std::vector<float>& in, int fromRate, int toRate) {
    if (in.empty() || fromRate <= 0 || toRate <= 0 || fromRate == toRate) {
        return in;
    }

    const double ratio = static_cast<double>(fromRate) / static_cast<double>(toRate);
    const size_t outLen = static_cast<size_t>(
        std::llround(static_cast<double>(in.size()) * toRate / fromRate));

    std::vector<float> out(outLen);
    for (size_t i = 0; i < outLen; ++i) {
        double pos = static_cast<double>(i) * ratio;
        size_t idx = static_cast<size_t>(pos);
        if (idx >= in.size() - 1) {
            out[i] = in.back();
            continue;
        }
        double frac = pos - static_cast<double>(idx);
        out[i] = static_cast<float>(in[idx] + (in[idx + 1] - in[idx]) * frac);
    }
    return out;
}

std::vector<int16_t> floatToPcm16(const std::vector<float>& samples) {
    std::vector<int16_t> pcm(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        float s = std::max(-1.0f, std::min(1.0f, samples[i]));
        pcm[i] = static_cast<int16_t>(s < 0 ? s * 0x8000 : s * 0x7FFF);
    }
    return pcm;
}

std::string packLittleEndian(const std::vector<int16_t>& samples) {
    std::string bytes;
    bytes.resize(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t v = static_cast<uint16_t>(samples[i]);
        bytes[2 * i]     = static_cast<char>(v & 0xFF);
        bytes[2 * i + 1] = static_cast<char>((v >> 8) & 0xFF);
    }
    return bytes;
}

// ------------------------------------------------------------
// PcmEncoder
// ------------------------------------------------------------
PcmEncoder::PcmEncoder(int captureRate, int targetRate)
    : captureRate_(captureRate), targetRate_(targetRate) {}

std::vector<float> PcmEncoder::toMono(const float* interleaved, size_t frameCount, int channels) const {
    return resampleLinear(downmixToMono(interleaved, frameCount, channels),
                          captureRate_, targetRate_);
}

std::string PcmEncoder::encode(const float* interleaved, size_t frameCount, int channels) const {
    return packLittleEndian(floatToPcm16(toMono(interleaved, frameCount, channels)));
}

} // namespace Audio
