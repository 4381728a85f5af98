#pragma once
#include <string>
#include <functional>
#include <cstddef>
#include <nlohmann/json_fwd.hpp>

namespace Audio {

struct CaptureFormat {
    int deviceIndex = -1;               // -1 = default input device
    int sampleRate = 48000;
    int channels = 1;
    unsigned long framesPerBuffer = 4096;
    size_t maxPendingFrames = 32;       // encoded frames waiting for the network
};

CaptureFormat captureFormatFromJson(const nlohmann::json& section);

// Runs on the OS audio thread. Must not block.
using FrameCallback = std::function<void(const float* interleaved,
                                         unsigned long frameCount,
                                         int channels)>;

// Microphone stream. open() is where device access is requested; a
// failure there means the microphone is unavailable or denied.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual bool open(const CaptureFormat& format, FrameCallback callback, std::string* err) = 0;
    virtual bool start(std::string* err) = 0;
    virtual void stop() = 0;
    virtual void close() = 0;
    virtual bool isActive() const = 0;
};

} // namespace Audio
