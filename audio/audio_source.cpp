#include "audio_source.hpp"

#include <nlohmann/json.hpp>

namespace Audio {

CaptureFormat captureFormatFromJson(const nlohmann::json& section) {
    CaptureFormat f;
    if (!section.is_object()) return f;

    f.deviceIndex      = section.value("input_device_index", f.deviceIndex);
    f.sampleRate       = section.value("capture_sample_rate", f.sampleRate);
    f.channels         = section.value("capture_channels", f.channels);
    f.framesPerBuffer  = section.value("frames_per_buffer", f.framesPerBuffer);
    f.maxPendingFrames = section.value("max_pending_frames", f.maxPendingFrames);
    return f;
}

} // namespace Audio
