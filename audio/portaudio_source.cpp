#include "portaudio_source.hpp"
#include "logger.hpp"

#include <portaudio.h>
#include <algorithm>

namespace Audio {

PortAudioSource::~PortAudioSource() {
    close();
}

// ------------------------------------------------------------
// open: initialize PortAudio and claim the input device
// ------------------------------------------------------------
bool PortAudioSource::open(const CaptureFormat& format, FrameCallback callback, std::string* err) {
    std::lock_guard<std::mutex> lock(mtx_);

    if (stream_) {
        if (err) *err = "Capture stream already open";
        return false;
    }

    PaError paErr = Pa_Initialize();
    if (paErr != paNoError) {
        if (err) *err = std::string("Failed to initialize PortAudio: ") + Pa_GetErrorText(paErr);
        return false;
    }
    initialized_ = true;

    int deviceIndex = (format.deviceIndex >= 0) ? format.deviceIndex : Pa_GetDefaultInputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        if (err) *err = "No valid input device found";
        Pa_Terminate();
        initialized_ = false;
        return false;
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    if (!devInfo || devInfo->maxInputChannels <= 0) {
        if (err) *err = "Device #" + std::to_string(deviceIndex) + " has no input channels";
        Pa_Terminate();
        initialized_ = false;
        return false;
    }

    channels_ = std::min(std::max(format.channels, 1), devInfo->maxInputChannels);
    callback_ = std::move(callback);

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = channels_;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    paErr = Pa_OpenStream(&stream_,
                          &inputParams,
                          nullptr,
                          format.sampleRate,
                          format.framesPerBuffer,
                          paNoFlag,
                          [](const void* input, void*, unsigned long frameCount,
                             const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* userData) -> int {
                              auto* self = static_cast<PortAudioSource*>(userData);
                              const float* in = static_cast<const float*>(input);
                              if (in && self->running_.load() && self->callback_) {
                                  self->callback_(in, frameCount, self->channels_);
                              }
                              return paContinue;
                          },
                          this);

    if (paErr != paNoError || !stream_) {
        if (err) *err = std::string("Could not open mic stream: ") + Pa_GetErrorText(paErr);
        stream_ = nullptr;
        Pa_Terminate();
        initialized_ = false;
        return false;
    }

    LOG_DEBUG("Audio", std::string("Opened input device #") + std::to_string(deviceIndex) +
                       " (" + devInfo->name + ") at " + std::to_string(format.sampleRate) +
                       " Hz, " + std::to_string(channels_) + " ch");
    return true;
}

bool PortAudioSource::start(std::string* err) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!stream_) {
        if (err) *err = "Capture stream is not open";
        return false;
    }

    running_ = true;
    PaError paErr = Pa_StartStream(stream_);
    if (paErr != paNoError) {
        running_ = false;
        if (err) *err = std::string("Could not start mic stream: ") + Pa_GetErrorText(paErr);
        return false;
    }
    return true;
}

void PortAudioSource::stop() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stream_ && running_) {
        running_ = false;
        Pa_StopStream(stream_);
    }
}

void PortAudioSource::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stream_) {
        if (running_) {
            running_ = false;
            Pa_StopStream(stream_);
        }
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        LOG_DEBUG("Audio", "Capture stream closed");
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}

bool PortAudioSource::isActive() const {
    return running_.load();
}

} // namespace Audio
