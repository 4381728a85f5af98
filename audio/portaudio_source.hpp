#pragma once
#include <atomic>
#include <mutex>

#include "audio_source.hpp"

typedef void PaStream;

namespace Audio {

class PortAudioSource : public AudioSource {
public:
    PortAudioSource() = default;
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    bool open(const CaptureFormat& format, FrameCallback callback, std::string* err) override;
    bool start(std::string* err) override;
    void stop() override;
    void close() override;
    bool isActive() const override;

private:
    std::mutex mtx_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
    std::atomic<bool> running_{false};
    int channels_ = 1;
    FrameCallback callback_;
};

} // namespace Audio
