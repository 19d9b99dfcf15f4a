#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace Voice {

    // Called from the capture thread with one block of mono float samples
    using SamplesCallback = std::function<void(const float* samples, size_t count)>;

    // Called at most once when the device stops delivering audio on its own
    using CaptureErrorCallback = std::function<void(const std::string& message)>;

    class AudioSource {
    public:
        virtual ~AudioSource() = default;

        virtual bool start(SamplesCallback onSamples, CaptureErrorCallback onError) = 0;

        // Idempotent. No callback runs after stop() returns.
        virtual void stop() = 0;

        virtual bool isCapturing() const = 0;
        virtual int sampleRate() const = 0;
    };

} // namespace Voice
