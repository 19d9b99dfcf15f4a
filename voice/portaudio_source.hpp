#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <portaudio.h>

#include "voice/audio_source.hpp"

namespace AudioDevices { class PortAudioSession; }

namespace Voice {

    // Microphone capture through PortAudio: mono paFloat32 at the configured
    // rate, delivered in blocks of blockMs.
    class PortAudioSource : public AudioSource {
    public:
        PortAudioSource(int sampleRate, int blockMs, int deviceIndex = -1);
        ~PortAudioSource() override;

        PortAudioSource(const PortAudioSource&) = delete;
        PortAudioSource& operator=(const PortAudioSource&) = delete;

        bool start(SamplesCallback onSamples, CaptureErrorCallback onError) override;
        void stop() override;
        bool isCapturing() const override;
        int sampleRate() const override { return sampleRate_; }

        // Callback blocks that arrived with paInputOverflow set
        unsigned long overflowCount() const { return overflows_.load(); }

        const std::string& deviceName() const { return deviceName_; }

    private:
        static int recordCallback(const void* input,
                                  void* output,
                                  unsigned long frameCount,
                                  const PaStreamCallbackTimeInfo* timeInfo,
                                  PaStreamCallbackFlags statusFlags,
                                  void* userData);
        static void finishedCallback(void* userData);

        void closeStream();

        int sampleRate_;
        int blockMs_;
        int requestedDevice_;
        std::string deviceName_;

        std::unique_ptr<AudioDevices::PortAudioSession> session_;
        PaStream* stream_ = nullptr;

        mutable std::mutex mtx_;
        SamplesCallback onSamples_;
        CaptureErrorCallback onError_;

        std::atomic<bool> running_{false};
        std::atomic<bool> stopping_{false};
        std::atomic<unsigned long> overflows_{0};
    };

} // namespace Voice
