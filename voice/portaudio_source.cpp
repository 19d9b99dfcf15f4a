#include "voice/portaudio_source.hpp"
#include "device_setups/audio_devices.hpp"
#include "logger.hpp"

namespace Voice {

PortAudioSource::PortAudioSource(int sampleRate, int blockMs, int deviceIndex)
    : sampleRate_(sampleRate), blockMs_(blockMs), requestedDevice_(deviceIndex) {}

PortAudioSource::~PortAudioSource() {
    stop();
}

// ---------------- PortAudio Callbacks ----------------
int PortAudioSource::recordCallback(const void* input,
                                    void* /*output*/,
                                    unsigned long frameCount,
                                    const PaStreamCallbackTimeInfo* /*timeInfo*/,
                                    PaStreamCallbackFlags statusFlags,
                                    void* userData) {
    auto* self = static_cast<PortAudioSource*>(userData);
    if (statusFlags & paInputOverflow) {
        self->overflows_++;
    }

    const float* in = static_cast<const float*>(input);
    if (in && frameCount > 0 && self->onSamples_) {
        self->onSamples_(in, static_cast<size_t>(frameCount));
    }
    return self->stopping_.load() ? paComplete : paContinue;
}

// Runs when the stream ends. Only an end we did not ask for is a failure.
void PortAudioSource::finishedCallback(void* userData) {
    auto* self = static_cast<PortAudioSource*>(userData);
    self->running_ = false;
    if (!self->stopping_.load() && self->onError_) {
        self->onError_("audio stream finished unexpectedly");
    }
}

// ---------------- Start / Stop ----------------
bool PortAudioSource::start(SamplesCallback onSamples, CaptureErrorCallback onError) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_) return true;

    session_ = std::make_unique<AudioDevices::PortAudioSession>();
    if (!session_->ok()) {
        LOG_ERROR("Audio", "PortAudio unavailable: " + session_->error());
        session_.reset();
        return false;
    }

    std::string err;
    int deviceIndex = AudioDevices::resolveInputDevice(requestedDevice_, &err);
    if (deviceIndex < 0) {
        LOG_ERROR("Audio", err);
        session_.reset();
        return false;
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    deviceName_ = (devInfo && devInfo->name) ? devInfo->name : "?";
    LOG_DEBUG("Audio", "Using input device #" + std::to_string(deviceIndex) + " (" + deviceName_ + ")");

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = devInfo ? devInfo->defaultLowInputLatency : 0.0;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    onSamples_ = std::move(onSamples);
    onError_   = std::move(onError);
    stopping_  = false;

    const unsigned long framesPerBuffer =
        static_cast<unsigned long>(sampleRate_) * static_cast<unsigned long>(blockMs_) / 1000UL;

    PaError paErr = Pa_OpenStream(&stream_,
                                  &inputParams, nullptr,
                                  sampleRate_,
                                  framesPerBuffer,
                                  paClipOff,
                                  &PortAudioSource::recordCallback,
                                  this);
    if (paErr != paNoError || !stream_) {
        LOG_ERROR("Audio", std::string("Could not open mic stream: ") + Pa_GetErrorText(paErr));
        stream_ = nullptr;
        session_.reset();
        return false;
    }

    Pa_SetStreamFinishedCallback(stream_, &PortAudioSource::finishedCallback);

    paErr = Pa_StartStream(stream_);
    if (paErr != paNoError) {
        LOG_ERROR("Audio", std::string("Could not start mic stream: ") + Pa_GetErrorText(paErr));
        closeStream();
        return false;
    }

    running_ = true;
    LOG_DEBUG("Audio", "Capturing " + std::to_string(sampleRate_) + " Hz mono, " +
                       std::to_string(framesPerBuffer) + " frames per block");
    return true;
}

// Pa_StopStream waits for the callback in progress, so nothing is delivered
// after this returns
void PortAudioSource::stop() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!stream_) return;

    stopping_ = true;
    if (Pa_IsStreamStopped(stream_) == 0) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            LOG_ERROR("Audio", std::string("Pa_StopStream: ") + Pa_GetErrorText(err));
        }
    }
    closeStream();

    if (overflows_.load() > 0) {
        LOG_DEBUG("Audio", "Input overflows during session: " + std::to_string(overflows_.load()));
    }
    LOG_DEBUG("Audio", "Stream stopped");
}

void PortAudioSource::closeStream() {
    if (stream_) {
        PaError err = Pa_CloseStream(stream_);
        if (err != paNoError) {
            LOG_ERROR("Audio", std::string("Pa_CloseStream: ") + Pa_GetErrorText(err));
        }
        stream_ = nullptr;
    }
    running_ = false;
    session_.reset();
}

bool PortAudioSource::isCapturing() const {
    if (!running_.load()) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    return stream_ && Pa_IsStreamActive(stream_) == 1;
}

} // namespace Voice
