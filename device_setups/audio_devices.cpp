#include "audio_devices.hpp"
#include "logger.hpp"

#include <portaudio.h>
#include <sstream>

namespace AudioDevices {

// ---------------- PortAudio lifetime ----------------
PortAudioSession::PortAudioSession() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        error_ = Pa_GetErrorText(err);
        LOG_ERROR("Audio", "Pa_Initialize failed: " + error_);
        return;
    }
    ok_ = true;
}

PortAudioSession::~PortAudioSession() {
    if (ok_) {
        Pa_Terminate();
    }
}

// ---------------- Enumeration ----------------
bool listDevices(std::vector<DeviceInfo>& out, std::string* err) {
    out.clear();

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        if (err) *err = std::string("Pa_GetDeviceCount: ") + Pa_GetErrorText(numDevices);
        return false;
    }

    const int defIn = Pa_GetDefaultInputDevice();
    const int defOut = Pa_GetDefaultOutputDevice();

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        DeviceInfo d;
        d.index             = i;
        d.name              = deviceInfo->name ? deviceInfo->name : "";
        d.hostApi           = (hostApiInfo && hostApiInfo->name) ? hostApiInfo->name : "?";
        d.maxInputChannels  = deviceInfo->maxInputChannels;
        d.maxOutputChannels = deviceInfo->maxOutputChannels;
        d.defaultSampleRate = deviceInfo->defaultSampleRate;
        d.inputLatency      = deviceInfo->defaultLowInputLatency;
        d.outputLatency     = deviceInfo->defaultLowOutputLatency;
        d.defaultInput      = (i == defIn);
        d.defaultOutput     = (i == defOut);
        out.push_back(d);
    }
    return true;
}

int resolveInputDevice(int requested, std::string* err) {
    const int count = Pa_GetDeviceCount();
    int index = (requested >= 0) ? requested : Pa_GetDefaultInputDevice();

    if (index == paNoDevice || index < 0 || index >= count) {
        if (err) {
            *err = requested >= 0
                     ? "input device #" + std::to_string(requested) + " does not exist"
                     : std::string("no default input device");
        }
        return -1;
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (!info || info->maxInputChannels < 1) {
        if (err) *err = "device #" + std::to_string(index) + " has no input channels";
        return -1;
    }
    return index;
}

std::string formatDeviceList(const std::vector<DeviceInfo>& devices) {
    std::ostringstream out;
    out << "=== PortAudio Device List ===\n";
    out << "Found " << devices.size() << " devices total\n\n";

    for (const auto& d : devices) {
        out << "Device #" << d.index << ": " << d.name
            << "  (Host API: " << d.hostApi << ")\n";
        out << "  Max input channels : " << d.maxInputChannels << "\n";
        out << "  Max output channels: " << d.maxOutputChannels << "\n";
        out << "  Default sample rate: " << d.defaultSampleRate << "\n";
        out << "  Latency (input/output): "
            << d.inputLatency << " / " << d.outputLatency << " sec\n";

        if (d.defaultInput)
            out << "  *** Default INPUT device ***\n";
        if (d.defaultOutput)
            out << "  *** Default OUTPUT device ***\n";

        out << "-------------------------------------------\n\n";
    }
    return out.str();
}

bool printDeviceList(std::ostream& out, std::ostream& err) {
    PortAudioSession session;
    if (!session.ok()) {
        err << "PortAudio error: " << session.error() << "\n";
        return false;
    }

    std::vector<DeviceInfo> devices;
    std::string why;
    if (!listDevices(devices, &why)) {
        err << "ERROR: " << why << "\n";
        return false;
    }
    out << formatDeviceList(devices);
    return true;
}

} // namespace AudioDevices
