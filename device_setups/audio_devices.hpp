#pragma once
#include <ostream>
#include <string>
#include <vector>

namespace AudioDevices {

    struct DeviceInfo {
        int index = -1;
        std::string name;
        std::string hostApi;
        int maxInputChannels = 0;
        int maxOutputChannels = 0;
        double defaultSampleRate = 0.0;
        double inputLatency = 0.0;
        double outputLatency = 0.0;
        bool defaultInput = false;
        bool defaultOutput = false;
    };

    // RAII wrapper around Pa_Initialize / Pa_Terminate
    class PortAudioSession {
    public:
        PortAudioSession();
        ~PortAudioSession();

        PortAudioSession(const PortAudioSession&) = delete;
        PortAudioSession& operator=(const PortAudioSession&) = delete;

        bool ok() const { return ok_; }
        const std::string& error() const { return error_; }

    private:
        bool ok_ = false;
        std::string error_;
    };

    // All devices PortAudio reports (requires an active PortAudioSession).
    // Returns false and fills err when enumeration fails.
    bool listDevices(std::vector<DeviceInfo>& out, std::string* err = nullptr);

    // Index to open: requested if it is a valid input device, the default
    // input for -1, or -1 when neither exists
    int resolveInputDevice(int requested, std::string* err = nullptr);

    // Human-readable listing used by livescribe --list-devices
    std::string formatDeviceList(const std::vector<DeviceInfo>& devices);

    // Opens a PortAudio session and prints the listing to out; problems go
    // to err. Shared by livescribe --list-devices and livescribe_list_devices.
    bool printDeviceList(std::ostream& out, std::ostream& err);

} // namespace AudioDevices
