#include <iostream>

#include "device_setups/audio_devices.hpp"

int main() {
    return AudioDevices::printDeviceList(std::cout, std::cerr) ? 0 : 1;
}
