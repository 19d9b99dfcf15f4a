#pragma once
#include <cstdint>
#include <filesystem>
#include <vector>

namespace Output {

    // float [-1, 1] → int16, out-of-range samples clamped, NaN → 0
    std::vector<int16_t> toPcm16(const std::vector<float>& samples);

    // Write the whole session as 16-bit mono WAV. Returns false (and reports
    // ERR_AUDIO_SAVE) when the file cannot be written.
    bool saveSessionAudio(const std::filesystem::path& path,
                          const std::vector<float>& samples,
                          int sampleRate);

} // namespace Output
