#include "output/session_recorder.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <SFML/Audio/OutputSoundFile.hpp>
#include <SFML/Audio/SoundChannel.hpp>

#include <algorithm>
#include <cmath>

namespace Output {

std::vector<int16_t> toPcm16(const std::vector<float>& samples) {
    std::vector<int16_t> pcm;
    pcm.reserve(samples.size());
    for (float s : samples) {
        float c = std::isnan(s) ? 0.0f : std::clamp(s, -1.0f, 1.0f);
        pcm.push_back(static_cast<int16_t>(c * 32767.0f));
    }
    return pcm;
}

bool saveSessionAudio(const std::filesystem::path& path,
                      const std::vector<float>& samples,
                      int sampleRate) {
    if (sampleRate <= 0) {
        ErrorManager::report(ErrorCode::AudioSave, "invalid sample rate");
        return false;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    sf::OutputSoundFile file;
    if (!file.openFromFile(path, static_cast<unsigned int>(sampleRate), 1, { sf::SoundChannel::Mono })) {
        ErrorManager::report(ErrorCode::AudioSave, path.string());
        return false;
    }

    const std::vector<int16_t> pcm = toPcm16(samples);
    if (!pcm.empty()) {
        file.write(pcm.data(), pcm.size());
    }
    file.close();

    LOG_DEBUG("Recorder", "Saved " + std::to_string(samples.size()) + " samples to " + path.string());
    LOG_PHASE("Session audio saved", true);
    return true;
}

} // namespace Output
