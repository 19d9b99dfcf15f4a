#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "voice/recognition_engine.hpp"

struct whisper_context;

namespace Voice {

    struct TokenScore {
        int id = 0;
        float p = 0.0f;
    };

    // Mean probability over text tokens. Ids at or above firstSpecialId
    // (whisper's end-of-text and everything after it: timestamps, language
    // and task markers) are ignored. 0 when no text token is present.
    float meanTextTokenConfidence(const std::vector<TokenScore>& tokens, int firstSpecialId);

    // whisper.cpp backed engine. Owns the context for its whole lifetime.
    class WhisperEngine : public RecognitionEngine {
    public:
        WhisperEngine() = default;
        ~WhisperEngine() override;

        WhisperEngine(const WhisperEngine&) = delete;
        WhisperEngine& operator=(const WhisperEngine&) = delete;

        // Load the model; false (and ERR_MODEL_LOAD_FAILED logged) on failure
        bool load(const std::filesystem::path& modelPath);
        bool loaded() const { return ctx_ != nullptr; }

        RecognitionResult transcribe(const float* samples,
                                     size_t count,
                                     int sampleRate,
                                     const RecognitionOptions& options) override;

    private:
        whisper_context* ctx_ = nullptr;
        std::mutex mtx_;
    };

} // namespace Voice
