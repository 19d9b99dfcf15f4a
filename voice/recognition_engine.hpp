#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace Voice {

    // whisper decodes 16 kHz mono only; capture must run at this rate
    constexpr int kRecognitionSampleRate = 16000;

    // Passed through to the engine untouched by the commit controller
    struct RecognitionOptions {
        std::string language = "en";   // "auto" = detect
        int threads = 0;               // 0 = engine default

        // Voice-activity filtering inside the engine (off while vadModel is empty)
        std::string vadModel;
        int vadMinSilenceMs = 300;
        int vadSpeechPadMs = 100;
    };

    struct RecognitionResult {
        std::string text;              // trimmed; empty = no speech
        std::string language;          // language guess ("" if unknown)
        float confidence = 0.0f;       // mean token probability, 0..1
        uint64_t processTimeMs = 0;
    };

    // Speech-to-text black box. Implementations throw std::runtime_error when
    // a span cannot be decoded; an empty text is a normal "no speech" answer.
    class RecognitionEngine {
    public:
        virtual ~RecognitionEngine() = default;

        virtual RecognitionResult transcribe(const float* samples,
                                             size_t count,
                                             int sampleRate,
                                             const RecognitionOptions& options) = 0;
    };

} // namespace Voice
