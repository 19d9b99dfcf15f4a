#include "voice/whisper_engine.hpp"
#include "voice/transcript_text.hpp"
#include "error_manager.hpp"
#include "system_detect.hpp"
#include "logger.hpp"

#include <whisper.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace Voice {

// whisper decodes badly below one second of audio
static constexpr size_t kMinDecodeSamples = kRecognitionSampleRate;

float meanTextTokenConfidence(const std::vector<TokenScore>& tokens, int firstSpecialId) {
    double sum = 0.0;
    int n = 0;
    for (const auto& t : tokens) {
        if (t.id >= firstSpecialId) continue;
        sum += t.p;
        n++;
    }
    return n > 0 ? static_cast<float>(sum / n) : 0.0f;
}

// ============================================================
// Lifetime
// ============================================================
WhisperEngine::~WhisperEngine() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool WhisperEngine::load(const fs::path& modelPath) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (ctx_) return true;

    std::error_code ec;
    if (modelPath.empty() || !fs::exists(modelPath, ec)) {
        ErrorManager::report(ErrorCode::ModelLoadFailed,
                             "model missing: " + (modelPath.empty() ? std::string("<none>") : modelPath.string()));
        return false;
    }

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(modelPath.string().c_str(), cparams);
    if (!ctx_) {
        ErrorManager::report(ErrorCode::ModelLoadFailed, modelPath.string());
        return false;
    }

    LOG_DEBUG("Whisper", "Model loaded: " + modelPath.string());
    LOG_PHASE("Whisper model load", true);
    return true;
}

// ============================================================
// Transcription
// ============================================================
RecognitionResult WhisperEngine::transcribe(const float* samples,
                                            size_t count,
                                            int sampleRate,
                                            const RecognitionOptions& options) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!ctx_) {
        throw std::runtime_error("whisper context not loaded");
    }
    if (sampleRate != kRecognitionSampleRate) {
        throw std::runtime_error("whisper needs " + std::to_string(kRecognitionSampleRate) +
                                 " Hz audio, got " + std::to_string(sampleRate));
    }

    auto t0 = std::chrono::steady_clock::now();

    std::vector<float> pcm(samples, samples + count);
    if (pcm.size() < kMinDecodeSamples) {
        pcm.resize(kMinDecodeSamples, 0.0f);
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.no_timestamps    = true;
    wparams.single_segment   = false;
    wparams.greedy.best_of   = 1;

    wparams.n_threads = options.threads > 0
                          ? options.threads
                          : recommendedThreads(static_cast<int>(std::thread::hardware_concurrency()));

    const bool detect = options.language.empty() || options.language == "auto";
    wparams.language        = detect ? "auto" : options.language.c_str();
    wparams.detect_language = false;

    if (!options.vadModel.empty()) {
        wparams.vad            = true;
        wparams.vad_model_path = options.vadModel.c_str();
        wparams.vad_params     = whisper_vad_default_params();
        wparams.vad_params.min_silence_duration_ms = options.vadMinSilenceMs;
        wparams.vad_params.speech_pad_ms           = options.vadSpeechPadMs;
    }

    if (whisper_full(ctx_, wparams, pcm.data(), static_cast<int>(pcm.size())) != 0) {
        throw std::runtime_error("whisper_full failed on " + std::to_string(count) + " samples");
    }

    RecognitionResult result;
    std::string raw;
    std::vector<TokenScore> tokens;

    const int nSegments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < nSegments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_, i);
        if (text) raw += text;

        const int nTokens = whisper_full_n_tokens(ctx_, i);
        for (int j = 0; j < nTokens; ++j) {
            tokens.push_back({ whisper_full_get_token_id(ctx_, i, j),
                               whisper_full_get_token_p(ctx_, i, j) });
        }
    }

    std::string cleaned = TranscriptText::cleanRecognizedText(raw);
    if (cleaned.empty() && !TranscriptText::trim(raw).empty()) {
        LOG_DEBUG("Whisper", "Discarded non-speech output: \"" + TranscriptText::trim(raw) + "\"");
    }

    result.text       = cleaned;
    result.confidence = meanTextTokenConfidence(tokens, whisper_token_eot(ctx_));

    const int langId = whisper_full_lang_id(ctx_);
    if (langId >= 0) {
        const char* lang = whisper_lang_str(langId);
        result.language = lang ? lang : "";
    } else if (!detect) {
        result.language = options.language;
    }

    result.processTimeMs = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count());
    return result;
}

} // namespace Voice
