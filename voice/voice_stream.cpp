#include "voice/voice_stream.hpp"
#include "voice/transcript_text.hpp"
#include "output/transcript_sink.hpp"
#include "logger.hpp"

#include <algorithm>
#include <sstream>
#include <iomanip>

namespace VoiceStream {

// ---------------- Helpers ----------------
static std::string seconds(size_t samples, int sampleRate) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << static_cast<double>(samples) / static_cast<double>(sampleRate) << "s";
    return oss.str();
}

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Listening: return "Listening";
        case SessionState::Draining:  return "Draining";
        case SessionState::Flushed:   return "Flushed";
    }
    return "Unknown";
}

const char* toString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::Idle:      return "idle";
        case CycleOutcome::TooShort:  return "too-short";
        case CycleOutcome::Silent:    return "silent";
        case CycleOutcome::Committed: return "committed";
        case CycleOutcome::NoSpeech:  return "no-speech";
        case CycleOutcome::Failed:    return "failed";
    }
    return "unknown";
}

// ---------------- Construction ----------------
StreamCommitController::StreamCommitController(const ControllerConfig& config,
                                               Voice::RecognitionEngine& engine,
                                               Output::TranscriptSink& sink)
    : config_(config), engine_(engine), sink_(sink) {}

// ---------------- Producer ----------------
bool StreamCommitController::pushSamples(const float* samples, size_t count) {
    return buffer_.append(samples, count);
}

// ---------------- Commit cycle ----------------
CycleOutcome StreamCommitController::runCycle() {
    std::lock_guard<std::mutex> guard(cycleMtx_);
    if (state_.load() != SessionState::Listening) {
        return CycleOutcome::Idle;
    }

    {
        std::lock_guard<std::mutex> lock(transcriptMtx_);
        stats_.cycles++;
    }

    CycleOutcome outcome = evaluatePending(Pass::Cycle);
    LOG_TRACE("VoiceStream", std::string("Cycle -> ") + toString(outcome) +
                             " (watermark=" + std::to_string(watermark_.load()) + ")");
    return outcome;
}

// Evaluate buffer[watermark : snapshot]. The lock inside AudioBuffer is held
// only while the pending span is copied, never across the engine call.
CycleOutcome StreamCommitController::evaluatePending(Pass pass) {
    const size_t from = watermark_.load();
    std::vector<float> pending;
    const size_t snapshotLen = buffer_.snapshotFrom(from, pending);

    if (snapshotLen <= from || pending.empty()) {
        return CycleOutcome::Idle;
    }

    const Voice::GateVerdict verdict = config_.gate.evaluate(pending.data(), pending.size());

    if (verdict == Voice::GateVerdict::TooShort) {
        if (pass == Pass::Flush) {
            // Final tail below the minimum span: covered without a call
            LOG_DEBUG("VoiceStream", "Flush: tail too short (" +
                                     seconds(pending.size(), config_.sampleRate) + "), not transcribed");
            advanceWatermark(snapshotLen);
        }
        return CycleOutcome::TooShort;
    }

    if (verdict == Voice::GateVerdict::Silent) {
        {
            std::lock_guard<std::mutex> lock(transcriptMtx_);
            stats_.silentSpans++;
        }
        LOG_TRACE("VoiceStream", "Skipping silent span (" +
                                 seconds(pending.size(), config_.sampleRate) + ")");
        advanceWatermark(snapshotLen);
        return CycleOutcome::Silent;
    }

    {
        std::lock_guard<std::mutex> lock(transcriptMtx_);
        stats_.actionableSpans++;
        stats_.recognitionCalls++;
        stats_.recognizedSpans.push_back({ from, snapshotLen });
    }

    LOG_DEBUG("VoiceStream", std::string(pass == Pass::Flush ? "Flush" : "Cycle") +
                             ": transcribing " + seconds(pending.size(), config_.sampleRate) +
                             " [" + std::to_string(from) + ", " + std::to_string(snapshotLen) + ")");

    Voice::RecognitionResult result;
    try {
        result = engine_.transcribe(pending.data(), pending.size(),
                                    config_.sampleRate, config_.recognition);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(transcriptMtx_);
            stats_.failures++;
        }
        ErrorManager::report(ErrorCode::RecognitionFailed, e.what());
        advanceWatermark(snapshotLen);
        return CycleOutcome::Failed;
    }

    const std::string text = TranscriptText::trim(result.text);
    {
        std::lock_guard<std::mutex> lock(transcriptMtx_);
        stats_.totalProcessTimeMs += result.processTimeMs;
    }

    if (text.empty()) {
        {
            std::lock_guard<std::mutex> lock(transcriptMtx_);
            stats_.emptyResults++;
        }
        LOG_DEBUG("VoiceStream", "No speech recognised in span; marked committed");
        advanceWatermark(snapshotLen);
        return CycleOutcome::NoSpeech;
    }

    commitFragment(text);
    advanceWatermark(snapshotLen);
    LOG_DEBUG("VoiceStream", "Committed: \"" + text + "\" (lang=" + result.language +
                             ", p=" + std::to_string(result.confidence) +
                             ", " + std::to_string(result.processTimeMs) + " ms)");
    notifyPartial(transcript());
    return CycleOutcome::Committed;
}

void StreamCommitController::advanceWatermark(size_t to) {
    size_t current = watermark_.load();
    while (to > current && !watermark_.compare_exchange_weak(current, to)) {
    }
}

void StreamCommitController::commitFragment(const std::string& text) {
    std::lock_guard<std::mutex> lock(transcriptMtx_);
    fragments_.push_back(text);
}

void StreamCommitController::notifyPartial(const std::string& text) {
    try {
        sink_.onPartial(text);
    } catch (const std::exception& e) {
        LOG_ERROR("VoiceStream", std::string("Transcript sink failed on partial: ") + e.what());
    }
}

void StreamCommitController::notifyFinal(const std::string& text) {
    try {
        sink_.onFinal(text);
    } catch (const std::exception& e) {
        LOG_ERROR("VoiceStream", std::string("Transcript sink failed on final: ") + e.what());
    }
}

// ---------------- Main loop ----------------
SessionSummary StreamCommitController::runUntilStopped(Voice::AudioSource& source,
                                                       const std::atomic<bool>* externalStop) {
    auto shouldStop = [&] {
        return stopRequested_.load() || (externalStop && externalStop->load());
    };

    bool started = source.start(
        [this](const float* samples, size_t count) { pushSamples(samples, count); },
        [this](const std::string& message) { notifyCaptureFailure(message); });

    if (!started) {
        SessionSummary failed;
        failed.captureFailed = true;
        failed.result = ErrorManager::report(ErrorCode::CaptureStart);
        LOG_PHASE("Capture start", false);
        return failed;
    }
    LOG_PHASE("Capture start", true);

    auto nextCycle = std::chrono::steady_clock::now() + config_.chunkInterval;
    while (!shouldStop()) {
        if (!source.isCapturing()) {
            notifyCaptureFailure("input stream is no longer active");
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= nextCycle) {
            runCycle();
            // The interval counts from the end of the previous cycle, so a
            // slow engine lets audio pile up into one larger span
            nextCycle = std::chrono::steady_clock::now() + config_.chunkInterval;
            continue;
        }

        auto wait = std::min<std::chrono::steady_clock::duration>(config_.stopPollInterval, nextCycle - now);
        std::unique_lock<std::mutex> lock(stopMtx_);
        stopCv_.wait_for(lock, wait, [this] { return stopRequested_.load(); });
    }

    if (externalStop && externalStop->load()) {
        LOG_PHASE("Stop signal received", true);
    }
    return finish(&source);
}

// ---------------- Drain + flush ----------------
SessionSummary StreamCommitController::finish(Voice::AudioSource* source) {
    std::lock_guard<std::mutex> guard(cycleMtx_);
    if (state_.load() == SessionState::Flushed) {
        return summary_;
    }

    state_.store(SessionState::Draining);
    LOG_PHASE("Session draining", true);

    // Nothing captured before stop() returns is lost: the source finishes
    // its last callback before the buffer is sealed
    if (source) {
        source->stop();
    }
    buffer_.seal();

    const size_t tailStart = watermark_.load();
    CycleOutcome tail = evaluatePending(Pass::Flush);
    LOG_DEBUG("VoiceStream", std::string("Flush -> ") + toString(tail) + " (tail " +
                             seconds(buffer_.size() - std::min(buffer_.size(), tailStart), config_.sampleRate) + ")");

    // Every sample is now covered by a commit, a silence verdict, or the flush
    advanceWatermark(buffer_.size());

    if (audioHandler_) {
        try {
            audioHandler_(buffer_.copyAll(), config_.sampleRate);
        } catch (const std::exception& e) {
            LOG_ERROR("VoiceStream", std::string("Session audio handler failed: ") + e.what());
        }
    }

    const std::string finalText = transcript();
    buffer_.release();
    state_.store(SessionState::Flushed);
    summary_ = buildSummary();
    LOG_PHASE("Session flushed", true);

    notifyFinal(finalText);
    return summary_;
}

SessionSummary StreamCommitController::buildSummary() {
    SessionSummary summary;
    summary.transcript    = transcript();
    summary.captureFailed = captureFailed_.load();
    summary.totalSamples  = buffer_.size();
    summary.stats         = stats();

    if (!summary.transcript.empty()) {
        summary.result = ErrorManager::ok("Transcript ready");
    } else if (summary.stats.actionableSpans == 0) {
        summary.result = ErrorManager::notice(ErrorCode::SilentInput);
    } else {
        summary.result = ErrorManager::notice(ErrorCode::NoSpeech);
    }
    return summary;
}

// ---------------- Stop control ----------------
void StreamCommitController::requestStop() {
    {
        std::lock_guard<std::mutex> lock(stopMtx_);
        stopRequested_.store(true);
    }
    stopCv_.notify_all();
}

bool StreamCommitController::stopRequested() const {
    return stopRequested_.load();
}

void StreamCommitController::notifyCaptureFailure(const std::string& message) {
    if (!captureFailed_.exchange(true)) {
        ErrorManager::report(ErrorCode::CaptureFailed, message);
    }
    requestStop();
}

void StreamCommitController::setSessionAudioHandler(SessionAudioHandler handler) {
    audioHandler_ = std::move(handler);
}

// ---------------- Inspection ----------------
SessionState StreamCommitController::state() const {
    return state_.load();
}

size_t StreamCommitController::watermark() const {
    return watermark_.load();
}

size_t StreamCommitController::bufferedSamples() const {
    return buffer_.size();
}

std::vector<std::string> StreamCommitController::fragments() const {
    std::lock_guard<std::mutex> lock(transcriptMtx_);
    return fragments_;
}

std::string StreamCommitController::joinedLocked() const {
    return TranscriptText::joinFragments(fragments_);
}

std::string StreamCommitController::transcript() const {
    std::lock_guard<std::mutex> lock(transcriptMtx_);
    return joinedLocked();
}

SessionStats StreamCommitController::stats() const {
    std::lock_guard<std::mutex> lock(transcriptMtx_);
    return stats_;
}

} // namespace VoiceStream
