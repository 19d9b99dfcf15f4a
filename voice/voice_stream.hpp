#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "error_manager.hpp"
#include "voice/audio_buffer.hpp"
#include "voice/audio_source.hpp"
#include "voice/recognition_engine.hpp"
#include "voice/silence_gate.hpp"

namespace Output { class TranscriptSink; }

namespace VoiceStream {

    // Listening -> Draining -> Flushed, never backwards
    enum class SessionState {
        Listening,
        Draining,
        Flushed
    };

    const char* toString(SessionState state);

    // What a single commit cycle did
    enum class CycleOutcome {
        Idle,        // not listening, or nothing new buffered
        TooShort,
        Silent,
        Committed,   // text appended
        NoSpeech,    // engine returned empty text
        Failed       // engine threw; span skipped
    };

    const char* toString(CycleOutcome outcome);

    struct ControllerConfig {
        int sampleRate = 16000;
        std::chrono::milliseconds chunkInterval{2000};
        Voice::SilenceGate gate;
        Voice::RecognitionOptions recognition;

        // Granularity at which the wait between cycles notices a stop
        std::chrono::milliseconds stopPollInterval{50};
    };

    // [begin, end) sample offsets handed to the engine
    struct SpanRecord {
        size_t begin = 0;
        size_t end = 0;
    };

    struct SessionStats {
        size_t cycles = 0;
        size_t silentSpans = 0;
        size_t actionableSpans = 0;   // includes the flush span
        size_t recognitionCalls = 0;
        size_t emptyResults = 0;
        size_t failures = 0;
        uint64_t totalProcessTimeMs = 0;
        std::vector<SpanRecord> recognizedSpans;
    };

    struct SessionSummary {
        std::string transcript;
        SessionResult result;          // ERR_NONE, ERR_SILENT_INPUT or ERR_NO_SPEECH
        bool captureFailed = false;
        size_t totalSamples = 0;
        SessionStats stats;
    };

    // Invoked once at Flushed, before the buffer is released
    using SessionAudioHandler = std::function<void(const std::vector<float>& samples, int sampleRate)>;

    // Owns the growing audio buffer and the committed watermark; decides
    // which span is sent for recognition and merges results into the
    // transcript. One recognition call is in flight at a time.
    class StreamCommitController {
    public:
        StreamCommitController(const ControllerConfig& config,
                               Voice::RecognitionEngine& engine,
                               Output::TranscriptSink& sink);

        StreamCommitController(const StreamCommitController&) = delete;
        StreamCommitController& operator=(const StreamCommitController&) = delete;

        // ---------------- Producer side ----------------
        // Capture callback entry. Returns false once draining has begun.
        bool pushSamples(const float* samples, size_t count);

        // ---------------- Consumer side ----------------
        // One commit cycle over buffer[watermark : now]
        CycleOutcome runCycle();

        // Start the source and run cycles every chunkInterval until a stop
        // is requested (requestStop(), externalStop, or capture failure),
        // then drain and flush. Returns the flushed session summary.
        SessionSummary runUntilStopped(Voice::AudioSource& source,
                                       const std::atomic<bool>* externalStop = nullptr);

        // Draining + final commit pass + Flushed. Stops the source first
        // when one is given. Calling it again returns the same summary.
        SessionSummary finish(Voice::AudioSource* source = nullptr);

        // Thread-safe, cooperative
        void requestStop();
        bool stopRequested() const;

        // Capture dropout: handled as an end-of-stream stop
        void notifyCaptureFailure(const std::string& message);

        void setSessionAudioHandler(SessionAudioHandler handler);

        // ---------------- Inspection ----------------
        SessionState state() const;
        size_t watermark() const;
        size_t bufferedSamples() const;
        std::vector<std::string> fragments() const;
        std::string transcript() const;
        SessionStats stats() const;

    private:
        enum class Pass { Cycle, Flush };

        CycleOutcome evaluatePending(Pass pass);
        void advanceWatermark(size_t to);
        void commitFragment(const std::string& text);
        void notifyPartial(const std::string& transcript);
        void notifyFinal(const std::string& transcript);
        std::string joinedLocked() const;
        SessionSummary buildSummary();

        ControllerConfig config_;
        Voice::RecognitionEngine& engine_;
        Output::TranscriptSink& sink_;

        Voice::AudioBuffer buffer_;
        std::atomic<size_t> watermark_{0};
        std::atomic<SessionState> state_{SessionState::Listening};

        // Serialises runCycle() against finish()
        std::mutex cycleMtx_;

        mutable std::mutex transcriptMtx_;
        std::vector<std::string> fragments_;
        SessionStats stats_;

        std::mutex stopMtx_;
        std::condition_variable stopCv_;
        std::atomic<bool> stopRequested_{false};
        std::atomic<bool> captureFailed_{false};

        SessionAudioHandler audioHandler_;
        SessionSummary summary_;
    };

} // namespace VoiceStream
