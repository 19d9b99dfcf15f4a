#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

#include "voice/voice_stream.hpp"
#include "test_support.hpp"

using VoiceStream::CycleOutcome;
using VoiceStream::SessionState;
using VoiceStream::StreamCommitController;

static VoiceStream::ControllerConfig makeConfig() {
    VoiceStream::ControllerConfig cfg;
    cfg.sampleRate = test::kRate;
    cfg.chunkInterval = std::chrono::milliseconds(2000);
    cfg.gate = Voice::SilenceGate::fromSeconds(0.3, 0.005f, test::kRate);
    return cfg;
}

static void push(StreamCommitController& c, const std::vector<float>& block) {
    assert(c.pushSamples(block.data(), block.size()));
}

// 5 x 0.5 s of near-silence: nothing reaches the engine, everything is covered
static void silentSession() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    StreamCommitController c(makeConfig(), engine, sink);

    for (int i = 0; i < 4; ++i) push(c, test::quiet(0.5));
    assert(c.runCycle() == CycleOutcome::Silent);
    assert(c.watermark() == test::samplesFor(2.0));
    assert(c.runCycle() == CycleOutcome::Idle);
    assert(c.watermark() == test::samplesFor(2.0));

    push(c, test::quiet(0.5));
    auto summary = c.finish();

    assert(engine.calls().empty());
    assert(c.watermark() == test::samplesFor(2.5));
    assert(summary.transcript.empty());
    assert(summary.result.success);
    assert(summary.result.errorCode == ErrorCode::SilentInput);
    assert(sink.partials.empty());
    assert(sink.finals.size() == 1 && sink.finals[0].empty());
}

// 4 s of speech at a 2 s cadence: two calls over adjacent 2 s spans
static void twoChunks() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    StreamCommitController c(makeConfig(), engine, sink);

    push(c, test::tone(2.0));
    assert(c.runCycle() == CycleOutcome::Committed);
    push(c, test::tone(2.0));
    assert(c.runCycle() == CycleOutcome::Committed);

    auto calls = engine.calls();
    assert(calls.size() == 2);
    assert(calls[0].count == test::samplesFor(2.0));
    assert(calls[1].count == test::samplesFor(2.0));

    auto stats = c.stats();
    assert(stats.recognizedSpans.size() == 2);
    assert(stats.recognizedSpans[0].begin == 0);
    assert(stats.recognizedSpans[0].end == stats.recognizedSpans[1].begin);
    assert(stats.recognizedSpans[1].end == test::samplesFor(4.0));

    assert(sink.partials.size() == 2);
    assert(sink.partials[0] == "chunk1");
    assert(sink.partials[1] == "chunk1 chunk2");

    auto summary = c.finish();
    assert(engine.calls().size() == 2);
    assert(summary.transcript == "chunk1 chunk2");
    assert(summary.result.errorCode == ErrorCode::None);
    assert(sink.finals.size() == 1 && sink.finals[0] == "chunk1 chunk2");
}

// Stop with an unevaluated 0.4 s tail: one more call, appended last
static void flushTail() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    engine.say("hello");
    engine.say("world");
    StreamCommitController c(makeConfig(), engine, sink);

    push(c, test::tone(2.0));
    assert(c.runCycle() == CycleOutcome::Committed);
    push(c, test::tone(0.4));

    auto summary = c.finish();
    auto calls = engine.calls();
    assert(calls.size() == 2);
    assert(calls[1].count == test::samplesFor(0.4));
    assert(summary.transcript == "hello world");
    assert(c.watermark() == test::samplesFor(2.4));
    assert(sink.finals.size() == 1 && sink.finals[0] == "hello world");
}

// A short span stays pending and is evaluated together with what follows
static void tooShortStaysPending() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    StreamCommitController c(makeConfig(), engine, sink);

    push(c, test::tone(0.2));
    assert(c.runCycle() == CycleOutcome::TooShort);
    assert(c.watermark() == 0);
    assert(engine.calls().empty());

    push(c, test::tone(0.2));
    assert(c.runCycle() == CycleOutcome::Committed);
    assert(engine.calls().size() == 1);
    assert(engine.calls()[0].count == test::samplesFor(0.4));
}

// A tail below the minimum span is covered without a call
static void shortTailCovered() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    StreamCommitController c(makeConfig(), engine, sink);

    push(c, test::tone(2.0));
    c.runCycle();
    push(c, test::tone(0.1));
    auto summary = c.finish();

    assert(engine.calls().size() == 1);
    assert(c.watermark() == test::samplesFor(2.1));
    assert(summary.totalSamples == test::samplesFor(2.1));
}

// Engine failure: span skipped, session continues, later text kept
static void failureSkipsSpan() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    engine.fail("decoder exploded");
    engine.say("after");
    StreamCommitController c(makeConfig(), engine, sink);

    push(c, test::tone(2.0));
    assert(c.runCycle() == CycleOutcome::Failed);
    assert(c.watermark() == test::samplesFor(2.0));
    assert(sink.partials.empty());

    push(c, test::tone(2.0));
    assert(c.runCycle() == CycleOutcome::Committed);

    auto stats = c.stats();
    assert(stats.failures == 1);
    assert(stats.recognizedSpans[1].begin == test::samplesFor(2.0));

    auto summary = c.finish();
    assert(summary.transcript == "after");
    assert(summary.result.errorCode == ErrorCode::None);
}

// Empty text on audible audio: watermark advances, reported as no speech
static void emptyTextIsNoSpeech() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    engine.say("   ");
    StreamCommitController c(makeConfig(), engine, sink);

    push(c, test::tone(2.0));
    assert(c.runCycle() == CycleOutcome::NoSpeech);
    assert(c.watermark() == test::samplesFor(2.0));
    assert(c.fragments().empty());

    auto summary = c.finish();
    assert(summary.transcript.empty());
    assert(summary.result.success);
    assert(summary.result.errorCode == ErrorCode::NoSpeech);
    assert(summary.stats.emptyResults == 1);
}

static void stateMachine() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    StreamCommitController c(makeConfig(), engine, sink);
    assert(c.state() == SessionState::Listening);

    push(c, test::tone(1.0));
    auto first = c.finish();
    assert(c.state() == SessionState::Flushed);

    // Terminal: no more cycles, no more audio, one final
    assert(c.runCycle() == CycleOutcome::Idle);
    auto more = test::tone(1.0);
    assert(!c.pushSamples(more.data(), more.size()));

    auto second = c.finish();
    assert(second.transcript == first.transcript);
    assert(sink.finals.size() == 1);
    assert(engine.calls().size() == 1);
}

static void optionsPassThrough() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    auto cfg = makeConfig();
    cfg.recognition.language = "de";
    cfg.recognition.vadModel = "silero.bin";
    cfg.recognition.vadMinSilenceMs = 450;
    cfg.recognition.vadSpeechPadMs = 70;
    StreamCommitController c(cfg, engine, sink);

    push(c, test::tone(1.0));
    c.runCycle();
    auto calls = engine.calls();
    assert(calls.size() == 1);
    assert(calls[0].options.language == "de");
    assert(calls[0].options.vadModel == "silero.bin");
    assert(calls[0].options.vadMinSilenceMs == 450);
    assert(calls[0].options.vadSpeechPadMs == 70);
}

static void sessionAudioHandler() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    StreamCommitController c(makeConfig(), engine, sink);

    size_t handed = 0;
    int rate = 0;
    c.setSessionAudioHandler([&](const std::vector<float>& samples, int sampleRate) {
        handed = samples.size();
        rate = sampleRate;
    });

    push(c, test::tone(1.5));
    c.finish();
    assert(handed == test::samplesFor(1.5));
    assert(rate == test::kRate);
}

// ---------------- Main loop ----------------
static VoiceStream::ControllerConfig fastConfig() {
    auto cfg = makeConfig();
    cfg.chunkInterval = std::chrono::milliseconds(20);
    cfg.stopPollInterval = std::chrono::milliseconds(5);
    return cfg;
}

static void waitCapturing(const test::ManualSource& src) {
    for (int i = 0; i < 500 && !src.isCapturing(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    assert(src.isCapturing());
}

static void externalStopFlushes() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    test::ManualSource source;
    StreamCommitController c(fastConfig(), engine, sink);
    std::atomic<bool> stop{false};

    VoiceStream::SessionSummary summary;
    std::thread loop([&] { summary = c.runUntilStopped(source, &stop); });

    waitCapturing(source);
    for (int i = 0; i < 10; ++i) source.push(test::tone(0.1));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    stop = true;
    loop.join();

    assert(c.state() == SessionState::Flushed);
    assert(source.stopCalls.load() >= 1);
    assert(c.watermark() == test::samplesFor(1.0));
    assert(!summary.transcript.empty());
    assert(!summary.captureFailed);
    assert(sink.finals.size() == 1);
}

static void requestStopFlushes() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    test::ManualSource source;
    auto cfg = fastConfig();
    cfg.chunkInterval = std::chrono::milliseconds(60000);
    StreamCommitController c(cfg, engine, sink);

    VoiceStream::SessionSummary summary;
    auto started = std::chrono::steady_clock::now();
    std::thread loop([&] { summary = c.runUntilStopped(source); });

    waitCapturing(source);
    source.push(test::tone(0.5));
    c.requestStop();
    loop.join();

    // The stop cuts the interval wait short; the flush transcribes the audio
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
    assert(engine.calls().size() == 1);
    assert(summary.transcript == "chunk1");
}

static void captureDropout() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    test::ManualSource source;
    StreamCommitController c(fastConfig(), engine, sink);

    VoiceStream::SessionSummary summary;
    std::thread loop([&] { summary = c.runUntilStopped(source); });

    waitCapturing(source);
    source.push(test::tone(0.5));
    source.dropout("device unplugged");
    loop.join();

    assert(summary.captureFailed);
    assert(c.state() == SessionState::Flushed);
    assert(c.watermark() == test::samplesFor(0.5));
    assert(sink.finals.size() == 1);
}

static void startFailure() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;
    test::ManualSource source;
    source.failStart = true;
    StreamCommitController c(fastConfig(), engine, sink);

    auto summary = c.runUntilStopped(source);
    assert(!summary.result.success);
    assert(summary.result.errorCode == ErrorCode::CaptureStart);
    assert(summary.captureFailed);
    assert(sink.finals.empty());
}

int main() {
    silentSession();
    twoChunks();
    flushTail();
    tooShortStaysPending();
    shortTailCovered();
    failureSkipsSpan();
    emptyTextIsNoSpeech();
    stateMachine();
    optionsPassThrough();
    sessionAudioHandler();
    externalStopFlushes();
    requestStopFlushes();
    captureDropout();
    startFailure();
    return 0;
}
