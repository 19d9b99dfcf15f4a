#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "voice/voice_stream.hpp"
#include "test_support.hpp"

// Spans handed to the engine start at 0, touch end to end and never overlap
static void assertTiled(const std::vector<VoiceStream::SpanRecord>& spans, size_t total) {
    assert(!spans.empty());
    assert(spans.front().begin == 0);
    for (size_t i = 0; i < spans.size(); ++i) {
        assert(spans[i].begin < spans[i].end);
        if (i > 0) assert(spans[i].begin == spans[i - 1].end);
    }
    assert(spans.back().end <= total);
}

static std::string expectedTranscript(size_t calls) {
    std::string expected;
    for (size_t i = 0; i < calls; ++i) {
        if (!expected.empty()) expected += ' ';
        expected += "chunk" + std::to_string(i + 1);
    }
    return expected;
}

// Capture thread appends 10 ms blocks while the consumer runs cycles
// back to back. Spans must tile the buffer in order.
static void cyclesInterleaveWithCapture() {
    test::ScriptedEngine engine;
    test::RecordingSink sink;

    VoiceStream::ControllerConfig cfg;
    cfg.sampleRate = test::kRate;
    cfg.gate = Voice::SilenceGate::fromSeconds(0.05, 0.005f, test::kRate);
    VoiceStream::StreamCommitController controller(cfg, engine, sink);

    const int blocks = 300;
    const auto block = test::tone(0.01);
    std::atomic<bool> producing{true};

    std::thread producer([&] {
        for (int i = 0; i < blocks; ++i) {
            assert(controller.pushSamples(block.data(), block.size()));
            std::this_thread::sleep_for(std::chrono::microseconds(300));
        }
        producing = false;
    });

    size_t lastWatermark = 0;
    while (producing.load()) {
        controller.runCycle();
        size_t wm = controller.watermark();
        assert(wm >= lastWatermark);
        assert(wm <= controller.bufferedSamples());
        lastWatermark = wm;
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
    }
    producer.join();

    auto summary = controller.finish();
    const size_t total = block.size() * blocks;
    assert(summary.totalSamples == total);
    assert(controller.watermark() == total);

    const auto& spans = summary.stats.recognizedSpans;
    assertTiled(spans, total);

    // Fragments arrive in capture order
    auto calls = engine.calls();
    assert(calls.size() == spans.size());
    const std::string expected = expectedTranscript(calls.size());
    assert(summary.transcript == expected);
    assert(sink.finals.size() == 1 && sink.finals[0] == expected);
}

// Engine slower than the cycle interval: audio piles up into larger spans,
// calls never overlap and nothing is dropped
static void slowEngineGrowsSpans() {
    test::ScriptedEngine engine;
    engine.setDelay(std::chrono::milliseconds(40));
    test::RecordingSink sink;
    test::ManualSource source;

    VoiceStream::ControllerConfig cfg;
    cfg.sampleRate = test::kRate;
    cfg.chunkInterval = std::chrono::milliseconds(10);
    cfg.stopPollInterval = std::chrono::milliseconds(2);
    cfg.gate = Voice::SilenceGate::fromSeconds(0.05, 0.005f, test::kRate);
    VoiceStream::StreamCommitController controller(cfg, engine, sink);

    VoiceStream::SessionSummary summary;
    std::thread loop([&] { summary = controller.runUntilStopped(source); });

    for (int i = 0; i < 500 && !source.isCapturing(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    assert(source.isCapturing());

    const int blocks = 400;
    const auto block = test::tone(0.01);
    const auto started = std::chrono::steady_clock::now();
    for (int i = 0; i < blocks; ++i) {
        source.push(block);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    controller.requestStop();
    loop.join();

    const size_t total = block.size() * blocks;
    assert(summary.totalSamples == total);
    assert(controller.watermark() == total);
    assert(engine.maxInFlight() == 1);

    const auto& spans = summary.stats.recognizedSpans;
    assertTiled(spans, total);

    // Audio the producer delivers during one cycle interval
    const double samplesPerMs = static_cast<double>(total) / std::max<long long>(1, elapsedMs);
    const double cycleWorth = samplesPerMs * static_cast<double>(cfg.chunkInterval.count());

    size_t largest = 0;
    for (const auto& s : spans) largest = std::max(largest, s.end - s.begin);
    assert(static_cast<double>(largest) > 2.0 * cycleWorth);

    // Fewer calls than cycles would allow if the engine were instant
    assert(static_cast<long long>(spans.size()) < elapsedMs / cfg.chunkInterval.count());
    assert(summary.transcript == expectedTranscript(engine.calls().size()));
}

int main() {
    cyclesInterleaveWithCapture();
    slowEngineGrowsSpans();
    return 0;
}
