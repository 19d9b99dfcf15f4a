#pragma once
#include <cstddef>

namespace Voice {

    enum class GateVerdict {
        TooShort,   // leave pending, watermark stays
        Silent,     // consume without recognition
        Actionable  // forward to the recognition engine
    };

    const char* toString(GateVerdict verdict);

    // Peak absolute amplitude of a span (0 for an empty span)
    float peakAmplitude(const float* samples, size_t count);

    struct SilenceGate {
        size_t minSpanSamples = 4800;        // 0.3 s at 16 kHz
        float silenceThreshold = 0.005f;     // peak amplitude

        static SilenceGate fromSeconds(double minSpanSec, float threshold, int sampleRate);

        GateVerdict evaluate(const float* samples, size_t count) const;
    };

} // namespace Voice
