#include "voice/silence_gate.hpp"

#include <cmath>

namespace Voice {

const char* toString(GateVerdict verdict) {
    switch (verdict) {
        case GateVerdict::TooShort:   return "too-short";
        case GateVerdict::Silent:     return "silent";
        case GateVerdict::Actionable: return "actionable";
    }
    return "unknown";
}

float peakAmplitude(const float* samples, size_t count) {
    float peak = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        float a = std::fabs(samples[i]);
        if (a > peak) peak = a;
    }
    return peak;
}

SilenceGate SilenceGate::fromSeconds(double minSpanSec, float threshold, int sampleRate) {
    SilenceGate gate;
    gate.minSpanSamples = static_cast<size_t>(std::lround(minSpanSec * sampleRate));
    gate.silenceThreshold = threshold;
    return gate;
}

GateVerdict SilenceGate::evaluate(const float* samples, size_t count) const {
    if (count == 0 || count < minSpanSamples) {
        return GateVerdict::TooShort;
    }
    if (peakAmplitude(samples, count) < silenceThreshold) {
        return GateVerdict::Silent;
    }
    return GateVerdict::Actionable;
}

} // namespace Voice
