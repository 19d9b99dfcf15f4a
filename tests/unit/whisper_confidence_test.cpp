#include <cassert>
#include <cmath>
#include <vector>

#include "voice/whisper_engine.hpp"

using Voice::TokenScore;

static bool near(float a, float b) {
    return std::fabs(a - b) < 1e-5f;
}

int main() {
    const int eot = 50257;

    // Timestamp and end-of-text tokens carry high probabilities that would
    // inflate the score
    std::vector<TokenScore> tokens = {
        { 50364, 0.99f },   // timestamp
        { 440, 0.60f },
        { 2068, 0.80f },
        { eot, 1.00f },
    };
    assert(near(Voice::meanTextTokenConfidence(tokens, eot), 0.70f));

    assert(near(Voice::meanTextTokenConfidence({ { eot, 0.9f }, { eot + 1, 0.9f } }, eot), 0.0f));
    assert(near(Voice::meanTextTokenConfidence({}, eot), 0.0f));
    assert(near(Voice::meanTextTokenConfidence({ { 0, 0.25f } }, eot), 0.25f));
    return 0;
}
