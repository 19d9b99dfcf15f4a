#pragma once
#include <string>
#include <vector>

// Text helpers shared by the recognition engine and the commit controller
namespace TranscriptText {

    // Strip leading/trailing whitespace (space, tab, CR, LF)
    std::string trim(const std::string& input);

    // "[BLANK_AUDIO]", "[ Silence ]", "(music)" ... a whole string that is one
    // bracketed or parenthesised token
    bool isNonSpeechToken(const std::string& text);

    // Phrases whisper produces on noise or near-silence
    bool isHallucination(const std::string& text);

    // trim + drop non-speech tokens and hallucinations (returns "" for those)
    std::string cleanRecognizedText(const std::string& raw);

    // Fragments joined by a single space
    std::string joinFragments(const std::vector<std::string>& fragments);

}
