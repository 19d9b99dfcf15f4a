#include "voice/transcript_text.hpp"

#include <algorithm>

namespace TranscriptText {

std::string trim(const std::string& input) {
    size_t a = input.find_first_not_of(" \t\r\n");
    size_t b = input.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    return input.substr(a, b - a + 1);
}

bool isNonSpeechToken(const std::string& text) {
    std::string t = trim(text);
    if (t.size() < 2) return false;
    return (t.front() == '[' && t.back() == ']') ||
           (t.front() == '(' && t.back() == ')');
}

bool isHallucination(const std::string& text) {
    static const std::vector<std::string> phrases = {
        "you",
        "Thank you.",
        "Thanks for watching!",
        "Bye.",
        "..."
    };
    std::string t = trim(text);
    return std::find(phrases.begin(), phrases.end(), t) != phrases.end();
}

std::string cleanRecognizedText(const std::string& raw) {
    std::string t = trim(raw);
    if (t.empty() || isNonSpeechToken(t) || isHallucination(t)) {
        return {};
    }
    return t;
}

std::string joinFragments(const std::vector<std::string>& fragments) {
    std::string out;
    for (const auto& f : fragments) {
        if (f.empty()) continue;
        if (!out.empty()) out += ' ';
        out += f;
    }
    return out;
}

} // namespace TranscriptText
