#pragma once
#include <string>

namespace Output {

    class TranscriptSink {
    public:
        virtual ~TranscriptSink() = default;

        // Full joined transcript after every successful commit
        virtual void onPartial(const std::string& transcriptSoFar) = 0;

        // Exactly once per session, when the controller reaches Flushed
        virtual void onFinal(const std::string& transcript) = 0;
    };

} // namespace Output
