#pragma once
#include <iosfwd>
#include <mutex>

#include "output/transcript_sink.hpp"

namespace Output {

    // Live transcript on one rewritten terminal line, final block on finish
    class ConsoleSink : public TranscriptSink {
    public:
        explicit ConsoleSink(std::ostream& out);

        void onPartial(const std::string& transcriptSoFar) override;
        void onFinal(const std::string& transcript) override;

    private:
        std::ostream& out_;
        std::mutex mtx_;
        bool lineDirty_ = false;
    };

} // namespace Output
