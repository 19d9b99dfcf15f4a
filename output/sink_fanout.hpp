#pragma once
#include <vector>

#include "output/transcript_sink.hpp"

namespace Output {

    // Forwards to each registered sink in order. Sinks are not owned.
    class SinkFanout : public TranscriptSink {
    public:
        void add(TranscriptSink* sink);
        size_t size() const { return sinks_.size(); }

        void onPartial(const std::string& transcriptSoFar) override;
        void onFinal(const std::string& transcript) override;

    private:
        std::vector<TranscriptSink*> sinks_;
    };

} // namespace Output
