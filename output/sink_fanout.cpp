#include "output/sink_fanout.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace Output {

void SinkFanout::add(TranscriptSink* sink) {
    if (sink) sinks_.push_back(sink);
}

void SinkFanout::onPartial(const std::string& transcriptSoFar) {
    for (auto* sink : sinks_) {
        try {
            sink->onPartial(transcriptSoFar);
        } catch (const std::exception& e) {
            LOG_ERROR("Output", std::string("Sink failed on partial: ") + e.what());
        }
    }
}

void SinkFanout::onFinal(const std::string& transcript) {
    for (auto* sink : sinks_) {
        try {
            sink->onFinal(transcript);
        } catch (const std::exception& e) {
            LOG_ERROR("Output", std::string("Sink failed on final: ") + e.what());
        }
    }
}

} // namespace Output
