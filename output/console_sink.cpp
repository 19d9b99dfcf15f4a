#include "output/console_sink.hpp"

#include <ostream>

namespace Output {

static const char* kClearLine = "\r\033[K";
static const char* kSeparator = "----------------------------------------";

ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::onPartial(const std::string& transcriptSoFar) {
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << kClearLine << transcriptSoFar << std::flush;
    lineDirty_ = true;
}

void ConsoleSink::onFinal(const std::string& transcript) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (lineDirty_) {
        out_ << kClearLine;
        lineDirty_ = false;
    }
    out_ << kSeparator << "\n";
    out_ << (transcript.empty() ? std::string("(No speech detected)") : transcript) << "\n";
    out_ << kSeparator << std::endl;
}

} // namespace Output
