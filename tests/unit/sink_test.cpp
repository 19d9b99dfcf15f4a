#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "output/clipboard_sink.hpp"
#include "output/console_sink.hpp"
#include "output/sink_fanout.hpp"
#include "test_support.hpp"

class ThrowingSink : public Output::TranscriptSink {
public:
    void onPartial(const std::string&) override { throw std::runtime_error("partial"); }
    void onFinal(const std::string&) override { throw std::runtime_error("final"); }
};

static void consoleRewritesLine() {
    std::ostringstream out;
    Output::ConsoleSink console(out);
    console.onPartial("hello");
    console.onPartial("hello world");
    console.onFinal("hello world");

    std::string s = out.str();
    assert(s.find("\r\033[Khello\r\033[Khello world") == 0);
    assert(s.find("hello world\n") != std::string::npos);

    std::ostringstream empty;
    Output::ConsoleSink silent(empty);
    silent.onFinal("");
    assert(empty.str().find("(No speech detected)") != std::string::npos);
}

static void clipboardFallsBack() {
    std::vector<std::string> tried;
    Output::ClipboardSink clip([&](const std::string& cmd, const std::string& text) {
        tried.push_back(cmd);
        assert(text == "copy me");
        return cmd.rfind("xclip", 0) == 0;
    });

    clip.onFinal("copy me");
    assert(tried.size() == 2);
    assert(tried[0] == "wl-copy");
    assert(clip.lastTool() == "xclip");

    // Empty transcript is never copied
    tried.clear();
    clip.onFinal("");
    assert(tried.empty());
    assert(clip.lastTool().empty());

    Output::ClipboardSink none([](const std::string&, const std::string&) { return false; });
    none.onFinal("text");
    assert(none.lastTool().empty());
}

// A tool that never reads stdin must fail cleanly so the fallback and the
// sinks after the clipboard still run
static void missingClipboardToolFallsBack() {
    const std::string missing = "livescribe-no-such-clipboard-tool";
    const std::string big(200000, 'a');

    assert(!Output::runClipboardCommand(missing, big));
    assert(!Output::runClipboardCommand(missing, "short"));
    assert(Output::runClipboardCommand("cat", "short"));

    Output::ClipboardSink clip([&](const std::string& cmd, const std::string& text) {
        return Output::runClipboardCommand(cmd == "wl-copy" ? missing : "cat", text);
    });
    test::RecordingSink after;

    Output::SinkFanout fan;
    fan.add(&clip);
    fan.add(&after);

    for (int i = 0; i < 5; ++i) {
        fan.onFinal(big);
        assert(clip.lastTool() == "xclip");
    }
    assert(after.finals.size() == 5);
    assert(after.finals.back().size() == big.size());
}

static void fanoutIsolatesFailures() {
    ThrowingSink bad;
    test::RecordingSink a;
    test::RecordingSink b;

    Output::SinkFanout fan;
    fan.add(&a);
    fan.add(&bad);
    fan.add(nullptr);
    fan.add(&b);
    assert(fan.size() == 3);

    fan.onPartial("x");
    fan.onFinal("x y");
    assert(a.partials.size() == 1 && b.partials.size() == 1);
    assert(a.finals.size() == 1 && b.finals[0] == "x y");
}

int main() {
    consoleRewritesLine();
    clipboardFallsBack();
    missingClipboardToolFallsBack();
    fanoutIsolatesFailures();
    return 0;
}
