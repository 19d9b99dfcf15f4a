#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>

#include "output/transcript_history.hpp"

namespace fs = std::filesystem;

int main() {
    fs::path path = fs::temp_directory_path() / "livescribe_history_test" / "transcripts.json";
    fs::remove_all(path.parent_path());

    Output::TranscriptHistory history(path, 3);
    assert(history.loadAll().empty());

    // Empty text never recorded
    assert(history.append("", 10));
    assert(!fs::exists(path));

    auto t0 = std::chrono::system_clock::from_time_t(1700000000);
    for (int i = 0; i < 5; ++i) {
        assert(history.append("entry " + std::to_string(i), 100 + i, t0 + std::chrono::seconds(i)));
    }

    auto all = history.loadAll();
    assert(all.size() == 3);
    assert(all.front().text == "entry 2");
    assert(all.back().text == "entry 4");
    assert(all.back().timestamp == 1700000004);
    assert(all.back().processTimeMs == 104);
    assert(all.back().datetime.size() == 19);

    // onFinal takes the process time from the registered source
    history.setProcessTimeSource([] { return static_cast<uint64_t>(777); });
    history.onFinal("from session");
    all = history.loadAll();
    assert(all.back().text == "from session");
    assert(all.back().processTimeMs == 777);

    // Unbounded history keeps everything; trimming an existing file later
    Output::TranscriptHistory unbounded(path, 0);
    assert(unbounded.append("more", 1));
    assert(unbounded.loadAll().size() == 4);
    Output::TranscriptHistory trimmer(path, 2);
    assert(trimmer.enforceMax());
    assert(trimmer.loadAll().size() == 2);

    // Corrupt file reads as empty and is replaced on the next append
    { std::ofstream(path) << "[{broken"; }
    assert(history.loadAll().empty());
    assert(history.append("fresh", 1));
    assert(history.loadAll().size() == 1);

    fs::remove_all(path.parent_path());
    return 0;
}
