#include "output/transcript_history.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace Output {

// ------------------------------------------------------------
// JSON mapping
// ------------------------------------------------------------
void to_json(nlohmann::json& j, const TranscriptEntry& e) {
    j = nlohmann::json{
        {"timestamp", e.timestamp},
        {"datetime", e.datetime},
        {"text", e.text},
        {"process_time_ms", e.processTimeMs}
    };
}

void from_json(const nlohmann::json& j, TranscriptEntry& e) {
    e.timestamp     = j.value("timestamp", static_cast<int64_t>(0));
    e.datetime      = j.value("datetime", std::string());
    e.text          = j.value("text", std::string());
    e.processTimeMs = j.value("process_time_ms", static_cast<uint64_t>(0));
}

static std::string formatLocal(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

// ------------------------------------------------------------
// TranscriptHistory
// ------------------------------------------------------------
TranscriptHistory::TranscriptHistory(fs::path path, int maxTranscripts)
    : path_(std::move(path)), maxTranscripts_(maxTranscripts) {}

std::vector<TranscriptEntry> TranscriptHistory::loadAll() const {
    std::vector<TranscriptEntry> entries;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return entries;
    }

    try {
        std::ifstream in(path_);
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_array()) {
            LOG_ERROR("History", path_.string() + " is not a JSON array; starting empty");
            return entries;
        }
        for (const auto& item : j) {
            if (item.is_object()) {
                entries.push_back(item.get<TranscriptEntry>());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("History", "Failed to parse " + path_.string() + ": " + e.what());
        entries.clear();
    }
    return entries;
}

bool TranscriptHistory::saveAll(const std::vector<TranscriptEntry>& entries) const {
    try {
        std::error_code ec;
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path(), ec);
        }

        std::ofstream out(path_, std::ios::trunc);
        if (!out) {
            ErrorManager::report(ErrorCode::HistoryWrite, path_.string());
            return false;
        }
        out << nlohmann::json(entries).dump(2);
        return static_cast<bool>(out);
    } catch (const std::exception& e) {
        ErrorManager::report(ErrorCode::HistoryWrite, e.what());
        return false;
    }
}

bool TranscriptHistory::append(const std::string& text,
                               uint64_t processTimeMs,
                               std::chrono::system_clock::time_point when) {
    if (text.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    auto entries = loadAll();

    TranscriptEntry entry;
    entry.timestamp = static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                               when.time_since_epoch()).count());
    entry.datetime      = formatLocal(when);
    entry.text          = text;
    entry.processTimeMs = processTimeMs;
    entries.push_back(entry);

    if (maxTranscripts_ > 0 && entries.size() > static_cast<size_t>(maxTranscripts_)) {
        entries.erase(entries.begin(), entries.end() - maxTranscripts_);
    }

    if (!saveAll(entries)) {
        return false;
    }
    LOG_DEBUG("History", "Saved transcript (" + std::to_string(entries.size()) + " in " + path_.string() + ")");
    return true;
}

bool TranscriptHistory::enforceMax() {
    if (maxTranscripts_ <= 0) return true;

    std::lock_guard<std::mutex> lock(mtx_);
    auto entries = loadAll();
    if (entries.size() <= static_cast<size_t>(maxTranscripts_)) {
        return true;
    }
    entries.erase(entries.begin(), entries.end() - maxTranscripts_);
    return saveAll(entries);
}

void TranscriptHistory::setProcessTimeSource(std::function<uint64_t()> source) {
    processTime_ = std::move(source);
}

void TranscriptHistory::onFinal(const std::string& transcript) {
    append(transcript, processTime_ ? processTime_() : 0);
}

} // namespace Output
