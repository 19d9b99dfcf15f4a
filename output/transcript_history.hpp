#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "output/transcript_sink.hpp"

namespace Output {

    struct TranscriptEntry {
        int64_t timestamp = 0;       // unix seconds
        std::string datetime;        // local "YYYY-MM-DD HH:MM:SS"
        std::string text;
        uint64_t processTimeMs = 0;
    };

    void to_json(nlohmann::json& j, const TranscriptEntry& e);
    void from_json(const nlohmann::json& j, TranscriptEntry& e);

    // JSON array of past transcripts, oldest first
    class TranscriptHistory : public TranscriptSink {
    public:
        TranscriptHistory(std::filesystem::path path, int maxTranscripts);

        // Unreadable or corrupt file → empty list (logged)
        std::vector<TranscriptEntry> loadAll() const;

        // Append one entry and drop the oldest beyond maxTranscripts.
        // Empty text is ignored. Returns false if the file could not be written.
        bool append(const std::string& text,
                    uint64_t processTimeMs,
                    std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

        // Trim an existing file to maxTranscripts (no-op for 0)
        bool enforceMax();

        // Where onFinal() takes the session's recognition time from
        void setProcessTimeSource(std::function<uint64_t()> source);

        void onPartial(const std::string&) override {}
        void onFinal(const std::string& transcript) override;

        const std::filesystem::path& path() const { return path_; }

    private:
        bool saveAll(const std::vector<TranscriptEntry>& entries) const;

        std::filesystem::path path_;
        int maxTranscripts_;
        std::function<uint64_t()> processTime_;
        mutable std::mutex mtx_;
    };

} // namespace Output
