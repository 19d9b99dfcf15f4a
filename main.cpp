#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "device_setups/audio_devices.hpp"
#include "voice/portaudio_source.hpp"
#include "voice/voice_stream.hpp"
#include "voice/whisper_engine.hpp"
#include "output/clipboard_sink.hpp"
#include "output/console_sink.hpp"
#include "output/session_recorder.hpp"
#include "output/sink_fanout.hpp"
#include "output/transcript_history.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

// ---------------- Signal Handling ----------------
// The handler only flips the flag; the commit loop polls it
static std::atomic<bool> g_stopSignal{false};

static void handleStopSignal(int) {
    g_stopSignal = true;
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    CliOptions cli = bootstrap_config::parseCommandLine(argc, argv);
    if (!cli.error.empty()) {
        std::cerr << "Error: " << cli.error << "\n\n" << bootstrap_config::usage(argv[0]);
        return 2;
    }
    if (cli.help) {
        std::cout << bootstrap_config::usage(argv[0]);
        return 0;
    }
    if (cli.listDevices) {
        return AudioDevices::printDeviceList(std::cout, std::cerr) ? 0 : 1;
    }

    setConsoleLogging(cli.verbose);
    setLogLevel(cli.verbose ? LogLevel::Trace : LogLevel::Debug);
    initLogger(Settings().logFile);
    LOG_PHASE("Startup begin", true);

    BootstrapResult boot = runBootstrapChecks(cli);
    if (!boot.status.success) {
        std::cerr << boot.status.message << "\n";
        shutdownLogger();
        return 1;
    }
    const Settings& settings = boot.settings;

    if (settings.logFile != Settings().logFile) {
        LOG_DEBUG("Logger", "Switching log file to " + settings.logFile);
        shutdownLogger();
        initLogger(settings.logFile);
    }

    // ============================================================
    // Recognition engine
    // ============================================================
    std::cerr << "Loading model: " << boot.modelPath.filename().string() << "\n";
    Voice::WhisperEngine engine;
    if (!engine.load(boot.modelPath)) {
        std::cerr << ErrorManager::getUserMessage(ErrorCode::ModelLoadFailed) << "\n";
        shutdownLogger();
        return 1;
    }

    // ============================================================
    // Commit controller + outputs
    // ============================================================
    VoiceStream::ControllerConfig cc;
    cc.sampleRate    = settings.sampleRate;
    cc.chunkInterval = std::chrono::milliseconds(static_cast<long long>(settings.chunkIntervalSec * 1000.0));
    cc.gate          = Voice::SilenceGate::fromSeconds(settings.minSpanSec,
                                                       settings.silenceThreshold,
                                                       settings.sampleRate);
    cc.recognition.language        = settings.language;
    cc.recognition.threads         = settings.threads;
    cc.recognition.vadModel        = settings.vadModel;
    cc.recognition.vadMinSilenceMs = settings.vadMinSilenceMs;
    cc.recognition.vadSpeechPadMs  = settings.vadSpeechPadMs;

    Output::ConsoleSink console(std::cout);
    Output::ClipboardSink clipboard;
    Output::TranscriptHistory history(settings.historyFile, settings.maxTranscripts);

    Output::SinkFanout sinks;
    sinks.add(&console);
    if (settings.clipboardAutoCopy) {
        sinks.add(&clipboard);
    }
    sinks.add(&history);

    VoiceStream::StreamCommitController controller(cc, engine, sinks);
    history.setProcessTimeSource([&controller] { return controller.stats().totalProcessTimeMs; });

    if (!settings.saveAudio.empty()) {
        const std::string wavPath = settings.saveAudio;
        controller.setSessionAudioHandler([wavPath](const std::vector<float>& samples, int rate) {
            if (!Output::saveSessionAudio(wavPath, samples, rate)) {
                std::cerr << ErrorManager::getUserMessage(ErrorCode::AudioSave) << "\n";
            }
        });
    }

    Voice::PortAudioSource source(settings.sampleRate, settings.blockMs, settings.inputDeviceIndex);

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);
    // Clipboard tools may exit without reading the transcript
    std::signal(SIGPIPE, SIG_IGN);

    LOG_PHASE("Startup complete, listening", true);
    std::cerr << "Listening... (Ctrl+C to stop)\n";

    VoiceStream::SessionSummary summary = controller.runUntilStopped(source, &g_stopSignal);

    // ============================================================
    // Report
    // ============================================================
    if (!summary.result.success) {
        std::cerr << summary.result.message << "\n";
        shutdownLogger();
        return 1;
    }

    if (summary.captureFailed) {
        std::cerr << ErrorManager::getUserMessage(ErrorCode::CaptureFailed) << "\n";
    }

    if (settings.clipboardAutoCopy && !summary.transcript.empty()) {
        if (!clipboard.lastTool().empty()) {
            std::cerr << "Copied to clipboard (" << clipboard.lastTool() << ")\n";
        } else {
            std::cerr << ErrorManager::getUserMessage(ErrorCode::ClipboardFailed) << "\n";
        }
    }

    const auto& st = summary.stats;
    LOG_DEBUG("Session", "cycles=" + std::to_string(st.cycles) +
                         " silent=" + std::to_string(st.silentSpans) +
                         " recognised=" + std::to_string(st.recognitionCalls) +
                         " empty=" + std::to_string(st.emptyResults) +
                         " failed=" + std::to_string(st.failures) +
                         " process_ms=" + std::to_string(st.totalProcessTimeMs) +
                         " samples=" + std::to_string(summary.totalSamples));
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}
