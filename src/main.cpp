#include <atomic>
#include <chrono>
#include <deque>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include "AudioRecorder/RecordingSession.hpp"
#include "AudioRecorder/RtAudioInputDevice.hpp"
#include "Playback/RtAudioClipTrack.hpp"
#include "Playback/SyncPlaybackCoordinator.hpp"
#include "SavingWorkers/WavFileWorker.hpp"
#include "common/RecorderConfig.hpp"
#include "common/Timecode.hpp"
#include "common/debug_log.hpp"

namespace {

// Lines typed on stdin, shared with the reader thread.
struct CommandQueue {
    std::mutex mutex;
    std::deque<std::string> lines;
};

// Terminal stand-in for the video element: tracks and prints its state.
class ConsoleVideoSurface : public IVideoSurface {
public:
    void SetMuted(bool muted) noexcept override {
        _muted = muted;
        std::cout << "[VIDEO] " << (muted ? "muted" : "unmuted") << std::endl;
    }
    bool IsMuted() const override { return _muted; }
    void SeekToStart() override { std::cout << "[VIDEO] rewind to 00:00:00:000" << std::endl; }
    void Play() override {
        _paused = false;
        std::cout << "[VIDEO] play" << std::endl;
    }
    void Pause() noexcept override {
        if (!_paused) {
            std::cout << "[VIDEO] pause" << std::endl;
        }
        _paused = true;
    }
    bool IsPaused() const override { return _paused; }

private:
    bool _muted = false;
    bool _paused = true;
};

} // namespace

class DubRecorderApplication {
public:
    DubRecorderApplication(const RecorderConfig& config, const DialogueWindow& window)
        : _config(config)
        , _window(window)
        , _session(config, []() { return std::make_unique<RtAudioInputDevice>(); })
        , _playback(MakeLocalTrackFactory())
        , _commands(std::make_shared<CommandQueue>())
        , _running(true) {
    }

    bool Run() {
        _session.SetPhaseCallback([this](RecordingSession::Phase phase) {
            OnPhaseChanged(phase);
        });
        _playback.SetStateCallback([](bool playing) {
            std::cout << "[PLAYBACK] " << (playing ? "playing" : "stopped") << std::endl;
        });

        PrintHelp();

        // stdin is read on its own thread; the session is only touched from this one.
        std::thread reader(&DubRecorderApplication::ReadCommands, _commands);

        while (_running) {
            std::string command;
            if (PopCommand(command)) {
                if (!ProcessCommand(command)) {
                    _running = false;
                    break;
                }
            }

            _session.Pump();
            _playback.Poll();
            ReportProgress();

            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        _playback.Stop();
        _session.Discard();
        // Blocked in getline until stdin closes; it only holds the shared queue.
        reader.detach();
        return true;
    }

private:
    static void ReadCommands(std::shared_ptr<CommandQueue> commands) {
        std::string line;
        while (std::getline(std::cin, line)) {
            std::lock_guard<std::mutex> lock(commands->mutex);
            commands->lines.push_back(line);
        }
        std::lock_guard<std::mutex> lock(commands->mutex);
        commands->lines.push_back("quit");
    }

    bool PopCommand(std::string& command) {
        std::lock_guard<std::mutex> lock(_commands->mutex);
        if (_commands->lines.empty()) {
            return false;
        }
        command = _commands->lines.front();
        _commands->lines.pop_front();
        return true;
    }

    void OnPhaseChanged(RecordingSession::Phase phase) {
        std::cout << "[STATE] " << ToString(phase) << std::endl;
        if (phase == RecordingSession::Phase::Encoded && _session.GetClip()) {
            const EncodedClip& clip = *_session.GetClip();
            const double window = _session.GetMaxDurationSeconds();
            std::cout << "Recorded " << FormatTimecode(clip.GetDurationSeconds()) << " ("
                      << clip.GetBytes().size() << " bytes, " << EncodedClip::MIME_TYPE << ")";
            if (!DurationsMatch(clip.GetDurationSeconds(), window, _config.durationTolerance)) {
                std::cout << " - duration mismatch, window is " << FormatTimecode(window);
            }
            std::cout << std::endl;
        }
    }

    void ReportProgress() {
        if (!_session.IsRecording()) {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now - _lastReport < std::chrono::milliseconds(500)) {
            return;
        }
        _lastReport = now;
        std::cout << "  " << FormatTimecode(_session.ElapsedSeconds()) << " / "
                  << FormatTimecode(_session.GetMaxDurationSeconds())
                  << "  peak " << std::fixed << std::setprecision(2) << _session.GetPeakLevel()
                  << std::defaultfloat << std::endl;
    }

    bool ProcessCommand(const std::string& line) {
        std::istringstream input(line);
        std::string command;
        input >> command;

        try {
            if (command.empty()) {
                return true;
            }
            else if (command == "record") {
                _playback.Stop();
                // Re-recording replaces the previous take.
                if (_session.GetPhase() == RecordingSession::Phase::Encoded
                    || _session.GetPhase() == RecordingSession::Phase::Error) {
                    _session.Discard();
                }
                _session.Start(_window);
            }
            else if (command == "stop") {
                _session.Stop();
            }
            else if (command == "play") {
                if (_session.HasClip()) {
                    _playback.Toggle(_video, *_session.GetClip());
                } else if (_window.voiceOverUrl) {
                    _playback.Toggle(_video, *_window.voiceOverUrl);
                } else {
                    std::cout << "Nothing recorded yet" << std::endl;
                }
            }
            else if (command == "save") {
                std::string filename;
                input >> filename;
                Save(filename.empty() ? "voice_over.wav" : filename);
            }
            else if (command == "discard") {
                _playback.Stop();
                _session.Discard();
            }
            else if (command == "status") {
                PrintStatus();
            }
            else if (command == "quit" || command == "exit") {
                return false;
            }
            else if (command == "help") {
                PrintHelp();
            }
            else {
                std::cout << "Unknown command: " << command << std::endl;
                PrintHelp();
            }
        } catch (const DeviceUnavailableException& e) {
            std::cerr << "Microphone unavailable (" << ToString(e.GetReason()) << "): "
                      << e.what() << std::endl;
            std::cerr << "Use 'discard' and try again." << std::endl;
        } catch (const DubCaptureException& e) {
            std::cerr << "Error: " << e.what() << std::endl;
        }
        return true;
    }

    void Save(const std::string& filename) {
        if (!_session.HasClip()) {
            std::cout << "Nothing to save" << std::endl;
            return;
        }
        WavFileWorker worker(filename);
        worker.SetClip(*_session.GetClip());
        if (worker.Save()) {
            std::cout << "Saved " << filename << std::endl;
        } else {
            std::cerr << "Error saving file!" << std::endl;
        }
    }

    void PrintStatus() {
        std::cout << "Phase: " << ToString(_session.GetPhase())
                  << ", elapsed " << FormatTimecode(_session.ElapsedSeconds())
                  << ", limit " << FormatTimecode(_window.MaxDurationSeconds());
        if (!_session.GetLastError().empty()) {
            std::cout << ", last error: " << _session.GetLastError();
        }
        std::cout << std::endl;
    }

    void PrintHelp() {
        std::cout << "\n=== Voice-over recorder " << _window.timeStart << " - " << _window.timeEnd
                  << " ===" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  record       - Start recording (stops at the end of the dialogue window)" << std::endl;
        std::cout << "  stop         - Stop recording" << std::endl;
        std::cout << "  play         - Play / stop synced playback" << std::endl;
        std::cout << "  save [file]  - Write the recording as WAV" << std::endl;
        std::cout << "  discard      - Drop the recording" << std::endl;
        std::cout << "  status       - Show the session state" << std::endl;
        std::cout << "  help         - Show this help" << std::endl;
        std::cout << "  quit         - Exit application" << std::endl;
        std::cout << "===============================\n" << std::endl;
    }

    RecorderConfig _config;
    DialogueWindow _window;
    RecordingSession _session;
    SyncPlaybackCoordinator _playback;
    ConsoleVideoSurface _video;

    std::shared_ptr<CommandQueue> _commands;
    std::atomic<bool> _running;
    std::chrono::steady_clock::time_point _lastReport;
};

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <timeStart> <timeEnd> [config.json] [voiceOverUrl]" << std::endl;
        std::cout << "Example: " << argv[0] << " 00:00:01:000 00:00:04:000 recorder.json" << std::endl;
        return 1;
    }

    DialogueWindow window;
    window.timeStart = argv[1];
    window.timeEnd = argv[2];
    if (argc > 4) {
        window.voiceOverUrl = std::string(argv[4]);
    }

    try {
        const double limit = window.MaxDurationSeconds();
        DEBUG_LOG("Dialogue window allows " << FormatTimecode(limit) << DEBUG_LOG_ENDL);
        RecorderConfig config = argc > 3 ? RecorderConfig::LoadFromFile(argv[3]) : RecorderConfig();

        DubRecorderApplication app(config, window);
        return app.Run() ? 0 : 1;
    } catch (const DubCaptureException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}
