// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioCapture.hpp>
#include <audio/AudioPlayback.hpp>
#include <audio/SpeechPlayback.hpp>
#include <audio/SpeechRecorder.hpp>
#include <audio/StaticMicrophonePermission.hpp>
#include <core/Executor.hpp>
#include <core/Log.hpp>
#include <core/Text.hpp>
#include <speech/HttpClient.hpp>
#include <speech/HttpProviderFactory.hpp>
#include <speech/SettingsStore.hpp>
#include <speech/SpeechConfig.hpp>

#include <format>
#include <map>
#include <print>
#include <string>
#include <utility>

namespace parley
{

namespace
{

    constexpr auto HelpText = std::string_view {
        "Commands:\n"
        "  <text>                 Speak a new message\n"
        "  /speak <id> <text>     Speak text as message <id>\n"
        "  /toggle [id]           Pause, resume or cancel a message (default: last)\n"
        "  /stop [id]             Stop playback (only if <id> is playing, when given)\n"
        "  /record                Start recording\n"
        "  /transcribe            Stop recording and print the transcript\n"
        "  /cancel                Abandon the current recording or transcription\n"
        "  /status                Show playback and recording state\n"
        "  /set <key> [value]     Change a speech setting (no value clears it)\n"
        "  /save                  Write the configuration file\n"
        "  /help                  Show this help\n"
        "  /quit                  Exit"
    };

    /// Splits "word rest" at the first whitespace; rest is trimmed.
    auto splitWord(std::string_view line) -> std::pair<std::string_view, std::string_view>
    {
        auto const trimmed = text::trim(line);
        auto const space = trimmed.find_first_of(text::Whitespace);
        if (space == std::string_view::npos)
            return { trimmed, {} };
        return { trimmed.substr(0, space), text::trim(trimmed.substr(space)) };
    }

    auto toPermissionStatus(MicrophoneAccess access) -> PermissionStatus
    {
        switch (access)
        {
            case MicrophoneAccess::Granted: return PermissionStatus::Authorized;
            case MicrophoneAccess::Denied: return PermissionStatus::Denied;
            case MicrophoneAccess::Prompt: return PermissionStatus::NotDetermined;
        }
        return PermissionStatus::Authorized;
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    std::string configPath;

    JsonSettingsStore settings;
    std::map<std::string, std::string, std::less<>> messages;
    std::string lastMessageId;
    int nextMessageNumber = 1;

    // Destroyed in reverse order: the coordinators go first, on the executor thread (see ~Impl).
    ThreadExecutor executor;
    AudioCapture capture;
    AudioPlayback playbackDevice;
    StaticMicrophonePermission permission;
    HttpProviderFactory providers;
    std::unique_ptr<SpeechPlayback> playback;
    std::unique_ptr<SpeechRecorder> recorder;

    Impl(AppConfig cfg, std::string path):
        config(std::move(cfg)),
        configPath(std::move(path)),
        settings(config.speech),
        permission(toPermissionStatus(config.audio.microphoneAccess)),
        providers(std::make_shared<CurlHttpClient>())
    {
    }

    ~Impl()
    {
        executor.runAndWait([this] {
            playback.reset();
            recorder.reset();
        });
        executor.shutdown();
    }

    void speak(const std::string& messageId, std::string_view text)
    {
        auto resolved = resolveTextToSpeech(settings);
        if (!resolved)
        {
            std::println("Error: {}", resolved.error().message);
            return;
        }

        messages[messageId] = std::string(text);
        lastMessageId = messageId;
        request(messageId, *resolved);
    }

    void toggle(std::string_view messageId)
    {
        auto const it = messages.find(messageId);
        if (it == messages.end())
        {
            std::println("Unknown message '{}'", messageId);
            return;
        }

        auto resolved = resolveTextToSpeech(settings);
        if (!resolved)
        {
            std::println("Error: {}", resolved.error().message);
            return;
        }
        request(it->first, *resolved);
    }

    void request(const std::string& messageId, const SynthesisConfig& synthesis)
    {
        auto const backend = backendOf(synthesis);
        auto const& text = messages[messageId];
        auto result = VoidResult {};
        executor.runAndWait([&] {
            result = playback->request(messageId, text, synthesis, [messageId, backend](const Error& error) {
                std::println("Speaking '{}' failed: {}", messageId, describeSynthesisError(error, backend));
            });
        });
        if (!result)
            std::println("Error: {}", result.error().message);
    }

    void stop(std::string_view messageId)
    {
        executor.runAndWait([&] {
            if (messageId.empty())
                playback->stop();
            else
                playback->stop(messageId);
        });
    }

    void startRecording()
    {
        executor.post([this] {
            recorder->startRecording(
                [](VoidResult result) {
                    if (result)
                        std::println("Recording... (/transcribe to finish, /cancel to abort)");
                    else
                        std::println("Error: {}", result.error().message);
                },
                [](const Error& error) { std::println("Recording stopped: {}", error.message); });
        });
    }

    void transcribe()
    {
        auto resolved = resolveSpeechToText(settings);
        if (!resolved)
        {
            std::println("Error: {}", resolved.error().message);
            return;
        }

        executor.post([this, transcription = std::move(*resolved)] {
            recorder->stopAndTranscribe(transcription, [](Result<std::string> transcript) {
                if (!transcript)
                    std::println("Transcription failed: {}", transcript.error().message);
                else if (transcript->empty())
                    std::println("(nothing recognized)");
                else
                    std::println("Transcript: {}", *transcript);
            });
        });
    }

    void printStatus()
    {
        executor.runAndWait([this] {
            auto const& state = playback->state();
            if (state.phase == PlaybackPhase::Idle)
                std::println("Playback: idle");
            else
                std::println("Playback: {} '{}' ({} clip(s) queued)",
                             phaseName(state.phase),
                             state.messageId,
                             playback->queuedClipCount());

            if (recorder->isRecording())
                std::println("Recording: {:.1f}s", recorder->elapsedSeconds());
            else
                std::println("Recording: {}", phaseName(recorder->state().phase));
        });
        std::println("Speech to text: {}, text to speech: {}",
                     backendName(selectedTranscriptionBackend(settings)),
                     backendName(selectedSynthesisBackend(settings)));
    }

    void setSetting(std::string_view arguments)
    {
        auto const [key, value] = splitWord(arguments);
        if (key.empty())
        {
            std::println("Usage: /set <key> [value]");
            return;
        }

        if (value.empty())
            settings.set(key, nullptr);
        else
            settings.set(key, std::string(value));
        config.speech = settings.values();
        std::println("{} {}", key, value.empty() ? "cleared" : "updated");
    }

    void save()
    {
        if (auto saved = saveConfigToFile(configPath, config); !saved)
            std::println("Error: {}", saved.error().message);
        else
            std::println("Saved {}", configPath);
    }
};

App::App(AppConfig config, std::string configPath):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    if (auto captureResult = _impl->capture.initialize(_impl->config.audio.captureDevice); !captureResult)
        log::warning("Audio capture unavailable: {}", captureResult.error().message);

    _impl->executor.runAndWait([this] {
        auto& impl = *_impl;
        impl.playback = std::make_unique<SpeechPlayback>(impl.executor, impl.playbackDevice, impl.providers);
        impl.recorder =
            std::make_unique<SpeechRecorder>(impl.executor, impl.capture, impl.permission, impl.providers);

        impl.playback->setStateObserver([](const PlaybackState& state) {
            log::debug("Playback state: {} {}", phaseName(state.phase), state.messageId);
        });
        impl.recorder->setStateObserver([](const RecordingState& state) {
            log::debug("Recording state: {}", phaseName(state.phase));
        });
    });

    log::info("Speech to text via {}, text to speech via {}",
              backendName(selectedTranscriptionBackend(_impl->settings)),
              backendName(selectedSynthesisBackend(_impl->settings)));
    return {};
}

auto App::run(std::istream& input) -> int
{
    std::println("parley: type text to speak it, /help for commands.");

    auto line = std::string {};
    while (std::getline(input, line))
    {
        auto const trimmed = text::trim(line);
        if (trimmed.empty())
            continue;

        if (!trimmed.starts_with('/'))
        {
            auto const id = std::format("msg-{}", _impl->nextMessageNumber++);
            std::println("[{}]", id);
            _impl->speak(id, trimmed);
            continue;
        }

        auto const [command, arguments] = splitWord(trimmed);
        if (command == "/quit" || command == "/exit")
            break;
        else if (command == "/help")
            std::println("{}", HelpText);
        else if (command == "/speak")
        {
            auto const [id, text] = splitWord(arguments);
            if (id.empty() || text.empty())
                std::println("Usage: /speak <id> <text>");
            else
                _impl->speak(std::string(id), text);
        }
        else if (command == "/toggle")
            _impl->toggle(arguments.empty() ? std::string_view(_impl->lastMessageId) : arguments);
        else if (command == "/stop")
            _impl->stop(arguments);
        else if (command == "/record")
            _impl->startRecording();
        else if (command == "/transcribe")
            _impl->transcribe();
        else if (command == "/cancel")
            _impl->executor.post([this] { _impl->recorder->cancelAndCleanup(); });
        else if (command == "/status")
            _impl->printStatus();
        else if (command == "/set")
            _impl->setSetting(arguments);
        else if (command == "/save")
            _impl->save();
        else
            std::println("Unknown command '{}'. Type /help for commands.", command);
    }

    return 0;
}

} // namespace parley
