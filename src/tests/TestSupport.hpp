// SPDX-License-Identifier: Apache-2.0
#pragma once

// Fakes for the device, provider and HTTP seams, plus an executor that the test thread drains by hand.

#include <audio/Devices.hpp>
#include <audio/WavContainer.hpp>
#include <core/Executor.hpp>
#include <speech/HttpClient.hpp>
#include <speech/Providers.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace parley::test
{

inline auto bytesOf(std::string_view text) -> std::vector<std::uint8_t>
{
    return { text.begin(), text.end() };
}

inline auto textOf(const std::vector<std::uint8_t>& bytes) -> std::string
{
    return { bytes.begin(), bytes.end() };
}

/// Executor whose tasks run on the test thread, inside runPending() or runUntil().
class ManualExecutor final: public Executor
{
  public:
    void post(Task task) override
    {
        {
            auto lock = std::lock_guard(_mutex);
            _tasks.push_back(std::move(task));
        }
        _cv.notify_all();
    }

    /// Runs the tasks queued so far. Returns how many ran.
    auto runPending() -> std::size_t
    {
        auto batch = std::deque<Task> {};
        {
            auto lock = std::lock_guard(_mutex);
            batch.swap(_tasks);
        }
        for (auto& task: batch)
            task();
        return batch.size();
    }

    /// Runs tasks as they arrive until @p done holds or @p timeout passes.
    auto runUntil(const std::function<bool()>& done,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds { 5000 }) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout;
        while (!done())
        {
            {
                auto lock = std::unique_lock(_mutex);
                if (!_cv.wait_until(lock, deadline, [this] { return !_tasks.empty(); }))
                    return done();
            }
            runPending();
        }
        return true;
    }

    /// Keeps running tasks for @p duration, for checks that nothing else arrives.
    void drainFor(std::chrono::milliseconds duration)
    {
        auto const deadline = std::chrono::steady_clock::now() + duration;
        while (std::chrono::steady_clock::now() < deadline)
        {
            {
                auto lock = std::unique_lock(_mutex);
                _cv.wait_until(lock, deadline, [this] { return !_tasks.empty(); });
            }
            runPending();
        }
    }

  private:
    std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<Task> _tasks;
};

/// A latch that blocks callers until opened.
class Gate
{
  public:
    void wait()
    {
        auto lock = std::unique_lock(_mutex);
        ++_waiting;
        _cv.notify_all();
        _cv.wait(lock, [this] { return _open; });
    }

    void open()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _open = true;
        }
        _cv.notify_all();
    }

    /// Blocks until at least @p count callers have reached wait().
    auto awaitWaiters(int count, std::chrono::milliseconds timeout = std::chrono::milliseconds { 5000 }) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        return _cv.wait_for(lock, timeout, [&] { return _waiting >= count; });
    }

  private:
    std::mutex _mutex;
    std::condition_variable _cv;
    int _waiting = 0;
    bool _open = false;
};

// {{{ playback

struct FakeClip
{
    std::vector<std::uint8_t> bytes;
    PlayerEvents events;
    bool playing = false;
    bool paused = false;
    bool stopped = false;
};

class FakePlayer final: public AudioPlayer
{
  public:
    explicit FakePlayer(std::shared_ptr<FakeClip> clip): _clip(std::move(clip)) {}

    auto play() -> VoidResult override
    {
        _clip->playing = true;
        return {};
    }

    void pause() override
    {
        _clip->playing = false;
        _clip->paused = true;
    }

    auto resume() -> VoidResult override
    {
        _clip->playing = true;
        _clip->paused = false;
        return {};
    }

    void stop() override
    {
        _clip->playing = false;
        _clip->stopped = true;
    }

    [[nodiscard]] auto isPlaying() const -> bool override { return _clip->playing; }

  private:
    std::shared_ptr<FakeClip> _clip;
};

/// Records every loaded clip. Clips are finished by the test via finishCurrent().
class FakePlaybackDevice final: public PlaybackDevice
{
  public:
    auto load(std::vector<std::uint8_t> bytes, PlayerEvents events) -> Result<std::unique_ptr<AudioPlayer>> override
    {
        if (failNextLoad)
        {
            failNextLoad = false;
            return makeError(ErrorCode::PlaybackDecodeError, "Unrecognized audio data");
        }

        auto clip = std::make_shared<FakeClip>(FakeClip { .bytes = std::move(bytes), .events = std::move(events) });
        clips.push_back(clip);
        return std::make_unique<FakePlayer>(clip);
    }

    /// The clip that is loaded and not stopped, if any.
    [[nodiscard]] auto current() const -> std::shared_ptr<FakeClip>
    {
        for (auto it = clips.rbegin(); it != clips.rend(); ++it)
            if (!(*it)->stopped)
                return *it;
        return nullptr;
    }

    /// Reports the end of the current clip, as the audio thread would.
    void finishCurrent()
    {
        if (auto clip = current(); clip && clip->events.onFinished)
            clip->events.onFinished();
    }

    void failCurrent(Error error)
    {
        if (auto clip = current(); clip && clip->events.onDecodeError)
            clip->events.onDecodeError(std::move(error));
    }

    [[nodiscard]] auto loadedTexts() const -> std::vector<std::string>
    {
        auto texts = std::vector<std::string> {};
        for (auto const& clip: clips)
            texts.push_back(textOf(clip->bytes));
        return texts;
    }

    std::vector<std::shared_ptr<FakeClip>> clips;
    bool failNextLoad = false;
};

// }}}

// {{{ recording

/// Writes a tiny WAV file on start so that transcription has something to read.
class FakeCaptureDevice final: public CaptureDevice
{
  public:
    auto start(const std::filesystem::path& file, const CaptureFormat& format, EncodeErrorHandler onEncodeError)
        -> VoidResult override
    {
        ++startCount;
        lastFormat = format;
        if (startError)
            return std::unexpected(*startError);

        auto const silence = std::vector<std::uint8_t>(3200, 0);
        auto const wav = wav::wrapPcm16LeMono(silence, format.sampleRate);
        auto out = std::ofstream(file, std::ios::binary);
        out.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));

        _onEncodeError = std::move(onEncodeError);
        _capturing = true;
        return {};
    }

    void stop() override
    {
        _capturing = false;
        _onEncodeError = nullptr;
    }

    [[nodiscard]] auto isCapturing() const -> bool override { return _capturing; }

    /// Reports a write failure from another thread, as the audio callback would.
    void failEncoding(std::string message)
    {
        auto handler = _onEncodeError;
        auto thread = std::jthread([handler, message = std::move(message)] {
            if (handler)
                handler(Error { ErrorCode::IoError, message });
        });
    }

    std::optional<Error> startError;
    int startCount = 0;
    CaptureFormat lastFormat;

  private:
    EncodeErrorHandler _onEncodeError;
    std::atomic<bool> _capturing = false;
};

class FakePermission final: public MicrophonePermission
{
  public:
    explicit FakePermission(PermissionStatus status, bool answer = true): _status(status), _answer(answer) {}

    [[nodiscard]] auto status() const -> PermissionStatus override { return _status.load(); }

    [[nodiscard]] auto request() -> bool override
    {
        ++requestCount;
        _status = _answer ? PermissionStatus::Authorized : PermissionStatus::Denied;
        return _answer;
    }

    std::atomic<int> requestCount = 0;

  private:
    std::atomic<PermissionStatus> _status;
    bool _answer;
};

// }}}

// {{{ providers

using SynthesizeFunction = std::function<Result<std::vector<std::uint8_t>>(const SynthesisRequest&)>;
using TranscribeFunction = std::function<Result<std::string>(const TranscriptionRequest&, bool translate)>;

/// Provider factory whose providers call back into test-supplied functions from the job threads.
class FakeProviderFactory final: public SpeechProviderFactory
{
  public:
    struct Shared
    {
        std::mutex mutex;
        std::vector<std::string> synthesized;
        std::vector<bool> transcribeCalls; ///< true for translate()
        std::size_t lastAudioSize = 0;
        SynthesizeFunction synthesize;
        TranscribeFunction transcribe;
    };

    FakeProviderFactory()
    {
        _shared->synthesize = [](const SynthesisRequest& request) -> Result<std::vector<std::uint8_t>> {
            return bytesOf(request.text);
        };
        _shared->transcribe = [](const TranscriptionRequest&, bool) -> Result<std::string> {
            return std::string { "  hello world \n" };
        };
    }

    void onSynthesize(SynthesizeFunction function) { _shared->synthesize = std::move(function); }
    void onTranscribe(TranscribeFunction function) { _shared->transcribe = std::move(function); }

    [[nodiscard]] auto synthesizedTexts() const -> std::vector<std::string>
    {
        auto lock = std::lock_guard(_shared->mutex);
        return _shared->synthesized;
    }

    [[nodiscard]] auto transcribeCalls() const -> std::vector<bool>
    {
        auto lock = std::lock_guard(_shared->mutex);
        return _shared->transcribeCalls;
    }

    [[nodiscard]] auto lastAudioSize() const -> std::size_t
    {
        auto lock = std::lock_guard(_shared->mutex);
        return _shared->lastAudioSize;
    }

    auto makeTranscriber(const TranscriptionConfig&) -> std::unique_ptr<TranscriptionProvider> override
    {
        return std::make_unique<Transcriber>(_shared);
    }

    auto makeSynthesizer(const SynthesisConfig&) -> std::unique_ptr<SynthesisProvider> override
    {
        return std::make_unique<Synthesizer>(_shared);
    }

  private:
    class Synthesizer final: public SynthesisProvider
    {
      public:
        explicit Synthesizer(std::shared_ptr<Shared> shared): _shared(std::move(shared)) {}

        auto synthesize(const SynthesisRequest& request, std::stop_token) -> Result<std::vector<std::uint8_t>> override
        {
            {
                auto lock = std::lock_guard(_shared->mutex);
                _shared->synthesized.push_back(request.text);
            }
            return _shared->synthesize(request);
        }

      private:
        std::shared_ptr<Shared> _shared;
    };

    class Transcriber final: public TranscriptionProvider
    {
      public:
        explicit Transcriber(std::shared_ptr<Shared> shared): _shared(std::move(shared)) {}

        auto transcribe(const TranscriptionRequest& request, std::stop_token) -> Result<std::string> override
        {
            return call(request, false);
        }

        auto translate(const TranscriptionRequest& request, std::stop_token) -> Result<std::string> override
        {
            return call(request, true);
        }

      private:
        auto call(const TranscriptionRequest& request, bool translate) -> Result<std::string>
        {
            {
                auto lock = std::lock_guard(_shared->mutex);
                _shared->transcribeCalls.push_back(translate);
                _shared->lastAudioSize = request.audio.size();
            }
            return _shared->transcribe(request, translate);
        }

        std::shared_ptr<Shared> _shared;
    };

    std::shared_ptr<Shared> _shared = std::make_shared<Shared>();
};

// }}}

// {{{ http

/// What a FakeHttpClient saw, with the file part copied out of the caller's buffer.
struct RecordedRequest
{
    HttpRequest request;
    std::vector<std::uint8_t> fileContents;

    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>
    {
        for (auto const& [key, value]: request.headers)
            if (key == name)
                return value;
        return std::nullopt;
    }

    [[nodiscard]] auto formValues(std::string_view name) const -> std::vector<std::string>
    {
        auto values = std::vector<std::string> {};
        for (auto const& [key, value]: request.formFields)
            if (key == name)
                values.push_back(value);
        return values;
    }
};

/// Answers every request with a canned response, classified the way CurlHttpClient does it.
class FakeHttpClient final: public HttpClient
{
  public:
    auto post(const HttpRequest& request, std::stop_token) -> Result<HttpResponse> override
    {
        auto recorded = RecordedRequest { .request = request };
        if (request.file)
        {
            recorded.fileContents.assign(request.file->contents.begin(), request.file->contents.end());
            recorded.request.file->contents = {};
        }
        requests.push_back(std::move(recorded));

        if (transportError)
            return std::unexpected(*transportError);
        return classifyResponse(response);
    }

    void respond(int status, std::string_view body) { response = HttpResponse { .status = status, .body = bytesOf(body) }; }

    std::vector<RecordedRequest> requests;
    HttpResponse response { .status = 200, .body = {} };
    std::optional<Error> transportError;
};

// }}}

} // namespace parley::test
