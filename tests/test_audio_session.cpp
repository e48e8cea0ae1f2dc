/**
 * Recording lifecycle driven by a buffered frame source:
 * - stop() with nothing recorded reports NoActiveRecording
 * - a second start() while recording reports AlreadyRecording
 * - trailing silence and read errors end the capture loop on their own
 * - stop() hands the buffer off exactly once
 *
 * Run from build dir: ./test_audio_session
 */

#include "audio/buffered_frame_source.h"
#include "audio_session.h"
#include "fakes.h"
#include "logger.h"
#include <chrono>
#include <iostream>
#include <thread>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool finished_within(const std::shared_future<CaptureOutcome>& done, int ms) {
    return done.valid() && done.wait_for(std::chrono::milliseconds(ms)) == std::future_status::ready;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    AudioConfig config;

    // --- stop() on an idle session ---
    {
        audio::BufferedFrameSource source(frames(5, 5000));
        AudioSession session(source, config);
        ASSERT(session.state() == RecordingState::Idle);
        ASSERT(!session.completion().valid());
        auto stopped = session.stop();
        ASSERT(!stopped);
        ASSERT(stopped.error().type == ErrorType::NoActiveRecording);
        ASSERT(source.open_count() == 0);
    }

    // --- speech followed by silence ends on its own ---
    {
        std::vector<AudioFrame> input = frames(12, 6000);
        append(input, frames(31, 0));
        audio::BufferedFrameSource source(input);
        source.repeat_after_end(constant_frame(0));
        AudioSession session(source, config);

        ASSERT(session.start());
        auto done = session.completion();
        ASSERT(finished_within(done, 5000));
        ASSERT(done.get().reason == CaptureEnd::Silence);
        ASSERT(done.get().frames == 43);
        ASSERT(session.state() == RecordingState::Finished);
        ASSERT(!source.is_open());
        ASSERT(source.close_count() == 1);

        auto captured = session.stop();
        ASSERT(captured);
        ASSERT(captured.value().has_value());
        ASSERT(captured.value()->size() == 43u * DEFAULT_CHUNK_SIZE);
        ASSERT((*captured.value())[0] == 6000);

        // handed off already
        auto again = session.stop();
        ASSERT(!again);
        ASSERT(again.error().type == ErrorType::NoActiveRecording);
    }

    // --- second start while recording ---
    {
        audio::BufferedFrameSource source(frames(1, 6000));
        source.repeat_after_end(constant_frame(6000));
        source.set_frame_delay_ms(2);
        AudioSession session(source, config);

        ASSERT(session.start());
        auto second = session.start();
        ASSERT(!second);
        ASSERT(second.error().type == ErrorType::AlreadyRecording);
        ASSERT(source.open_count() == 1);

        // --- manual stop keeps what was captured ---
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        auto captured = session.stop();
        ASSERT(captured);
        ASSERT(captured.value().has_value());
        ASSERT(captured.value()->size() % DEFAULT_CHUNK_SIZE == 0);
        ASSERT(session.completion().get().reason == CaptureEnd::Stopped);
        ASSERT(session.state() == RecordingState::Finished);
    }

    // --- read error: frames before the failure are kept ---
    {
        audio::BufferedFrameSource source(frames(20, 6000));
        source.fail_at(7);
        AudioSession session(source, config);

        ASSERT(session.start());
        auto done = session.completion();
        ASSERT(finished_within(done, 5000));
        ASSERT(done.get().reason == CaptureEnd::ReadError);
        ASSERT(!done.get().error.empty());
        ASSERT(session.frames_captured() == 7);

        auto captured = session.stop();
        ASSERT(captured);
        ASSERT(captured.value()->size() == 7u * DEFAULT_CHUNK_SIZE);
    }

    // --- read error on the very first frame: nothing to hand off ---
    {
        audio::BufferedFrameSource source(frames(3, 6000));
        source.fail_at(0);
        AudioSession session(source, config);

        ASSERT(session.start());
        ASSERT(finished_within(session.completion(), 5000));
        auto captured = session.stop();
        ASSERT(captured);
        ASSERT(!captured.value().has_value());
    }

    // --- hard cap ---
    {
        audio::BufferedFrameSource source(frames(1, 7000));
        source.repeat_after_end(constant_frame(7000));
        AudioSession session(source, config);

        ASSERT(session.start());
        auto done = session.completion();
        ASSERT(finished_within(done, 10000));
        ASSERT(done.get().reason == CaptureEnd::MaxDuration);
        ASSERT(done.get().frames == 937);
    }

    // --- abort discards, reset allows a new recording ---
    {
        audio::BufferedFrameSource source(frames(1, 6000));
        source.repeat_after_end(constant_frame(6000));
        source.set_frame_delay_ms(2);
        AudioSession session(source, config);

        ASSERT(session.start());
        session.abort();
        ASSERT(session.state() == RecordingState::Aborted);
        auto stopped = session.stop();
        ASSERT(!stopped);
        ASSERT(stopped.error().type == ErrorType::NoActiveRecording);
        ASSERT(!source.is_open());

        ASSERT(session.reset());
        ASSERT(session.state() == RecordingState::Idle);
        ASSERT(session.frames_captured() == 0);
        ASSERT(session.start());
        ASSERT(source.open_count() == 2);
        ASSERT(session.state() == RecordingState::Recording);
        ASSERT(!session.reset());
        session.abort();
    }

    // --- one long input consumed answer by answer ---
    {
        std::vector<AudioFrame> input = frames(10, 7000);
        append(input, frames(31, 0));
        append(input, frames(8, 7000));
        append(input, frames(31, 0));
        audio::BufferedFrameSource source(input);
        source.keep_position_on_open(true);

        AudioSession first(source, config);
        ASSERT(first.start());
        ASSERT(finished_within(first.completion(), 5000));
        ASSERT(first.completion().get().reason == CaptureEnd::Silence);
        ASSERT(first.completion().get().frames == 41);
        ASSERT(!source.exhausted());

        AudioSession second(source, config);
        ASSERT(second.start());
        ASSERT(finished_within(second.completion(), 5000));
        ASSERT(second.completion().get().reason == CaptureEnd::Silence);
        ASSERT(second.completion().get().frames == 39);
        auto answer = second.stop();
        ASSERT(answer && answer.value().has_value());
        ASSERT((*answer.value())[0] == 7000);
        ASSERT(source.exhausted());
        ASSERT(source.open_count() == 2);
    }

    Logger::shutdown();
    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All audio session tests passed.\n";
    return 0;
}
