#include <catch2/catch.hpp>

#include "AudioCaptureEngine.hpp"
#include "Errors.hpp"
#include "Fakes.hpp"
#include "SyntheticAudioInput.hpp"

#include <atomic>
#include <mutex>
#include <vector>

using namespace std::chrono_literals;
using rune::AudioCaptureEngine;
using rune::AudioFrame;
using rune::CaptureConfig;
using rune::ErrorCode;
using rune::LevelFrame;
using rune::RuneError;
using rune::testing::FakeAudioInput;
using rune::testing::FakeInputState;
using rune::testing::eventually;

namespace {

struct Recorder {
    std::mutex               mu;
    std::vector<std::size_t> frame_sizes;
    std::vector<LevelFrame>  levels;
    std::vector<std::string> errors;

    rune::FrameCallback on_frame() {
        return [this](const AudioFrame& f) {
            std::lock_guard<std::mutex> lock(mu);
            frame_sizes.push_back(f.frame_count);
        };
    }
    rune::LevelCallback on_levels() {
        return [this](const LevelFrame& l) {
            std::lock_guard<std::mutex> lock(mu);
            levels.push_back(l);
        };
    }
    rune::CaptureErrorCallback on_error() {
        return [this](const std::string& m) {
            std::lock_guard<std::mutex> lock(mu);
            errors.push_back(m);
        };
    }
    std::size_t frames() {
        std::lock_guard<std::mutex> lock(mu);
        return frame_sizes.size();
    }
};

} // namespace

TEST_CASE("Capture device selection", "[capture]") {
    auto state = std::make_shared<FakeInputState>();
    AudioCaptureEngine engine(std::make_unique<FakeAudioInput>(state));
    Recorder rec;

    SECTION("NoIdUsesSystemDefault") {
        engine.start(std::nullopt, rec.on_frame());
        engine.stop();
        REQUIRE(state->last_opened.empty());
    }

    SECTION("ConfiguredDefaultIsPreferred") {
        engine.set_default_device(std::string("usb-2"));
        engine.start(std::nullopt, rec.on_frame());
        engine.stop();
        REQUIRE(state->last_opened == "usb-2");
    }

    SECTION("ExplicitIdWins") {
        engine.set_default_device(std::string("usb-2"));
        engine.start(std::string("mic-1"), rec.on_frame());
        engine.stop();
        REQUIRE(state->last_opened == "mic-1");
    }

    SECTION("EmptyDefaultMeansSystem") {
        engine.set_default_device(std::string());
        REQUIRE_FALSE(engine.default_device());
    }

    SECTION("ListsDevices") {
        auto devices = engine.list_devices();
        REQUIRE(devices.size() == 2);
        REQUIRE(devices[1].id == "usb-2");
        REQUIRE(engine.system_default_device()->id == "mic-1");
    }
}

TEST_CASE("Capture exclusivity and failures", "[capture]") {
    auto state = std::make_shared<FakeInputState>();
    AudioCaptureEngine engine(std::make_unique<FakeAudioInput>(state));
    Recorder rec;

    SECTION("SecondStartIsAlreadyRecording") {
        engine.start(std::nullopt, rec.on_frame());
        try {
            engine.start(std::nullopt, rec.on_frame());
            FAIL("expected an exception");
        } catch (const RuneError& e) {
            REQUIRE(e.code() == ErrorCode::already_recording);
        }
        REQUIRE(engine.is_capturing());
        REQUIRE(state->opens == 1);
        engine.stop();
    }

    SECTION("PermissionDeniedIsDistinct") {
        state->open_error = ErrorCode::permission_denied;
        try {
            engine.start(std::nullopt, rec.on_frame());
            FAIL("expected an exception");
        } catch (const RuneError& e) {
            REQUIRE(e.code() == ErrorCode::permission_denied);
        }
        REQUIRE_FALSE(engine.is_capturing());
    }

    SECTION("ProbeWhileRunningIsAlreadyRecording") {
        engine.start(std::nullopt, rec.on_frame());
        REQUIRE_THROWS_AS(engine.probe(std::nullopt), RuneError);
        engine.stop();
        engine.probe(std::nullopt);
        REQUIRE(state->closes == 2);
    }

    SECTION("DeviceLossIsReported") {
        state->fail_after_reads = 3;
        engine.start(std::nullopt, rec.on_frame(), nullptr, rec.on_error());
        REQUIRE(eventually([&] { return !engine.is_capturing(); }));
        REQUIRE(eventually([&] {
            std::lock_guard<std::mutex> lock(rec.mu);
            return rec.errors.size() == 1;
        }));
        engine.stop();

        // The engine recovers for the next session.
        state->fail_after_reads = -1;
        engine.start(std::nullopt, rec.on_frame());
        REQUIRE(engine.is_capturing());
        engine.stop();
    }

    SECTION("InputThatRunsDryIsReported") {
        state->end_after_reads = 4;
        engine.start(std::nullopt, rec.on_frame(), nullptr, rec.on_error());
        REQUIRE(eventually([&] { return !engine.is_capturing(); }));
        REQUIRE(eventually([&] {
            std::lock_guard<std::mutex> lock(rec.mu);
            return rec.errors.size() == 1;
        }));
        {
            std::lock_guard<std::mutex> lock(rec.mu);
            REQUIRE(rec.errors[0] == "Audio input ended unexpectedly");
            REQUIRE_FALSE(rec.frame_sizes.empty());
        }
        engine.stop();
    }

    SECTION("StopDoesNotReportAnError") {
        engine.start(std::nullopt, rec.on_frame(), nullptr, rec.on_error());
        REQUIRE(eventually([&] { return rec.frames() > 0; }));
        engine.stop();
        std::lock_guard<std::mutex> lock(rec.mu);
        REQUIRE(rec.errors.empty());
    }

    SECTION("StopIsIdempotent") {
        engine.start(std::nullopt, rec.on_frame());
        engine.stop();
        engine.stop();
        REQUIRE_FALSE(engine.is_capturing());
        REQUIRE(state->closes == 1);
        REQUIRE(engine.format().sample_rate == 0);
    }
}

TEST_CASE("Capture frames and levels", "[capture]") {
    auto state = std::make_shared<FakeInputState>();
    state->chunk_delay = 2ms;
    CaptureConfig config;
    config.frame_size     = 1024;
    config.level_interval = 0ms;
    AudioCaptureEngine engine(std::make_unique<FakeAudioInput>(state), config);
    Recorder rec;

    const auto fmt = engine.start(std::nullopt, rec.on_frame(), rec.on_levels());
    REQUIRE(fmt.sample_rate == 48000);
    REQUIRE(fmt.channels == 1);

    REQUIRE(eventually([&] { return rec.frames() >= 5; }));
    REQUIRE(engine.current_level() > 0.0f);
    engine.stop();

    std::lock_guard<std::mutex> lock(rec.mu);
    // Every frame but the flushed tail is exactly frame_size long.
    for (std::size_t i = 0; i + 1 < rec.frame_sizes.size(); ++i) {
        REQUIRE(rec.frame_sizes[i] == 1024);
    }
    REQUIRE(rec.frame_sizes.back() <= 1024);
    REQUIRE_FALSE(rec.levels.empty());
    for (const auto& l : rec.levels) {
        REQUIRE(l.size() == 8);
        for (float v : l) {
            REQUIRE(v >= 0.0f);
            REQUIRE(v <= 1.0f);
        }
    }
}

TEST_CASE("Synthetic input", "[capture]") {
    rune::SyntheticInputConfig config;
    config.realtime   = false;
    config.max_frames = 1000;
    rune::SyntheticAudioInput input(config);

    REQUIRE(input.list_devices().size() == 1);
    REQUIRE_THROWS_AS(input.open("nope"), RuneError);

    const auto fmt = input.open("");
    REQUIRE(fmt.sample_rate == 48000);

    std::vector<float> buf;
    std::size_t total = 0;
    std::size_t n;
    while ((n = input.read(buf)) > 0) total += n;
    REQUIRE(total == 1000);
    input.close();
}
