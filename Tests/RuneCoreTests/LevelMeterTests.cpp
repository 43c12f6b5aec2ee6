#include <catch2/catch.hpp>

#include "LevelMeter.hpp"
#include "Session.hpp"

#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>
#include <thread>
#include <vector>

using rune::LevelFrame;
using rune::LevelMeter;
using rune::kLevelBands;

namespace {

bool in_unit_range(const LevelFrame& levels) {
    for (float v : levels) {
        if (!(v >= 0.0f && v <= 1.0f)) return false;
    }
    return true;
}

} // namespace

TEST_CASE("Level meter bands", "[levels]") {
    LevelMeter meter;

    SECTION("SilenceIsZero") {
        std::vector<float> silence(1024, 0.0f);
        const auto& levels = meter.process(silence.data(), 1024, 1);
        REQUIRE(levels.size() == kLevelBands);
        for (float v : levels) REQUIRE(v == 0.0f);
    }

    SECTION("BandsFollowTimeSlices") {
        // Loud only in the last eighth of the batch.
        std::vector<float> samples(800, 0.0f);
        for (std::size_t i = 700; i < 800; ++i) samples[i] = 0.6f;
        const auto& levels = meter.process(samples.data(), 800, 1);
        for (std::size_t b = 0; b + 1 < kLevelBands; ++b) REQUIRE(levels[b] == 0.0f);
        REQUIRE(levels[kLevelBands - 1] == Approx(0.6f));
    }

    SECTION("ClipsOutOfRangeInput") {
        std::vector<float> hot(512, 3.5f);
        hot[10] = -7.0f;
        hot[20] = std::numeric_limits<float>::quiet_NaN();
        hot[30] = std::numeric_limits<float>::infinity();
        REQUIRE(in_unit_range(meter.process(hot.data(), 512, 1)));
    }

    SECTION("StereoIsAveraged") {
        std::vector<float> stereo;
        for (int i = 0; i < 256; ++i) {
            stereo.push_back(0.8f);
            stereo.push_back(0.0f);
        }
        const auto& levels = meter.process(stereo.data(), 256, 2);
        for (float v : levels) REQUIRE(v == Approx(0.4f));
    }

    SECTION("ReleaseIsGradual") {
        std::vector<float> loud(256, 1.0f);
        std::vector<float> silence(256, 0.0f);
        meter.process(loud.data(), 256, 1);
        const float after_silence = meter.process(silence.data(), 256, 1)[0];
        REQUIRE(after_silence > 0.0f);
        REQUIRE(after_silence < 1.0f);
    }

    SECTION("ResetClearsMemory") {
        std::vector<float> loud(256, 1.0f);
        meter.process(loud.data(), 256, 1);
        meter.reset();
        for (float v : meter.levels()) REQUIRE(v == 0.0f);
    }

    SECTION("EmptyBatchOnlyDecays") {
        REQUIRE(in_unit_range(meter.process(nullptr, 0, 1)));
    }
}

TEST_CASE("Level meter RMS", "[levels]") {
    SECTION("ConstantSignal") {
        std::vector<float> v(100, 0.5f);
        REQUIRE(LevelMeter::compute_rms(v.data(), v.size()) == Approx(0.5f));
    }

    SECTION("ClampedToOne") {
        std::vector<float> v(100, 4.0f);
        REQUIRE(LevelMeter::compute_rms(v.data(), v.size()) == 1.0f);
    }

    SECTION("EmptyIsZero") {
        REQUIRE(LevelMeter::compute_rms(nullptr, 0) == 0.0f);
    }
}

TEST_CASE("Level slot", "[levels]") {
    rune::LevelSlot slot;
    uint64_t seen = 0;
    LevelFrame out{};

    SECTION("NothingBeforeTheFirstStore") {
        REQUIRE_FALSE(slot.take(seen, out));
    }

    SECTION("OnlyTheLatestFrameIsTaken") {
        LevelFrame a{};
        a.fill(0.25f);
        LevelFrame b{};
        b.fill(0.75f);
        slot.store(a);
        slot.store(b);

        REQUIRE(slot.take(seen, out));
        REQUIRE(out == b);
        REQUIRE_FALSE(slot.take(seen, out));
    }

    SECTION("ConcurrentWriterNeverYieldsOutOfRangeValues") {
        std::atomic<bool> done{false};
        std::thread writer([&] {
            LevelFrame f{};
            for (int i = 0; i < 20000; ++i) {
                f.fill(static_cast<float>(i % 100) / 100.0f);
                slot.store(f);
            }
            done = true;
        });
        bool in_range = true;
        while (!done.load()) {
            if (slot.take(seen, out)) in_range = in_range && in_unit_range(out);
        }
        writer.join();
        REQUIRE(in_range);

        uint64_t fresh = 0;
        REQUIRE(slot.take(fresh, out));
        REQUIRE(out[0] == Approx(0.99f));
    }
}
