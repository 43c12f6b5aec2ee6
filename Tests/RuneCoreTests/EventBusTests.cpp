#include <catch2/catch.hpp>

#include "EventBus.hpp"

#include <thread>

using namespace std::chrono_literals;
using rune::Event;
using rune::EventBus;
using rune::EventKind;
using rune::LevelFrame;
using rune::ProcessingStatus;

namespace {

LevelFrame level(float v) {
    LevelFrame f{};
    f.fill(v);
    return f;
}

} // namespace

TEST_CASE("Event bus delivery", "[events]") {
    EventBus bus;

    SECTION("StatusIsNeverDroppedOrReordered") {
        auto sub = bus.subscribe({4});
        const ProcessingStatus seq[] = {ProcessingStatus::recording, ProcessingStatus::transcribing,
                                        ProcessingStatus::completed, ProcessingStatus::idle};
        for (int round = 0; round < 100; ++round) {
            for (auto s : seq) bus.publish_status(s, "session");
        }
        for (int round = 0; round < 100; ++round) {
            for (auto s : seq) {
                auto e = sub->try_next();
                REQUIRE(e);
                REQUIRE(e->kind == EventKind::processing_status);
                REQUIRE(e->status == s);
            }
        }
        REQUIRE_FALSE(sub->try_next());
    }

    SECTION("LevelsDropOldestWhenFull") {
        auto sub = bus.subscribe({3});
        for (int i = 1; i <= 10; ++i) bus.publish_levels(level(i / 10.0f));

        REQUIRE(sub->dropped_levels() == 7);
        for (int i = 8; i <= 10; ++i) {
            auto e = sub->try_next();
            REQUIRE(e);
            REQUIRE(e->kind == EventKind::audio_levels);
            REQUIRE(e->levels[0] == Approx(i / 10.0f));
        }
        REQUIRE_FALSE(sub->try_next());
    }

    SECTION("LatestTranscriptWins") {
        auto sub = bus.subscribe();
        bus.publish_transcript("s1", "hel", 1);
        bus.publish_transcript("s1", "hello", 2);
        bus.publish_transcript("s1", "hello world", 3);

        auto e = sub->try_next();
        REQUIRE(e);
        REQUIRE(e->text == "hello world");
        REQUIRE(e->revision == 3);
        REQUIRE_FALSE(sub->try_next());
    }

    SECTION("TranscriptRevisionDeliveredAtMostOnce") {
        auto sub = bus.subscribe();
        bus.publish_transcript("s1", "hello", 2);
        REQUIRE(sub->try_next());

        bus.publish_transcript("s1", "hello", 2);
        bus.publish_transcript("s1", "older", 1);
        REQUIRE_FALSE(sub->try_next());

        // A new session starts counting again.
        bus.publish_transcript("s2", "fresh", 1);
        auto e = sub->try_next();
        REQUIRE(e);
        REQUIRE(e->session_id == "s2");
    }

    SECTION("MixedKindsComeOutInPublishOrder") {
        auto sub = bus.subscribe();
        bus.publish_status(ProcessingStatus::recording, "s");
        bus.publish_levels(level(0.5f));
        bus.publish_status(ProcessingStatus::transcribing, "s");
        bus.publish_transcript("s", "text", 1);
        bus.publish_status(ProcessingStatus::completed, "s");

        const EventKind expected[] = {EventKind::processing_status, EventKind::audio_levels,
                                      EventKind::processing_status, EventKind::transcription_result,
                                      EventKind::processing_status};
        uint64_t last = 0;
        for (auto kind : expected) {
            auto e = sub->try_next();
            REQUIRE(e);
            REQUIRE(e->kind == kind);
            REQUIRE(e->sequence > last);
            last = e->sequence;
        }
    }

    SECTION("NoReplayForLateSubscribers") {
        bus.publish_status(ProcessingStatus::recording, "s");
        auto sub = bus.subscribe();
        REQUIRE_FALSE(sub->try_next());
    }

    SECTION("EverySubscriberGetsItsOwnCopy") {
        auto a = bus.subscribe();
        auto b = bus.subscribe();
        bus.publish_error(rune::ErrorCode::engine_failure, "boom", "s");
        auto ea = a->try_next();
        auto eb = b->try_next();
        REQUIRE(ea);
        REQUIRE(eb);
        REQUIRE(ea->error_code == rune::ErrorCode::engine_failure);
        REQUIRE(eb->message == "boom");
    }
}

TEST_CASE("Event bus subscriptions", "[events]") {
    EventBus bus;

    SECTION("DroppingTheHandleUnsubscribes") {
        {
            auto sub = bus.subscribe();
            REQUIRE(bus.subscriber_count() == 1);
        }
        REQUIRE(bus.subscriber_count() == 0);
        bus.publish_status(ProcessingStatus::idle, "");
    }

    SECTION("CloseWakesAWaitingReader") {
        auto sub = bus.subscribe();
        std::thread closer([&] {
            std::this_thread::sleep_for(20ms);
            sub->close();
        });
        auto e = sub->next(5s);
        closer.join();
        REQUIRE_FALSE(e);
        REQUIRE(sub->closed());
        REQUIRE(bus.subscriber_count() == 0);
    }

    SECTION("NextWaitsForPublish") {
        auto sub = bus.subscribe();
        std::thread publisher([&] {
            std::this_thread::sleep_for(20ms);
            bus.publish_settings({{"log_level", "debug"}});
        });
        auto e = sub->next(5s);
        publisher.join();
        REQUIRE(e);
        REQUIRE(e->kind == EventKind::settings_changed);
        REQUIRE(e->data.at("log_level").get<std::string>() == "debug");
    }

    SECTION("NextTimesOut") {
        auto sub = bus.subscribe();
        REQUIRE_FALSE(sub->next(10ms));
    }
}

TEST_CASE("Event names", "[events]") {
    REQUIRE(std::string(rune::event_name(EventKind::audio_levels)) == "audio-levels");
    REQUIRE(std::string(rune::event_name(EventKind::processing_status)) == "audio-processing-status");
    REQUIRE(std::string(rune::event_name(EventKind::transcription_result)) == "transcription-result");
    REQUIRE(std::string(rune::event_name(EventKind::transcription_added)) == "transcription-added");
}
