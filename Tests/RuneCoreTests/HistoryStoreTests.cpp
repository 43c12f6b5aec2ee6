#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "Fakes.hpp"
#include "HistoryStore.hpp"

#include <regex>

using rune::ErrorCode;
using rune::HistoryStore;
using rune::RuneError;
using rune::TranscriptionRecord;
using rune::testing::TempDir;

namespace {

const std::regex kIso8601(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");

TranscriptionRecord make_record(const std::string& text) {
    TranscriptionRecord r;
    r.text = text;
    return r;
}

} // namespace

TEST_CASE("History store appends", "[history]") {
    TempDir dir;
    HistoryStore store(dir.file("history.db"));
    store.open();

    SECTION("AssignsIdsAndTimestamps") {
        auto a = store.append(make_record("first"));
        auto b = store.append(make_record("second"));
        REQUIRE(a.id > 0);
        REQUIRE(b.id > a.id);
        REQUIRE(std::regex_match(a.timestamp, kIso8601));
        REQUIRE(store.count() == 2);
    }

    SECTION("CallerIdIsIgnored") {
        TranscriptionRecord r = make_record("text");
        r.id = 999;
        auto stored = store.append(r);
        REQUIRE(stored.id != 999);
    }

    SECTION("KeepsGivenTimestampAndAudioPath") {
        TranscriptionRecord r = make_record("with audio");
        r.timestamp  = "2024-05-01T10:00:00.000Z";
        r.audio_path = "/tmp/a.wav";
        auto stored = store.append(r);

        auto fetched = store.get(stored.id);
        REQUIRE(fetched);
        REQUIRE(fetched->timestamp == "2024-05-01T10:00:00.000Z");
        REQUIRE(fetched->audio_path);
        REQUIRE(*fetched->audio_path == "/tmp/a.wav");
    }

    SECTION("ListIsInsertionOrder") {
        store.append(make_record("one"));
        store.append(make_record("two"));
        store.append(make_record("three"));
        auto all = store.list();
        REQUIRE(all.size() == 3);
        REQUIRE(all[0].text == "one");
        REQUIRE(all[1].text == "two");
        REQUIRE(all[2].text == "three");
        REQUIRE_FALSE(all[0].audio_path);
    }

    SECTION("RejectsEmptyText") {
        try {
            store.append(make_record(""));
            FAIL("expected an exception");
        } catch (const RuneError& e) {
            REQUIRE(e.code() == ErrorCode::invalid_argument);
        }
        REQUIRE(store.count() == 0);
    }

    SECTION("WithdrawnAppendLeavesNoRow") {
        store.append(make_record("kept"));
        bool asked = false;
        auto r = store.append_if(make_record("withdrawn"), "session-1", [&] {
            asked = true;
            return false;
        });
        REQUIRE(asked);
        REQUIRE_FALSE(r);
        REQUIRE(store.count() == 1);
        REQUIRE(store.list()[0].text == "kept");

        auto c = store.append_if(make_record("confirmed"), "session-2", [] { return true; });
        REQUIRE(c);
        REQUIRE(store.get(c->id)->text == "confirmed");
        REQUIRE(store.count() == 2);
    }

    SECTION("UnknownIdIsEmpty") {
        REQUIRE_FALSE(store.get(12345));
    }
}

TEST_CASE("History store persistence", "[history]") {
    TempDir dir;
    const std::string path = dir.file("nested/dir/history.db");

    {
        HistoryStore store(path);
        store.open();
        store.append(make_record("survives restart"));
    }

    HistoryStore reopened(path);
    reopened.open();
    auto all = reopened.list();
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].text == "survives restart");
}

TEST_CASE("History store unavailable", "[history]") {
    TempDir dir;

    SECTION("NotOpened") {
        HistoryStore store(dir.file("history.db"));
        try {
            store.append(make_record("lost"));
            FAIL("expected an exception");
        } catch (const RuneError& e) {
            REQUIRE(e.code() == ErrorCode::storage_unavailable);
        }
    }

    SECTION("PathIsADirectory") {
        HistoryStore store(dir.path().string());
        REQUIRE_THROWS_AS(store.open(), RuneError);
        REQUIRE_FALSE(store.is_open());
    }

    SECTION("Timestamps") {
        REQUIRE(std::regex_match(HistoryStore::now_iso8601(), kIso8601));
    }
}
