#include <catch2/catch.hpp>

#include "CommandBridge.hpp"
#include "Fakes.hpp"
#include "RuneApp.hpp"

#include <fstream>

using namespace std::chrono_literals;
using nlohmann::json;
using rune::CommandBridge;
using rune::Event;
using rune::EventKind;
using rune::ProcessingStatus;
using rune::testing::FakeAudioInput;
using rune::testing::FakeHotkeyRegistrar;
using rune::testing::FakeInputState;
using rune::testing::FakeTranscriptionEngine;
using rune::testing::TempDir;
using rune::testing::collect_until;
using rune::testing::is_status;

namespace {

/// A RuneApp on fakes, with short timings written to its settings file.
struct App {
    App()
        : input(std::make_shared<FakeInputState>()),
          hotkeys(std::make_shared<FakeHotkeyRegistrar::Shared>()) {
        const json settings = {
            {"pipeline", {{"completion_grace_ms", 50}, {"min_recording_ms", 100}}},
        };
        std::ofstream(dir.file("settings.json")) << settings.dump();

        rune::RuneAppOptions options;
        options.settings_path = dir.file("settings.json");
        options.history_path  = dir.file("history.db");
        options.uinput_path   = dir.file("no-uinput");

        auto fake_engine = std::make_unique<FakeTranscriptionEngine>();
        engine = fake_engine.get();
        app = std::make_unique<rune::RuneApp>(options,
                                              std::make_unique<FakeAudioInput>(input),
                                              std::move(fake_engine),
                                              std::make_unique<FakeHotkeyRegistrar>(hotkeys));
        bridge = std::make_unique<CommandBridge>(*app);
        sub    = app->subscribe({256});
        app->start();
    }

    json call(const std::string& cmd, const json& args = json::object()) {
        return bridge->handle({{"cmd", cmd}, {"args", args}});
    }

    TempDir                                  dir;
    std::shared_ptr<FakeInputState>          input;
    std::shared_ptr<FakeHotkeyRegistrar::Shared> hotkeys;
    FakeTranscriptionEngine*                 engine = nullptr;
    std::unique_ptr<rune::RuneApp>           app;
    std::unique_ptr<CommandBridge>           bridge;
    std::shared_ptr<rune::Subscription>      sub;
};

std::string error_code(const json& response) {
    return response.at("error").at("code").get<std::string>();
}

} // namespace

TEST_CASE("Bridge request handling", "[bridge]") {
    App a;

    SECTION("UnknownCommand") {
        auto r = a.call("launch_rockets");
        REQUIRE_FALSE(r.at("ok").get<bool>());
        REQUIRE(error_code(r) == "InvalidArgument");
    }

    SECTION("MissingCmd") {
        auto r = a.bridge->handle(json{{"args", json::object()}});
        REQUIRE(error_code(r) == "InvalidArgument");
    }

    SECTION("MalformedLine") {
        auto r = a.bridge->handle_line("{\"cmd\": ");
        REQUIRE_FALSE(r.at("ok").get<bool>());
        REQUIRE(error_code(r) == "InvalidArgument");
    }

    SECTION("RequestIdIsEchoed") {
        auto r = a.bridge->handle_line(R"({"cmd": "get_status", "id": 42})");
        REQUIRE(r.at("ok").get<bool>());
        REQUIRE(r.at("id").get<int>() == 42);
        REQUIRE(r.at("result").get<std::string>() == "idle");
    }

    SECTION("WrongArgumentType") {
        auto r = a.call("set_default_device", {{"deviceId", 7}});
        REQUIRE(error_code(r) == "InvalidArgument");
        r = a.call("hotkey", {{"pressed", "yes"}});
        REQUIRE(error_code(r) == "InvalidArgument");
    }
}

TEST_CASE("Bridge devices", "[bridge]") {
    App a;

    SECTION("ListsDevices") {
        auto r = a.call("get_devices");
        REQUIRE(r.at("ok").get<bool>());
        const json& devices = r.at("result");
        REQUIRE(devices.size() == 2);
        REQUIRE(devices[0].at("id").get<std::string>() == "mic-1");
        REQUIRE(devices[0].at("name").get<std::string>() == "Built-in Microphone");
    }

    SECTION("DefaultFallsBackToSystem") {
        auto r = a.call("get_default_device");
        REQUIRE(r.at("result").at("id").get<std::string>() == "mic-1");
    }

    SECTION("SetThenGetRoundTrips") {
        REQUIRE(a.call("set_default_device", {{"deviceId", "usb-2"}}).at("ok").get<bool>());
        auto r = a.call("get_default_device");
        REQUIRE(r.at("result").at("id").get<std::string>() == "usb-2");
        REQUIRE(a.app->get_settings().audio.default_device == std::string("usb-2"));

        // The next session opens the chosen device.
        a.call("begin_recording");
        a.call("cancel_recording");
        REQUIRE(a.input->last_opened == "usb-2");
    }

    SECTION("UnknownDeviceIsRejected") {
        auto r = a.call("set_default_device", {{"device_id", "ghost"}});
        REQUIRE(error_code(r) == "DeviceUnavailable");
    }

    SECTION("EmptyIdClears") {
        a.call("set_default_device", {{"deviceId", "usb-2"}});
        a.call("set_default_device", {{"deviceId", ""}});
        REQUIRE_FALSE(a.app->get_settings().audio.default_device);
    }

    SECTION("NoDevicesAtAll") {
        {
            std::lock_guard<std::mutex> lock(a.input->mu);
            a.input->devices.clear();
            a.input->system_default.reset();
        }
        auto r = a.call("get_default_device");
        REQUIRE(r.at("ok").get<bool>());
        REQUIRE(r.at("result").is_null());
    }
}

TEST_CASE("Bridge recording flow", "[bridge]") {
    App a;
    a.engine->text = "dictated through the bridge";

    REQUIRE(a.call("begin_recording").at("ok").get<bool>());
    REQUIRE(a.call("get_status").at("result").get<std::string>() == "recording");

    auto second = a.call("begin_recording");
    REQUIRE(error_code(second) == "AlreadyRecording");

    std::this_thread::sleep_for(200ms);
    REQUIRE(a.call("stop_recording").at("ok").get<bool>());
    collect_until(*a.sub, is_status(ProcessingStatus::idle));

    auto history = a.call("get_transcription_history").at("result");
    REQUIRE(history.size() == 1);
    REQUIRE(history[0].at("text").get<std::string>() == "dictated through the bridge");
    REQUIRE(history[0].at("audio_path").is_null());
    REQUIRE(history[0].at("id").get<int64_t>() > 0);
}

TEST_CASE("Bridge hotkeys", "[bridge]") {
    App a;

    SECTION("StoredShortcutIsRegisteredOnStart") {
        FakeHotkeyRegistrar view(a.hotkeys);
        auto reg = view.registered();
        REQUIRE(reg.size() == 1);
        REQUIRE(reg[0].to_string() == "CONTROL+Space");
    }

    SECTION("UpdateShortcuts") {
        auto r = a.call("update_shortcuts", {{"key", "F8"}, {"modifier", "super"}});
        REQUIRE(r.at("ok").get<bool>());
        FakeHotkeyRegistrar view(a.hotkeys);
        REQUIRE(view.registered().at(0).to_string() == "SUPER+F8");

        r = a.call("update_shortcuts", {{"key", ""}, {"modifier", "CONTROL"}});
        REQUIRE(error_code(r) == "InvalidArgument");
    }

    SECTION("PressAndReleaseDriveASession") {
        FakeHotkeyRegistrar view(a.hotkeys);
        view.fire(true);
        view.fire(true);   // auto-repeat is ignored
        REQUIRE(a.app->get_status() == ProcessingStatus::recording);
        std::this_thread::sleep_for(200ms);
        view.fire(false);
        auto events = collect_until(*a.sub, is_status(ProcessingStatus::completed));
        REQUIRE(a.app->get_transcription_history().size() == 1);
    }

    SECTION("HotkeyCommand") {
        REQUIRE(a.call("hotkey", {{"pressed", true}}).at("ok").get<bool>());
        REQUIRE(a.app->get_status() == ProcessingStatus::recording);
        a.call("hotkey", {{"pressed", false}});
        REQUIRE(a.app->get_status() != ProcessingStatus::recording);
    }
}

TEST_CASE("Bridge permissions", "[bridge]") {
    App a;

    SECTION("MicrophoneGranted") {
        REQUIRE(a.call("check_microphone_permissions").at("result").get<bool>());
        REQUIRE(a.call("request_microphone_permissions").at("result").get<bool>());
    }

    SECTION("MicrophoneDenied") {
        {
            std::lock_guard<std::mutex> lock(a.input->mu);
            a.input->open_error = rune::ErrorCode::permission_denied;
        }
        REQUIRE_FALSE(a.call("check_microphone_permissions").at("result").get<bool>());

        auto events = collect_until(*a.sub, [](const Event& e) {
            return e.kind == EventKind::permissions_changed;
        }, 1s);
        REQUIRE_FALSE(events.empty());
        REQUIRE(events.back().data.at("microphone").get<bool>() == false);
    }

    SECTION("MissingDeviceIsNotADenial") {
        {
            std::lock_guard<std::mutex> lock(a.input->mu);
            a.input->open_error = rune::ErrorCode::device_unavailable;
        }
        REQUIRE(a.call("check_microphone_permissions").at("result").get<bool>());
    }

    SECTION("AccessibilityNeedsUinput") {
        REQUIRE_FALSE(a.call("check_accessibility_permissions").at("result").get<bool>());
        REQUIRE_FALSE(a.call("request_accessibility_permissions").at("result").get<bool>());
        REQUIRE_FALSE(a.call("check_all_permissions").at("result").get<bool>());
    }
}

TEST_CASE("Bridge settings", "[bridge]") {
    App a;

    SECTION("ProfileAndKeys") {
        a.call("update_user_profile", {{"name", "Ada"}, {"email", "ada@example.com"}});
        a.call("update_api_key", {{"service", "openai"}, {"apiKey", "sk-1"}});

        auto s = a.call("get_settings").at("result");
        REQUIRE(s.at("user_profile").at("name").get<std::string>() == "Ada");
        REQUIRE(s.at("user_profile").at("email").get<std::string>() == "ada@example.com");
        REQUIRE(s.at("api_keys").at("openai").get<std::string>() == "sk-1");
        REQUIRE(s.at("window").at("width").get<double>() == 400.0);
        REQUIRE(s.at("pipeline").at("completion_grace_ms").get<int>() == 50);
    }

    SECTION("ApiKeyNeedsService") {
        auto r = a.call("update_api_key", {{"apiKey", "sk-1"}});
        REQUIRE(error_code(r) == "InvalidArgument");
        r = a.call("update_api_key", {{"service", ""}, {"apiKey", "sk-1"}});
        REQUIRE(error_code(r) == "InvalidArgument");
    }

    SECTION("ChangesArePushed") {
        a.call("update_api_key", {{"service", "openai"}, {"api_key", "sk-2"}});
        auto events = collect_until(*a.sub, [](const Event& e) {
            return e.kind == EventKind::settings_changed;
        }, 1s);
        REQUIRE_FALSE(events.empty());
        REQUIRE(events.back().data.at("api_keys").at("openai").get<std::string>() == "sk-2");
    }
}

TEST_CASE("Event serialization", "[bridge]") {
    SECTION("Levels") {
        Event e;
        e.kind = EventKind::audio_levels;
        e.levels.fill(0.25f);
        auto j = CommandBridge::event_to_json(e);
        REQUIRE(j.at("event").get<std::string>() == "audio-levels");
        REQUIRE(j.at("payload").size() == 8);
        REQUIRE(j.at("payload")[0].get<float>() == Approx(0.25f));
    }

    SECTION("Status") {
        Event e;
        e.kind       = EventKind::processing_status;
        e.status     = ProcessingStatus::thinking_action;
        e.session_id = "abc";
        auto j = CommandBridge::event_to_json(e);
        REQUIRE(j.at("event").get<std::string>() == "audio-processing-status");
        REQUIRE(j.at("payload").get<std::string>() == "thinking_action");
        REQUIRE(j.at("session_id").get<std::string>() == "abc");
    }

    SECTION("Record") {
        Event e;
        e.kind = EventKind::transcription_added;
        rune::TranscriptionRecord r;
        r.id         = 3;
        r.timestamp  = "2024-01-01T00:00:00.000Z";
        r.audio_path = "/tmp/x.wav";
        r.text       = "hi";
        e.record = r;
        auto j = CommandBridge::event_to_json(e);
        REQUIRE(j.at("event").get<std::string>() == "transcription-added");
        REQUIRE(j.at("payload").at("id").get<int64_t>() == 3);
        REQUIRE(j.at("payload").at("audio_path").get<std::string>() == "/tmp/x.wav");
    }

    SECTION("Error") {
        Event e;
        e.kind       = EventKind::pipeline_error;
        e.error_code = rune::ErrorCode::storage_unavailable;
        e.message    = "disk full";
        auto j = CommandBridge::event_to_json(e);
        REQUIRE(j.at("event").get<std::string>() == "pipeline-error");
        REQUIRE(j.at("payload").at("code").get<std::string>() == "StorageUnavailable");
        REQUIRE(j.at("payload").at("message").get<std::string>() == "disk full");
    }
}
