#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "Fakes.hpp"
#include "SettingsStore.hpp"
#include "ShortcutManager.hpp"

#include <atomic>

using rune::ErrorCode;
using rune::Hotkey;
using rune::RuneError;
using rune::SettingsStore;
using rune::ShortcutManager;
using rune::testing::FakeHotkeyRegistrar;
using rune::testing::TempDir;

TEST_CASE("Shortcut parsing", "[shortcuts]") {
    SECTION("KeysAreCaseInsensitive") {
        REQUIRE(ShortcutManager::canonical_key("keya") == std::string("KeyA"));
        REQUIRE(ShortcutManager::canonical_key(" SPACE ") == std::string("Space"));
        REQUIRE(ShortcutManager::canonical_key("f12") == std::string("F12"));
        REQUIRE(ShortcutManager::canonical_key("arrowup") == std::string("ArrowUp"));
    }

    SECTION("UnknownKeysAreRejected") {
        REQUIRE_FALSE(ShortcutManager::canonical_key("Hyper"));
        REQUIRE_FALSE(ShortcutManager::canonical_key("F25"));
        REQUIRE_FALSE(ShortcutManager::canonical_key(""));
    }

    SECTION("ModifierAliasesAreCanonical") {
        REQUIRE(ShortcutManager::canonical_modifier("ctrl") == std::string("CONTROL"));
        REQUIRE(ShortcutManager::canonical_modifier("cmd") == std::string("SUPER"));
        REQUIRE(ShortcutManager::canonical_modifier("Option") == std::string("ALT"));
        REQUIRE(ShortcutManager::canonical_modifier("shift+ctrl") == std::string("CONTROL+SHIFT"));
        REQUIRE(ShortcutManager::canonical_modifier("ctrl+control") == std::string("CONTROL"));
    }

    SECTION("BadModifiersAreRejected") {
        REQUIRE_FALSE(ShortcutManager::canonical_modifier("ctrl+"));
        REQUIRE_FALSE(ShortcutManager::canonical_modifier("hyper"));
    }

    SECTION("BothEmptyClears") {
        REQUIRE_FALSE(ShortcutManager::parse("", ""));
    }

    SECTION("BareKeyHasNoModifier") {
        auto h = ShortcutManager::parse("F9", "");
        REQUIRE(h);
        REQUIRE(h->key == "F9");
        REQUIRE_FALSE(h->modifier);
        REQUIRE(h->to_string() == "F9");
    }

    SECTION("ModifierWithoutKeyIsInvalid") {
        try {
            ShortcutManager::parse("", "CONTROL");
            FAIL("expected an exception");
        } catch (const RuneError& e) {
            REQUIRE(e.code() == ErrorCode::invalid_argument);
        }
    }
}

TEST_CASE("Shortcut registration", "[shortcuts]") {
    TempDir dir;
    SettingsStore settings(dir.file("settings.json"));
    settings.load();

    FakeHotkeyRegistrar registrar;
    std::atomic<int> presses{0};
    std::atomic<int> releases{0};
    ShortcutManager manager(settings, registrar, [&](bool pressed) {
        if (pressed) ++presses; else ++releases;
    });

    SECTION("StoredBindingIsRegistered") {
        manager.register_from_settings();
        auto reg = registrar.registered();
        REQUIRE(reg.size() == 1);
        REQUIRE(reg[0].to_string() == "CONTROL+Space");

        registrar.fire(true);
        registrar.fire(false);
        REQUIRE(presses == 1);
        REQUIRE(releases == 1);
    }

    SECTION("UpdatePersistsAndReregisters") {
        manager.register_from_settings();
        manager.update_shortcuts("keyr", "alt+shift");

        auto reg = registrar.registered();
        REQUIRE(reg.size() == 1);
        REQUIRE(reg[0].key == "KeyR");
        REQUIRE(reg[0].modifier == std::string("SHIFT+ALT"));
        REQUIRE(settings.get().shortcuts.record_key == std::string("KeyR"));
        REQUIRE(settings.get().shortcuts.record_modifier == std::string("SHIFT+ALT"));
        REQUIRE(manager.current() == reg[0]);
    }

    SECTION("EmptyStringsClearBinding") {
        manager.register_from_settings();
        manager.update_shortcuts("", "");
        REQUIRE(registrar.registered().empty());
        REQUIRE_FALSE(manager.current());
        REQUIRE_FALSE(settings.get().shortcuts.record_key);
    }

    SECTION("InvalidUpdateKeepsOldBinding") {
        manager.register_from_settings();
        REQUIRE_THROWS_AS(manager.update_shortcuts("NotAKey", "CONTROL"), RuneError);
        REQUIRE(registrar.registered().size() == 1);
        REQUIRE(settings.get().shortcuts.record_key == std::string("Space"));
    }

    SECTION("InvalidStoredBindingIsSkipped") {
        settings.update_shortcuts(std::string("Bogus"), std::string("CONTROL"));
        manager.register_from_settings();
        REQUIRE(registrar.registered().empty());
        REQUIRE_FALSE(manager.current());
    }
}
