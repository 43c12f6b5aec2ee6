#include "CommandBridge.hpp"
#include "Errors.hpp"
#include "FfmpegAudioInput.hpp"
#include "Log.hpp"
#include "RuneApp.hpp"
#include "SettingsStore.hpp"
#include "SyntheticAudioInput.hpp"
#include "TextInjector.hpp"
#include "WhisperEngine.hpp"

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

namespace {

constexpr const char* kTag = "runed";

struct Args {
    std::string config_path;
    std::string model_path;
    std::string log_level;
    bool        synthetic = false;
};

Args parse_args(int argc, char** argv) {
    Args a{};
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      ((s == "--config" || s == "-c") && i + 1 < argc) a.config_path = argv[++i];
        else if ((s == "--model" || s == "-m") && i + 1 < argc)  a.model_path  = argv[++i];
        else if (s == "--log-level" && i + 1 < argc)             a.log_level   = argv[++i];
        else if (s == "--synthetic")                             a.synthetic   = true;
        else if (s == "--help" || s == "-h") {
            std::cout << "runed: push-to-talk dictation daemon\n"
                      << "Reads one JSON command per line on stdin, answers on stdout.\n"
                      << "  -c, --config <path>       Settings file (default XDG config)\n"
                      << "  -m, --model <path>        whisper.cpp model (default from settings)\n"
                      << "      --synthetic           Use a generated tone instead of a microphone\n"
                      << "      --log-level <level>   debug | info | warn | error\n";
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << s << " (try --help)\n";
            std::exit(2);
        }
    }
    return a;
}

/// No global hotkey backend ships with the daemon; the UI forwards key
/// events with the `hotkey` command instead.
class LoggingHotkeyRegistrar : public rune::HotkeyRegistrar {
public:
    void register_hotkey(const rune::Hotkey& hotkey, Handler) override {
        rune::log::info(kTag, "shortcut bound to " + hotkey.to_string()
                                  + " (delivered via the hotkey command)");
    }
    void unregister_all() override {}
};

/// Settings as they are on disk, before the app takes ownership of them.
rune::Settings peek_settings(const std::string& path) {
    rune::SettingsStore store(path);
    try {
        store.load();
    } catch (const rune::RuneError& e) {
        rune::log::warn(kTag, e.what());
    }
    return store.get();
}

class LineWriter {
public:
    void write(const nlohmann::json& j) {
        const std::string line = j.dump();
        std::lock_guard<std::mutex> lock(mu_);
        std::cout << line << '\n' << std::flush;
    }

private:
    std::mutex mu_;
};

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    const Args args = parse_args(argc, argv);

    rune::RuneAppOptions options;
    options.settings_path = args.config_path.empty() ? rune::default_settings_path()
                                                     : args.config_path;

    const rune::Settings settings = peek_settings(options.settings_path);
    rune::log::set_level(rune::log::level_from_string(
        args.log_level.empty() ? settings.log_level : args.log_level));

    // ---- Engine ----
    rune::WhisperConfig whisper_config;
    whisper_config.language = settings.pipeline.language;
    auto whisper = std::make_unique<rune::WhisperEngine>(whisper_config);

    const std::string model_path = rune::expand_path(
        args.model_path.empty() ? settings.pipeline.model_path : args.model_path);
    if (model_path.empty()) {
        rune::log::warn(kTag, "no model configured; transcription will fail");
    } else if (!whisper->init(model_path)) {
        rune::log::error(kTag, "could not load model " + model_path
                                   + "; transcription will fail");
    }

    // ---- Audio input ----
    std::unique_ptr<rune::AudioInput> input;
    if (args.synthetic) {
        input = std::make_unique<rune::SyntheticAudioInput>();
        rune::log::info(kTag, "using synthetic audio input");
    } else {
        rune::FfmpegInputConfig input_config;
        input_config.input_format = settings.audio.input_format;
        input_config.sample_rate = settings.audio.sample_rate;
        input_config.channels    = settings.audio.channels;
        input = std::make_unique<rune::FfmpegAudioInput>(input_config);
    }

    // ---- Text injection ----
    std::unique_ptr<rune::TextInjector> injector;
    if (settings.pipeline.inject_text) {
        try {
            injector = std::make_unique<rune::CommandTextInjector>(settings.pipeline.typing_tool);
        } catch (const rune::RuneError& e) {
            rune::log::error(kTag, std::string(e.what()) + "; text injection disabled");
        }
    }
    const bool injecting = injector != nullptr;

    std::unique_ptr<rune::RuneApp> app;
    try {
        app = std::make_unique<rune::RuneApp>(options, std::move(input), std::move(whisper),
                                              std::make_unique<LoggingHotkeyRegistrar>(),
                                              nullptr, std::move(injector));
    } catch (const rune::RuneError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    rune::CommandBridge bridge(*app);
    LineWriter          out;

    auto events = app->subscribe();
    std::thread pump([&] {
        while (!g_stop.load()) {
            auto event = events->next(std::chrono::milliseconds(200));
            if (!event) {
                if (events->closed()) break;
                continue;
            }
            out.write(rune::CommandBridge::event_to_json(*event));
        }
    });

    app->start();
    if (injecting && !app->check_accessibility_permissions()) {
        rune::log::warn(kTag, "no uinput access; ydotool cannot type, other tools may still work");
    }
    rune::log::info(kTag, "ready");

    // stdin is polled so a signal can end the loop between lines.
    std::string pending;
    char        buf[4096];
    while (!g_stop.load()) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            rune::log::error(kTag, "poll on stdin failed");
            break;
        }
        if (ready == 0) continue;

        const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            rune::log::error(kTag, "read on stdin failed");
            break;
        }
        if (n == 0) break;   // UI closed the pipe
        pending.append(buf, static_cast<std::size_t>(n));

        std::size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            out.write(bridge.handle_line(line));
        }
    }

    rune::log::info(kTag, "shutting down");
    g_stop.store(true);
    app->shutdown();
    events->close();
    pump.join();
    return 0;
}
