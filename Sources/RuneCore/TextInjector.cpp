#include "TextInjector.hpp"

#include "Errors.hpp"
#include "Log.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

extern char** environ;

namespace rune {

namespace {
constexpr const char* kTag = "inject";
} // namespace

CommandTextInjector::CommandTextInjector(std::string tool)
    : tool_(std::move(tool)) {
    if (!tool_.empty()) command_for(tool_, {});   // validate early
}

const std::vector<std::string>& CommandTextInjector::known_tools() {
    static const std::vector<std::string> tools{"ydotool", "wtype", "xdotool"};
    return tools;
}

std::vector<std::string> CommandTextInjector::command_for(const std::string& tool,
                                                          const std::string& text) {
    if (tool == "ydotool") return {"ydotool", "type", "--", text};
    if (tool == "wtype")   return {"wtype", "--", text};
    if (tool == "xdotool") return {"xdotool", "type", "--clearmodifiers", "--", text};
    throw RuneError(ErrorCode::invalid_argument, "Unknown typing tool '" + tool + "'");
}

std::string CommandTextInjector::tool() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tool_;
}

// ---------------------------------------------------------------------------
// inject
// ---------------------------------------------------------------------------

void CommandTextInjector::inject(const std::string& text) {
    if (text.empty()) return;

    std::string tool;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (tool_.empty()) {
            tool_ = detect();
            if (tool_.empty()) {
                throw RuneError(ErrorCode::device_unavailable,
                                "No typing tool found (need ydotool, wtype or xdotool)");
            }
            log::info(kTag, "text injection will use " + tool_);
        }
        tool = tool_;
    }

    const auto status = run(command_for(tool, text));
    if (!status) {
        throw RuneError(ErrorCode::device_unavailable, "Could not run " + tool);
    }
    if (*status != 0) {
        throw RuneError(ErrorCode::device_unavailable,
                        tool + " exited with status " + std::to_string(*status));
    }
}

// Typing an empty string is the cheapest way to see whether a tool can
// reach the display server at all.
std::string CommandTextInjector::detect() const {
    for (const auto& tool : known_tools()) {
        const auto status = run(command_for(tool, {}));
        if (status && *status == 0) return tool;
        log::debug(kTag, tool + " is not usable here");
    }
    return {};
}

// ---------------------------------------------------------------------------
// Process helper
// ---------------------------------------------------------------------------

std::optional<int> CommandTextInjector::run(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO, STDERR_FILENO);

    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) return std::nullopt;

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return std::nullopt;
    }
    if (!WIFEXITED(status)) return -1;
    return WEXITSTATUS(status);
}

} // namespace rune
