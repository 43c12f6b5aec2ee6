#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rune {

/// Types finished text into whatever window has the keyboard focus.
class TextInjector {
public:
    virtual ~TextInjector() = default;

    /// @throws RuneError(device_unavailable) if no typing backend works.
    virtual void inject(const std::string& text) = 0;
};

/// Injects text by running an external typing tool.
///
/// ydotool goes through uinput and works on any compositor, which is why
/// accessibility on Linux means write access to /dev/uinput.  wtype covers
/// wlroots compositors and xdotool covers X11.  With no tool configured the
/// first one that runs is picked on the first injection and kept.
class CommandTextInjector : public TextInjector {
public:
    explicit CommandTextInjector(std::string tool = {});

    void inject(const std::string& text) override;

    /// Tool in use; empty until the first injection has picked one.
    std::string tool() const;

    /// argv for typing `text` with `tool`.
    /// @throws RuneError(invalid_argument) for an unknown tool.
    static std::vector<std::string> command_for(const std::string& tool,
                                                const std::string& text);

    static const std::vector<std::string>& known_tools();

private:
    /// Run argv with stdout/stderr discarded.  Returns the exit status, or
    /// nullopt if the program could not be started.
    static std::optional<int> run(const std::vector<std::string>& argv);

    std::string detect() const;

    mutable std::mutex mu_;
    std::string        tool_;
};

} // namespace rune
