#pragma once

#include "CancellationToken.hpp"

#include <string>

namespace rune {

/// Optional post-processing of a transcript by a language model.
///
/// The controller first asks for the intent (status `thinking_action`).
/// If the transcript asks for new text it calls `generate()` (status
/// `generating_text`), otherwise `transform()` cleans the dictation up.
/// All calls may block; all failures are RuneError(engine_failure).
class ActionEngine {
public:
    virtual ~ActionEngine() = default;

    /// True if the transcript is an instruction to generate text.
    virtual bool detect_intent(const std::string& transcript,
                               const CancellationToken& token) = 0;

    virtual std::string generate(const std::string& transcript,
                                 const CancellationToken& token) = 0;

    virtual std::string transform(const std::string& transcript,
                                  const CancellationToken& token) = 0;
};

} // namespace rune
