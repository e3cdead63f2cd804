// =================================================================
// include/GitCC/MessageRenderer.hpp
// =================================================================
// Turns a completed AnswerSet into Conventional Commit text.

#pragma once

#include "GitCC/AnswerSet.hpp"
#include <string>

namespace GitCC {

class MessageRenderer {
public:
    /**
     * @brief Render the commit message
     *
     * Produces `type[(scope)][!]: short`, then the long description and
     * the `BREAKING CHANGE:` footer, each separated by one blank line and
     * only when present. The result has no trailing newline.
     *
     * @param answers The completed answers
     * @return Commit message text
     */
    static std::string render(const AnswerSet& answers);

    /**
     * @brief Whether a scope produces a `(scope)` annotation
     */
    static bool hasScope(const std::string& scope);

    static constexpr const char* kBreakingChangePrefix = "BREAKING CHANGE: ";
};

} // namespace GitCC
