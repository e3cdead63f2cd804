// =================================================================
// src/GitCC/MessageRenderer.cpp
// =================================================================
// Implementation for the commit message renderer.

#include "GitCC/MessageRenderer.hpp"
#include <sstream>

namespace GitCC {

bool MessageRenderer::hasScope(const std::string& scope) {
    return !scope.empty() && scope != kNoScope;
}

std::string MessageRenderer::render(const AnswerSet& answers) {
    std::ostringstream message;

    // Header
    message << answers.commit_type;
    if (hasScope(answers.scope)) {
        message << "(" << answers.scope << ")";
    }
    if (answers.breaking_change) {
        message << "!";
    }
    message << ": " << answers.short_description;

    // Body
    if (!answers.long_description.empty()) {
        message << "\n\n" << answers.long_description;
    }

    // Footer, a note left over from an unset flag is never rendered
    if (answers.breaking_change && !answers.breaking_change_note.empty()) {
        message << "\n\n" << kBreakingChangePrefix << answers.breaking_change_note;
    }

    return message.str();
}

} // namespace GitCC
