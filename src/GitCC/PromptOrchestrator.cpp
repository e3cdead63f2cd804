// =================================================================
// src/GitCC/PromptOrchestrator.cpp
// =================================================================
// Implementation for the commit questionnaire.

#include "GitCC/PromptOrchestrator.hpp"
#include "GitCC/Logger.hpp"
#include <algorithm>

namespace GitCC {

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

static bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

PromptOrchestrator::PromptOrchestrator(const ChoiceSet& choices, PromptBackend& backend,
                                       SessionStateStore* store)
    : m_choices(choices), m_backend(backend), m_store(store), m_failed_saves(0) {}

std::string PromptOrchestrator::getStepName(PromptStep step) {
    switch (step) {
        case PromptStep::SELECT_TYPE: return "commit type";
        case PromptStep::SCOPE: return "scope";
        case PromptStep::SHORT_DESCRIPTION: return "short description";
        case PromptStep::LONG_DESCRIPTION: return "long description";
        case PromptStep::BREAKING_CHANGE_FLAG: return "breaking change";
        case PromptStep::BREAKING_CHANGE_NOTE: return "breaking change note";
        default: return "unknown";
    }
}

std::string PromptOrchestrator::defaultCommitType(const ChoiceSet& choices, const AnswerSet& restored) {
    if (!restored.commit_type.empty() && contains(choices.commit_types, restored.commit_type)) {
        return restored.commit_type;
    }
    return "";
}

std::string PromptOrchestrator::defaultScope(const ChoiceSet& choices, const AnswerSet& restored) {
    if (!restored.scope.empty() && contains(choices.scopes, restored.scope)) {
        return restored.scope;
    }
    if (contains(choices.scopes, kNoScope)) {
        return kNoScope;
    }
    return "";
}

AnswerSet PromptOrchestrator::run(const AnswerSet& restored) {
    // Unanswered fields keep their restored values until their step runs
    AnswerSet answers = restored;
    m_failed_saves = 0;

    answers.commit_type = m_backend.select("Commit Type", m_choices.commit_types,
                                           defaultCommitType(m_choices, restored));
    persist(answers, PromptStep::SELECT_TYPE);

    if (!m_choices.scopes.empty()) {
        answers.scope = m_backend.select("Scope", m_choices.scopes,
                                         defaultScope(m_choices, restored));
    } else {
        answers.scope = trim(m_backend.textInput("Scope (optional)", restored.scope));
    }
    persist(answers, PromptStep::SCOPE);

    answers.short_description = trim(m_backend.textInput("Short Description",
                                                         restored.short_description));
    if (answers.short_description.empty()) {
        LOG_WARNING("PromptOrchestrator", "Short description is empty");
    }
    persist(answers, PromptStep::SHORT_DESCRIPTION);

    answers.long_description = trim(m_backend.multiLineInput("Long Description (optional)",
                                                             restored.long_description));
    persist(answers, PromptStep::LONG_DESCRIPTION);

    answers.breaking_change = m_backend.confirm("Breaking Change", restored.breaking_change);
    persist(answers, PromptStep::BREAKING_CHANGE_FLAG);

    if (answers.breaking_change) {
        answers.breaking_change_note = trim(m_backend.textInput("Breaking Change Note",
                                                                restored.breaking_change_note));
        persist(answers, PromptStep::BREAKING_CHANGE_NOTE);
    }

    return answers;
}

void PromptOrchestrator::persist(const AnswerSet& answers, PromptStep completed) {
    if (m_store == nullptr) {
        return;
    }
    if (!m_store->save(answers)) {
        m_failed_saves++;
        return;
    }
    LOG_DEBUG("PromptOrchestrator", "Saved answers after " + getStepName(completed));
}

} // namespace GitCC
