// =================================================================
// include/GitCC/PromptOrchestrator.hpp
// =================================================================
// Drives the commit questionnaire.

#pragma once

#include "GitCC/AnswerSet.hpp"
#include "GitCC/PromptBackend.hpp"
#include "GitCC/SessionStateStore.hpp"
#include <string>

namespace GitCC {

/**
 * @brief Questions asked, in order
 */
enum class PromptStep {
    SELECT_TYPE,
    SCOPE,
    SHORT_DESCRIPTION,
    LONG_DESCRIPTION,
    BREAKING_CHANGE_FLAG,
    BREAKING_CHANGE_NOTE
};

/**
 * @brief Asks the commit questions and collects the answers
 *
 * Answers restored from an earlier run are offered as defaults. After
 * each answered question the answers so far are written to the session
 * store, so an interrupted run can be picked up again. The breaking
 * change note is only asked for when the flag is set; a note restored
 * from an earlier run is kept otherwise.
 */
class PromptOrchestrator {
public:
    /**
     * @param choices Resolved commit types and scopes, must outlive run()
     * @param backend Input widgets
     * @param store Where partial answers are persisted, may be null
     */
    PromptOrchestrator(const ChoiceSet& choices, PromptBackend& backend,
                       SessionStateStore* store = nullptr);

    /**
     * @brief Ask every applicable question
     * @param restored Answers from an earlier run, used as defaults
     * @return The completed answers
     * @throws PromptCancelled if the user abandons a question
     */
    AnswerSet run(const AnswerSet& restored);

    /**
     * @brief Number of saves that failed during the last run
     */
    size_t getFailedSaves() const { return m_failed_saves; }

    static std::string getStepName(PromptStep step);

    /**
     * @brief Default offered by the commit type question
     * @return The restored type if it is still a valid choice, otherwise empty
     */
    static std::string defaultCommitType(const ChoiceSet& choices, const AnswerSet& restored);

    /**
     * @brief Default offered by the scope selection
     * @return The restored scope if listed, else kNoScope if listed, else empty
     */
    static std::string defaultScope(const ChoiceSet& choices, const AnswerSet& restored);

private:
    const ChoiceSet& m_choices;
    PromptBackend& m_backend;
    SessionStateStore* m_store;
    size_t m_failed_saves;

    void persist(const AnswerSet& answers, PromptStep completed);
};

} // namespace GitCC
