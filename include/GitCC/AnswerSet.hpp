// =================================================================
// include/GitCC/AnswerSet.hpp
// =================================================================
// The structured answers collected by the commit questionnaire.

#pragma once

#include <string>
#include <vector>

namespace GitCC {

/// Reserved scope value meaning "no scope annotation".
inline const std::string kNoScope = "none";

/**
 * @brief Answers for one commit message
 *
 * A breaking_change_note is only rendered while breaking_change is set,
 * and a scope equal to kNoScope is treated like an empty scope.
 */
struct AnswerSet {
    std::string commit_type;
    std::string scope;
    std::string short_description;
    std::string long_description;   ///< May span several lines
    bool breaking_change = false;
    std::string breaking_change_note;

    bool operator==(const AnswerSet& other) const {
        return commit_type == other.commit_type &&
               scope == other.scope &&
               short_description == other.short_description &&
               long_description == other.long_description &&
               breaking_change == other.breaking_change &&
               breaking_change_note == other.breaking_change_note;
    }

    bool operator!=(const AnswerSet& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Selectable values for the type and scope questions
 *
 * An empty scope list means the scope is entered as free text.
 */
struct ChoiceSet {
    std::vector<std::string> commit_types;
    std::vector<std::string> scopes;
};

} // namespace GitCC
