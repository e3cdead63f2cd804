// =================================================================
// include/GitCC/PromptBackend.hpp
// =================================================================
// Abstract "ask the user" capability used by the questionnaire.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace GitCC {

/**
 * @brief Thrown by a backend when the user abandons a question
 */
class PromptCancelled : public std::runtime_error {
public:
    explicit PromptCancelled(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Interface for interactive input widgets
 *
 * Every method blocks until the user has answered and returns the
 * answer, or throws PromptCancelled.
 */
class PromptBackend {
public:
    virtual ~PromptBackend() = default;

    /**
     * @brief Let the user pick one of the options
     * @param label Question text
     * @param options Non-empty list of choices
     * @param default_option Preselected option, empty for none
     * @return The chosen option
     */
    virtual std::string select(const std::string& label,
                               const std::vector<std::string>& options,
                               const std::string& default_option) = 0;

    /**
     * @brief Ask for a single line of text
     * @param label Question text
     * @param default_value Value kept when the user just confirms
     */
    virtual std::string textInput(const std::string& label,
                                  const std::string& default_value) = 0;

    /**
     * @brief Ask for free text spanning several lines
     * @param label Question text
     * @param default_value Value kept when the user enters nothing
     */
    virtual std::string multiLineInput(const std::string& label,
                                       const std::string& default_value) = 0;

    /**
     * @brief Ask a yes/no question
     */
    virtual bool confirm(const std::string& label, bool default_value) = 0;
};

} // namespace GitCC
