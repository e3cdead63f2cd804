// =================================================================
// include/GitCC/TerminalPrompter.hpp
// =================================================================
// Line-oriented prompts on a pair of text streams.

#pragma once

#include "GitCC/PromptBackend.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace GitCC {

/**
 * @brief PromptBackend reading answers line by line
 *
 * - select: numbered list; Enter takes the default, a number or the exact
 *   option text picks an option.
 * - textInput: Enter keeps the default shown in brackets, "-" clears it.
 * - multiLineInput: lines until a single "." or end of input.
 * - confirm: y/yes/n/no, Enter keeps the default.
 *
 * Invalid answers repeat the question. End of input throws PromptCancelled.
 */
class TerminalPrompter : public PromptBackend {
public:
    static constexpr const char* kClearToken = "-";
    static constexpr const char* kEndOfTextToken = ".";

    TerminalPrompter(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::string select(const std::string& label,
                       const std::vector<std::string>& options,
                       const std::string& default_option) override;

    std::string textInput(const std::string& label,
                          const std::string& default_value) override;

    std::string multiLineInput(const std::string& label,
                               const std::string& default_value) override;

    bool confirm(const std::string& label, bool default_value) override;

private:
    std::istream& m_in;
    std::ostream& m_out;

    /**
     * @brief Read one line, stripping a trailing carriage return
     * @throws PromptCancelled at end of input
     */
    std::string readLine(const std::string& label);

    /**
     * @brief Map a select answer to an option
     * @return Index into options, or -1 if the answer matches nothing
     */
    static int parseSelection(const std::string& input,
                              const std::vector<std::string>& options);
};

} // namespace GitCC
