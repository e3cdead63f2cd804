// =================================================================
// include/GitCC/ChoiceSetResolver.hpp
// =================================================================
// Merges the built-in commit types with the user's configuration.

#pragma once

#include "GitCC/AnswerSet.hpp"
#include <string>
#include <vector>

namespace GitCC {

/**
 * @brief User-supplied inputs for building the choice lists
 */
struct ChoiceSetOptions {
    bool use_defaults = true;
    std::vector<std::string> custom_commit_types;
    std::vector<std::string> scopes;
};

class ChoiceSetResolver {
public:
    /**
     * @brief The built-in commit types, in presentation order
     */
    static const std::vector<std::string>& defaultCommitTypes();

    /**
     * @brief Build the commit type and scope lists for this run
     *
     * With defaults enabled the built-in types come first, followed by the
     * custom types, and a non-empty scope list is prefixed with kNoScope.
     * With defaults disabled both lists are taken as declared. Both lists
     * are deduplicated.
     *
     * @param options Values from the configuration
     * @return The resolved choice set
     */
    static ChoiceSet resolve(const ChoiceSetOptions& options);

    /**
     * @brief Drop repeated values, keeping the first occurrence of each
     * @param values Input list
     * @return The list with duplicates removed, in original relative order
     */
    static std::vector<std::string> removeDuplicates(const std::vector<std::string>& values);
};

} // namespace GitCC
