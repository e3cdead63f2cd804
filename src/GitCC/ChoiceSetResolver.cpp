// =================================================================
// src/GitCC/ChoiceSetResolver.cpp
// =================================================================
// Implementation for the commit type and scope list builder.

#include "GitCC/ChoiceSetResolver.hpp"
#include <unordered_set>

namespace GitCC {

const std::vector<std::string>& ChoiceSetResolver::defaultCommitTypes() {
    static const std::vector<std::string> types = {
        "feat", "fix", "build", "chore", "ci", "docs", "refactor", "test"
    };
    return types;
}

ChoiceSet ChoiceSetResolver::resolve(const ChoiceSetOptions& options) {
    ChoiceSet choices;

    if (options.use_defaults) {
        choices.commit_types = defaultCommitTypes();
        choices.commit_types.insert(choices.commit_types.end(),
                                    options.custom_commit_types.begin(),
                                    options.custom_commit_types.end());

        // An empty scope list switches the scope question to free text
        if (!options.scopes.empty()) {
            choices.scopes.push_back(kNoScope);
            choices.scopes.insert(choices.scopes.end(),
                                  options.scopes.begin(), options.scopes.end());
        }
    } else {
        choices.commit_types = options.custom_commit_types;
        choices.scopes = options.scopes;
    }

    choices.commit_types = removeDuplicates(choices.commit_types);
    choices.scopes = removeDuplicates(choices.scopes);
    return choices;
}

std::vector<std::string> ChoiceSetResolver::removeDuplicates(const std::vector<std::string>& values) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    unique.reserve(values.size());

    for (const auto& value : values) {
        if (seen.insert(value).second) {
            unique.push_back(value);
        }
    }
    return unique;
}

} // namespace GitCC
