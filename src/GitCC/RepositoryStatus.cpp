// =================================================================
// src/GitCC/RepositoryStatus.cpp
// =================================================================
// Implementation for the repository precondition check.

#include "GitCC/RepositoryStatus.hpp"
#include "GitCC/Logger.hpp"
#include <sstream>
#include <stdexcept>

namespace GitCC {

RepositoryStatus::RepositoryStatus(SysInteraction& sys)
    : m_sys(sys) {}

RepoStatusReport RepositoryStatus::check() {
    RepoStatusReport report;

    try {
        auto [root_output, root_code] = m_sys.executeCommand("git", {"rev-parse", "--show-toplevel"});
        std::string root = root_output;
        while (!root.empty() && (root.back() == '\n' || root.back() == '\r')) {
            root.pop_back();
        }
        if (root_code != 0 || root.empty()) {
            report.state = RepoState::NOT_A_REPOSITORY;
            return report;
        }
        report.root = root;
        LOG_DEBUG("RepositoryStatus", "Root directory of Git repository: " + root);

        // -uall lists untracked files inside untracked directories too
        auto [status_output, status_code] = m_sys.executeCommand(
            "git", {"-C", root, "status", "--porcelain", "-uall"});
        if (status_code != 0) {
            LOG_ERROR("RepositoryStatus", "Failed to get status (git exited with " +
                      std::to_string(status_code) + ")");
            report.state = RepoState::NOT_A_REPOSITORY;
            return report;
        }

        report.state = classifyPorcelain(status_output);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("RepositoryStatus", std::string("Cannot run git: ") + e.what());
        report.state = RepoState::NOT_A_REPOSITORY;
    }

    return report;
}

RepoState RepositoryStatus::classifyPorcelain(const std::string& porcelain) {
    bool has_untracked = false;

    std::istringstream lines(porcelain);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.size() < 2) {
            continue;
        }

        // Column one is the index state
        char staged = line[0];
        if (staged == '?') {
            has_untracked = true;
        } else if (staged != ' ' && staged != '!') {
            return RepoState::READY;
        }
    }

    return has_untracked ? RepoState::NOTHING_STAGED_UNTRACKED : RepoState::NOTHING_STAGED;
}

std::string RepositoryStatus::describe(RepoState state) {
    switch (state) {
        case RepoState::READY:
            return "ready to commit";
        case RepoState::NOT_A_REPOSITORY:
            return "not a git repository (or any of the parent directories): .git";
        case RepoState::NOTHING_STAGED:
            return "nothing added to commit";
        case RepoState::NOTHING_STAGED_UNTRACKED:
            return "nothing added to commit but untracked files present (use \"git add\" to track)";
        default:
            return "unknown repository state";
    }
}

} // namespace GitCC
