// =================================================================
// tests/RepositoryStatusTest.cpp
// =================================================================
// Unit tests for RepositoryStatus and CommitRunner.

#include "GitCC/RepositoryStatus.hpp"
#include "GitCC/CommitRunner.hpp"
#include "GitCC/Logger.hpp"
#include <iostream>
#include <cassert>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Replays canned git output keyed by the first argument
class FakeGit : public GitCC::SysInteraction {
public:
    std::map<std::string, std::pair<std::string, int>> responses;
    std::vector<std::vector<std::string>> executed;
    bool fail_to_start = false;

    std::vector<std::string> last_run_args;
    std::string last_message;
    int commit_exit_code = 0;
    std::vector<std::string> removed;

    std::pair<std::string, int> executeCommand(const std::string& command,
                                               const std::vector<std::string>& args) override {
        if (fail_to_start) {
            throw std::runtime_error("popen() failed!");
        }
        executed.push_back(args);
        std::string key = args.empty() ? command : args[0];
        if (key == "-C" && args.size() > 2) {
            key = args[2];
        }
        auto it = responses.find(key);
        if (it == responses.end()) {
            return {"", 128};
        }
        return it->second;
    }

    std::string writeTempFile(const std::string& name_prefix, const std::string& content) override {
        last_message = content;
        return "/tmp/" + name_prefix + "-fake";
    }

    int runCommand(const std::string& /*command*/, const std::vector<std::string>& args) override {
        last_run_args = args;
        return commit_exit_code;
    }

    std::string removeFile(const std::string& file_path) override {
        removed.push_back(file_path);
        return "";
    }
};

class RepositoryStatusTest {
public:
    RepositoryStatusTest() {
        GitCC::Logger::getInstance().setConsoleLogging(false);
    }

    void testClassifyPorcelain() {
        std::cout << "Testing porcelain classification..." << std::endl;

        using GitCC::RepoState;
        using GitCC::RepositoryStatus;

        assert(RepositoryStatus::classifyPorcelain("") == RepoState::NOTHING_STAGED && "Clean tree");
        assert(RepositoryStatus::classifyPorcelain(" M src/a.cpp\n") == RepoState::NOTHING_STAGED &&
               "Unstaged edits are not staged");
        assert(RepositoryStatus::classifyPorcelain("?? notes.txt\n") == RepoState::NOTHING_STAGED_UNTRACKED &&
               "Untracked files are reported");
        assert(RepositoryStatus::classifyPorcelain("?? notes.txt\nM  src/a.cpp\n") == RepoState::READY &&
               "Any staged entry makes the tree ready");
        assert(RepositoryStatus::classifyPorcelain("A  new.cpp") == RepoState::READY && "Added file");
        assert(RepositoryStatus::classifyPorcelain("R  old -> new\n") == RepoState::READY && "Renamed file");
        assert(RepositoryStatus::classifyPorcelain("!! build/\n\nx\n") == RepoState::NOTHING_STAGED &&
               "Ignored and short lines are skipped");

        std::cout << "✓ Porcelain classification test passed" << std::endl;
    }

    void testCheckReady() {
        std::cout << "Testing check in a repository with staged changes..." << std::endl;

        FakeGit git;
        git.responses["rev-parse"] = {"/work/project\n", 0};
        git.responses["status"] = {"M  README.md\n", 0};

        GitCC::RepositoryStatus status(git);
        auto report = status.check();

        assert(report.state == GitCC::RepoState::READY && "Staged change is ready");
        assert(report.root == "/work/project" && "Trailing newline is stripped from the root");
        assert(git.executed.size() == 2 && "Root then status are queried");
        assert(git.executed[1][0] == "-C" && git.executed[1][1] == "/work/project" &&
               "Status runs against the work tree root");

        std::cout << "✓ Check ready test passed" << std::endl;
    }

    void testCheckFailures() {
        std::cout << "Testing check outside a repository..." << std::endl;

        FakeGit outside;
        GitCC::RepositoryStatus outside_status(outside);
        auto report = outside_status.check();
        assert(report.state == GitCC::RepoState::NOT_A_REPOSITORY && "Non-zero rev-parse");
        assert(report.root.empty() && "No root outside a repository");
        assert(outside.executed.size() == 1 && "Status is not queried");

        FakeGit no_git;
        no_git.fail_to_start = true;
        GitCC::RepositoryStatus no_git_status(no_git);
        assert(no_git_status.check().state == GitCC::RepoState::NOT_A_REPOSITORY && "Missing git");

        FakeGit untracked;
        untracked.responses["rev-parse"] = {"/work/project\n", 0};
        untracked.responses["status"] = {"?? scratch.txt\n", 0};
        GitCC::RepositoryStatus untracked_status(untracked);
        assert(untracked_status.check().state == GitCC::RepoState::NOTHING_STAGED_UNTRACKED &&
               "Untracked only");

        assert(GitCC::RepositoryStatus::describe(GitCC::RepoState::NOTHING_STAGED_UNTRACKED)
                   .find("use \"git add\" to track") != std::string::npos && "Hint to stage files");

        std::cout << "✓ Check failures test passed" << std::endl;
    }

    void testCommitRunner() {
        std::cout << "Testing commit handoff..." << std::endl;

        FakeGit git;
        GitCC::CommitRunner runner(git, "/work/project");
        auto result = runner.commit("feat: add thing");

        assert(result.success && result.exit_code == 0 && "Zero exit is success");
        assert(git.last_message == "feat: add thing" && "Message goes to the temp file unchanged");
        std::vector<std::string> expected = {"-C", "/work/project", "commit", "-F", "/tmp/commitMessage-fake"};
        assert(git.last_run_args == expected && "git commit reads the message file");
        assert(git.removed.size() == 1 && git.removed[0] == "/tmp/commitMessage-fake" &&
               "Temp file is removed");

        git.commit_exit_code = 1;
        auto rejected = runner.commit("fix: rejected by hook");
        assert(!rejected.success && rejected.exit_code == 1 && rejected.error.empty() &&
               "Hook rejection is reported with git's exit code");
        assert(git.removed.size() == 2 && "Temp file is removed after a failure too");

        std::cout << "✓ Commit runner test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running RepositoryStatus unit tests..." << std::endl;

        testClassifyPorcelain();
        testCheckReady();
        testCheckFailures();
        testCommitRunner();

        std::cout << "All RepositoryStatus tests passed!" << std::endl;
    }
};

int main() {
    try {
        RepositoryStatusTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All RepositoryStatus component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
