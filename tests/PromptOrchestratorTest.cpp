// =================================================================
// tests/PromptOrchestratorTest.cpp
// =================================================================
// Unit tests for PromptOrchestrator component.

#include "GitCC/PromptOrchestrator.hpp"
#include "GitCC/ChoiceSetResolver.hpp"
#include "GitCC/MessageRenderer.hpp"
#include "GitCC/Logger.hpp"
#include <iostream>
#include <cassert>
#include <deque>
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

// Answers questions from a script and records what was asked
class ScriptedBackend : public GitCC::PromptBackend {
public:
    struct Question {
        std::string kind;
        std::string label;
        std::string default_value;
        std::vector<std::string> options;
    };

    std::deque<std::string> answers;
    std::vector<Question> asked;

    std::string select(const std::string& label, const std::vector<std::string>& options,
                       const std::string& default_option) override {
        asked.push_back({"select", label, default_option, options});
        std::string answer = next(label);
        return answer.empty() ? default_option : answer;
    }

    std::string textInput(const std::string& label, const std::string& default_value) override {
        asked.push_back({"text", label, default_value, {}});
        std::string answer = next(label);
        return answer.empty() ? default_value : answer;
    }

    std::string multiLineInput(const std::string& label, const std::string& default_value) override {
        asked.push_back({"multiline", label, default_value, {}});
        std::string answer = next(label);
        return answer.empty() ? default_value : answer;
    }

    bool confirm(const std::string& label, bool default_value) override {
        asked.push_back({"confirm", label, default_value ? "true" : "false", {}});
        std::string answer = next(label);
        if (answer.empty()) {
            return default_value;
        }
        return answer == "y";
    }

private:
    std::string next(const std::string& label) {
        if (answers.empty()) {
            throw GitCC::PromptCancelled("script exhausted at " + label);
        }
        std::string answer = answers.front();
        answers.pop_front();
        return answer;
    }
};

class PromptOrchestratorTest {
private:
    std::string test_dir;

    GitCC::ChoiceSet choicesWithScopes() {
        GitCC::ChoiceSetOptions options;
        options.scopes = {"api", "ui"};
        return GitCC::ChoiceSetResolver::resolve(options);
    }

    GitCC::ChoiceSet choicesWithoutScopes() {
        return GitCC::ChoiceSetResolver::resolve(GitCC::ChoiceSetOptions{});
    }

public:
    PromptOrchestratorTest()
        : test_dir((std::filesystem::temp_directory_path() /
                    ("gitcc_orchestrator_test_" + std::to_string(getpid()))).string()) {
        std::filesystem::create_directories(test_dir);
        GitCC::Logger::getInstance().setConsoleLogging(false);
    }

    ~PromptOrchestratorTest() {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    void testFullRunWithScopeSelection() {
        std::cout << "Testing full questionnaire with scope list..." << std::endl;

        auto choices = choicesWithScopes();
        ScriptedBackend backend;
        backend.answers = {"feat", "api", "  add health endpoint  ", "\n  Body text.\n\n", "y", " drops v1 "};

        GitCC::PromptOrchestrator orchestrator(choices, backend);
        auto answers = orchestrator.run(GitCC::AnswerSet{});

        assert(backend.asked.size() == 6 && "All six questions are asked");
        assert(backend.asked[0].kind == "select" && backend.asked[0].options == choices.commit_types &&
               "Type question offers the resolved types");
        assert(backend.asked[0].default_value.empty() && "No type default without a previous session");
        assert(backend.asked[1].kind == "select" && backend.asked[1].default_value == "none" &&
               "Scope list defaults to the sentinel");
        assert(backend.asked[3].kind == "multiline" && "Long description is multi-line");
        assert(backend.asked[5].label == "Breaking Change Note" && "Note is asked when breaking");

        assert(answers.commit_type == "feat" && answers.scope == "api" && "Selections are recorded");
        assert(answers.short_description == "add health endpoint" && "Short description is trimmed");
        assert(answers.long_description == "Body text." && "Long description is trimmed as a block");
        assert(answers.breaking_change && answers.breaking_change_note == "drops v1" && "Note is trimmed");

        std::cout << "✓ Full run with scope selection test passed" << std::endl;
    }

    void testFreeTextScopeAndSkippedNote() {
        std::cout << "Testing free-text scope and skipped note..." << std::endl;

        auto choices = choicesWithoutScopes();
        ScriptedBackend backend;
        backend.answers = {"fix", " parser ", "handle tabs", "", "n"};

        GitCC::PromptOrchestrator orchestrator(choices, backend);
        auto answers = orchestrator.run(GitCC::AnswerSet{});

        assert(backend.asked.size() == 5 && "Note is skipped when not breaking");
        assert(backend.asked[1].kind == "text" && backend.asked[1].label == "Scope (optional)" &&
               "Empty scope list switches to free text");
        assert(answers.scope == "parser" && "Free-text scope is trimmed");
        assert(!answers.breaking_change && answers.breaking_change_note.empty() && "No note collected");

        std::cout << "✓ Free-text scope and skipped note test passed" << std::endl;
    }

    void testRestoredDefaults() {
        std::cout << "Testing restored answers as defaults..." << std::endl;

        auto choices = choicesWithScopes();
        GitCC::AnswerSet restored;
        restored.commit_type = "docs";
        restored.scope = "ui";
        restored.short_description = "explain config";
        restored.long_description = "Longer text";
        restored.breaking_change = true;
        restored.breaking_change_note = "old behaviour removed";

        ScriptedBackend backend;
        backend.answers = {"", "", "", "", "", ""};

        GitCC::PromptOrchestrator orchestrator(choices, backend);
        auto answers = orchestrator.run(restored);

        assert(backend.asked[0].default_value == "docs" && "Restored type is the default");
        assert(backend.asked[1].default_value == "ui" && "Restored scope is the default");
        assert(backend.asked[2].default_value == "explain config" && "Restored subject is the default");
        assert(backend.asked[4].default_value == "true" && "Restored flag is the default");
        assert(backend.asked[5].default_value == "old behaviour removed" && "Restored note is the default");
        assert(answers == restored && "Accepting every default reproduces the restored answers");

        std::cout << "✓ Restored defaults test passed" << std::endl;
    }

    void testInvalidRestoredValues() {
        std::cout << "Testing restored values no longer offered..." << std::endl;

        auto choices = choicesWithScopes();
        GitCC::AnswerSet restored;
        restored.commit_type = "removed-type";
        restored.scope = "removed-scope";

        assert(GitCC::PromptOrchestrator::defaultCommitType(choices, restored).empty() &&
               "Unknown type falls back to no default");
        assert(GitCC::PromptOrchestrator::defaultScope(choices, restored) == "none" &&
               "Unknown scope falls back to the sentinel");

        GitCC::ChoiceSetOptions options;
        options.use_defaults = false;
        options.custom_commit_types = {"feature"};
        options.scopes = {"core"};
        auto custom = GitCC::ChoiceSetResolver::resolve(options);
        assert(GitCC::PromptOrchestrator::defaultScope(custom, restored).empty() &&
               "Without the sentinel there is no scope default");

        std::cout << "✓ Invalid restored values test passed" << std::endl;
    }

    void testStaleNoteKeptButNotRendered() {
        std::cout << "Testing note kept when flag is turned off..." << std::endl;

        auto choices = choicesWithoutScopes();
        GitCC::AnswerSet restored;
        restored.commit_type = "feat";
        restored.breaking_change = true;
        restored.breaking_change_note = "was breaking";

        ScriptedBackend backend;
        backend.answers = {"", "", "new subject", "", "n"};

        GitCC::PromptOrchestrator orchestrator(choices, backend);
        auto answers = orchestrator.run(restored);

        assert(!answers.breaking_change && "Flag was turned off");
        assert(answers.breaking_change_note == "was breaking" && "Note stays in the answers");
        assert(GitCC::MessageRenderer::render(answers) == "feat: new subject" && "Note is not rendered");

        std::cout << "✓ Stale note test passed" << std::endl;
    }

    void testProgressIsSavedPerStep() {
        std::cout << "Testing answers are saved after each question..." << std::endl;

        auto choices = choicesWithoutScopes();
        GitCC::SessionStateStore store(test_dir + "/.git-cc.swp");
        assert(store.clear() && "Start without a swap file");

        GitCC::AnswerSet restored;
        restored.long_description = "from last time";

        // The script runs out at the long description question
        ScriptedBackend backend;
        backend.answers = {"ci", "pipeline", "cache dependencies"};

        GitCC::PromptOrchestrator orchestrator(choices, backend, &store);
        bool cancelled = false;
        try {
            orchestrator.run(restored);
        } catch (const GitCC::PromptCancelled&) {
            cancelled = true;
        }
        assert(cancelled && "Cancellation propagates to the caller");
        assert(orchestrator.getFailedSaves() == 0 && "All saves succeeded");

        auto saved = store.load();
        assert(saved.commit_type == "ci" && saved.scope == "pipeline" &&
               saved.short_description == "cache dependencies" && "Answered questions are persisted");
        assert(saved.long_description == "from last time" && "Unanswered fields keep restored values");

        // A second run resumes from the persisted answers
        ScriptedBackend resumed_backend;
        resumed_backend.answers = {"", "", "", "", "n"};
        GitCC::PromptOrchestrator resumed(choices, resumed_backend, &store);
        auto answers = resumed.run(saved);

        assert(answers.commit_type == "ci" && answers.short_description == "cache dependencies" &&
               "Resumed run offers the earlier answers");
        assert(store.load() == answers && "Final answers are persisted");

        std::cout << "✓ Progress saved per step test passed" << std::endl;
    }

    void testSaveFailureDoesNotStopQuestions() {
        std::cout << "Testing unwritable swap location..." << std::endl;

        auto choices = choicesWithoutScopes();
        GitCC::SessionStateStore store(test_dir + "/missing/dir/.git-cc.swp");

        ScriptedBackend backend;
        backend.answers = {"test", "", "add cases", "", "n"};

        GitCC::PromptOrchestrator orchestrator(choices, backend, &store);
        auto answers = orchestrator.run(GitCC::AnswerSet{});

        assert(answers.commit_type == "test" && "Questionnaire completes");
        assert(orchestrator.getFailedSaves() == 5 && "Every failed save is counted");

        std::cout << "✓ Save failure test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PromptOrchestrator unit tests..." << std::endl;

        testFullRunWithScopeSelection();
        testFreeTextScopeAndSkippedNote();
        testRestoredDefaults();
        testInvalidRestoredValues();
        testStaleNoteKeptButNotRendered();
        testProgressIsSavedPerStep();
        testSaveFailureDoesNotStopQuestions();

        std::cout << "All PromptOrchestrator tests passed!" << std::endl;
    }
};

int main() {
    try {
        PromptOrchestratorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All PromptOrchestrator component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
