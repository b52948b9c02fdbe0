// =================================================================
// tests/WorkflowTest.cpp
// =================================================================
// Unit tests for the tag-and-push and commit workflows.

#include "Gitwise/Workflow.hpp"
#include "Gitwise/GitRepository.hpp"
#include "Gitwise/Logger.hpp"
#include "MockCommandRunner.hpp"
#include <iostream>
#include <cassert>
#include <vector>

class WorkflowTest {
private:
    typedef std::vector<std::string> Args;

    bool contains(const std::string& text, const std::string& part) {
        return text.find(part) != std::string::npos;
    }

    Gitwise::TagOptions createTagOptions(Gitwise::BumpKind bump, bool push = true) {
        Gitwise::TagOptions options;
        options.bump = bump;
        options.push = push;
        return options;
    }

    Gitwise::CommitOptions createCommitOptions(const std::string& description) {
        Gitwise::CommitOptions options;
        options.spec.type = Gitwise::CommitType::FEAT;
        options.spec.description = description;
        return options;
    }

public:
    WorkflowTest() {
        Gitwise::Logger::getInstance().setConsoleLogging(false);
    }

    void testFirstReleaseFromNoTags() {
        std::cout << "Testing first release without existing tags..." << std::endl;

        MockCommandRunner runner;
        runner.queueFailure("fatal: No names found, cannot describe anything.\n", 128);
        Gitwise::GitRepository repo(runner);

        Gitwise::TagAndPushWorkflow workflow(repo, createTagOptions(Gitwise::BumpKind::PATCH));
        auto report = workflow.run();

        assert(report.succeeded);
        assert(report.tag_name == "v0.0.1");
        assert(report.message == "Successfully created tag v0.0.1 and pushed to origin");
        assert(workflow.state() == Gitwise::TagAndPushWorkflow::State::SUCCESS);

        assert(runner.callCount() == 4);
        assert(runner.gitArgs(0) == Args({"describe", "--tags", "--abbrev=0"}));
        assert(runner.gitArgs(1) == Args({"tag", "v0.0.1"}));
        assert(runner.gitArgs(2) == Args({"push", "origin"}));
        assert(runner.gitArgs(3) == Args({"push", "origin", "--tags"}));

        std::cout << "✓ First release test passed" << std::endl;
    }

    void testBumpFromExistingTag() {
        std::cout << "Testing bump from existing tag..." << std::endl;

        MockCommandRunner runner;
        runner.queueSuccess("v1.4.7\n");
        Gitwise::GitRepository repo(runner);

        auto options = createTagOptions(Gitwise::BumpKind::MINOR, false);
        options.message = "Release notes";
        Gitwise::TagAndPushWorkflow workflow(repo, options);
        auto report = workflow.run();

        assert(report.succeeded);
        assert(report.tag_name == "v1.5.0");
        assert(report.message == "Successfully created tag: v1.5.0" && "Without push the tag message is the result");
        assert(runner.callCount() == 2 && "No push without the push option");
        assert(runner.gitArgs(1) == Args({"tag", "-a", "v1.5.0", "-m", "Release notes"}));
        assert(workflow.baseline().minor == 4);
        assert(workflow.target().minor == 5);

        std::cout << "✓ Bump from existing tag test passed" << std::endl;
    }

    void testCustomPrefix() {
        std::cout << "Testing custom tag prefix..." << std::endl;

        MockCommandRunner runner;
        runner.queueSuccess("release-2.3.4\n");
        Gitwise::GitRepository repo(runner);

        auto options = createTagOptions(Gitwise::BumpKind::MAJOR, false);
        options.prefix = "release-";
        Gitwise::TagAndPushWorkflow workflow(repo, options);
        auto report = workflow.run();

        assert(report.succeeded);
        assert(report.tag_name == "release-3.0.0");

        std::cout << "✓ Custom tag prefix test passed" << std::endl;
    }

    void testPushFailureKeepsTagAndRetriesOnlyPush() {
        std::cout << "Testing push failure after tag creation..." << std::endl;

        MockCommandRunner runner;
        runner.queueFailure("fatal: No names found\n", 128);
        runner.queueSuccess();
        runner.queueFailure("fatal: unable to access 'origin': connection refused\n", 128);
        Gitwise::GitRepository repo(runner);

        Gitwise::TagAndPushWorkflow workflow(repo, createTagOptions(Gitwise::BumpKind::PATCH));
        auto failed = workflow.run();

        assert(!failed.succeeded);
        assert(failed.failed_step == Gitwise::WorkflowStep::PUSH);
        assert(failed.cause == Gitwise::ErrorKind::TOOL_FAILURE);
        assert(contains(failed.message, "v0.0.1") && "Message names the created tag");
        assert(contains(failed.message, "connection refused") && "Message carries the push error");
        assert(contains(failed.message, "push step failed"));
        assert(failed.durable_effects.size() == 1);
        assert(failed.durable_effects[0] == "tag v0.0.1 created locally");
        assert(failed.toResult().error == Gitwise::ErrorKind::WORKFLOW_STEP_FAILURE);
        assert(workflow.state() == Gitwise::TagAndPushWorkflow::State::FAILED);
        assert(runner.callCount() == 3);

        // Second run resumes at push; no describe, no tag
        auto retried = workflow.run();
        assert(retried.succeeded);
        assert(retried.message == "Successfully created tag v0.0.1 and pushed to origin");
        assert(runner.callCount() == 5);
        assert(runner.gitArgs(3) == Args({"push", "origin"}));
        assert(runner.gitArgs(4) == Args({"push", "origin", "--tags"}));

        // A finished workflow does nothing further
        auto again = workflow.run();
        assert(again.succeeded);
        assert(runner.callCount() == 5);

        std::cout << "✓ Push failure retry test passed" << std::endl;
    }

    void testUnparsableTagStopsBeforeTagging() {
        std::cout << "Testing unparsable latest tag..." << std::endl;

        MockCommandRunner runner;
        runner.queueSuccess("nightly\n");
        Gitwise::GitRepository repo(runner);

        Gitwise::TagAndPushWorkflow workflow(repo, createTagOptions(Gitwise::BumpKind::PATCH));
        auto report = workflow.run();

        assert(!report.succeeded);
        assert(report.cause == Gitwise::ErrorKind::NOT_A_VERSION);
        assert(report.failed_step == Gitwise::WorkflowStep::RESOLVE_BASELINE);
        assert(contains(report.message, "Failed to parse version from tag: nightly"));
        assert(report.durable_effects.empty());
        assert(runner.callCount() == 1 && "No tag or push after a parse failure");

        std::cout << "✓ Unparsable tag test passed" << std::endl;
    }

    void testTagFailureBlocksPush() {
        std::cout << "Testing tag creation failure..." << std::endl;

        MockCommandRunner runner;
        runner.queueSuccess("v1.0.0\n");
        runner.queueFailure("fatal: tag 'v1.0.1' already exists\n", 128);
        Gitwise::GitRepository repo(runner);

        Gitwise::TagAndPushWorkflow workflow(repo, createTagOptions(Gitwise::BumpKind::PATCH));
        auto report = workflow.run();

        assert(!report.succeeded);
        assert(report.failed_step == Gitwise::WorkflowStep::CREATE_TAG);
        assert(contains(report.message, "already exists"));
        assert(runner.callCount() == 2 && "Push must not run after a failed tag");

        // Retry after a pre-tag failure starts over from the baseline
        runner.queueSuccess("v1.0.1\n");
        auto retried = workflow.run();
        assert(retried.succeeded);
        assert(retried.tag_name == "v1.0.2");
        assert(runner.gitArgs(2) == Args({"describe", "--tags", "--abbrev=0"}));

        std::cout << "✓ Tag creation failure test passed" << std::endl;
    }

    void testResumePush() {
        std::cout << "Testing resume of a pending push..." << std::endl;

        MockCommandRunner runner;
        Gitwise::GitRepository repo(runner);

        auto options = createTagOptions(Gitwise::BumpKind::PATCH, false);
        options.remote = "upstream";
        auto workflow = Gitwise::TagAndPushWorkflow::resumePush(repo, options, "v2.1.0");
        auto report = workflow.run();

        assert(report.succeeded);
        assert(report.message == "Successfully created tag v2.1.0 and pushed to upstream");
        assert(runner.callCount() == 2 && "Resume only pushes");
        assert(runner.gitArgs(0) == Args({"push", "upstream"}));
        assert(runner.gitArgs(1) == Args({"push", "upstream", "--tags"}));

        std::cout << "✓ Resume push test passed" << std::endl;
    }

    void testCommitWorkflowOrdering() {
        std::cout << "Testing commit workflow ordering..." << std::endl;

        MockCommandRunner runner;
        runner.queueSuccess();
        runner.queueSuccess();
        runner.queueSuccess("v0.3.0\n");
        Gitwise::GitRepository repo(runner);

        auto options = createCommitOptions("add export");
        options.stage = true;
        options.tag = true;
        options.bump = Gitwise::BumpKind::MINOR;
        Gitwise::CommitWorkflow workflow(repo, options);
        auto report = workflow.run();

        assert(report.succeeded);
        assert(report.tag_name == "v0.4.0");
        assert(runner.callCount() == 6);
        assert(runner.gitArgs(0) == Args({"add", "."}));
        assert(runner.gitArgs(1) == Args({"commit", "-m", "feat: add export"}));
        assert(runner.gitArgs(2) == Args({"describe", "--tags", "--abbrev=0"}));
        assert(runner.gitArgs(3) == Args({"tag", "-a", "v0.4.0", "-m", "add export"}));
        assert(runner.gitArgs(4) == Args({"push", "origin"}));
        assert(runner.gitArgs(5) == Args({"push", "origin", "--tags"}));
        assert(contains(report.message, "Successfully created commit: feat: add export"));
        assert(contains(report.message, "v0.4.0"));

        std::cout << "✓ Commit workflow ordering test passed" << std::endl;
    }

    void testCommitWorkflowStageFailure() {
        std::cout << "Testing commit workflow stage failure..." << std::endl;

        MockCommandRunner runner;
        runner.queueFailure("fatal: pathspec 'ghost' did not match any files\n", 128);
        Gitwise::GitRepository repo(runner);

        auto options = createCommitOptions("fix it");
        options.stage = true;
        options.stage_all = false;
        options.paths = {"ghost"};
        Gitwise::CommitWorkflow workflow(repo, options);
        auto report = workflow.run();

        assert(!report.succeeded);
        assert(report.failed_step == Gitwise::WorkflowStep::STAGE);
        assert(report.durable_effects.empty());
        assert(runner.callCount() == 1 && "Commit must not run after a failed stage");
        assert(runner.gitArgs(0) == Args({"add", "--", "ghost"}));

        std::cout << "✓ Commit workflow stage failure test passed" << std::endl;
    }

    void testCommitWorkflowCommitFailure() {
        std::cout << "Testing commit workflow commit failure..." << std::endl;

        MockCommandRunner runner;
        runner.queueFailure("", 1, "nothing to commit, working tree clean\n");
        Gitwise::GitRepository repo(runner);

        auto options = createCommitOptions("nothing");
        options.tag = true;
        options.push = true;
        Gitwise::CommitWorkflow workflow(repo, options);
        auto report = workflow.run();

        assert(!report.succeeded);
        assert(report.failed_step == Gitwise::WorkflowStep::COMMIT);
        assert(contains(report.message, "nothing to commit"));
        assert(runner.callCount() == 1 && "Tag and push must not run after a failed commit");

        std::cout << "✓ Commit workflow commit failure test passed" << std::endl;
    }

    void testCommitWorkflowPushWithoutTag() {
        std::cout << "Testing commit workflow push without tag..." << std::endl;

        MockCommandRunner runner;
        Gitwise::GitRepository repo(runner);

        auto options = createCommitOptions("ship it");
        options.push = true;
        options.remote = "upstream";
        options.branch = "main";
        Gitwise::CommitWorkflow workflow(repo, options);
        auto report = workflow.run();

        assert(report.succeeded);
        assert(runner.callCount() == 2);
        assert(runner.gitArgs(1) == Args({"push", "upstream", "main"}) && "No tag push without a tag");

        MockCommandRunner failing;
        failing.queueSuccess();
        failing.queueFailure("connection refused\n");
        Gitwise::GitRepository failing_repo(failing);
        Gitwise::CommitWorkflow failing_workflow(failing_repo, options);
        auto failed = failing_workflow.run();
        assert(!failed.succeeded);
        assert(failed.failed_step == Gitwise::WorkflowStep::PUSH);
        assert(contains(failed.message, "already done: commit created"));

        std::cout << "✓ Commit workflow push without tag test passed" << std::endl;
    }

    void testCommitWorkflowTagPushFailure() {
        std::cout << "Testing commit workflow tag push failure..." << std::endl;

        MockCommandRunner runner;
        runner.queueSuccess();
        runner.queueSuccess("v1.0.0\n");
        runner.queueSuccess();
        runner.queueFailure("connection refused\n", 128);
        Gitwise::GitRepository repo(runner);

        auto options = createCommitOptions("final touch");
        options.tag = true;
        Gitwise::CommitWorkflow workflow(repo, options);
        auto report = workflow.run();

        assert(!report.succeeded);
        assert(report.failed_step == Gitwise::WorkflowStep::PUSH);
        assert(report.tag_name == "v1.0.1");
        assert(contains(report.message, "v1.0.1"));
        assert(contains(report.message, "connection refused"));
        assert(report.durable_effects.size() == 2);
        assert(report.durable_effects[0] == "commit created");
        assert(report.durable_effects[1] == "tag v1.0.1 created locally");

        std::cout << "✓ Commit workflow tag push failure test passed" << std::endl;
    }

    void testCommitWorkflowRejectsEmptyDescription() {
        std::cout << "Testing commit workflow validation..." << std::endl;

        MockCommandRunner runner;
        Gitwise::GitRepository repo(runner);

        auto options = createCommitOptions("   ");
        options.stage = true;
        options.push = true;
        Gitwise::CommitWorkflow workflow(repo, options);
        auto report = workflow.run();

        assert(!report.succeeded);
        assert(report.cause == Gitwise::ErrorKind::EMPTY_DESCRIPTION);
        assert(runner.callCount() == 0 && "Validation must precede every command");

        std::cout << "✓ Commit workflow validation test passed" << std::endl;
    }

    void testStepNames() {
        std::cout << "Testing workflow step names..." << std::endl;

        assert(Gitwise::workflowStepToString(Gitwise::WorkflowStep::RESOLVE_BASELINE) == "resolve-baseline");
        assert(Gitwise::workflowStepToString(Gitwise::WorkflowStep::CREATE_TAG) == "create-tag");
        assert(Gitwise::workflowStepToString(Gitwise::WorkflowStep::PUSH) == "push");
        assert(Gitwise::workflowStepToString(Gitwise::WorkflowStep::NONE) == "none");

        std::cout << "✓ Workflow step names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Workflow unit tests..." << std::endl;

        testFirstReleaseFromNoTags();
        testBumpFromExistingTag();
        testCustomPrefix();
        testPushFailureKeepsTagAndRetriesOnlyPush();
        testUnparsableTagStopsBeforeTagging();
        testTagFailureBlocksPush();
        testResumePush();
        testCommitWorkflowOrdering();
        testCommitWorkflowStageFailure();
        testCommitWorkflowCommitFailure();
        testCommitWorkflowPushWithoutTag();
        testCommitWorkflowTagPushFailure();
        testCommitWorkflowRejectsEmptyDescription();
        testStepNames();

        std::cout << "All Workflow tests passed!" << std::endl;
    }
};

int main() {
    try {
        WorkflowTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
