// EN: Unit tests for the StageRunner: status mapping, timeouts, cancellation and output capture
// FR: Tests unitaires du StageRunner : correspondance des statuts, timeouts, annulation et capture de sortie

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/stage_runner.hpp"

using namespace CDP;
using namespace CDP::Orchestrator;
using namespace std::chrono_literals;

class StageRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }
    
    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }
    
    static StageDefinition makeStage(const std::string& name, StageWork work) {
        StageDefinition stage;
        stage.name = name;
        stage.work = std::move(work);
        return stage;
    }
    
    RunContext context_{BuildMetadata{"telco-churn-prediction"}};
    StageRunner runner_;
};

TEST_F(StageRunnerTest, SuccessfulWorkIsRecorded) {
    auto outcome = runner_.execute(makeStage("unit-tests", [](StageExecution& execution) {
        EXPECT_EQ(execution.stage_name, "unit-tests");
        return WorkResult::success("12 passed\n", "all green");
    }), context_);
    
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_FALSE(outcome.failure_kind.has_value());
    EXPECT_EQ(outcome.output, "12 passed\n");
    EXPECT_EQ(outcome.message, "all green");
    ASSERT_EQ(context_.outcomes().size(), 1u);
    EXPECT_EQ(context_.outcomes()[0].stage, "unit-tests");
}

TEST_F(StageRunnerTest, NonZeroStatusIsWorkFailed) {
    auto outcome = runner_.execute(makeStage("code-quality", [](StageExecution&) {
        return WorkResult::failure(1, "app.py:3:1: E302 expected 2 blank lines\n");
    }), context_);
    
    EXPECT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure_kind, ErrorKind::WORK_FAILED);
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_EQ(outcome.message, "exit status 1");
    EXPECT_NE(outcome.output.find("E302"), std::string::npos);
}

TEST_F(StageRunnerTest, ExplicitFailureKindIsKept) {
    auto outcome = runner_.execute(makeStage("test-image", [](StageExecution&) {
        return WorkResult::failure(1, "", "health check never passed", ErrorKind::TIMEOUT);
    }), context_);
    
    EXPECT_EQ(outcome.failure_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(outcome.message, "health check never passed");
}

TEST_F(StageRunnerTest, PipelineErrorsKeepTheirKind) {
    auto outcome = runner_.execute(makeStage("build-image", [](StageExecution&) -> WorkResult {
        throw BuildFailedError("docker build exited with 1");
    }), context_);
    
    EXPECT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure_kind, ErrorKind::BUILD_FAILED);
    EXPECT_EQ(outcome.message, "docker build exited with 1");
}

TEST_F(StageRunnerTest, OtherExceptionsAreAborted) {
    auto outcome = runner_.execute(makeStage("crash", [](StageExecution&) -> WorkResult {
        throw std::runtime_error("unexpected");
    }), context_);
    
    EXPECT_EQ(outcome.failure_kind, ErrorKind::ABORTED);
    EXPECT_EQ(outcome.message, "unexpected");
}

TEST_F(StageRunnerTest, MissingWorkIsAborted) {
    StageDefinition stage;
    stage.name = "empty";
    auto outcome = runner_.execute(stage, context_);
    EXPECT_EQ(outcome.failure_kind, ErrorKind::ABORTED);
    EXPECT_EQ(outcome.message, "stage has no work");
}

TEST_F(StageRunnerTest, TimeoutCancelsTheStageTokenAndWaits) {
    std::atomic<bool> observed_cancel{false};
    auto stage = makeStage("slow", [&observed_cancel](StageExecution& execution) {
        while (!execution.token.isCancelled()) {
            std::this_thread::sleep_for(5ms);
        }
        observed_cancel = true;
        return WorkResult::success();
    });
    stage.timeout = 100ms;
    
    auto outcome = runner_.execute(stage, context_);
    
    EXPECT_TRUE(observed_cancel.load());
    EXPECT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(outcome.message, "stage exceeded timeout of 100ms");
    EXPECT_GE(outcome.duration, 100ms);
    EXPECT_FALSE(context_.isCancelled());
}

TEST_F(StageRunnerTest, WorkFinishingWithinTimeoutSucceeds) {
    auto stage = makeStage("quick", [](StageExecution&) { return WorkResult::success(); });
    stage.timeout = 5s;
    EXPECT_TRUE(runner_.execute(stage, context_).succeeded());
}

TEST_F(StageRunnerTest, RunCancellationDuringStageIsAborted) {
    auto outcome = runner_.execute(makeStage("interrupted", [](StageExecution& execution) {
        execution.context.requestCancellation();
        return WorkResult::success();
    }), context_);
    
    EXPECT_EQ(outcome.failure_kind, ErrorKind::ABORTED);
    EXPECT_EQ(outcome.message, "run cancelled during stage");
}

// EN: A deploy interrupted by the run being cancelled is Aborted, not DeployFailed
// FR: Un déploiement interrompu par l'annulation de l'exécution est Aborted, pas DeployFailed
TEST_F(StageRunnerTest, RunCancellationOverridesErrorThrownWhileUnwinding) {
    auto outcome = runner_.execute(makeStage("deploy-staging", [](StageExecution& execution) -> WorkResult {
        execution.context.requestCancellation();
        throw DeployFailedError("Deployment of telco-churn-staging is unhealthy: cancelled");
    }), context_);
    
    EXPECT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure_kind, ErrorKind::ABORTED);
    EXPECT_EQ(outcome.message,
              "run cancelled during stage: Deployment of telco-churn-staging is unhealthy: cancelled");
}

TEST_F(StageRunnerTest, NonStandardExceptionIsAborted) {
    auto outcome = runner_.execute(makeStage("crash", [](StageExecution&) -> WorkResult {
        throw 42;
    }), context_);
    
    EXPECT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure_kind, ErrorKind::ABORTED);
    EXPECT_EQ(outcome.message, "stage threw a non-standard exception");
    EXPECT_EQ(context_.outcomes().size(), 1u);
}

TEST_F(StageRunnerTest, OutputAndMessageAreRedacted) {
    context_.redactor().addSecret("pa55word");
    auto outcome = runner_.execute(makeStage("push-image", [](StageExecution&) {
        return WorkResult::failure(1, "login with pa55word failed", "denied for pa55word");
    }), context_);
    
    EXPECT_EQ(outcome.output, "login with **** failed");
    EXPECT_EQ(outcome.message, "denied for ****");
}

TEST_F(StageRunnerTest, OutputIsTrimmedToItsTail) {
    const std::string big(StageRunner::OUTPUT_TAIL_BYTES + 100, 'x');
    auto outcome = runner_.execute(makeStage("noisy", [&big](StageExecution&) {
        return WorkResult::success(big + "END");
    }), context_);
    
    EXPECT_EQ(outcome.output.size(), StageRunner::OUTPUT_TAIL_BYTES);
    EXPECT_EQ(outcome.output.substr(outcome.output.size() - 3), "END");
    EXPECT_EQ(StageRunner::tail("abcdef", 3), "def");
    EXPECT_EQ(StageRunner::tail("ab", 3), "ab");
}
