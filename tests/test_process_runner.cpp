// EN: Unit tests for the POSIX process runner. Spawns /bin/sh to check capture, exit codes, timeouts and cancellation.
// FR: Tests unitaires du lanceur de processus POSIX. Lance /bin/sh pour vérifier capture, codes de sortie, timeouts et annulation.

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>

#include <sys/resource.h>

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/process_runner.hpp"

using namespace CDP;
using namespace std::chrono_literals;

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }
    
    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }
    
    ProcessSpec shell(const std::string& script) {
        ProcessSpec spec;
        spec.argv = {"/bin/sh", "-c", script};
        return spec;
    }
    
    PosixProcessRunner runner_;
};

TEST_F(ProcessRunnerTest, CapturesStdoutAndStderrSeparately) {
    auto result = runner_.run(shell("echo out; echo err 1>&2"));
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_EQ(result.combinedOutput(), "out\nerr\n");
}

TEST_F(ProcessRunnerTest, ReportsNonZeroExitCode) {
    auto result = runner_.run(shell("exit 3"));
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.timed_out);
}

TEST_F(ProcessRunnerTest, FeedsStdinThenClosesIt) {
    ProcessSpec spec;
    spec.argv = {"cat"};
    spec.stdin_data = std::string("s3cret-password");
    auto result = runner_.run(spec);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_text, "s3cret-password");
}

TEST_F(ProcessRunnerTest, AppliesEnvironmentAndWorkingDirectory) {
    auto spec = shell("echo \"$CDP_PROCESS_TEST_VAR\"; pwd");
    spec.environment["CDP_PROCESS_TEST_VAR"] = "hello";
    spec.working_directory = "/tmp";
    auto result = runner_.run(spec);
    EXPECT_TRUE(result.succeeded());
    EXPECT_NE(result.stdout_text.find("hello\n"), std::string::npos);
    EXPECT_NE(result.stdout_text.find("/tmp"), std::string::npos);
}

TEST_F(ProcessRunnerTest, EnvironmentOverridesInheritedVariables) {
    setenv("CDP_PROCESS_TEST_INHERITED", "parent", 1);
    setenv("CDP_PROCESS_TEST_REPLACED", "parent", 1);
    auto spec = shell("echo \"$CDP_PROCESS_TEST_INHERITED $CDP_PROCESS_TEST_REPLACED\"");
    spec.environment["CDP_PROCESS_TEST_REPLACED"] = "child";
    
    auto result = runner_.run(spec);
    
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_text, "parent child\n");
    EXPECT_STREQ(std::getenv("CDP_PROCESS_TEST_REPLACED"), "parent");
    unsetenv("CDP_PROCESS_TEST_INHERITED");
    unsetenv("CDP_PROCESS_TEST_REPLACED");
}

TEST_F(ProcessRunnerTest, MissingWorkingDirectoryExits126) {
    auto spec = shell("true");
    spec.working_directory = "/nonexistent/cdp/workspace";
    EXPECT_EQ(runner_.run(spec).exit_code, 126);
}

TEST_F(ProcessRunnerTest, UnknownCommandExits127) {
    ProcessSpec spec;
    spec.argv = {"cdp-command-that-does-not-exist"};
    EXPECT_EQ(runner_.run(spec).exit_code, 127);
    
    ProcessSpec empty;
    auto result = runner_.run(empty);
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_EQ(result.stderr_text, "empty command");
}

TEST_F(ProcessRunnerTest, TimeoutTerminatesTheProcessGroup) {
    auto spec = shell("sleep 10");
    spec.timeout = 200ms;
    spec.kill_grace = 500ms;
    
    const auto started = std::chrono::steady_clock::now();
    auto result = runner_.run(spec);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.cancelled);
    EXPECT_FALSE(result.succeeded());
    EXPECT_NE(result.term_signal, 0);
    EXPECT_EQ(result.exit_code, 128 + result.term_signal);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(ProcessRunnerTest, CancellationStopsTheProcess) {
    CancellationToken token;
    std::thread canceller([token]() {
        std::this_thread::sleep_for(150ms);
        token.cancel();
    });
    
    auto result = runner_.run(shell("sleep 10"), &token);
    canceller.join();
    
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(result.duration, 5000ms);
}

// EN: A child closing its stdio must not keep the parent busy until it exits
// FR: Un enfant fermant ses E/S standard ne doit pas occuper le parent jusqu'à sa fin
TEST_F(ProcessRunnerTest, ClosedOutputPipesDoNotSpinTheLoop) {
    auto cpuSeconds = []() {
        struct rusage usage {};
        getrusage(RUSAGE_SELF, &usage);
        return static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
               static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
    };
    
    const double cpu_before = cpuSeconds();
    auto result = runner_.run(shell("exec >&- 2>&-; sleep 1"));
    const double cpu_used = cpuSeconds() - cpu_before;
    
    EXPECT_TRUE(result.succeeded());
    EXPECT_GE(result.duration, 900ms);
    EXPECT_LT(cpu_used, 0.3);
}

// EN: A child exiting without reading stdin: the write fails quietly, SIGPIPE disposition untouched
// FR: Un enfant sortant sans lire stdin : l'écriture échoue sans bruit, disposition de SIGPIPE intacte
TEST_F(ProcessRunnerTest, UnreadStdinLeavesSigpipeDispositionAlone) {
    struct sigaction before {};
    sigaction(SIGPIPE, nullptr, &before);
    
    auto spec = shell("exit 0");
    spec.stdin_data = std::string(1 << 20, 'x');
    auto result = runner_.run(spec);
    
    struct sigaction after {};
    sigaction(SIGPIPE, nullptr, &after);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}

TEST(JoinCommandLineTest, QuotesArgumentsWithSpaces) {
    EXPECT_EQ(joinCommandLine({"docker", "run", "-d", "--name", "telco-churn-staging"}),
              "docker run -d --name telco-churn-staging");
    EXPECT_EQ(joinCommandLine({"/bin/sh", "-c", "python -m pytest"}),
              "/bin/sh -c 'python -m pytest'");
}
