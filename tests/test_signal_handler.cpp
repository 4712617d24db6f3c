// EN: Unit tests for the SignalHandler and CancellationToken
// FR: Tests unitaires du SignalHandler et du CancellationToken

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <signal.h>
#include <stdexcept>
#include <thread>

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/cancellation.hpp"
#include "infrastructure/system/signal_handler.hpp"

using namespace CDP;
using namespace std::chrono_literals;

// EN: Test fixture for SignalHandler tests
// FR: Fixture de test pour les tests SignalHandler
class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // EN: Reset signal handler before each test
        // FR: Remet à zéro le gestionnaire de signaux avant chaque test
        signal_handler_ = &SignalHandler::getInstance();
        signal_handler_->reset();
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }
    
    void TearDown() override {
        // EN: Restore default handlers after each test
        // FR: Restaure les handlers par défaut après chaque test
        signal_handler_->shutdown();
        signal_handler_->reset();
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }
    
    SignalHandler* signal_handler_;
};

TEST_F(SignalHandlerTest, SingletonPattern) {
    EXPECT_EQ(&SignalHandler::getInstance(), &SignalHandler::getInstance());
}

TEST_F(SignalHandlerTest, TriggerShutdownRunsEveryCallback) {
    CancellationToken token;
    std::atomic<int> seen_signal{0};
    signal_handler_->registerCallback("cancel-run", [token](int) { token.cancel(); });
    signal_handler_->registerCallback("record", [&seen_signal](int sig) { seen_signal = sig; });
    
    signal_handler_->triggerShutdown(SIGINT);
    
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(seen_signal.load(), SIGINT);
    EXPECT_TRUE(signal_handler_->isShutdownRequested());
    
    auto stats = signal_handler_->getStats();
    EXPECT_EQ(stats.signals_received, 1u);
    EXPECT_EQ(stats.callbacks_registered, 2u);
    EXPECT_EQ(stats.last_signal, SIGINT);
}

TEST_F(SignalHandlerTest, FailingCallbackDoesNotStopOthers) {
    std::atomic<bool> ran{false};
    signal_handler_->registerCallback("a-throws", [](int) { throw std::runtime_error("boom"); });
    signal_handler_->registerCallback("b-runs", [&ran](int) { ran = true; });
    
    signal_handler_->triggerShutdown();
    
    EXPECT_TRUE(ran.load());
    EXPECT_EQ(signal_handler_->getStats().callbacks_failed, 1u);
}

TEST_F(SignalHandlerTest, UnregisteredCallbackIsNotCalled) {
    std::atomic<bool> ran{false};
    signal_handler_->registerCallback("temp", [&ran](int) { ran = true; });
    signal_handler_->unregisterCallback("temp");
    
    signal_handler_->triggerShutdown();
    
    EXPECT_FALSE(ran.load());
    EXPECT_EQ(signal_handler_->getStats().callbacks_registered, 0u);
}

TEST_F(SignalHandlerTest, DeliveredSignalIsDispatchedFromWorkerThread) {
    CancellationToken token;
    signal_handler_->registerCallback("cancel-run", [token](int) { token.cancel(); });
    signal_handler_->initialize();
    
    ASSERT_EQ(::raise(SIGTERM), 0);
    
    for (int i = 0; i < 100 && !token.isCancelled(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(signal_handler_->getStats().last_signal, SIGTERM);
}

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;
    EXPECT_FALSE(copy.isCancelled());
    token.cancel();
    EXPECT_TRUE(copy.isCancelled());
}

TEST(CancellationTokenTest, ChildFollowsParentButNotTheReverse) {
    CancellationToken parent;
    CancellationToken child = parent.child();
    CancellationToken grandchild = child.child();
    
    child.cancel();
    EXPECT_TRUE(grandchild.isCancelled());
    EXPECT_FALSE(parent.isCancelled());
    
    CancellationToken other = parent.child();
    parent.cancel();
    EXPECT_TRUE(other.isCancelled());
}
