// EN: Unit tests for notification payloads, rendering and dispatch
// FR: Tests unitaires du contenu, du rendu et de l'envoi des notifications

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "infrastructure/logging/logger.hpp"
#include "notify/notifier.hpp"
#include "test_fakes.hpp"

using namespace CDP;
using namespace CDP::Notify;
using namespace CDP::Orchestrator;
using CDP::Testing::RecordingTransport;

class NotifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        // EN: A failed run: build failed, later stages skipped
        // FR: Une exécution en échec : build échoué, étapes suivantes ignorées
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        
        StageOutcome quality;
        quality.stage = "code-quality";
        quality.status = StageStatus::SUCCEEDED;
        StageOutcome build;
        build.stage = "build-image";
        build.status = StageStatus::FAILED;
        build.failure_kind = ErrorKind::BUILD_FAILED;
        StageOutcome push;
        push.stage = "push-image";
        push.status = StageStatus::SKIPPED;
        outcome_.stages = {quality, build, push};
        
        timestamp_ = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    }
    
    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }
    
    RunContext context_{BuildMetadata{"telco-churn-prediction", "57", "main", "a1b2c3d",
                                      "https://ci.example.com/job/telco/57", ""}};
    RunOutcome outcome_;
    std::chrono::system_clock::time_point timestamp_;
};

TEST_F(NotifierTest, PayloadCarriesRunIdentityAndStages) {
    NotificationEvent event = buildNotificationEvent(NotificationKind::FAILURE, context_, outcome_,
                                                     "telco-churn-prediction:57", "", {"mlops@example.com"},
                                                     timestamp_);
    const auto& p = event.payload;
    
    EXPECT_EQ(p.project, "telco-churn-prediction");
    EXPECT_EQ(p.branch, "main");
    EXPECT_EQ(p.revision, "a1b2c3d");
    EXPECT_EQ(p.run_id, "57");
    EXPECT_EQ(p.image_reference, "telco-churn-prediction:57");
    EXPECT_EQ(p.target_url, "n/a");
    EXPECT_EQ(p.build_url, "https://ci.example.com/job/telco/57");
    EXPECT_EQ(p.timestamp, "2023-11-14T22:13:20Z");
    ASSERT_EQ(p.stages.size(), 3u);
    EXPECT_EQ(p.stages[1].first, "build-image");
    EXPECT_EQ(p.stages[1].second, "FAILED (BuildFailed)");
    EXPECT_EQ(p.stages[2].second, "SKIPPED");
    EXPECT_TRUE(p.missingFields().empty());
    EXPECT_EQ(event.recipients, (std::vector<std::string>{"mlops@example.com"}));
}

TEST_F(NotifierTest, MissingFieldsAreListed) {
    NotificationPayload payload;
    payload.project = "telco-churn-prediction";
    auto missing = payload.missingFields();
    EXPECT_EQ(missing.size(), 7u);
    EXPECT_EQ(missing.front(), "branch");
}

TEST_F(NotifierTest, RendersFixedTemplates) {
    SecretRedactor redactor;
    NotificationEvent success = buildNotificationEvent(NotificationKind::SUCCESS, context_, RunOutcome{},
                                                       "telco-churn-prediction:57", "http://localhost:5000",
                                                       {"mlops@example.com"}, timestamp_);
    RenderedMessage message = renderMessage(success, redactor);
    
    EXPECT_EQ(message.subject, "SUCCESS: telco-churn-prediction #57 deployed");
    EXPECT_NE(message.body.find("Branch:    main"), std::string::npos);
    EXPECT_NE(message.body.find("Target:    http://localhost:5000"), std::string::npos);
    EXPECT_EQ(message.body.find("See the build log"), std::string::npos);
    
    NotificationEvent failure = buildNotificationEvent(NotificationKind::FAILURE, context_, outcome_,
                                                       "", "", {}, timestamp_);
    RenderedMessage failed = renderMessage(failure, redactor);
    EXPECT_EQ(failed.subject, "FAILURE: telco-churn-prediction #57 failed");
    EXPECT_NE(failed.body.find("  - build-image: FAILED (BuildFailed)"), std::string::npos);
    EXPECT_NE(failed.body.find("See the build log"), std::string::npos);
}

TEST_F(NotifierTest, RenderingRedactsSecrets) {
    SecretRedactor redactor;
    redactor.addSecret("a1b2c3d");
    NotificationEvent event = buildNotificationEvent(NotificationKind::SUCCESS, context_, outcome_,
                                                     "img", "url", {}, timestamp_);
    RenderedMessage message = renderMessage(event, redactor);
    EXPECT_EQ(message.body.find("a1b2c3d"), std::string::npos);
    EXPECT_NE(message.body.find("Revision:  ****"), std::string::npos);
}

TEST_F(NotifierTest, DispatchesThroughTransport) {
    auto transport = std::make_shared<RecordingTransport>();
    Notifier notifier(transport);
    NotificationEvent event = buildNotificationEvent(NotificationKind::SUCCESS, context_, outcome_,
                                                     "img", "url", {"mlops@example.com"}, timestamp_);
    
    EXPECT_TRUE(notifier.notify(event, context_));
    ASSERT_EQ(transport->sent.size(), 1u);
    EXPECT_EQ(transport->sent[0].recipients, (std::vector<std::string>{"mlops@example.com"}));
    EXPECT_TRUE(context_.warnings().empty());
}

// EN: Transport error: no exception, a NotificationDispatchFailed warning instead
// FR: Erreur de transport : aucune exception, un avertissement NotificationDispatchFailed à la place
TEST_F(NotifierTest, TransportErrorBecomesWarning) {
    auto transport = std::make_shared<RecordingTransport>();
    transport->fail = true;
    Notifier notifier(transport);
    NotificationEvent event = buildNotificationEvent(NotificationKind::FAILURE, context_, outcome_,
                                                     "img", "url", {}, timestamp_);
    
    bool sent = true;
    EXPECT_NO_THROW(sent = notifier.notify(event, context_));
    EXPECT_FALSE(sent);
    ASSERT_EQ(context_.warnings().size(), 1u);
    EXPECT_EQ(context_.warnings()[0].kind, ErrorKind::NOTIFICATION_DISPATCH_FAILED);
    EXPECT_NE(context_.warnings()[0].message.find("relay refused connection"), std::string::npos);
}

TEST_F(NotifierTest, IncompletePayloadIsNotSent) {
    auto transport = std::make_shared<RecordingTransport>();
    Notifier notifier(transport);
    NotificationEvent event;
    event.payload.project = "telco-churn-prediction";
    
    EXPECT_FALSE(notifier.notify(event, context_));
    EXPECT_TRUE(transport->sent.empty());
    ASSERT_EQ(context_.warnings().size(), 1u);
    EXPECT_NE(context_.warnings()[0].message.find("payload is missing branch"), std::string::npos);
}

TEST_F(NotifierTest, MissingTransportBecomesWarning) {
    Notifier notifier(nullptr);
    NotificationEvent event = buildNotificationEvent(NotificationKind::SUCCESS, context_, outcome_,
                                                     "img", "url", {}, timestamp_);
    EXPECT_FALSE(notifier.notify(event, context_));
    EXPECT_EQ(context_.warnings().size(), 1u);
}

TEST_F(NotifierTest, LogTransportNeverThrows) {
    LogTransport transport;
    RenderedMessage message{"SUCCESS: telco #57 deployed", "body", {"a@example.com", "b@example.com"}};
    EXPECT_NO_THROW(transport.send(message));
    EXPECT_EQ(transport.name(), "log");
}

TEST(SmtpTransportTest, FormatsRfc5322Payload) {
    RenderedMessage message{"FAILURE: telco #57 failed", "line one\nline two\n", {"a@example.com", "b@example.com"}};
    const std::string payload = SmtpTransport::formatPayload(message, "cdp@example.com");
    
    EXPECT_EQ(payload.rfind("To: a@example.com, b@example.com\r\n", 0), 0u);
    EXPECT_NE(payload.find("From: cdp@example.com\r\n"), std::string::npos);
    EXPECT_NE(payload.find("Subject: FAILURE: telco #57 failed\r\n"), std::string::npos);
    EXPECT_NE(payload.find("\r\n\r\nline one\r\nline two\r\n"), std::string::npos);
}

TEST(SmtpTransportTest, RejectsMissingUrlOrRecipients) {
    SmtpTransport unconfigured(SmtpTransport::Config{});
    RenderedMessage message{"subject", "body", {"a@example.com"}};
    EXPECT_THROW(unconfigured.send(message), std::runtime_error);
    
    SmtpTransport::Config config;
    config.url = "smtp://localhost:25";
    SmtpTransport transport(config);
    EXPECT_THROW(transport.send(RenderedMessage{"subject", "body", {}}), std::runtime_error);
    EXPECT_EQ(transport.name(), "smtp");
}

TEST(SmtpTransportTest, UnreachableRelayThrows) {
    SmtpTransport::Config config;
    config.url = "smtp://127.0.0.1:1";
    config.sender = "cdp@example.com";
    config.timeout_ms = 2000;
    SmtpTransport transport(config);
    
    RenderedMessage message{"subject", "body", {"a@example.com", "b@example.com"}};
    try {
        transport.send(message);
        FAIL() << "send to a closed port succeeded";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("smtp send failed"), std::string::npos);
    }
}
