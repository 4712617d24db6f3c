#include "notify/notifier.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/networking/http_client.hpp"
#include "orchestrator/pipeline_errors.hpp"
#include "orchestrator/pipeline_utils.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include <curl/curl.h>

namespace CDP {
namespace Notify {

using Orchestrator::PipelineUtils::errorKindToString;
using Orchestrator::PipelineUtils::stageStatusToString;

namespace {

const char* const NOT_AVAILABLE = "n/a";

std::string orNotAvailable(const std::string& value) {
    return value.empty() ? std::string(NOT_AVAILABLE) : value;
}

struct UploadPayload {
    std::string data;
    size_t offset = 0;
};

size_t uploadCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* payload = static_cast<UploadPayload*>(userdata);
    const size_t capacity = size * nitems;
    if (payload == nullptr || capacity == 0 || payload->offset >= payload->data.size()) {
        return 0;
    }
    const size_t to_copy = std::min(payload->data.size() - payload->offset, capacity);
    std::memcpy(buffer, payload->data.data() + payload->offset, to_copy);
    payload->offset += to_copy;
    return to_copy;
}

} // namespace

std::vector<std::string> NotificationPayload::missingFields() const {
    std::vector<std::string> missing;
    const std::vector<std::pair<const char*, const std::string*>> fields = {
        {"project", &project}, {"branch", &branch}, {"revision", &revision},
        {"run_id", &run_id}, {"image_reference", &image_reference}, {"target_url", &target_url},
        {"build_url", &build_url}, {"timestamp", &timestamp}};
    for (const auto& [name, value] : fields) {
        if (value->empty()) {
            missing.emplace_back(name);
        }
    }
    return missing;
}

std::string kindToString(NotificationKind kind) {
    return kind == NotificationKind::SUCCESS ? "SUCCESS" : "FAILURE";
}

NotificationEvent buildNotificationEvent(NotificationKind kind,
                                         const Orchestrator::RunContext& context,
                                         const Orchestrator::RunOutcome& outcome,
                                         const std::string& image_reference,
                                         const std::string& target_url,
                                         const std::vector<std::string>& recipients,
                                         std::chrono::system_clock::time_point timestamp) {
    const auto& metadata = context.metadata();
    NotificationEvent event;
    event.kind = kind;
    event.recipients = recipients;
    
    auto& payload = event.payload;
    payload.project = orNotAvailable(metadata.project);
    payload.branch = orNotAvailable(metadata.branch);
    payload.revision = orNotAvailable(metadata.revision);
    payload.run_id = orNotAvailable(metadata.run_id);
    payload.image_reference = orNotAvailable(image_reference);
    payload.target_url = orNotAvailable(target_url);
    payload.build_url = orNotAvailable(metadata.build_url);
    payload.timestamp = Orchestrator::PipelineUtils::formatTimestamp(timestamp);
    
    for (const auto& stage : outcome.stages) {
        std::string status = stageStatusToString(stage.status);
        if (stage.failure_kind) {
            status += " (" + errorKindToString(*stage.failure_kind) + ")";
        }
        payload.stages.emplace_back(stage.stage, status);
    }
    return event;
}

RenderedMessage renderMessage(const NotificationEvent& event, const Orchestrator::SecretRedactor& redactor) {
    const auto& p = event.payload;
    RenderedMessage message;
    message.recipients = event.recipients;
    
    std::ostringstream body;
    if (event.kind == NotificationKind::SUCCESS) {
        message.subject = "SUCCESS: " + p.project + " #" + p.run_id + " deployed";
        body << "Pipeline " << p.project << " #" << p.run_id << " succeeded.\n\n";
    } else {
        message.subject = "FAILURE: " + p.project + " #" + p.run_id + " failed";
        body << "Pipeline " << p.project << " #" << p.run_id << " failed.\n\n";
    }
    body << "Branch:    " << p.branch << "\n"
         << "Revision:  " << p.revision << "\n"
         << "Image:     " << p.image_reference << "\n"
         << "Target:    " << p.target_url << "\n"
         << "Build:     " << p.build_url << "\n"
         << "Timestamp: " << p.timestamp << "\n\n"
         << "Stages:\n";
    for (const auto& [stage, status] : p.stages) {
        body << "  - " << stage << ": " << status << "\n";
    }
    if (event.kind == NotificationKind::FAILURE) {
        body << "\nSee the build log for the failing stage output.\n";
    }
    
    message.subject = redactor.redact(message.subject);
    message.body = redactor.redact(body.str());
    return message;
}

void LogTransport::send(const RenderedMessage& message) {
    std::string recipients;
    for (const auto& recipient : message.recipients) {
        recipients += (recipients.empty() ? "" : ",") + recipient;
    }
    LOG_INFO_META("notifier", message.subject + "\n" + message.body,
                  (std::unordered_map<std::string, std::string>{{"recipients", recipients}}));
}

SmtpTransport::SmtpTransport(Config config) : config_(std::move(config)) {
    ensureCurlInitialized();
}

std::string SmtpTransport::formatPayload(const RenderedMessage& message, const std::string& sender) {
    std::ostringstream out;
    out << "To: ";
    for (size_t i = 0; i < message.recipients.size(); ++i) {
        out << (i > 0 ? ", " : "") << message.recipients[i];
    }
    out << "\r\n";
    out << "From: " << sender << "\r\n";
    out << "Subject: " << message.subject << "\r\n";
    out << "MIME-Version: 1.0\r\n";
    out << "Content-Type: text/plain; charset=utf-8\r\n";
    out << "\r\n";
    std::istringstream lines(message.body);
    std::string line;
    while (std::getline(lines, line)) {
        out << line << "\r\n";
    }
    return out.str();
}

void SmtpTransport::send(const RenderedMessage& message) {
    if (config_.url.empty()) {
        throw std::runtime_error("smtp url is not configured");
    }
    if (message.recipients.empty()) {
        throw std::runtime_error("no recipients");
    }
    
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("failed to initialize curl for smtp");
    }
    
    UploadPayload payload;
    payload.data = formatPayload(message, config_.sender);
    
    curl_easy_setopt(curl.get(), CURLOPT_URL, config_.url.c_str());
    if (!config_.username.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, config_.username.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, config_.password.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_USE_SSL,
                     config_.url.rfind("smtps://", 0) == 0 ? CURLUSESSL_ALL : CURLUSESSL_TRY);
    const std::string mail_from = "<" + config_.sender + ">";
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, mail_from.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, uploadCallback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &payload);
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config_.timeout_ms);
    
    CurlList recipients;
    for (const auto& recipient : message.recipients) {
        curl_slist* appended = curl_slist_append(recipients.get(), ("<" + recipient + ">").c_str());
        if (appended == nullptr) {
            throw std::runtime_error("failed to build smtp recipient list");
        }
        recipients.release();
        recipients.reset(appended);
    }
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients.get());
    
    const CURLcode code = curl_easy_perform(curl.get());
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    
    if (code != CURLE_OK) {
        throw std::runtime_error("smtp send failed: " + std::string(curl_easy_strerror(code)));
    }
    if (status >= 400) {
        throw std::runtime_error("smtp server rejected message with status " + std::to_string(status));
    }
}

Notifier::Notifier(std::shared_ptr<NotificationTransport> transport) : transport_(std::move(transport)) {}

bool Notifier::notify(const NotificationEvent& event, Orchestrator::RunContext& context) {
    const std::string kind = kindToString(event.kind);
    try {
        if (!transport_) {
            throw Orchestrator::NotificationDispatchError("no notification transport configured");
        }
        const auto missing = event.payload.missingFields();
        if (!missing.empty()) {
            std::string fields;
            for (const auto& field : missing) {
                fields += (fields.empty() ? "" : ", ") + field;
            }
            throw Orchestrator::NotificationDispatchError("payload is missing " + fields);
        }
        
        const RenderedMessage message = renderMessage(event, context.redactor());
        transport_->send(message);
        LOG_INFO("notifier", kind + " notification sent via " + transport_->name() + " to " +
                 std::to_string(message.recipients.size()) + " recipient(s)");
        return true;
    } catch (const std::exception& e) {
        context.addWarning(Orchestrator::ErrorKind::NOTIFICATION_DISPATCH_FAILED, "notifier",
                           kind + " notification not delivered: " + e.what());
        return false;
    }
}

} // namespace Notify
} // namespace CDP
