// EN: Run notifications: pure payload construction and rendering, pluggable dispatch transports
// FR: Notifications d'exécution : construction et rendu purs du contenu, transports d'envoi interchangeables

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "orchestrator/credential_store.hpp"
#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/run_context.hpp"

namespace CDP {
namespace Notify {

enum class NotificationKind {
    SUCCESS = 0,
    FAILURE = 1
};

// EN: Every field is populated before dispatch; unknown values are "n/a"
// FR: Chaque champ est renseigné avant l'envoi ; les valeurs inconnues valent "n/a"
struct NotificationPayload {
    std::string project;
    std::string branch;
    std::string revision;
    std::string run_id;
    std::string image_reference;
    std::string target_url;
    std::string build_url;
    std::string timestamp;                                          // EN: ISO-8601 UTC / FR: ISO-8601 UTC
    std::vector<std::pair<std::string, std::string>> stages;        // EN: (stage name, status) in order / FR: (nom d'étape, statut) dans l'ordre
    
    // EN: Names of empty required fields
    // FR: Noms des champs requis vides
    std::vector<std::string> missingFields() const;
};

struct NotificationEvent {
    NotificationKind kind = NotificationKind::FAILURE;
    NotificationPayload payload;
    std::vector<std::string> recipients;
};

struct RenderedMessage {
    std::string subject;
    std::string body;
    std::vector<std::string> recipients;
};

// EN: Pure: reads the context and the stages recorded so far, performs no I/O.
// FR: Pure : lit le contexte et les étapes enregistrées jusqu'ici, sans aucune E/S.
NotificationEvent buildNotificationEvent(NotificationKind kind,
                                         const Orchestrator::RunContext& context,
                                         const Orchestrator::RunOutcome& outcome,
                                         const std::string& image_reference,
                                         const std::string& target_url,
                                         const std::vector<std::string>& recipients,
                                         std::chrono::system_clock::time_point timestamp =
                                             std::chrono::system_clock::now());

// EN: Pure: fixed template per kind, result passed through the redactor.
// FR: Pure : modèle fixe par type, résultat passé dans le redacteur.
RenderedMessage renderMessage(const NotificationEvent& event, const Orchestrator::SecretRedactor& redactor);

std::string kindToString(NotificationKind kind);

// EN: Delivers a rendered message; throws on failure
// FR: Délivre un message rendu ; lève en cas d'échec
class NotificationTransport {
public:
    virtual ~NotificationTransport() = default;
    virtual std::string name() const = 0;
    virtual void send(const RenderedMessage& message) = 0;
};

// EN: Writes the message as an INFO log line, for local runs
// FR: Écrit le message comme ligne de log INFO, pour les exécutions locales
class LogTransport : public NotificationTransport {
public:
    std::string name() const override { return "log"; }
    void send(const RenderedMessage& message) override;
};

// EN: SMTP delivery through libcurl
// FR: Envoi SMTP via libcurl
class SmtpTransport : public NotificationTransport {
public:
    struct Config {
        std::string url;                    // EN: smtp://host:port or smtps://host:port / FR: smtp://hôte:port ou smtps://hôte:port
        std::string sender;
        std::string username;
        std::string password;
        long timeout_ms = 30000;
    };
    
    explicit SmtpTransport(Config config);
    std::string name() const override { return "smtp"; }
    void send(const RenderedMessage& message) override;
    
    // EN: RFC 5322 text handed to the server
    // FR: Texte RFC 5322 transmis au serveur
    static std::string formatPayload(const RenderedMessage& message, const std::string& sender);

private:
    Config config_;
};

class Notifier {
public:
    explicit Notifier(std::shared_ptr<NotificationTransport> transport);
    
    // EN: Renders then dispatches. Never throws: any failure becomes a
    //     NotificationDispatchFailed warning in the context. Returns true when sent.
    // FR: Rend puis envoie. Ne lève jamais : tout échec devient un avertissement
    //     NotificationDispatchFailed dans le contexte. Retourne true si envoyé.
    bool notify(const NotificationEvent& event, Orchestrator::RunContext& context);

private:
    std::shared_ptr<NotificationTransport> transport_;
};

} // namespace Notify
} // namespace CDP
