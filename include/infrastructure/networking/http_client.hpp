// EN: Minimal libcurl HTTP client used by liveness probes.
// FR : Client HTTP libcurl minimal utilisé par les sondes de disponibilité.

#pragma once

#include <map>
#include <memory>
#include <string>

#include <curl/curl.h>

namespace CDP {

// EN: Structure representing an HTTP response.
// FR : Structure représentant une réponse HTTP.
struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    long elapsed_ms = 0;
    
    bool isSuccess() const { return status >= 200 && status < 300; }
};

// EN: HttpClient class. Performs blocking requests with connect and total timeouts.
//     Transport errors (refused connection, DNS, timeout) are thrown as std::runtime_error.
// FR : Classe HttpClient. Effectue des requêtes bloquantes avec timeouts de connexion et total.
//     Les erreurs de transport (connexion refusée, DNS, timeout) sont levées en std::runtime_error.
class HttpClient {
public:
    HttpClient(long connect_timeout_ms, long read_timeout_ms);

    // EN: Performs a GET request.
    // FR : Effectue une requête GET.
    HttpResponse get(const std::string& url,
                     const std::map<std::string, std::string>& extra_headers = {}) const;

    // EN: Performs a HEAD request.
    // FR : Effectue une requête HEAD.
    HttpResponse head(const std::string& url,
                      const std::map<std::string, std::string>& extra_headers = {}) const;

private:
    HttpResponse perform(const std::string& url,
                         const std::map<std::string, std::string>& extra_headers,
                         bool no_body) const;

    long connect_timeout_ms_;
    long read_timeout_ms_;
};

// EN: Owning handles for libcurl easy handles and header/recipient lists.
// FR : Handles propriétaires pour les handles easy libcurl et les listes d'en-têtes/destinataires.
struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using CurlList = std::unique_ptr<curl_slist, SlistDeleter>;

// EN: Process-wide libcurl initialisation, safe to call many times.
// FR : Initialisation libcurl globale au processus, appelable plusieurs fois.
void ensureCurlInitialized();

} // namespace CDP
