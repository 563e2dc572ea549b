#pragma once

#include "core/client_identity.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

// Forward declarations for uWS types
namespace uWS {
    template <bool SSL> struct TemplatedApp;
    template <bool SSL, bool isServer, typename USERDATA> struct WebSocket;
    template <bool SSL> struct HttpResponse;
    struct HttpRequest;
    struct Loop;
    using App = TemplatedApp<false>;
}

struct us_listen_socket_t;
struct us_socket_context_t;

namespace voicebridge {
namespace core {

class SessionManager;
class HealthReporter;
class ResultChannel;

// Per-socket data structure
struct PerSocketData {
    std::string sessionId;
    std::string clientKey;
};

using ClientSocket = uWS::WebSocket<false, true, PerSocketData>;

/**
 * Network edge: WebSocket audio ingress, result egress and GET /health.
 *
 * All socket access happens on the event loop thread. Result channels and
 * session closures signal from other threads and are marshalled onto the
 * loop with Loop::defer.
 */
class WebSocketServer {
public:
    WebSocketServer(int port, std::shared_ptr<SessionManager> sessions,
                    std::shared_ptr<HealthReporter> health);
    ~WebSocketServer();

    void setAuthorizer(Authorizer authorizer);

    // start() and run() must be called on the thread that runs the loop
    void start();
    void run();

    // Thread-safe: stops listening and closes every connection
    void stop();

    bool isRunning() const { return running_; }

private:
    void handleUpgrade(uWS::HttpResponse<false>* res, uWS::HttpRequest* req, us_socket_context_t* context);
    void handleOpen(ClientSocket* ws);
    void handleTextMessage(ClientSocket* ws, std::string_view message);
    void handleBinaryMessage(ClientSocket* ws, std::string_view data);
    void handleClose(ClientSocket* ws, int code);
    void handleHealthCheck(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    void sendMessage(const std::string& sessionId, const std::string& message);
    void flushChannel(const std::string& sessionId);
    void onSessionClosed(const std::string& sessionId, const std::string& reason);

    int port_;
    std::atomic<bool> running_;
    std::shared_ptr<SessionManager> sessions_;
    std::shared_ptr<HealthReporter> health_;
    Authorizer authorizer_;

    std::unique_ptr<uWS::App> app_;
    uWS::Loop* loop_;
    us_listen_socket_t* listenSocket_;

    struct Connection {
        ClientSocket* ws;
        std::shared_ptr<ResultChannel> channel;
        bool textSubscribed = true;
    };

    // Loop thread only
    std::unordered_map<std::string, Connection> connections_;
};

} // namespace core
} // namespace voicebridge
