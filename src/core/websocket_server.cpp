#include "core/websocket_server.hpp"
#include "core/health_reporter.hpp"
#include "core/message_protocol.hpp"
#include "core/session_manager.hpp"
#include "stt/transcription_provider.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <App.h>
#include <vector>

namespace voicebridge {
namespace core {

WebSocketServer::WebSocketServer(int port, std::shared_ptr<SessionManager> sessions,
                                 std::shared_ptr<HealthReporter> health)
    : port_(port), running_(false), sessions_(std::move(sessions)), health_(std::move(health)),
      authorizer_(makeTokenAuthorizer({}, false)), app_(nullptr), loop_(nullptr), listenSocket_(nullptr) {
}

WebSocketServer::~WebSocketServer() {
    if (sessions_) {
        sessions_->setClosedCallback(nullptr);
    }
}

void WebSocketServer::setAuthorizer(Authorizer authorizer) {
    authorizer_ = std::move(authorizer);
}

void WebSocketServer::start() {
    utils::Logger::info("Starting WebSocket server on port " + std::to_string(port_));

    app_ = std::make_unique<uWS::App>();
    loop_ = uWS::Loop::get();

    sessions_->setClosedCallback([this](const std::string& sessionId, const std::string& reason) {
        onSessionClosed(sessionId, reason);
    });

    uWS::App::WebSocketBehavior<PerSocketData> behavior;
    behavior.maxPayloadLength = 1024 * 1024;
    behavior.idleTimeout = 120;

    behavior.upgrade = [this](auto* res, auto* req, auto* context) {
        handleUpgrade(res, req, context);
    };

    behavior.open = [this](ClientSocket* ws) {
        handleOpen(ws);
    };

    behavior.message = [this](ClientSocket* ws, std::string_view message, uWS::OpCode opCode) {
        if (opCode == uWS::OpCode::TEXT) {
            handleTextMessage(ws, message);
        } else if (opCode == uWS::OpCode::BINARY) {
            handleBinaryMessage(ws, message);
        }
    };

    behavior.close = [this](ClientSocket* ws, int code, std::string_view /*message*/) {
        handleClose(ws, code);
    };

    app_->ws<PerSocketData>("/*", std::move(behavior));

    app_->get("/health", [this](auto* res, auto* req) {
        handleHealthCheck(res, req);
    });
}

void WebSocketServer::run() {
    if (!app_) {
        utils::Logger::error("Server not started. Call start() first.");
        return;
    }

    app_->listen(port_, [this](us_listen_socket_t* listen_socket) {
        listenSocket_ = listen_socket;
        if (listen_socket) {
            running_ = true;
            utils::Logger::info("WebSocket server listening on port " + std::to_string(port_));
        } else {
            utils::Logger::error("Failed to listen on port " + std::to_string(port_));
        }
    });

    if (running_) {
        app_->run();
    }
    running_ = false;
    utils::Logger::info("WebSocket server event loop finished");
}

void WebSocketServer::stop() {
    if (!running_ || !loop_) {
        return;
    }
    utils::Logger::info("Stopping WebSocket server");
    loop_->defer([this]() {
        if (listenSocket_) {
            us_listen_socket_close(0, listenSocket_);
            listenSocket_ = nullptr;
        }
        std::vector<ClientSocket*> open;
        for (const auto& entry : connections_) {
            open.push_back(entry.second.ws);
        }
        for (auto* ws : open) {
            ws->end(1001, "server shutting down");
        }
    });
}

void WebSocketServer::handleUpgrade(uWS::HttpResponse<false>* res, uWS::HttpRequest* req,
                                    us_socket_context_t* context) {
    // Headers must be read before the request goes out of scope
    std::string secKey(req->getHeader("sec-websocket-key"));
    std::string secProtocol(req->getHeader("sec-websocket-protocol"));
    std::string secExtensions(req->getHeader("sec-websocket-extensions"));
    std::string clientKey = resolveClientKey(req->getHeader("x-forwarded-for"), res->getRemoteAddressAsText());
    std::string token = extractAuthToken(req->getQuery("token"), req->getHeader("authorization"));

    if (authorizer_ && !authorizer_(token, clientKey)) {
        utils::Logger::warn("Rejected unauthorized connection from " + clientKey);
        res->writeStatus("401 Unauthorized")
           ->writeHeader("Content-Type", "application/json")
           ->end(ErrorMessage(utils::error_codes::UNAUTHORIZED, "authorization required").serialize());
        return;
    }

    std::string sessionId;
    try {
        sessionId = sessions_->openSession(clientKey);
    } catch (const utils::CapacityExceededException& e) {
        utils::ErrorHandler::getInstance().reportError(e, "WebSocket upgrade");
        res->writeStatus("429 Too Many Requests")
           ->writeHeader("Content-Type", "application/json")
           ->end(ErrorMessage(e.getCode(), e.what()).serialize());
        return;
    }

    res->template upgrade<PerSocketData>(PerSocketData{sessionId, clientKey},
                                         secKey, secProtocol, secExtensions, context);
}

void WebSocketServer::handleOpen(ClientSocket* ws) {
    auto* data = ws->getUserData();
    const std::string sessionId = data->sessionId;
    utils::Logger::info("New client connection: " + sessionId + " from " + data->clientKey);

    auto channel = sessions_->getChannel(sessionId);
    if (!channel) {
        // Reaped between upgrade and open
        ws->end(1011, "session unavailable");
        return;
    }
    connections_[sessionId] = Connection{ws, channel, true};
    ws->send(ConnectionEstablishedMessage(sessionId, stt::nowMillis()).serialize(), uWS::OpCode::TEXT);

    uWS::Loop* loop = loop_;
    channel->setNotifier([this, loop, sessionId]() {
        loop->defer([this, sessionId]() { flushChannel(sessionId); });
    });
    flushChannel(sessionId);
}

void WebSocketServer::handleTextMessage(ClientSocket* ws, std::string_view message) {
    const std::string sessionId = ws->getUserData()->sessionId;
    auto parsed = MessageProtocol::parseMessage(std::string(message));
    if (!parsed) {
        sendMessage(sessionId, ErrorMessage(utils::error_codes::INVALID_MESSAGE,
                                            "unrecognized message").serialize());
        return;
    }

    try {
        switch (parsed->getType()) {
            case MessageType::PING:
                sendMessage(sessionId, PongMessage(stt::nowMillis()).serialize());
                break;

            case MessageType::END_SESSION:
                sessions_->closeSession(sessionId);
                break;

            case MessageType::GET_STATUS: {
                SessionInfo info = sessions_->getSessionInfo(sessionId);
                utils::JsonValue data;
                data.setObject();
                data.setObjectProperty("sessionId", utils::JsonValue(info.sessionId));
                data.setObjectProperty("state", utils::JsonValue(sessionStateToString(info.state)));
                data.setObjectProperty("segmentsIssued", utils::JsonValue(static_cast<int64_t>(info.segmentsIssued)));
                data.setObjectProperty("resultsFinalized", utils::JsonValue(static_cast<int64_t>(info.resultsFinalized)));
                data.setObjectProperty("resultsBuffered", utils::JsonValue(static_cast<int64_t>(info.resultsBuffered)));
                data.setObjectProperty("bytesReceived", utils::JsonValue(static_cast<int64_t>(info.bytesReceived)));
                data.setObjectProperty("createdAt", utils::JsonValue(info.createdAtMs));
                sendMessage(sessionId, StatusMessage(data).serialize());
                break;
            }

            case MessageType::SUBSCRIBE_TEXT:
            case MessageType::UNSUBSCRIBE_TEXT: {
                bool subscribe = parsed->getType() == MessageType::SUBSCRIBE_TEXT;
                auto it = connections_.find(sessionId);
                if (it != connections_.end()) {
                    it->second.textSubscribed = subscribe;
                }
                sendMessage(sessionId, TextSubscriptionAckMessage(sessionId, subscribe, stt::nowMillis()).serialize());
                break;
            }

            default:
                sendMessage(sessionId, ErrorMessage(utils::error_codes::INVALID_MESSAGE,
                                                    "unsupported message").serialize());
                break;
        }
    } catch (const utils::UnknownSessionException& e) {
        sendMessage(sessionId, ErrorMessage(e.getCode(), e.what()).serialize());
    }
}

void WebSocketServer::handleBinaryMessage(ClientSocket* ws, std::string_view data) {
    const std::string sessionId = ws->getUserData()->sessionId;
    try {
        bool accepted = sessions_->ingest(sessionId, reinterpret_cast<const uint8_t*>(data.data()), data.size());
        if (!accepted) {
            utils::Logger::debug("Audio frame throttled for " + sessionId);
        }
        sendMessage(sessionId, AudioReceivedMessage(sessionId, data.size(), accepted, stt::nowMillis()).serialize());
    } catch (const utils::UnknownSessionException& e) {
        sendMessage(sessionId, ErrorMessage(e.getCode(), e.what()).serialize());
    }
}

void WebSocketServer::handleClose(ClientSocket* ws, int code) {
    const std::string sessionId = ws->getUserData()->sessionId;
    connections_.erase(sessionId);
    utils::Logger::info("Client disconnected: " + sessionId + " (code " + std::to_string(code) + ")");

    try {
        sessions_->closeSession(sessionId);
    } catch (const utils::UnknownSessionException&) {
        utils::Logger::debug("Session " + sessionId + " already released");
    }
}

void WebSocketServer::handleHealthCheck(uWS::HttpResponse<false>* res, uWS::HttpRequest* /*req*/) {
    try {
        if (!health_) {
            res->writeStatus("503 Service Unavailable")
               ->writeHeader("Content-Type", "application/json")
               ->end("{\"status\":\"unavailable\",\"message\":\"Health reporter not initialized\"}");
            return;
        }

        auto snapshot = health_->snapshot();
        res->writeStatus(HealthReporter::httpStatus(snapshot.status) == 200 ? "200 OK" : "503 Service Unavailable")
           ->writeHeader("Content-Type", "application/json")
           ->writeHeader("Cache-Control", "no-cache")
           ->end(HealthReporter::toJson(snapshot));

    } catch (const std::exception& e) {
        utils::Logger::error("Exception in health check endpoint: " + std::string(e.what()));
        res->writeStatus("500 Internal Server Error")
           ->writeHeader("Content-Type", "application/json")
           ->end("{\"status\":\"error\",\"message\":\"Internal server error\"}");
    }
}

void WebSocketServer::sendMessage(const std::string& sessionId, const std::string& message) {
    auto it = connections_.find(sessionId);
    if (it != connections_.end()) {
        it->second.ws->send(message, uWS::OpCode::TEXT);
    } else {
        utils::Logger::debug("Attempted to send message to unknown session: " + sessionId);
    }
}

void WebSocketServer::flushChannel(const std::string& sessionId) {
    auto it = connections_.find(sessionId);
    if (it == connections_.end()) {
        return;
    }
    ClientSocket* ws = it->second.ws;
    bool textSubscribed = it->second.textSubscribed;
    for (const auto& message : it->second.channel->drain()) {
        if (MessageProtocol::shouldDeliver(message, textSubscribed)) {
            ws->send(MessageProtocol::serializeOutbound(message), uWS::OpCode::TEXT);
        }
    }
}

void WebSocketServer::onSessionClosed(const std::string& sessionId, const std::string& reason) {
    if (!loop_) {
        return;
    }
    // Deferred after any pending flush, so queued finals reach the client before the close frame
    loop_->defer([this, sessionId, reason]() {
        flushChannel(sessionId);
        auto it = connections_.find(sessionId);
        if (it == connections_.end()) {
            return;
        }
        ClientSocket* ws = it->second.ws;
        connections_.erase(it);
        ws->end(1000, reason);
    });
}

} // namespace core
} // namespace voicebridge
