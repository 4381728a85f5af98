#include "ix_transport.hpp"
#include "logger.hpp"

#include <ixwebsocket/IXNetSystem.h>

namespace Voice {

IxTransport::IxTransport(int handshakeTimeoutSecs) {
    ix::initNetSystem();
    socket_.disableAutomaticReconnection();
    socket_.setHandshakeTimeout(handshakeTimeoutSecs);
}

IxTransport::~IxTransport() {
    socket_.stop();
}

void IxTransport::setHandlers(TransportHandlers handlers) {
    handlers_ = std::move(handlers);

    socket_.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
        switch (msg->type) {
            case ix::WebSocketMessageType::Open:
                LOG_DEBUG("Transport", "Connected");
                if (handlers_.onOpen) handlers_.onOpen();
                break;
            case ix::WebSocketMessageType::Message:
                if (!msg->binary && handlers_.onMessage) handlers_.onMessage(msg->str);
                break;
            case ix::WebSocketMessageType::Close:
                LOG_DEBUG("Transport", "Closed: " + std::to_string(msg->closeInfo.code) +
                                       " " + msg->closeInfo.reason);
                if (handlers_.onClose) handlers_.onClose(msg->closeInfo.code, msg->closeInfo.reason);
                break;
            case ix::WebSocketMessageType::Error:
                LOG_ERROR("Transport", "Socket error: " + msg->errorInfo.reason);
                if (handlers_.onError) handlers_.onError(msg->errorInfo.reason);
                break;
            default:
                break;
        }
    });
}

void IxTransport::open(const std::string& url) {
    // Previous run (if any) must be fully joined before restarting
    socket_.stop();
    socket_.setUrl(url);
    socket_.start();
}

bool IxTransport::sendBinary(const std::string& data) {
    return socket_.sendBinary(data).success;
}

bool IxTransport::sendText(const std::string& text) {
    return socket_.sendText(text).success;
}

void IxTransport::close() {
    socket_.stop();
}

bool IxTransport::isOpen() const {
    return socket_.getReadyState() == ix::ReadyState::Open;
}

} // namespace Voice
