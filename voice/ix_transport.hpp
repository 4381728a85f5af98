#pragma once
#include <ixwebsocket/IXWebSocket.h>

#include "transport.hpp"

namespace Voice {

class IxTransport : public RecognitionTransport {
public:
    explicit IxTransport(int handshakeTimeoutSecs = 10);
    ~IxTransport() override;

    void setHandlers(TransportHandlers handlers) override;
    void open(const std::string& url) override;
    bool sendBinary(const std::string& data) override;
    bool sendText(const std::string& text) override;
    void close() override;
    bool isOpen() const override;

private:
    ix::WebSocket socket_;
    TransportHandlers handlers_;
};

} // namespace Voice
