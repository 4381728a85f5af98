#pragma once
#include <string>
#include <functional>

namespace Voice {

struct TransportHandlers {
    std::function<void()> onOpen;
    std::function<void(const std::string& text)> onMessage;
    std::function<void(int code, const std::string& reason)> onClose;
    std::function<void(const std::string& reason)> onError;
};

// One streaming connection. Handlers fire on the transport's own thread;
// close() must not be called from inside a handler.
class RecognitionTransport {
public:
    virtual ~RecognitionTransport() = default;

    virtual void setHandlers(TransportHandlers handlers) = 0;
    virtual void open(const std::string& url) = 0;
    virtual bool sendBinary(const std::string& data) = 0;
    virtual bool sendText(const std::string& text) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

} // namespace Voice
