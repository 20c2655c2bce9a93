#pragma once

#include "core/ipc/message.h"

#include <QLocalSocket>

#include <optional>

namespace hr {

// Blocking request/response client for one service socket. Calls wait on the
// socket directly and never spin the caller's event loop.
class SocketClient {
public:
    SocketClient() = default;
    ~SocketClient();

    SocketClient(const SocketClient&) = delete;
    SocketClient& operator=(const SocketClient&) = delete;

    bool connectToServer(const QString& socketPath, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;

    // The response or error envelope whose id matches; nullopt on timeout,
    // encode failure or a dropped connection. Replies to earlier, abandoned
    // requests are discarded.
    std::optional<QJsonObject> sendRequest(const QString& method,
                                           const QJsonObject& params = {},
                                           int timeoutMs = 30000);

private:
    QLocalSocket m_socket;
    FrameCodec m_codec;
    uint64_t m_nextRequestId = 1;
};

} // namespace hr
